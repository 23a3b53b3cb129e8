#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <cuda_runtime.h>

#include "gpu/command_sequence.hpp"
#include "gpu/cuda_memory.hpp"
#include "gpu/pipeline.hpp"
#include "ntt/evaluation_domain.hpp"
#include "ntt/twiddles.hpp"
#include "types/gpu_field.hpp"

namespace gpu_poly {

enum class FftVariant {
    Multiple,   // all remaining stages inside one shared-memory tile
    Single,     // one stage, straight to device memory
};

const char* to_string(FftVariant variant);

/**
 * Pipeline keys for each stage kind. These validate the stage
 * preconditions and throw std::invalid_argument before any device work.
 */
gpu::PipelineKey fft_stage_key(const std::string& field, size_t n, size_t num_boxes, FftVariant variant);
gpu::PipelineKey bit_reverse_stage_key(const std::string& field, size_t n);
gpu::PipelineKey mul_assign_stage_key(const std::string& field, size_t n);
gpu::PipelineKey mul_pow_stage_key(const std::string& field, size_t n, size_t shift);
gpu::PipelineKey add_assign_stage_key(const std::string& field, size_t n);

/**
 * norm_factor * scale_factor^i for i in [0, n)
 */
std::vector<BFieldElement> compute_scale_factors(size_t n, BFieldElement scale_factor, BFieldElement norm_factor);

/**
 * One compiled kernel plus its fixed dispatch geometry.
 *
 * Building a stage resolves and compiles its pipeline (through the
 * library's cache) and is the only step that can fail. Encoding appends
 * exactly one dispatch and its barrier to a command sequence and never
 * blocks the host.
 */
class ComputeStage {
public:
    virtual ~ComputeStage() = default;

    virtual const char* name() const = 0;

    const gpu::ComputePipeline& pipeline() const { return *pipeline_; }
    size_t n() const { return n_; }
    uint32_t grid_size() const { return grid_; }
    uint32_t threadgroup_size() const { return gpu::kThreadgroupSize; }

protected:
    ComputeStage(std::shared_ptr<const gpu::ComputePipeline> pipeline, size_t n, uint32_t grid)
        : pipeline_(std::move(pipeline)), n_(n), grid_(grid) {}

    /**
     * Binding 0 is the written buffer.
     */
    void encode_dispatch(gpu::CommandSequence& seq, std::initializer_list<void*> buffers,
                         uint32_t power = 0, uint32_t shift = 0) const;

    template<typename T>
    static void* binding(const T* ptr) {
        return const_cast<void*>(static_cast<const void*>(ptr));
    }

    void check_binding(size_t buffer_size, const char* what) const;

private:
    std::shared_ptr<const gpu::ComputePipeline> pipeline_;
    size_t n_;
    uint32_t grid_;
};

/**
 * Butterfly stage(s) of the radix-2 transform, n/2 lanes.
 *
 * Single:   one stage at the given box count.
 * Multiple: every stage from the given box count down to box size 2,
 *           inside a kFftTileSize-element shared-memory tile; requires
 *           n / num_boxes <= kFftTileSize.
 */
template<typename F>
class FftStage : public ComputeStage {
public:
    FftStage(gpu::KernelLibrary& library, size_t n, size_t num_boxes, FftVariant variant)
        : ComputeStage(library.pipeline(fft_stage_key(GpuField<F>::name(), n, num_boxes, variant)),
                       n, static_cast<uint32_t>(n / 2)),
          num_boxes_(num_boxes), variant_(variant) {}

    const char* name() const override {
        return variant_ == FftVariant::Multiple ? "fft_multiple" : "fft_single";
    }

    size_t num_boxes() const { return num_boxes_; }
    FftVariant variant() const { return variant_; }

    // Butterfly stages this dispatch performs
    uint32_t stages_covered() const {
        return variant_ == FftVariant::Single ? 1 : log2_exact(n() / num_boxes_);
    }

    void encode(gpu::CommandSequence& seq, gpu::DeviceBuffer<F>& buffer, const TwiddleBuffer& twiddles) const {
        check_binding(buffer.size(), "fft input");
        if (twiddles.n() != n()) {
            throw std::logic_error("twiddle table built for n=" + std::to_string(twiddles.n()) +
                                   ", stage expects n=" + std::to_string(n()));
        }
        encode_dispatch(seq, {binding(buffer.data()), binding(twiddles.buffer().data())});
    }

private:
    size_t num_boxes_;
    FftVariant variant_;
};

/**
 * In-place permutation into bit-reversed index order, n lanes.
 * Applying it twice restores the input.
 */
template<typename F>
class BitReverseStage : public ComputeStage {
public:
    BitReverseStage(gpu::KernelLibrary& library, size_t n)
        : ComputeStage(library.pipeline(bit_reverse_stage_key(GpuField<F>::name(), n)),
                       n, static_cast<uint32_t>(n)) {}

    const char* name() const override { return "bit_reverse"; }

    void encode(gpu::CommandSequence& seq, gpu::DeviceBuffer<F>& buffer) const {
        check_binding(buffer.size(), "bit_reverse input");
        encode_dispatch(seq, {binding(buffer.data())});
    }
};

/**
 * buffer[i] *= norm_factor * scale_factor^i, n lanes.
 *
 * The factor table is computed and uploaded once at construction and is
 * owned by the stage. Used for 1/n normalisation and coset shifts.
 */
template<typename F>
class ScaleAndNormalizeStage : public ComputeStage {
public:
    ScaleAndNormalizeStage(gpu::KernelLibrary& library, cudaStream_t stream, size_t n,
                           BFieldElement scale_factor, BFieldElement norm_factor)
        : ComputeStage(library.pipeline(mul_assign_stage_key(GpuField<F>::name(), n)),
                       n, static_cast<uint32_t>(n)),
          scale_factor_(scale_factor),
          norm_factor_(norm_factor),
          scale_factors_(gpu::copy_to_private_buffer(stream, compute_scale_factors(n, scale_factor, norm_factor))) {}

    const char* name() const override { return "scale_and_normalize"; }

    BFieldElement scale_factor() const { return scale_factor_; }
    BFieldElement norm_factor() const { return norm_factor_; }
    const gpu::DeviceBuffer<BFieldElement>& scale_factors() const { return scale_factors_; }

    void encode(gpu::CommandSequence& seq, gpu::DeviceBuffer<F>& buffer) const {
        check_binding(buffer.size(), "scale input");
        encode_dispatch(seq, {binding(buffer.data()), binding(scale_factors_.data())});
    }

private:
    BFieldElement scale_factor_;
    BFieldElement norm_factor_;
    gpu::DeviceBuffer<BFieldElement> scale_factors_;
};

/**
 * dst[i] = src[i] * w^(shift * i + power), w the primitive n-th root of
 * unity baked into the pipeline. `shift` is fixed per stage, `power` per
 * dispatch. dst and src may be the same buffer.
 */
template<typename F>
class MulPowStage : public ComputeStage {
public:
    MulPowStage(gpu::KernelLibrary& library, size_t n, size_t shift)
        : ComputeStage(library.pipeline(mul_pow_stage_key(GpuField<F>::name(), n, shift)),
                       n, static_cast<uint32_t>(n)),
          shift_(static_cast<uint32_t>(shift)) {}

    const char* name() const override { return "mul_pow"; }

    uint32_t shift() const { return shift_; }

    // power is reduced mod n: w has order n
    void encode(gpu::CommandSequence& seq, gpu::DeviceBuffer<F>& dst, const gpu::DeviceBuffer<F>& src,
                size_t power) const {
        check_binding(dst.size(), "mul_pow dst");
        check_binding(src.size(), "mul_pow src");
        encode_dispatch(seq, {binding(dst.data()), binding(src.data())},
                        static_cast<uint32_t>(power % n()), shift_);
    }

private:
    uint32_t shift_;
};

/**
 * dst[i] += src[i], n lanes.
 */
template<typename F>
class AddAssignStage : public ComputeStage {
public:
    AddAssignStage(gpu::KernelLibrary& library, size_t n)
        : ComputeStage(library.pipeline(add_assign_stage_key(GpuField<F>::name(), n)),
                       n, static_cast<uint32_t>(n)) {}

    const char* name() const override { return "add_assign"; }

    void encode(gpu::CommandSequence& seq, gpu::DeviceBuffer<F>& dst, const gpu::DeviceBuffer<F>& src) const {
        check_binding(dst.size(), "add_assign dst");
        check_binding(src.size(), "add_assign src");
        encode_dispatch(seq, {binding(dst.data()), binding(src.data())});
    }
};

} // namespace gpu_poly
