#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <cuda_runtime.h>

#include "common/debug_control.hpp"
#include "gpu/command_sequence.hpp"
#include "gpu/cuda_memory.hpp"
#include "gpu/pipeline.hpp"
#include "ntt/evaluation_domain.hpp"
#include "ntt/stages.hpp"
#include "ntt/twiddles.hpp"

namespace gpu_poly {

enum class OutputOrder {
    Natural,
    BitReversed,
};

/**
 * One FFT dispatch of the butterfly ladder.
 */
struct LadderStep {
    size_t num_boxes;
    FftVariant variant;
    uint32_t stages;   // butterfly stages performed by this dispatch
};

/**
 * Dispatch ladder for a size-n transform: Single dispatches at
 * num_boxes = 1, 2, 4, ... while a box is larger than one shared-memory
 * tile, then one Multiple dispatch finishing the last log2(kFftTileSize)
 * stages. The stage counts always sum to log2(n).
 * Throws std::invalid_argument on unsupported n.
 */
std::vector<LadderStep> plan_fft_ladder(size_t n);

std::string describe_ladder(const std::vector<LadderStep>& ladder);

/**
 * Stages for one (domain, direction) transform, built once and encoded
 * into any number of command sequences.
 *
 * Forward (coefficients -> evaluations on offset * <w>):
 *   [scale by offset^i]  ladder(w)  [bit_reverse]
 * Inverse (evaluations on offset * <w> -> coefficients):
 *   ladder(w^-1)  bit_reverse  scale by n^-1 * offset^-i
 *
 * The ladder takes natural-order input and leaves bit-reversed output, so
 * the bit reversal after it restores natural order. A forward plan may skip
 * it with OutputOrder::BitReversed.
 */
template<typename F>
class FftPlan {
public:
    FftPlan(gpu::KernelLibrary& library, TwiddleCache& twiddle_cache, const EvaluationDomain& domain,
            FftDirection direction, cudaStream_t stream, OutputOrder order = OutputOrder::Natural)
        : domain_(domain), direction_(direction), order_(order) {
        if (direction == FftDirection::Inverse && order == OutputOrder::BitReversed) {
            throw std::invalid_argument("inverse transforms always produce natural-order coefficients");
        }
        const size_t n = domain.size;
        ladder_ = plan_fft_ladder(n);
        twiddles_ = twiddle_cache.get(n, direction, stream);

        if (direction == FftDirection::Forward && domain.is_coset()) {
            pre_scale_ = std::make_unique<ScaleAndNormalizeStage<F>>(library, stream, n, domain.offset,
                                                                    BFieldElement::one());
        }
        fft_stages_.reserve(ladder_.size());
        for (const LadderStep& step : ladder_) {
            fft_stages_.emplace_back(library, n, step.num_boxes, step.variant);
        }
        if (order == OutputOrder::Natural) {
            bit_reverse_ = std::make_unique<BitReverseStage<F>>(library, n);
        }
        if (direction == FftDirection::Inverse) {
            post_scale_ = std::make_unique<ScaleAndNormalizeStage<F>>(library, stream, n, domain.offset_inv,
                                                                     domain.size_inv);
        }

        GPU_POLY_DEBUG_COUT("[fft_plan] " << to_string(direction) << " n=" << n
                            << (domain.is_coset() ? " coset" : "") << ": "
                            << describe_ladder(ladder_) << "\n");
    }

    /**
     * Append every dispatch of this transform to `seq`; `buffer` is
     * transformed in place once the sequence has executed.
     */
    void encode(gpu::CommandSequence& seq, gpu::DeviceBuffer<F>& buffer) const {
        if (pre_scale_) {
            pre_scale_->encode(seq, buffer);
        }
        for (const auto& stage : fft_stages_) {
            stage.encode(seq, buffer, *twiddles_);
        }
        if (bit_reverse_) {
            bit_reverse_->encode(seq, buffer);
        }
        if (post_scale_) {
            post_scale_->encode(seq, buffer);
        }
    }

    const EvaluationDomain& domain() const { return domain_; }
    FftDirection direction() const { return direction_; }
    OutputOrder output_order() const { return order_; }
    const std::vector<LadderStep>& ladder() const { return ladder_; }
    const std::vector<FftStage<F>>& fft_stages() const { return fft_stages_; }
    const TwiddleBuffer& twiddles() const { return *twiddles_; }

    size_t dispatch_count() const {
        return fft_stages_.size() + (pre_scale_ ? 1 : 0) + (bit_reverse_ ? 1 : 0) + (post_scale_ ? 1 : 0);
    }

private:
    EvaluationDomain domain_;
    FftDirection direction_;
    OutputOrder order_;
    std::vector<LadderStep> ladder_;
    std::shared_ptr<const TwiddleBuffer> twiddles_;
    std::unique_ptr<ScaleAndNormalizeStage<F>> pre_scale_;
    std::vector<FftStage<F>> fft_stages_;
    std::unique_ptr<BitReverseStage<F>> bit_reverse_;
    std::unique_ptr<ScaleAndNormalizeStage<F>> post_scale_;
};

/**
 * Forward and inverse plans for one domain, with host-vector entry points
 * that stage, submit, wait and read back.
 */
template<typename F>
class GpuFft {
public:
    GpuFft(gpu::KernelLibrary& library, TwiddleCache& twiddle_cache, const EvaluationDomain& domain,
           cudaStream_t stream)
        : stream_(stream),
          forward_(library, twiddle_cache, domain, FftDirection::Forward, stream),
          inverse_(library, twiddle_cache, domain, FftDirection::Inverse, stream) {}

    // coefficients -> evaluations
    void forward(std::vector<F>& values) const { run(forward_, values); }

    // evaluations -> coefficients
    void inverse(std::vector<F>& values) const { run(inverse_, values); }

    // Device-resident variants; the buffer stays on the device
    void forward(gpu::DeviceBuffer<F>& buffer) const { run(forward_, buffer); }
    void inverse(gpu::DeviceBuffer<F>& buffer) const { run(inverse_, buffer); }

    const FftPlan<F>& forward_plan() const { return forward_; }
    const FftPlan<F>& inverse_plan() const { return inverse_; }
    size_t size() const { return forward_.domain().size; }

private:
    void run(const FftPlan<F>& plan, std::vector<F>& values) const {
        if (values.size() != size()) {
            throw std::invalid_argument("expected " + std::to_string(size()) + " values, got " +
                                        std::to_string(values.size()));
        }
        gpu::DeviceBuffer<F> buffer = gpu::copy_to_private_buffer(stream_, values);
        run(plan, buffer);
        gpu::copy_from_private_buffer(stream_, buffer, values);
    }

    void run(const FftPlan<F>& plan, gpu::DeviceBuffer<F>& buffer) const {
        gpu::CommandSequence seq(std::string("fft ") + to_string(plan.direction()) + " n=" +
                                 std::to_string(size()));
        plan.encode(seq, buffer);
        seq.submit_and_wait(stream_);
    }

    cudaStream_t stream_;
    FftPlan<F> forward_;
    FftPlan<F> inverse_;
};

} // namespace gpu_poly
