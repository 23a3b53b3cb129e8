#include "ntt/stages.hpp"
#include "common/debug_control.hpp"

#include <algorithm>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace gpu_poly {

namespace {

constexpr size_t kScaleChunk = 4096;

gpu::PipelineKey make_key(const std::string& field, gpu::KernelOp op, size_t n, size_t param) {
    gpu::PipelineKey key;
    key.field = field;
    key.op = op;
    key.n = static_cast<uint32_t>(n);
    key.param = static_cast<uint32_t>(param);
    return key;
}

} // namespace

const char* to_string(FftVariant variant) {
    return variant == FftVariant::Multiple ? "multiple" : "single";
}

gpu::PipelineKey fft_stage_key(const std::string& field, size_t n, size_t num_boxes, FftVariant variant) {
    check_transform_size(n);
    if (!is_power_of_two(num_boxes) || num_boxes >= n) {
        throw std::invalid_argument("num_boxes=" + std::to_string(num_boxes) +
                                    " must be a power of two less than n=" + std::to_string(n));
    }
    if (variant == FftVariant::Multiple && n / num_boxes > gpu::kFftTileSize) {
        throw std::invalid_argument("fft_multiple needs box size n/num_boxes=" + std::to_string(n / num_boxes) +
                                    " <= " + std::to_string(gpu::kFftTileSize));
    }
    gpu::KernelOp op = variant == FftVariant::Multiple ? gpu::KernelOp::FftMultiple : gpu::KernelOp::FftSingle;
    return make_key(field, op, n, num_boxes);
}

gpu::PipelineKey bit_reverse_stage_key(const std::string& field, size_t n) {
    check_transform_size(n);
    return make_key(field, gpu::KernelOp::BitReverse, n, gpu::kBitReverseTileBits);
}

gpu::PipelineKey mul_assign_stage_key(const std::string& field, size_t n) {
    check_transform_size(n);
    return make_key(field, gpu::KernelOp::MulAssign, n, 0);
}

gpu::PipelineKey mul_pow_stage_key(const std::string& field, size_t n, size_t shift) {
    check_transform_size(n);
    if (shift > UINT32_MAX) {
        throw std::invalid_argument("mul_pow shift=" + std::to_string(shift) + " does not fit in 32 bits");
    }
    return make_key(field, gpu::KernelOp::MulPow, n, shift);
}

gpu::PipelineKey add_assign_stage_key(const std::string& field, size_t n) {
    check_transform_size(n);
    return make_key(field, gpu::KernelOp::AddAssign, n, 0);
}

std::vector<BFieldElement> compute_scale_factors(size_t n, BFieldElement scale_factor, BFieldElement norm_factor) {
    std::vector<BFieldElement> factors(n, norm_factor);
    if (scale_factor.is_one()) {
        return factors;
    }

    const long num_chunks = static_cast<long>((n + kScaleChunk - 1) / kScaleChunk);

    #pragma omp parallel for schedule(static) if(num_chunks > 1)
    for (long c = 0; c < num_chunks; ++c) {
        const size_t begin = static_cast<size_t>(c) * kScaleChunk;
        const size_t end = std::min(n, begin + kScaleChunk);
        BFieldElement acc = norm_factor * scale_factor.pow(begin);
        for (size_t i = begin; i < end; ++i) {
            factors[i] = acc;
            acc *= scale_factor;
        }
    }
    return factors;
}

void ComputeStage::encode_dispatch(gpu::CommandSequence& seq, std::initializer_list<void*> buffers,
                                   uint32_t power, uint32_t shift) const {
    gpu::Dispatch dispatch;
    dispatch.pipeline = pipeline_;
    size_t i = 0;
    for (void* b : buffers) {
        dispatch.buffers[i++] = b;
    }
    dispatch.buffer_count = i;
    dispatch.power = power;
    dispatch.shift = shift;
    dispatch.grid = grid_;
    dispatch.threadgroup = gpu::kThreadgroupSize;
    seq.encode(std::move(dispatch));
}

void ComputeStage::check_binding(size_t buffer_size, const char* what) const {
    if (buffer_size != n_) {
        throw std::logic_error(std::string(name()) + ": " + what + " holds " + std::to_string(buffer_size) +
                               " elements, stage was built for n=" + std::to_string(n_));
    }
}

} // namespace gpu_poly
