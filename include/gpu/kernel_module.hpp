#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <cuda_runtime.h>

namespace gpu_poly {
namespace gpu {

// Logical lanes per threadgroup for every engine kernel
constexpr uint32_t kThreadgroupSize = 1024;

// Elements staged in shared memory by one fft_multiple threadgroup
constexpr uint32_t kFftTileSize = 2 * kThreadgroupSize;

// log2 of the bit-reversal tile edge (32 x 32 tiles)
constexpr uint32_t kBitReverseTileBits = 5;

constexpr size_t kMaxBindings = 3;

enum class KernelOp {
    FftMultiple,
    FftSingle,
    BitReverse,
    MulAssign,
    MulPow,
    AddAssign,
};

constexpr std::array<KernelOp, 6> kAllKernelOps = {
    KernelOp::FftMultiple, KernelOp::FftSingle, KernelOp::BitReverse,
    KernelOp::MulAssign, KernelOp::MulPow, KernelOp::AddAssign,
};

const char* kernel_op_prefix(KernelOp op);

/**
 * Kernel identifier, e.g. "fft_single_p18446744069414584321".
 */
std::string kernel_name(KernelOp op, const std::string& field_name);

/**
 * Values baked into a pipeline when it is built.
 * `param` is num_boxes (FFT), the tile exponent (bit reversal) or the shift (MulPow).
 * `base` is the MulPow base, the primitive n-th root of unity.
 */
struct PipelineConstants {
    uint32_t n = 0;
    uint32_t log_n = 0;
    uint32_t param = 0;
    uint64_t base = 0;
};

/**
 * Everything a host launcher needs to issue one kernel.
 */
struct LaunchArgs {
    PipelineConstants constants;
    std::array<void*, kMaxBindings> buffers{};
    uint32_t power = 0;
    uint32_t shift = 0;
    uint32_t grid = 0;          // total lanes
    uint32_t threadgroup = 0;   // lanes per threadgroup
    size_t shared_bytes = 0;    // dynamic shared memory per threadgroup
};

using KernelLauncher = cudaError_t (*)(const LaunchArgs& args, cudaStream_t stream);

struct KernelEntry {
    std::string name;
    KernelOp op;
    std::string field;
    size_t element_bytes = 0;
    size_t shared_elements = 0;     // dynamic shared memory, in elements
    size_t bindings = 0;            // buffers the kernel binds
    KernelLauncher launch = nullptr;
    const void* symbol = nullptr;   // __global__ function, for attribute queries
};

/**
 * Registry of compiled kernels keyed by (operation, field).
 *
 * The compiled module is assembled from registration functions defined next
 * to the kernels themselves (src/gpu/kernels/*.cu).
 */
class KernelModule {
public:
    KernelModule() = default;

    /**
     * The module containing every kernel built into this library.
     */
    static KernelModule compiled();

    void add(KernelEntry entry);

    bool contains(KernelOp op, const std::string& field) const;

    /**
     * Throws KernelNotFoundError if the (op, field) variant was never compiled.
     */
    const KernelEntry& lookup(KernelOp op, const std::string& field) const;

    /**
     * Identifiers of every (op, field) pair that is missing, for each field given.
     */
    std::vector<std::string> missing(const std::vector<std::string>& fields) const;

    /**
     * Throws KernelNotFoundError listing every missing identifier.
     */
    void validate(const std::vector<std::string>& fields) const;

    size_t size() const { return entries_.size(); }

private:
    std::map<std::pair<KernelOp, std::string>, KernelEntry> entries_;
};

// Registration hooks, one per kernel translation unit
void register_fft_kernels(KernelModule& module);
void register_bit_reverse_kernels(KernelModule& module);
void register_elementwise_kernels(KernelModule& module);

} // namespace gpu
} // namespace gpu_poly
