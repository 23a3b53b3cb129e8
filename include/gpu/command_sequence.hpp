#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <cuda_runtime.h>

#include "gpu/pipeline.hpp"

namespace gpu_poly {
namespace gpu {

/**
 * One recorded kernel dispatch. Binding 0 is always the buffer the
 * dispatch writes; the remaining bindings are read-only.
 */
struct Dispatch {
    std::shared_ptr<const ComputePipeline> pipeline;
    std::array<void*, kMaxBindings> buffers{};
    size_t buffer_count = 0;
    uint32_t power = 0;
    uint32_t shift = 0;
    uint32_t grid = 0;
    uint32_t threadgroup = 0;
};

/**
 * Memory barrier recorded after a dispatch: later dispatches in the same
 * sequence observe every write made to `resources`.
 */
struct Barrier {
    std::vector<const void*> resources;
};

/**
 * Ordered list of dispatches forming one submission.
 *
 * Invariant: entries alternate dispatch, barrier, dispatch, barrier, ...
 * in encoding order, and each barrier names the buffer its dispatch wrote.
 * encode() is the only way to append, so the invariant cannot be broken.
 *
 * On submission every dispatch is issued on one CUDA stream in order. A
 * stream runs kernels one after another with all global-memory writes of a
 * kernel visible to the next, which is exactly what the barriers require.
 */
class CommandSequence {
public:
    explicit CommandSequence(std::string label = "command_sequence") : label_(std::move(label)) {}

    CommandSequence(const CommandSequence&) = delete;
    CommandSequence& operator=(const CommandSequence&) = delete;
    CommandSequence(CommandSequence&&) = default;
    CommandSequence& operator=(CommandSequence&&) = default;

    /**
     * Append `dispatch` followed by a barrier on its written buffer.
     */
    void encode(Dispatch dispatch);

    const std::vector<Dispatch>& dispatches() const { return dispatches_; }
    const std::vector<Barrier>& barriers() const { return barriers_; }
    size_t size() const { return dispatches_.size(); }
    bool empty() const { return dispatches_.empty(); }
    bool submitted() const { return submitted_; }
    const std::string& label() const { return label_; }

    /**
     * Issue all dispatches on `stream` and return without waiting.
     * Throws GpuError if a launch is rejected, std::logic_error if the
     * sequence was already submitted.
     */
    void submit(cudaStream_t stream);

    /**
     * submit() and block until the stream has drained. Execution faults
     * surface here as GpuError.
     */
    void submit_and_wait(cudaStream_t stream);

private:
    std::string label_;
    std::vector<Dispatch> dispatches_;
    std::vector<Barrier> barriers_;
    bool submitted_ = false;
};

} // namespace gpu
} // namespace gpu_poly
