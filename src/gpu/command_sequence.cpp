#include "gpu/command_sequence.hpp"
#include "common/errors.hpp"
#include "common/debug_control.hpp"
#include "common/scoped_timer.hpp"

#include <stdexcept>

namespace gpu_poly {
namespace gpu {

void CommandSequence::encode(Dispatch dispatch) {
    Barrier barrier;
    barrier.resources.push_back(dispatch.buffers[0]);
    dispatches_.push_back(std::move(dispatch));
    barriers_.push_back(std::move(barrier));
}

void CommandSequence::submit(cudaStream_t stream) {
    if (submitted_) {
        throw std::logic_error("command sequence '" + label_ + "' was already submitted");
    }
    submitted_ = true;

    for (size_t i = 0; i < dispatches_.size(); ++i) {
        const Dispatch& d = dispatches_[i];
        const ComputePipeline& pipeline = *d.pipeline;

        LaunchArgs args;
        args.constants = pipeline.constants();
        args.buffers = d.buffers;
        args.power = d.power;
        args.shift = d.shift;
        args.grid = d.grid;
        args.threadgroup = d.threadgroup;
        args.shared_bytes = pipeline.shared_memory_bytes();

        cudaError_t err = pipeline.entry().launch(args, stream);
        if (err != cudaSuccess) {
            std::cerr << "CUDA launch of " << pipeline.name() << " failed (dispatch " << i
                      << " of '" << label_ << "'): " << cudaGetErrorString(err) << std::endl;
            throw GpuError("launch of " + pipeline.name() + " failed: " + cudaGetErrorString(err));
        }
    }

    GPU_POLY_DEBUG_PRINT("[command_sequence] %s: submitted %zu dispatches\n",
                         label_.c_str(), dispatches_.size());
}

void CommandSequence::submit_and_wait(cudaStream_t stream) {
    ScopedTimer timer(label_);
    submit(stream);
    GPU_POLY_CUDA_CHECK(cudaStreamSynchronize(stream));
}

} // namespace gpu
} // namespace gpu_poly
