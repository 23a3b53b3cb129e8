#include "gpu/kernel_module.hpp"
#include "common/errors.hpp"
#include "common/debug_control.hpp"

namespace gpu_poly {
namespace gpu {

const char* kernel_op_prefix(KernelOp op) {
    switch (op) {
        case KernelOp::FftMultiple: return "fft_multiple";
        case KernelOp::FftSingle:   return "fft_single";
        case KernelOp::BitReverse:  return "bit_reverse";
        case KernelOp::MulAssign:   return "mul_assign";
        case KernelOp::MulPow:      return "mul_pow";
        case KernelOp::AddAssign:   return "add_assign";
    }
    return "unknown";
}

std::string kernel_name(KernelOp op, const std::string& field_name) {
    return std::string(kernel_op_prefix(op)) + "_" + field_name;
}

KernelModule KernelModule::compiled() {
    KernelModule module;
    register_fft_kernels(module);
    register_bit_reverse_kernels(module);
    register_elementwise_kernels(module);
    GPU_POLY_DEBUG_PRINT("[kernel_module] %zu kernels registered\n", module.size());
    return module;
}

void KernelModule::add(KernelEntry entry) {
    auto key = std::make_pair(entry.op, entry.field);
    entries_[key] = std::move(entry);
}

bool KernelModule::contains(KernelOp op, const std::string& field) const {
    return entries_.count(std::make_pair(op, field)) != 0;
}

const KernelEntry& KernelModule::lookup(KernelOp op, const std::string& field) const {
    auto it = entries_.find(std::make_pair(op, field));
    if (it == entries_.end()) {
        throw KernelNotFoundError("kernel '" + kernel_name(op, field) + "' is not in the compiled module");
    }
    return it->second;
}

std::vector<std::string> KernelModule::missing(const std::vector<std::string>& fields) const {
    std::vector<std::string> result;
    for (const auto& field : fields) {
        for (KernelOp op : kAllKernelOps) {
            if (!contains(op, field)) {
                result.push_back(kernel_name(op, field));
            }
        }
    }
    return result;
}

void KernelModule::validate(const std::vector<std::string>& fields) const {
    auto absent = missing(fields);
    if (absent.empty()) {
        return;
    }
    std::string msg = "compiled module is missing kernels:";
    for (const auto& name : absent) {
        msg += " " + name;
    }
    throw KernelNotFoundError(msg);
}

} // namespace gpu
} // namespace gpu_poly
