#pragma once

#include <chrono>
#include <cstdio>
#include <string>
#include <utility>

#include "common/debug_control.hpp"

namespace gpu_poly {

/**
 * Prints "<name> in <ms>ms" when it goes out of scope, if profiling is on.
 */
class ScopedTimer {
public:
    explicit ScopedTimer(std::string name)
        : name_(std::move(name)), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        GPU_POLY_IF_PROFILE {
            auto elapsed = std::chrono::steady_clock::now() - start_;
            double ms = std::chrono::duration<double, std::milli>(elapsed).count();
            printf("[profile] %s in %.3fms\n", name_.c_str(), ms);
        }
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    // Time since construction; callers that report their own timings read this
    double elapsed_ms() const {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        return std::chrono::duration<double, std::milli>(elapsed).count();
    }

private:
    std::string name_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace gpu_poly
