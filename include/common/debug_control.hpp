#pragma once

#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace gpu_poly {
namespace debug {

/**
 * Debug and Profile Control
 * 
 * Environment variables:
 * - GPU_POLY_PROFILE: Enable/disable profiling output (timing measurements)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 * 
 * - GPU_POLY_DEBUG: Enable/disable debug output (stage construction,
 *   pipeline cache activity, planned dispatch ladders)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 *
 * EngineConfig may override both flags after startup.
 */

inline bool env_flag(const char* name) {
    const char* env = std::getenv(name);
    return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
}

inline int& profile_state() {
    static int cached = -1;
    return cached;
}

inline int& debug_state() {
    static int cached = -1;
    return cached;
}

// Check if profiling is enabled
inline bool is_profile_enabled() {
    int& cached = profile_state();
    if (cached == -1) {
        cached = env_flag("GPU_POLY_PROFILE") ? 1 : 0;
    }
    return cached == 1;
}

// Check if debug printing is enabled
inline bool is_debug_enabled() {
    int& cached = debug_state();
    if (cached == -1) {
        cached = env_flag("GPU_POLY_DEBUG") ? 1 : 0;
    }
    return cached == 1;
}

inline void set_profile_enabled(bool enabled) { profile_state() = enabled ? 1 : 0; }
inline void set_debug_enabled(bool enabled) { debug_state() = enabled ? 1 : 0; }

} // namespace debug
} // namespace gpu_poly

// Profile printing (timing measurements)
#define GPU_POLY_PROFILE_ENABLED() (gpu_poly::debug::is_profile_enabled())

#define GPU_POLY_PROFILE_PRINT(...) \
    do { \
        if (gpu_poly::debug::is_profile_enabled()) { \
            printf(__VA_ARGS__); \
        } \
    } while(0)

#define GPU_POLY_PROFILE_COUT(expr) \
    do { \
        if (gpu_poly::debug::is_profile_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

// Debug printing (detailed state dumps)
#define GPU_POLY_DEBUG_ENABLED() (gpu_poly::debug::is_debug_enabled())

#define GPU_POLY_DEBUG_PRINT(...) \
    do { \
        if (gpu_poly::debug::is_debug_enabled()) { \
            printf(__VA_ARGS__); \
        } \
    } while(0)

#define GPU_POLY_DEBUG_COUT(expr) \
    do { \
        if (gpu_poly::debug::is_debug_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

#define GPU_POLY_IF_PROFILE if (gpu_poly::debug::is_profile_enabled())
#define GPU_POLY_IF_DEBUG if (gpu_poly::debug::is_debug_enabled())
