#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "stark/proof_options.hpp"

namespace gpu_poly {

/**
 * Engine-wide runtime configuration.
 *
 * Sources, lowest precedence first:
 *   1. defaults below
 *   2. JSON file named by GPU_POLY_CONFIG (or passed to load())
 *   3. environment: GPU_POLY_DEVICE, GPU_POLY_PROFILE, GPU_POLY_DEBUG
 *
 * JSON layout:
 *   { "device_id": 0, "profile": false, "debug": false, "cache_twiddles": true,
 *     "proof_options": { ... } }
 */
struct EngineConfig {
    int device_id = 0;
    bool profile = false;
    bool debug = false;
    bool cache_twiddles = true;
    ProofOptions proof_options;

    /**
     * Merge fields present in a JSON object; absent fields keep their value.
     * Throws std::invalid_argument on wrongly typed fields.
     */
    void merge_json(const nlohmann::json& j);

    /**
     * Merge GPU_POLY_DEVICE / GPU_POLY_PROFILE / GPU_POLY_DEBUG if set.
     */
    void merge_env();

    /**
     * Push profile/debug flags into the logging macros.
     */
    void apply() const;

    nlohmann::json to_json() const;

    static EngineConfig from_file(const std::string& path);

    /**
     * defaults -> $GPU_POLY_CONFIG (if set) -> environment
     */
    static EngineConfig load();
};

/**
 * Read and parse a JSON document; std::invalid_argument if unreadable or malformed.
 */
nlohmann::json read_json_file(const std::string& path);

} // namespace gpu_poly
