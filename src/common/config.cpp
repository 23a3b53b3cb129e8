#include "common/config.hpp"
#include "common/debug_control.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace gpu_poly {

namespace {

template<typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) {
        return;
    }
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("config field '") + key + "': " + e.what());
    }
}

bool parse_bool_env(const char* name, const char* value) {
    std::string v(value);
    if (v == "1" || v == "true") return true;
    if (v == "0" || v == "false" || v.empty()) return false;
    throw std::invalid_argument(std::string(name) + " must be 0/1/true/false, got '" + v + "'");
}

} // namespace

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::invalid_argument("Cannot open config: " + path);
    }
    try {
        return nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Malformed JSON in " + path + ": " + e.what());
    }
}

void EngineConfig::merge_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("engine config must be a JSON object");
    }
    read_field(j, "device_id", device_id);
    read_field(j, "profile", profile);
    read_field(j, "debug", debug);
    read_field(j, "cache_twiddles", cache_twiddles);
    if (j.contains("proof_options")) {
        proof_options = ProofOptions::from_config(j);
    }
    if (device_id < 0) {
        throw std::invalid_argument("device_id must be non-negative");
    }
}

void EngineConfig::merge_env() {
    if (const char* dev = std::getenv("GPU_POLY_DEVICE")) {
        try {
            device_id = std::stoi(dev);
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string("GPU_POLY_DEVICE is not an integer: ") + dev);
        }
        if (device_id < 0) {
            throw std::invalid_argument("GPU_POLY_DEVICE must be non-negative");
        }
    }
    if (const char* p = std::getenv("GPU_POLY_PROFILE")) {
        profile = parse_bool_env("GPU_POLY_PROFILE", p);
    }
    if (const char* d = std::getenv("GPU_POLY_DEBUG")) {
        debug = parse_bool_env("GPU_POLY_DEBUG", d);
    }
}

void EngineConfig::apply() const {
    debug::set_profile_enabled(profile);
    debug::set_debug_enabled(debug);
}

nlohmann::json EngineConfig::to_json() const {
    return nlohmann::json{
        {"device_id", device_id},
        {"profile", profile},
        {"debug", debug},
        {"cache_twiddles", cache_twiddles},
        {"proof_options", proof_options},
    };
}

EngineConfig EngineConfig::from_file(const std::string& path) {
    EngineConfig cfg;
    cfg.merge_json(read_json_file(path));
    return cfg;
}

EngineConfig EngineConfig::load() {
    EngineConfig cfg;
    if (const char* path = std::getenv("GPU_POLY_CONFIG")) {
        cfg.merge_json(read_json_file(path));
    }
    cfg.merge_env();
    return cfg;
}

} // namespace gpu_poly
