#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace gpu_poly {

/**
 * Prover parameters that size the transforms this engine runs: the LDE
 * blowup fixes the evaluation-domain size, the rest is carried for the
 * FRI layer and the security estimate.
 */
struct ProofOptions {
    static constexpr uint32_t MIN_NUM_QUERIES = 1;
    static constexpr uint32_t MAX_NUM_QUERIES = 128;
    static constexpr uint32_t MIN_BLOWUP_FACTOR = 1;
    static constexpr uint32_t MAX_BLOWUP_FACTOR = 64;
    static constexpr uint32_t MAX_GRINDING_FACTOR = 32;

    uint32_t num_queries = 32;
    uint32_t lde_blowup_factor = 8;
    uint32_t grinding_factor = 16;
    uint32_t fri_folding_factor = 8;
    uint32_t fri_max_remainder_size = 64;

    ProofOptions() = default;
    ProofOptions(uint32_t num_queries, uint32_t lde_blowup_factor, uint32_t grinding_factor,
                 uint32_t fri_folding_factor, uint32_t fri_max_remainder_size);

    /**
     * Throws std::invalid_argument if any field is out of range.
     */
    void validate() const;

    /**
     * Size of the LDE domain for a trace of `trace_len` rows.
     */
    size_t lde_domain_size(size_t trace_len) const { return trace_len * lde_blowup_factor; }

    /**
     * Conjectured security in bits of a proof over a field of `field_bits`
     * bits (extension degree included), using a hash with
     * `hash_security` bits of collision resistance.
     */
    size_t conjectured_security_level(size_t field_bits, size_t hash_security, size_t trace_len) const;

    /**
     * Read the "proof_options" object of an engine config document;
     * defaults if the key is absent.
     */
    static ProofOptions from_config(const nlohmann::json& config);

    bool operator==(const ProofOptions& rhs) const;
    bool operator!=(const ProofOptions& rhs) const { return !(*this == rhs); }
};

// Query rounds below this many bits do not get credit for grinding
constexpr size_t kGrindingContributionFloor = 80;

size_t conjectured_security_level(size_t field_bits, size_t hash_security, size_t lde_blowup_factor,
                                  size_t trace_len, size_t num_queries, size_t grinding_factor);

void to_json(nlohmann::json& j, const ProofOptions& options);
void from_json(const nlohmann::json& j, ProofOptions& options);

} // namespace gpu_poly
