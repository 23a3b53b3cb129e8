#include "stark/proof_options.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "ntt/evaluation_domain.hpp"

namespace gpu_poly {

ProofOptions::ProofOptions(uint32_t num_queries, uint32_t lde_blowup_factor, uint32_t grinding_factor,
                           uint32_t fri_folding_factor, uint32_t fri_max_remainder_size)
    : num_queries(num_queries),
      lde_blowup_factor(lde_blowup_factor),
      grinding_factor(grinding_factor),
      fri_folding_factor(fri_folding_factor),
      fri_max_remainder_size(fri_max_remainder_size) {
    validate();
}

void ProofOptions::validate() const {
    if (num_queries < MIN_NUM_QUERIES || num_queries > MAX_NUM_QUERIES) {
        throw std::invalid_argument("num_queries=" + std::to_string(num_queries) + " outside [" +
                                    std::to_string(MIN_NUM_QUERIES) + ", " + std::to_string(MAX_NUM_QUERIES) + "]");
    }
    if (!is_power_of_two(lde_blowup_factor) || lde_blowup_factor < MIN_BLOWUP_FACTOR ||
        lde_blowup_factor > MAX_BLOWUP_FACTOR) {
        throw std::invalid_argument("lde_blowup_factor=" + std::to_string(lde_blowup_factor) +
                                    " must be a power of two in [" + std::to_string(MIN_BLOWUP_FACTOR) + ", " +
                                    std::to_string(MAX_BLOWUP_FACTOR) + "]");
    }
    if (grinding_factor > MAX_GRINDING_FACTOR) {
        throw std::invalid_argument("grinding_factor=" + std::to_string(grinding_factor) + " exceeds " +
                                    std::to_string(MAX_GRINDING_FACTOR));
    }
}

size_t ProofOptions::conjectured_security_level(size_t field_bits, size_t hash_security, size_t trace_len) const {
    return gpu_poly::conjectured_security_level(field_bits, hash_security, lde_blowup_factor, trace_len,
                                                num_queries, grinding_factor);
}

ProofOptions ProofOptions::from_config(const nlohmann::json& config) {
    if (!config.is_object() || !config.contains("proof_options")) {
        return ProofOptions();
    }
    try {
        return config.at("proof_options").get<ProofOptions>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("config field 'proof_options': ") + e.what());
    }
}

bool ProofOptions::operator==(const ProofOptions& rhs) const {
    return num_queries == rhs.num_queries && lde_blowup_factor == rhs.lde_blowup_factor &&
           grinding_factor == rhs.grinding_factor && fri_folding_factor == rhs.fri_folding_factor &&
           fri_max_remainder_size == rhs.fri_max_remainder_size;
}

size_t conjectured_security_level(size_t field_bits, size_t hash_security, size_t lde_blowup_factor,
                                  size_t trace_len, size_t num_queries, size_t grinding_factor) {
    const size_t lde_size = lde_blowup_factor * trace_len;
    if (lde_size == 0 || !is_power_of_two(lde_blowup_factor)) {
        throw std::invalid_argument("security level needs a power-of-two blowup and a non-empty trace");
    }

    // Largest security the field allows for this domain size
    const size_t domain_bits = static_cast<size_t>(__builtin_ctzll(static_cast<unsigned long long>(lde_size)));
    const size_t field_security = field_bits > domain_bits ? field_bits - domain_bits : 0;

    size_t query_security = log2_exact(lde_blowup_factor) * num_queries;
    if (query_security >= kGrindingContributionFloor) {
        query_security += grinding_factor;
    }

    const size_t proof_security = std::min(field_security, query_security);
    return std::min(proof_security == 0 ? 0 : proof_security - 1, hash_security);
}

void to_json(nlohmann::json& j, const ProofOptions& options) {
    j = nlohmann::json{
        {"num_queries", options.num_queries},
        {"lde_blowup_factor", options.lde_blowup_factor},
        {"grinding_factor", options.grinding_factor},
        {"fri_folding_factor", options.fri_folding_factor},
        {"fri_max_remainder_size", options.fri_max_remainder_size},
    };
}

void from_json(const nlohmann::json& j, ProofOptions& options) {
    ProofOptions parsed;
    if (j.contains("num_queries")) j.at("num_queries").get_to(parsed.num_queries);
    if (j.contains("lde_blowup_factor")) j.at("lde_blowup_factor").get_to(parsed.lde_blowup_factor);
    if (j.contains("grinding_factor")) j.at("grinding_factor").get_to(parsed.grinding_factor);
    if (j.contains("fri_folding_factor")) j.at("fri_folding_factor").get_to(parsed.fri_folding_factor);
    if (j.contains("fri_max_remainder_size")) j.at("fri_max_remainder_size").get_to(parsed.fri_max_remainder_size);
    parsed.validate();
    options = parsed;
}

} // namespace gpu_poly
