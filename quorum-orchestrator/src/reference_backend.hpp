/**
 * @file reference_backend.hpp
 * @brief Deterministic, configurable reference implementation of IBackend
 *
 * Used to exercise the orchestrator and executor without a real model.
 */

#ifndef QUORUM_REFERENCE_BACKEND_HPP
#define QUORUM_REFERENCE_BACKEND_HPP

#include "backend_interface.hpp"
#include <mutex>
#include <random>
#include <string>

namespace quorum {

/**
 * @brief Canned-response backend with simulated latency
 *
 * Configuration Keys (BackendConfig::params):
 *   - "response_pattern": "analytical", "creative", "conservative" or anything
 *                         else for a generic answer (default: "default")
 *   - "base_confidence": Starting confidence before adjustments (default: 0.8)
 *   - "response_delay": Simulated latency in seconds (default: 0.1)
 *   - "jitter": Half-width of the uniform confidence noise (default: 0.1)
 *   - "seed": Unsigned 32-bit seed for the confidence noise (default: nondeterministic)
 *
 * Response selection keys on the query text, case-insensitively: queries
 * mentioning "sql" or "database" get the database template of the pattern,
 * queries mentioning "data" get the data template, others the generic one.
 *
 * Confidence scoring:
 *   base_confidence, x0.8 for responses shorter than 50 characters, x1.1 for
 *   responses longer than 200, x0.9 for queries of more than 10 words, plus
 *   uniform noise in [-jitter, +jitter], clamped to [0, 1].
 */
class ReferenceBackend : public IBackend {
public:
    /**
     * @throws ConfigurationError If a numeric parameter cannot be parsed or is out of range
     */
    explicit ReferenceBackend(const BackendConfig& config);

    std::string generate_response(
        const std::string& query,
        const QueryContext* context,
        const CancellationToken& cancel
    ) override;

    double get_confidence(const std::string& query, const std::string& response) override;

    const std::string& response_pattern() const { return response_pattern_; }
    double base_confidence() const { return base_confidence_; }
    double response_delay() const { return response_delay_; }

private:
    std::string response_pattern_;
    double base_confidence_;
    double response_delay_;
    double jitter_;

    std::mutex rng_mutex_;
    std::mt19937 rng_;

    std::string render_template(const std::string& query) const;
    double parse_param(const std::string& key, double default_value) const;
    std::mt19937::result_type parse_seed(const std::string& text) const;
};

} // namespace quorum

#endif // QUORUM_REFERENCE_BACKEND_HPP
