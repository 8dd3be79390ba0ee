/**
 * @file backend_factory.hpp
 * @brief Factory for creating query backends by kind
 *
 * Backend kinds form a closed set. The configuration string is resolved to a
 * BackendKind once, and construction is an exhaustive switch over the enum,
 * so adding a kind means one enum value, one case and one IBackend class.
 * Integrators with out-of-tree backends register instances directly with the
 * Orchestrator instead.
 */

#ifndef QUORUM_BACKEND_FACTORY_HPP
#define QUORUM_BACKEND_FACTORY_HPP

#include "backend_interface.hpp"
#include <memory>
#include <string>
#include <vector>

namespace quorum {

/**
 * @brief Backend kinds known to the factory
 */
enum class BackendKind {
    REFERENCE   ///< ReferenceBackend (canned responses, simulated latency)
};

/**
 * @brief Configuration identifiers for backend kinds
 */
namespace BackendKindName {
    constexpr const char* REFERENCE = "reference";
    constexpr const char* MOCK = "mock";   ///< Alias of REFERENCE
}

/**
 * @brief Canonical identifier of a backend kind
 */
std::string kind_to_string(BackendKind kind);

/**
 * @brief Resolve a configuration identifier to a backend kind
 *
 * Matching is case-insensitive.
 *
 * @throws ConfigurationError If the identifier is unknown
 */
BackendKind parse_backend_kind(const std::string& kind_name);

/**
 * @brief Factory for creating backend instances
 *
 * Usage Example:
 *   @code
 *   BackendFactory factory;
 *   BackendConfig config("analyst", BackendKindName::REFERENCE);
 *   std::shared_ptr<IBackend> backend = factory.create_backend(config);
 *   @endcode
 */
class BackendFactory {
public:
    /**
     * @brief Create a backend for the configuration's kind
     *
     * @throws ConfigurationError If the kind is unknown or the parameters are invalid
     */
    std::shared_ptr<IBackend> create_backend(const BackendConfig& config) const;

    /**
     * @brief Check if a configuration identifier names a known kind
     */
    bool is_supported(const std::string& kind_name) const;

    /**
     * @brief Canonical identifiers of all known kinds
     */
    std::vector<std::string> list_backend_kinds() const;
};

} // namespace quorum

#endif // QUORUM_BACKEND_FACTORY_HPP
