/**
 * @file backend_factory.cpp
 * @brief Implementation of BackendFactory
 */

#include "backend_factory.hpp"
#include "reference_backend.hpp"
#include <algorithm>
#include <cctype>

namespace quorum {

std::string kind_to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::REFERENCE: return BackendKindName::REFERENCE;
    }
    return "unknown";
}

BackendKind parse_backend_kind(const std::string& kind_name) {
    std::string lowered = kind_name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == BackendKindName::REFERENCE || lowered == BackendKindName::MOCK) {
        return BackendKind::REFERENCE;
    }

    throw ConfigurationError("Unknown backend kind: " + kind_name +
                             ". Available kinds: " + BackendKindName::REFERENCE +
                             " (alias: " + BackendKindName::MOCK + ")");
}

std::shared_ptr<IBackend> BackendFactory::create_backend(const BackendConfig& config) const {
    validate_backend_config(config);

    switch (parse_backend_kind(config.backend_kind)) {
        case BackendKind::REFERENCE:
            return std::make_shared<ReferenceBackend>(config);
    }
    throw ConfigurationError("Unhandled backend kind: " + config.backend_kind);
}

bool BackendFactory::is_supported(const std::string& kind_name) const {
    try {
        parse_backend_kind(kind_name);
        return true;
    } catch (const ConfigurationError&) {
        return false;
    }
}

std::vector<std::string> BackendFactory::list_backend_kinds() const {
    return {kind_to_string(BackendKind::REFERENCE)};
}

} // namespace quorum
