/**
 * @file reference_backend.cpp
 * @brief Implementation of ReferenceBackend
 */

#include "reference_backend.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>

namespace quorum {

namespace {

std::string to_lower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

size_t count_words(const std::string& text) {
    std::istringstream iss(text);
    size_t count = 0;
    std::string word;
    while (iss >> word) {
        count++;
    }
    return count;
}

} // namespace

ReferenceBackend::ReferenceBackend(const BackendConfig& config)
    : IBackend(config),
      response_pattern_("default"),
      base_confidence_(0.8),
      response_delay_(0.1),
      jitter_(0.1) {

    auto it = config_.params.find("response_pattern");
    if (it != config_.params.end() && !it->second.empty()) {
        response_pattern_ = to_lower(it->second);
    }

    base_confidence_ = parse_param("base_confidence", 0.8);
    if (base_confidence_ < 0.0 || base_confidence_ > 1.0) {
        throw ConfigurationError("base_confidence must be between 0 and 1 for backend '" +
                                 config_.backend_id + "'");
    }

    response_delay_ = parse_param("response_delay", 0.1);
    if (response_delay_ < 0.0) {
        throw ConfigurationError("response_delay cannot be negative for backend '" +
                                 config_.backend_id + "'");
    }

    jitter_ = parse_param("jitter", 0.1);
    if (jitter_ < 0.0 || jitter_ > 1.0) {
        throw ConfigurationError("jitter must be between 0 and 1 for backend '" +
                                 config_.backend_id + "'");
    }

    it = config_.params.find("seed");
    if (it != config_.params.end()) {
        rng_.seed(parse_seed(it->second));
    } else {
        rng_.seed(std::random_device{}());
    }
}

std::string ReferenceBackend::generate_response(
    const std::string& query,
    const QueryContext* /*context*/,
    const CancellationToken& cancel
) {
    if (response_delay_ > 0.0) {
        if (cancel.wait_for(bounded_wait(response_delay_))) {
            throw CancelledError("backend " + config_.backend_id + " stopped before responding");
        }
    }

    return render_template(query);
}

double ReferenceBackend::get_confidence(const std::string& query, const std::string& response) {
    double confidence = base_confidence_;

    if (response.size() < 50) {
        confidence *= 0.8;
    } else if (response.size() > 200) {
        confidence *= 1.1;
    }

    if (count_words(query) > 10) {
        confidence *= 0.9;
    }

    if (jitter_ > 0.0) {
        std::uniform_real_distribution<double> noise(-jitter_, jitter_);
        std::lock_guard<std::mutex> lock(rng_mutex_);
        confidence += noise(rng_);
    }

    return std::max(0.0, std::min(1.0, confidence));
}

std::string ReferenceBackend::render_template(const std::string& query) const {
    const std::string lowered = to_lower(query);
    const bool about_database = lowered.find("sql") != std::string::npos ||
                                lowered.find("database") != std::string::npos;
    const bool about_data = lowered.find("data") != std::string::npos;

    if (response_pattern_ == "analytical") {
        if (about_database) {
            return "Based on analytical assessment: " + query +
                   ". I recommend using proper indexing and query optimization techniques.";
        }
        if (about_data) {
            return "From an analytical perspective: " + query +
                   ". Consider data validation and statistical significance.";
        }
        return "Analytical response to: " + query +
               ". This requires systematic evaluation of the available information.";
    }

    if (response_pattern_ == "creative") {
        if (about_database) {
            return "Creative approach to: " + query +
                   ". Consider using innovative query patterns and modern database features.";
        }
        if (about_data) {
            return "Creative insight on: " + query +
                   ". Explore unconventional data visualization and analysis methods.";
        }
        return "Creative perspective on: " + query +
               ". Think outside the box and consider alternative approaches.";
    }

    if (response_pattern_ == "conservative") {
        if (about_database) {
            return "Conservative recommendation for: " + query +
                   ". Stick to well-tested SQL patterns and established best practices.";
        }
        if (about_data) {
            return "Conservative analysis of: " + query +
                   ". Use proven statistical methods and validated data sources.";
        }
        return "Conservative response to: " + query +
               ". Follow established procedures and industry standards.";
    }

    return "Standard response to: " + query + ". This is a general-purpose answer from " +
           config_.backend_id + ".";
}

double ReferenceBackend::parse_param(const std::string& key, double default_value) const {
    auto it = config_.params.find(key);
    if (it == config_.params.end()) {
        return default_value;
    }

    try {
        size_t consumed = 0;
        double value = std::stod(it->second, &consumed);
        if (consumed != it->second.size()) {
            throw std::invalid_argument(it->second);
        }
        if (!std::isfinite(value)) {
            throw ConfigurationError("Parameter '" + key + "' of backend '" + config_.backend_id +
                                     "' must be finite: " + it->second);
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw ConfigurationError("Parameter '" + key + "' of backend '" + config_.backend_id +
                                 "' is not a number: " + it->second);
    } catch (const std::out_of_range&) {
        throw ConfigurationError("Parameter '" + key + "' of backend '" + config_.backend_id +
                                 "' is out of range: " + it->second);
    }
}

std::mt19937::result_type ReferenceBackend::parse_seed(const std::string& text) const {
    const bool digits_only = !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
    if (!digits_only) {
        throw ConfigurationError("Parameter 'seed' of backend '" + config_.backend_id +
                                 "' must be a non-negative integer: " + text);
    }

    try {
        unsigned long long value = std::stoull(text);
        if (value > std::numeric_limits<uint32_t>::max()) {
            throw std::out_of_range(text);
        }
        return static_cast<std::mt19937::result_type>(value);
    } catch (const std::out_of_range&) {
        throw ConfigurationError("Parameter 'seed' of backend '" + config_.backend_id +
                                 "' is out of range: " + text);
    }
}

} // namespace quorum
