/**
 * @file test_reference_backend.cpp
 * @brief Tests for ReferenceBackend and BackendFactory
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/backend_factory.hpp"
#include "../src/reference_backend.hpp"
#include <chrono>
#include <thread>

using namespace quorum;

namespace {

BackendConfig make_config(const std::string& id, const std::string& pattern) {
    BackendConfig config(id, "reference");
    config.params["response_pattern"] = pattern;
    config.params["response_delay"] = "0";
    config.params["jitter"] = "0";
    return config;
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace

// ============================================================================
// Response templates
// ============================================================================

TEST_CASE("ReferenceBackend: analytical pattern", "[reference]") {
    ReferenceBackend backend(make_config("analyst", "analytical"));
    CancellationToken cancel;

    std::string database = backend.generate_response("Optimize this SQL join", nullptr, cancel);
    REQUIRE(contains(database, "Based on analytical assessment: Optimize this SQL join"));
    REQUIRE(contains(database, "indexing"));

    std::string data = backend.generate_response("Clean the data set", nullptr, cancel);
    REQUIRE(contains(data, "From an analytical perspective"));

    std::string other = backend.generate_response("Plan the sprint", nullptr, cancel);
    REQUIRE(contains(other, "Analytical response to: Plan the sprint"));
}

TEST_CASE("ReferenceBackend: creative and conservative patterns", "[reference]") {
    CancellationToken cancel;

    ReferenceBackend creative(make_config("ideas", "Creative"));
    REQUIRE(creative.response_pattern() == "creative");
    REQUIRE(contains(creative.generate_response("Tune the database", nullptr, cancel),
                     "Creative approach to"));

    ReferenceBackend conservative(make_config("skeptic", "conservative"));
    REQUIRE(contains(conservative.generate_response("Tune the database", nullptr, cancel),
                     "Conservative recommendation for"));
    REQUIRE(contains(conservative.generate_response("Write a poem", nullptr, cancel),
                     "Conservative response to"));
}

TEST_CASE("ReferenceBackend: unknown pattern uses the generic template", "[reference]") {
    ReferenceBackend backend(make_config("plain", "whatever"));
    CancellationToken cancel;

    std::string response = backend.generate_response("hello", nullptr, cancel);
    REQUIRE(response == "Standard response to: hello. This is a general-purpose answer from plain.");
}

// ============================================================================
// Confidence
// ============================================================================

TEST_CASE("ReferenceBackend: confidence without jitter is deterministic", "[reference]") {
    BackendConfig config = make_config("analyst", "analytical");
    config.params["base_confidence"] = "0.8";
    ReferenceBackend backend(config);
    CancellationToken cancel;

    SECTION("Medium response, short query") {
        std::string query = "How do I speed up this SQL query?";
        std::string response = backend.generate_response(query, nullptr, cancel);
        REQUIRE(response.size() >= 50);
        REQUIRE(response.size() <= 200);
        REQUIRE(backend.get_confidence(query, response) == Catch::Approx(0.8));
    }

    SECTION("Long response, long query") {
        std::string query;
        for (int i = 0; i < 30; ++i) {
            query += "alpha ";
        }
        std::string response = backend.generate_response(query, nullptr, cancel);
        REQUIRE(response.size() > 200);
        REQUIRE(backend.get_confidence(query, response) == Catch::Approx(0.8 * 1.1 * 0.9));
    }

    SECTION("Short response") {
        REQUIRE(backend.get_confidence("q", "tiny") == Catch::Approx(0.8 * 0.8));
    }
}

TEST_CASE("ReferenceBackend: confidence stays in [0, 1] with jitter", "[reference]") {
    BackendConfig config("noisy", "reference");
    config.params["base_confidence"] = "0.98";
    config.params["jitter"] = "0.5";
    config.params["seed"] = "42";
    ReferenceBackend backend(config);

    std::string long_response(300, 'x');
    for (int i = 0; i < 200; ++i) {
        double confidence = backend.get_confidence("q", long_response);
        REQUIRE(confidence >= 0.0);
        REQUIRE(confidence <= 1.0);
    }
}

TEST_CASE("ReferenceBackend: seeded jitter is reproducible", "[reference]") {
    BackendConfig config("seeded", "reference");
    config.params["seed"] = "7";
    ReferenceBackend first(config);
    ReferenceBackend second(config);

    for (int i = 0; i < 10; ++i) {
        REQUIRE(first.get_confidence("q", "some response text") ==
                second.get_confidence("q", "some response text"));
    }
}

// ============================================================================
// Latency and cancellation
// ============================================================================

TEST_CASE("ReferenceBackend: response delay is simulated", "[reference]") {
    BackendConfig config("slow", "reference");
    config.params["response_delay"] = "0.1";
    ReferenceBackend backend(config);
    CancellationToken cancel;

    auto start = std::chrono::steady_clock::now();
    backend.generate_response("q", nullptr, cancel);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    REQUIRE(elapsed >= 0.09);
}

TEST_CASE("ReferenceBackend: cancellation interrupts the delay", "[reference]") {
    BackendConfig config("slow", "reference");
    config.params["response_delay"] = "10";
    ReferenceBackend backend(config);
    CancellationToken cancel;

    std::thread canceller([cancel]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(backend.generate_response("q", nullptr, cancel), CancelledError);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    canceller.join();

    REQUIRE(elapsed < 2.0);
}

TEST_CASE("ReferenceBackend: very long delay is still interruptible", "[reference]") {
    BackendConfig config("glacial", "reference");
    config.params["response_delay"] = "1e10";
    ReferenceBackend backend(config);
    CancellationToken cancel;

    std::thread canceller([cancel]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(backend.generate_response("q", nullptr, cancel), CancelledError);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    canceller.join();

    REQUIRE(elapsed >= 0.09);   // Waited for the cancellation instead of returning at once
    REQUIRE(elapsed < 2.0);
}

// ============================================================================
// Parameter validation
// ============================================================================

TEST_CASE("ReferenceBackend: invalid parameters are rejected", "[reference]") {
    BackendConfig config("bad", "reference");

    SECTION("Non-numeric confidence") {
        config.params["base_confidence"] = "high";
        REQUIRE_THROWS_AS(ReferenceBackend(config), ConfigurationError);
    }

    SECTION("Trailing garbage") {
        config.params["response_delay"] = "0.5s";
        REQUIRE_THROWS_AS(ReferenceBackend(config), ConfigurationError);
    }

    SECTION("Confidence out of range") {
        config.params["base_confidence"] = "1.5";
        REQUIRE_THROWS_AS(ReferenceBackend(config), ConfigurationError);
    }

    SECTION("Negative delay") {
        config.params["response_delay"] = "-1";
        REQUIRE_THROWS_AS(ReferenceBackend(config), ConfigurationError);
    }

    SECTION("Jitter out of range") {
        config.params["jitter"] = "2";
        REQUIRE_THROWS_AS(ReferenceBackend(config), ConfigurationError);
    }

    SECTION("Non-finite values") {
        config.params["response_delay"] = "inf";
        REQUIRE_THROWS_AS(ReferenceBackend(config), ConfigurationError);
        config.params["response_delay"] = "0";
        config.params["base_confidence"] = "nan";
        REQUIRE_THROWS_AS(ReferenceBackend(config), ConfigurationError);
    }

    SECTION("Seed outside the unsigned 32-bit range") {
        config.params["seed"] = "-1";
        REQUIRE_THROWS_AS(ReferenceBackend(config), ConfigurationError);
        config.params["seed"] = "4294967296";
        REQUIRE_THROWS_AS(ReferenceBackend(config), ConfigurationError);
        config.params["seed"] = "99999999999999999999999";
        REQUIRE_THROWS_AS(ReferenceBackend(config), ConfigurationError);
    }

    SECTION("Seed that is not an integer") {
        config.params["seed"] = "1e3";
        REQUIRE_THROWS_AS(ReferenceBackend(config), ConfigurationError);
        config.params["seed"] = "abc";
        REQUIRE_THROWS_AS(ReferenceBackend(config), ConfigurationError);
        config.params["seed"] = "";
        REQUIRE_THROWS_AS(ReferenceBackend(config), ConfigurationError);
    }
}

TEST_CASE("ReferenceBackend: largest seed is accepted", "[reference]") {
    BackendConfig config("seeded", "reference");
    config.params["seed"] = "4294967295";
    REQUIRE_NOTHROW(ReferenceBackend(config));
}

TEST_CASE("ReferenceBackend: defaults", "[reference]") {
    ReferenceBackend backend(BackendConfig("plain", "reference"));

    REQUIRE(backend.response_pattern() == "default");
    REQUIRE(backend.base_confidence() == Catch::Approx(0.8));
    REQUIRE(backend.response_delay() == Catch::Approx(0.1));
}

// ============================================================================
// Factory
// ============================================================================

TEST_CASE("BackendFactory: creates reference backends", "[factory]") {
    BackendFactory factory;

    auto backend = factory.create_backend(make_config("analyst", "analytical"));
    REQUIRE(backend != nullptr);
    REQUIRE(backend->backend_id() == "analyst");
    REQUIRE(dynamic_cast<ReferenceBackend*>(backend.get()) != nullptr);

    BackendConfig mock("legacy", "MOCK");
    REQUIRE(factory.create_backend(mock) != nullptr);
}

TEST_CASE("BackendFactory: kind names", "[factory]") {
    BackendFactory factory;

    REQUIRE(factory.is_supported("reference"));
    REQUIRE(factory.is_supported("Reference"));
    REQUIRE(factory.is_supported("mock"));
    REQUIRE_FALSE(factory.is_supported("gpt"));

    REQUIRE(parse_backend_kind("mock") == BackendKind::REFERENCE);
    REQUIRE(kind_to_string(BackendKind::REFERENCE) == "reference");
    REQUIRE_THROWS_AS(parse_backend_kind("gpt"), ConfigurationError);

    auto kinds = factory.list_backend_kinds();
    REQUIRE_FALSE(kinds.empty());
    REQUIRE(kinds[0] == "reference");
}

TEST_CASE("BackendFactory: invalid configuration is rejected", "[factory]") {
    BackendFactory factory;

    BackendConfig unknown("x", "gpt");
    REQUIRE_THROWS_AS(factory.create_backend(unknown), ConfigurationError);

    BackendConfig bad_weight("x", "reference");
    bad_weight.weight = 11.0;
    REQUIRE_THROWS_AS(factory.create_backend(bad_weight), ConfigurationError);
}
