/**
 * @file test_circuit_breaker.cpp
 * @brief Tests for per-backend failure counting and cooldown recovery
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/circuit_breaker.hpp"
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace quorum;

TEST_CASE("CircuitBreaker: starts closed", "[circuit]") {
    CircuitBreaker breaker;

    REQUIRE_FALSE(breaker.is_open());
    REQUIRE(breaker.state().failure_count == 0);
    REQUIRE(breaker.threshold() == 5);
    REQUIRE(breaker.cooldown().count() == 60.0);
}

TEST_CASE("CircuitBreaker: opens when failures reach the threshold", "[circuit]") {
    CircuitBreaker breaker(3, std::chrono::seconds(60));

    REQUIRE_FALSE(breaker.record_failure());
    REQUIRE_FALSE(breaker.record_failure());
    REQUIRE_FALSE(breaker.is_open());

    REQUIRE(breaker.record_failure());   // Reports the transition once
    REQUIRE(breaker.is_open());
    REQUIRE_FALSE(breaker.record_failure());
    REQUIRE(breaker.is_open());
    REQUIRE(breaker.state().failure_count == 4);
}

TEST_CASE("CircuitBreaker: success decrements the count", "[circuit]") {
    CircuitBreaker breaker(3, std::chrono::seconds(60));

    breaker.record_failure();
    breaker.record_failure();
    breaker.record_success();
    REQUIRE(breaker.state().failure_count == 1);

    breaker.record_success();
    breaker.record_success();
    REQUIRE(breaker.state().failure_count == 0);   // Floored at zero
}

TEST_CASE("CircuitBreaker: closes again after the cooldown", "[circuit]") {
    CircuitBreaker breaker(2, std::chrono::milliseconds(100));

    breaker.record_failure();
    breaker.record_failure();

    bool was_reset = true;
    REQUIRE(breaker.is_open(&was_reset));
    REQUIRE_FALSE(was_reset);

    std::this_thread::sleep_for(std::chrono::milliseconds(150));

    REQUIRE_FALSE(breaker.is_open(&was_reset));
    REQUIRE(was_reset);
    REQUIRE(breaker.state().failure_count == 0);

    REQUIRE_FALSE(breaker.is_open(&was_reset));
    REQUIRE_FALSE(was_reset);
}

TEST_CASE("CircuitBreaker: records the last failure time", "[circuit]") {
    CircuitBreaker breaker;
    auto before = std::chrono::steady_clock::now();

    breaker.record_failure();

    REQUIRE(breaker.state().last_failure_time >= before);
}

TEST_CASE("CircuitBreaker: invalid parameters are rejected", "[circuit]") {
    REQUIRE_THROWS_AS(CircuitBreaker(0), std::invalid_argument);
    REQUIRE_THROWS_AS(CircuitBreaker(3, std::chrono::seconds(-1)), std::invalid_argument);
}
