/**
 * @file parallel_query_example.cpp
 * @brief Example dispatching one query to several backends in parallel
 *
 * This example shows how to:
 * - Load orchestrator settings from a JSON file (or use the default trio)
 * - Configure the logger from those settings
 * - Run health checks and a parallel query
 * - Inspect outcomes, circuit breaker state and executor statistics
 *
 * Usage: parallel_query_example [config.json] [query...]
 */

#include "../src/config_parser.hpp"
#include "../src/logger.hpp"
#include "../src/orchestrator.hpp"
#include <iomanip>
#include <iostream>

using namespace quorum;

int main(int argc, char** argv) {
    QuorumSettings settings;

    try {
        if (argc > 1) {
            settings = parse_settings_from_file(argv[1]);
        } else {
            settings = parse_settings_from_string("{}");
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 1;
    }

    Logger& logger = Logger::get_instance();
    logger.configure(settings.logging);

    std::string query = "How should I index the orders table for this SQL query?";
    if (argc > 2) {
        query.clear();
        for (int i = 2; i < argc; ++i) {
            if (!query.empty()) query += " ";
            query += argv[i];
        }
    }

    std::unique_ptr<Orchestrator> orchestrator;
    try {
        orchestrator = build_orchestrator(settings, &logger);
    } catch (const std::exception& e) {
        std::cerr << "Failed to register backends: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Registered backends:\n";
    for (const auto& [backend_id, info] : orchestrator->describe_backends()) {
        std::cout << "  " << backend_id << " (kind=" << info.backend_kind
                  << ", weight=" << info.weight
                  << ", timeout=" << info.timeout << "s"
                  << ", retries=" << info.max_retries
                  << (info.enabled ? "" : ", disabled") << ")\n";
    }

    std::cout << "\nHealth checks:\n";
    for (const auto& [backend_id, healthy] : orchestrator->health_check_all()) {
        std::cout << "  " << backend_id << ": " << (healthy ? "PASS" : "FAIL") << "\n";
    }

    QueryContext context("sql_optimization");
    context.hints["dialect"] = "postgres";

    std::cout << "\nQuery: " << query << "\n\nOutcomes:\n";
    std::vector<Outcome> outcomes = orchestrator->execute_parallel(query, &context);

    size_t usable = 0;
    for (const auto& outcome : outcomes) {
        std::cout << "  [" << status_to_string(outcome.status()) << "] " << outcome.backend_id()
                  << " in " << std::fixed << std::setprecision(3) << outcome.execution_time() << "s";
        if (outcome.confidence()) {
            std::cout << " confidence=" << std::setprecision(2) << *outcome.confidence();
        }
        if (outcome.error_message()) {
            std::cout << " error=\"" << *outcome.error_message() << "\"";
        }
        std::cout << "\n";
        if (outcome.content()) {
            std::cout << "      " << *outcome.content() << "\n";
        }
        if (outcome.is_valid()) {
            usable++;
        }
    }

    std::cout << "\nSummary: " << usable << "/" << outcomes.size() << " usable outcomes\n";
    for (const auto& [backend_id, stats] : orchestrator->get_backend_stats()) {
        std::cout << "  " << backend_id << ": failures=" << orchestrator->circuit_state(backend_id).failure_count
                  << " successes=" << stats.successful_runs
                  << " timeouts=" << stats.timeout_count
                  << " errors=" << stats.failed_runs << "\n";
    }

    logger.flush();
    return usable > 0 ? 0 : 1;
}
