#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include "holdings_ngin/core/logger.hpp"
#include "holdings_ngin/pipeline/consolidation_pipeline.hpp"

using namespace holdings_ngin;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " <config.json> refresh-stale <max_age_days>\n"
              << "  " << program << " <config.json> refresh <ticker>..." << std::endl;
}

void print_result(const ResolutionResult& result, const ClassificationCache& cache) {
    nlohmann::json j;
    j["classifications"] = nlohmann::json::object();
    for (const auto& [ticker, classification] : result.classifications) {
        j["classifications"][ticker] = {
            {"security_type", security_type_to_string(classification.type)},
            {"tier", classification_tier_to_string(classification.tier)}};
    }
    j["warnings"] = nlohmann::json::array();
    for (const auto& warning : result.warnings) {
        j["warnings"].push_back(warning.to_json());
    }
    j["stats"] = cache.stats().to_json();
    std::cout << std::setw(2) << j << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 2;
    }

    const std::string command = argv[2];
    if (command != "refresh-stale" && command != "refresh") {
        print_usage(argv[0]);
        return 2;
    }

    try {
        PipelineConfig config;
        auto loaded = config.load_from_file(argv[1]);
        if (loaded.is_error()) {
            std::cerr << "Failed to load configuration: " << loaded.error()->what() << std::endl;
            return 1;
        }

        Logger::instance().initialize(config.logging);
        Logger::register_component("classification_admin");

        if (config.database_connection_string.empty()) {
            std::cerr << "database_connection_string is required for administrative commands"
                      << std::endl;
            return 1;
        }

        auto cache = make_classification_cache(config);
        if (cache.is_error()) {
            std::cerr << "Failed to build classification cache: " << cache.error()->what()
                      << std::endl;
            return 1;
        }

        if (command == "refresh-stale") {
            int days = 0;
            try {
                days = std::stoi(argv[3]);
            } catch (const std::exception&) {
                std::cerr << "max_age_days must be an integer: " << argv[3] << std::endl;
                return 2;
            }
            if (days < 0) {
                std::cerr << "max_age_days must not be negative" << std::endl;
                return 2;
            }

            auto refreshed = cache.value()->refresh_stale(std::chrono::hours(24 * days));
            if (refreshed.is_error()) {
                std::cerr << "Refresh failed: " << refreshed.error()->what() << std::endl;
                return 1;
            }
            print_result(refreshed.value(), *cache.value());
            return 0;
        }

        std::vector<std::string> tickers(argv + 3, argv + argc);
        print_result(cache.value()->force_refresh(tickers), *cache.value());
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
