#include <fstream>
#include <iomanip>
#include <iostream>
#include "holdings_ngin/core/logger.hpp"
#include "holdings_ngin/pipeline/consolidation_pipeline.hpp"

using namespace holdings_ngin;

namespace {

Result<std::vector<ProviderPayload>> load_payloads(const std::string& path) {
    using ReturnType = std::vector<ProviderPayload>;
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<ReturnType>(ErrorCode::FILE_NOT_FOUND,
                                      "Failed to open payload file: " + path, "holdings_consolidate");
    }

    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_array()) {
            return make_error<ReturnType>(ErrorCode::INVALID_DATA,
                                          "Payload file must contain an array of payloads",
                                          "holdings_consolidate");
        }

        ReturnType payloads;
        for (const auto& entry : j) {
            ProviderPayload payload;
            payload.provider_id = entry.value("provider_id", "");
            payload.format = entry.value("format", "");
            payload.payload = entry.contains("payload") ? entry.at("payload") : nlohmann::json();
            payloads.push_back(std::move(payload));
        }
        return payloads;
    } catch (const nlohmann::json::exception& e) {
        return make_error<ReturnType>(ErrorCode::JSON_PARSE_ERROR,
                                      "Invalid payload file: " + std::string(e.what()),
                                      "holdings_consolidate");
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " <config.json> <payloads.json>" << std::endl;
        return 2;
    }

    try {
        PipelineConfig config;
        auto loaded = config.load_from_file(argv[1]);
        if (loaded.is_error()) {
            std::cerr << "Failed to load configuration: " << loaded.error()->what() << std::endl;
            return 1;
        }

        // Results go to stdout, so keep log lines off it
        if (config.logging.destination == LogDestination::CONSOLE) {
            config.logging.destination = LogDestination::FILE;
        }
        Logger::instance().initialize(config.logging);
        Logger::register_component("holdings_consolidate");

        auto cache = make_classification_cache(config);
        if (cache.is_error()) {
            std::cerr << "Failed to build classification cache: " << cache.error()->what()
                      << std::endl;
            return 1;
        }

        auto pipeline = ConsolidationPipeline::create(config, cache.value());
        if (pipeline.is_error()) {
            std::cerr << "Failed to start pipeline: " << pipeline.error()->what() << std::endl;
            return 1;
        }

        auto payloads = load_payloads(argv[2]);
        if (payloads.is_error()) {
            std::cerr << payloads.error()->what() << std::endl;
            return 1;
        }

        auto result = pipeline.value()->run(payloads.value());
        std::cout << std::setw(2) << result.to_json() << std::endl;
        INFO("Cache stats: " << cache.value()->stats().to_json().dump());
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
