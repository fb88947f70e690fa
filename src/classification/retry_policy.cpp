// src/classification/retry_policy.cpp
#include "holdings_ngin/classification/retry_policy.hpp"
#include <cmath>
#include <cstdint>

namespace holdings_ngin {

std::chrono::milliseconds RetryPolicy::backoff_for(int retry) const {
    if (retry < 1) {
        return std::chrono::milliseconds(0);
    }
    double delay = static_cast<double>(initial_backoff.count()) *
                   std::pow(backoff_multiplier, static_cast<double>(retry - 1));
    delay = std::min(delay, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

std::vector<ConfigValidationError> RetryPolicy::validate() const {
    std::vector<ConfigValidationError> errors;
    if (max_attempts < 1) {
        errors.push_back({"retry.max_attempts", "Must be at least 1"});
    }
    if (initial_backoff.count() < 0 || max_backoff.count() < 0) {
        errors.push_back({"retry.backoff", "Backoff durations must not be negative"});
    }
    if (backoff_multiplier < 1.0) {
        errors.push_back({"retry.backoff_multiplier", "Must be at least 1.0"});
    }
    return errors;
}

nlohmann::json RetryPolicy::to_json() const {
    nlohmann::json j;
    j["max_attempts"] = max_attempts;
    j["initial_backoff_ms"] = initial_backoff.count();
    j["backoff_multiplier"] = backoff_multiplier;
    j["max_backoff_ms"] = max_backoff.count();

    std::vector<std::string> codes;
    for (auto code : retryable_codes) {
        codes.push_back(error_code_to_string(code));
    }
    j["retryable_codes"] = codes;
    return j;
}

void RetryPolicy::from_json(const nlohmann::json& j) {
    if (j.contains("max_attempts"))
        max_attempts = j.at("max_attempts").get<int>();
    if (j.contains("initial_backoff_ms"))
        initial_backoff = std::chrono::milliseconds(j.at("initial_backoff_ms").get<int64_t>());
    if (j.contains("backoff_multiplier"))
        backoff_multiplier = j.at("backoff_multiplier").get<double>();
    if (j.contains("max_backoff_ms"))
        max_backoff = std::chrono::milliseconds(j.at("max_backoff_ms").get<int64_t>());
    if (j.contains("retryable_codes")) {
        static const ErrorCode known[] = {ErrorCode::TIMEOUT_ERROR, ErrorCode::CONNECTION_ERROR,
                                          ErrorCode::API_ERROR,     ErrorCode::DATABASE_ERROR,
                                          ErrorCode::DATA_NOT_FOUND, ErrorCode::UNKNOWN_ERROR};
        retryable_codes.clear();
        for (const auto& name : j.at("retryable_codes")) {
            for (auto code : known) {
                if (error_code_to_string(code) == name.get<std::string>())
                    retryable_codes.insert(code);
            }
        }
    }
}

}  // namespace holdings_ngin
