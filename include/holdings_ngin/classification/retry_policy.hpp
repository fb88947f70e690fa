// include/holdings_ngin/classification/retry_policy.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "holdings_ngin/core/config_base.hpp"
#include "holdings_ngin/core/error.hpp"
#include "holdings_ngin/core/logger.hpp"

namespace holdings_ngin {

/**
 * @brief Exponential backoff retry for operations returning Result
 */
struct RetryPolicy : public ConfigBase {
    int max_attempts{3};
    std::chrono::milliseconds initial_backoff{std::chrono::milliseconds(100)};
    double backoff_multiplier{2.0};
    std::chrono::milliseconds max_backoff{std::chrono::milliseconds(2000)};
    std::set<ErrorCode> retryable_codes{ErrorCode::TIMEOUT_ERROR, ErrorCode::CONNECTION_ERROR,
                                        ErrorCode::API_ERROR};

    bool is_retryable(ErrorCode code) const {
        return retryable_codes.count(code) > 0;
    }

    /**
     * @brief Delay before the given retry (1 = first retry)
     */
    std::chrono::milliseconds backoff_for(int retry) const;

    /**
     * @brief Run func until it succeeds, fails with a non-retryable code, or
     * max_attempts is reached
     * @param operation Name used in log messages
     */
    template <typename Func>
    auto execute(Func func, const std::string& operation) const -> decltype(func()) {
        const int attempts = std::max(1, max_attempts);
        for (int attempt = 1;; ++attempt) {
            auto result = func();
            if (!result.is_error() || attempt >= attempts ||
                !is_retryable(result.error()->code())) {
                return result;
            }

            auto delay = backoff_for(attempt);
            WARN(operation << " failed, retrying (attempt " << attempt + 1 << " of " << attempts
                           << ") in " << delay.count() << "ms: " << result.error()->what());
            std::this_thread::sleep_for(delay);
        }
    }

    std::vector<ConfigValidationError> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace holdings_ngin
