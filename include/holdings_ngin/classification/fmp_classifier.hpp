// include/holdings_ngin/classification/fmp_classifier.hpp
#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include "holdings_ngin/classification/authoritative_classifier.hpp"
#include "holdings_ngin/core/config_base.hpp"

namespace holdings_ngin {

/**
 * @brief Settings for the Financial Modeling Prep profile endpoint
 */
struct FmpConfig : public ConfigBase {
    std::string base_url{"https://financialmodelingprep.com/stable"};
    std::string api_key;  // falls back to the FMP_API_KEY environment variable
    std::chrono::milliseconds request_timeout{std::chrono::milliseconds(10000)};

    /**
     * @brief api_key, or FMP_API_KEY from the environment when empty
     */
    std::string resolved_api_key() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief AuthoritativeClassifier over FMP company profiles (isEtf / isFund)
 */
class FmpClassifier : public AuthoritativeClassifier {
public:
    explicit FmpClassifier(FmpConfig config);

    Result<AuthoritativeClassification> lookup(const std::string& ticker) override;

    std::string name() const override {
        return "fmp";
    }

    /**
     * @brief Interpret a /profile response body
     */
    static Result<AuthoritativeClassification> parse_profile(const std::string& ticker,
                                                             const std::string& body);

private:
    Result<std::string> http_get(const std::string& url) const;

    FmpConfig config_;
};

}  // namespace holdings_ngin
