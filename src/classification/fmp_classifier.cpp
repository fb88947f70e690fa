// src/classification/fmp_classifier.cpp
#include "holdings_ngin/classification/fmp_classifier.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <mutex>
#include "holdings_ngin/core/logger.hpp"

namespace holdings_ngin {

namespace {

size_t write_callback(char* data, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(data, size * nmemb);
    return size * nmemb;
}

void ensure_curl_global_init() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains_word(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(needle) != std::string::npos;
}

std::string string_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return "";
    return it->get<std::string>();
}

}  // namespace

std::string FmpConfig::resolved_api_key() const {
    if (!api_key.empty())
        return api_key;
    const char* env = std::getenv("FMP_API_KEY");
    return env ? std::string(env) : std::string();
}

nlohmann::json FmpConfig::to_json() const {
    nlohmann::json j;
    j["base_url"] = base_url;
    // api_key is a credential and is never written back out
    j["request_timeout_ms"] = request_timeout.count();
    return j;
}

void FmpConfig::from_json(const nlohmann::json& j) {
    if (j.contains("base_url"))
        base_url = j.at("base_url").get<std::string>();
    if (j.contains("api_key"))
        api_key = j.at("api_key").get<std::string>();
    if (j.contains("request_timeout_ms"))
        request_timeout = std::chrono::milliseconds(j.at("request_timeout_ms").get<int64_t>());
}

FmpClassifier::FmpClassifier(FmpConfig config) : config_(std::move(config)) {
    ensure_curl_global_init();
}

Result<AuthoritativeClassification> FmpClassifier::lookup(const std::string& ticker) {
    auto api_key = config_.resolved_api_key();
    if (api_key.empty()) {
        return make_error<AuthoritativeClassification>(
            ErrorCode::INVALID_CONFIGURATION, "FMP API key is not configured", "FmpClassifier");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error<AuthoritativeClassification>(ErrorCode::API_ERROR,
                                                       "Failed to initialize curl",
                                                       "FmpClassifier");
    }
    char* escaped = curl_easy_escape(curl, ticker.c_str(), static_cast<int>(ticker.size()));
    std::string symbol = escaped ? escaped : ticker;
    curl_free(escaped);
    curl_easy_cleanup(curl);

    auto body = http_get(config_.base_url + "/profile?symbol=" + symbol + "&apikey=" + api_key);
    if (body.is_error()) {
        return make_error<AuthoritativeClassification>(body.error()->code(), body.error()->what(),
                                                       "FmpClassifier");
    }
    return parse_profile(ticker, body.value());
}

Result<std::string> FmpClassifier::http_get(const std::string& url) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error<std::string>(ErrorCode::API_ERROR, "Failed to initialize curl",
                                       "FmpClassifier");
    }

    std::string body;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.request_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return make_error<std::string>(ErrorCode::TIMEOUT_ERROR, "FMP request timed out",
                                       "FmpClassifier");
    }
    if (res == CURLE_COULDNT_CONNECT || res == CURLE_COULDNT_RESOLVE_HOST) {
        return make_error<std::string>(ErrorCode::CONNECTION_ERROR,
                                       "FMP unreachable: " + std::string(curl_easy_strerror(res)),
                                       "FmpClassifier");
    }
    if (res != CURLE_OK) {
        return make_error<std::string>(ErrorCode::API_ERROR,
                                       "FMP request failed: " + std::string(curl_easy_strerror(res)),
                                       "FmpClassifier");
    }
    if (status == 404) {
        return make_error<std::string>(ErrorCode::DATA_NOT_FOUND, "FMP returned 404",
                                       "FmpClassifier");
    }
    if (status < 200 || status >= 300) {
        return make_error<std::string>(ErrorCode::API_ERROR,
                                       "FMP returned HTTP " + std::to_string(status),
                                       "FmpClassifier");
    }
    return body;
}

Result<AuthoritativeClassification> FmpClassifier::parse_profile(const std::string& ticker,
                                                                 const std::string& body) {
    try {
        auto data = nlohmann::json::parse(body);
        if (!data.is_array() || data.empty() || !data.front().is_object()) {
            return make_error<AuthoritativeClassification>(
                ErrorCode::DATA_NOT_FOUND, "No profile data returned for " + ticker,
                "FmpClassifier");
        }

        const auto& profile = data.front();
        AuthoritativeClassification result;
        result.is_etf = profile.value("isEtf", false);
        result.is_fund = profile.value("isFund", false);

        auto name = string_field(profile, "companyName");
        auto industry = string_field(profile, "industry");
        auto exchange = string_field(profile, "exchange");

        result.is_cash_marker =
            contains_word(name, "money market") || contains_word(industry, "money market");
        result.is_bond = !result.is_etf && !result.is_fund && contains_word(industry, "bond");
        result.is_crypto = exchange == "CRYPTO" || exchange == "CCC";
        result.description = name.empty() ? industry : name;
        return result;

    } catch (const nlohmann::json::exception& e) {
        return make_error<AuthoritativeClassification>(
            ErrorCode::JSON_PARSE_ERROR,
            "Invalid FMP profile for " + ticker + ": " + std::string(e.what()), "FmpClassifier");
    }
}

}  // namespace holdings_ngin
