// include/holdings_ngin/core/warning.hpp

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace holdings_ngin {

/**
 * @brief Non-fatal conditions surfaced next to a successful result
 */
enum class WarningCode {
    MALFORMED_RECORD,
    MIXED_CURRENCY_SAME_TICKER,
    AUTHORITATIVE_LOOKUP_TIMEOUT,
    AUTHORITATIVE_LOOKUP_FAILURE,
    PERSISTENT_STORE_UNAVAILABLE,
    PERSISTENT_STORE_ERROR,
    EMPTY_INPUT,
    UNKNOWN_PROVIDER,
    UNMAPPED_SECURITY_TYPE
};

inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::MALFORMED_RECORD:
            return "MalformedRecord";
        case WarningCode::MIXED_CURRENCY_SAME_TICKER:
            return "MixedCurrencySameTicker";
        case WarningCode::AUTHORITATIVE_LOOKUP_TIMEOUT:
            return "AuthoritativeLookupTimeout";
        case WarningCode::AUTHORITATIVE_LOOKUP_FAILURE:
            return "AuthoritativeLookupFailure";
        case WarningCode::PERSISTENT_STORE_UNAVAILABLE:
            return "PersistentStoreUnavailable";
        case WarningCode::PERSISTENT_STORE_ERROR:
            return "PersistentStoreError";
        case WarningCode::EMPTY_INPUT:
            return "EmptyInput";
        case WarningCode::UNKNOWN_PROVIDER:
            return "UnknownProvider";
        case WarningCode::UNMAPPED_SECURITY_TYPE:
            return "UnmappedSecurityType";
        default:
            return "Unknown";
    }
}

/**
 * @brief Structured warning
 */
struct Warning {
    WarningCode code;
    std::string message;
    std::string ticker;       // empty when not ticker specific
    std::string provider_id;  // empty when not provider specific

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["code"] = warning_code_to_string(code);
        j["message"] = message;
        if (!ticker.empty())
            j["ticker"] = ticker;
        if (!provider_id.empty())
            j["provider_id"] = provider_id;
        return j;
    }
};

using Warnings = std::vector<Warning>;

/**
 * @brief Append all warnings of src to dst
 */
inline void append_warnings(Warnings& dst, const Warnings& src) {
    dst.insert(dst.end(), src.begin(), src.end());
}

/**
 * @brief Count warnings with the given code
 */
inline size_t count_warnings(const Warnings& warnings, WarningCode code) {
    size_t count = 0;
    for (const auto& w : warnings) {
        if (w.code == code)
            ++count;
    }
    return count;
}

}  // namespace holdings_ngin
