// src/core/types.cpp

#include "holdings_ngin/core/types.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace holdings_ngin {

namespace {
std::string trim_upper(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c); })
                   .base();
    if (begin >= end) {
        return "";
    }
    std::string out(begin, end);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}
}  // namespace

std::string security_type_to_string(SecurityType type) {
    switch (type) {
        case SecurityType::EQUITY:
            return "equity";
        case SecurityType::ETF:
            return "etf";
        case SecurityType::FUND:
            return "fund";
        case SecurityType::MUTUAL_FUND:
            return "mutual_fund";
        case SecurityType::BOND:
            return "bond";
        case SecurityType::CASH:
            return "cash";
        case SecurityType::CRYPTO:
            return "crypto";
        case SecurityType::COMMODITY:
            return "commodity";
        case SecurityType::DERIVATIVE:
            return "derivative";
        case SecurityType::WARRANT:
            return "warrant";
        default:
            return "unknown";
    }
}

std::optional<SecurityType> security_type_from_string(const std::string& name) {
    static const std::unordered_map<std::string, SecurityType> types = {
        {"equity", SecurityType::EQUITY},           {"etf", SecurityType::ETF},
        {"fund", SecurityType::FUND},               {"mutual_fund", SecurityType::MUTUAL_FUND},
        {"bond", SecurityType::BOND},               {"cash", SecurityType::CASH},
        {"crypto", SecurityType::CRYPTO},           {"commodity", SecurityType::COMMODITY},
        {"derivative", SecurityType::DERIVATIVE},   {"warrant", SecurityType::WARRANT},
        {"unknown", SecurityType::UNKNOWN}};

    auto it = types.find(name);
    if (it == types.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string security_type_to_asset_class(SecurityType type) {
    switch (type) {
        case SecurityType::EQUITY:
            return "equity";
        case SecurityType::CASH:
            return "cash";
        case SecurityType::BOND:
            return "bond";
        case SecurityType::CRYPTO:
            return "crypto";
        case SecurityType::COMMODITY:
            return "commodity";
        case SecurityType::ETF:
        case SecurityType::FUND:
        case SecurityType::MUTUAL_FUND:
            return "mixed";
        case SecurityType::WARRANT:
        case SecurityType::DERIVATIVE:
            return "derivative";
        default:
            return "unknown";
    }
}

bool is_diversified(SecurityType type) {
    return type == SecurityType::ETF || type == SecurityType::FUND ||
           type == SecurityType::MUTUAL_FUND;
}

bool is_cash_ticker(const std::string& ticker) {
    return ticker.rfind(CASH_TICKER_PREFIX, 0) == 0;
}

std::string normalize_currency(const std::string& currency) {
    return trim_upper(currency);
}

std::string normalize_ticker(const std::string& ticker) {
    return trim_upper(ticker);
}

bool Position::is_cash() const {
    return is_cash_ticker(ticker) || security_type_hint == "cash";
}

std::string CanonicalPosition::base_ticker() const {
    auto pos = ticker.rfind(CURRENCY_KEY_SEPARATOR);
    if (pos == std::string::npos || pos == 0) {
        return ticker;
    }
    return ticker.substr(0, pos);
}

std::string CanonicalPosition::position_source() const {
    std::string joined;
    for (const auto& provider : contributing_providers) {
        if (!joined.empty()) {
            joined += ",";
        }
        joined += provider;
    }
    return joined;
}

}  // namespace holdings_ngin
