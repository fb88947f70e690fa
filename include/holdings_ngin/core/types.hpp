// include/holdings_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace holdings_ngin {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type for position sizes
 * Signed: negative values are shorts. Double to support fractional quantities
 */
using Quantity = double;

/**
 * @brief Prefix marking a cash position ticker, e.g. "CUR:USD"
 */
inline constexpr const char* CASH_TICKER_PREFIX = "CUR:";

/**
 * @brief Separator used for tickers split by the currency guard, e.g. "AAPL__EUR"
 */
inline constexpr const char* CURRENCY_KEY_SEPARATOR = "__";

/**
 * @brief Canonical security types
 */
enum class SecurityType {
    EQUITY,
    ETF,
    FUND,
    MUTUAL_FUND,
    BOND,
    CASH,
    CRYPTO,
    COMMODITY,
    DERIVATIVE,
    WARRANT,
    UNKNOWN
};

/**
 * @brief Convert SecurityType to its canonical lower-case name
 */
std::string security_type_to_string(SecurityType type);

/**
 * @brief Parse a canonical security type name
 * @return The type, or std::nullopt if the name is not canonical
 */
std::optional<SecurityType> security_type_from_string(const std::string& name);

/**
 * @brief Map security type to asset class ("equity", "mixed", "derivative", ...)
 */
std::string security_type_to_asset_class(SecurityType type);

/**
 * @brief True for types representing diversified baskets rather than single issuers
 */
bool is_diversified(SecurityType type);

/**
 * @brief Position as reported by a single provider
 * Produced by a ProviderNormalizer and not modified afterwards
 */
struct Position {
    std::string ticker;
    Quantity quantity{0.0};
    std::string currency;
    std::string security_type_hint;
    std::string account_id;
    std::optional<double> cost_basis;
    std::optional<double> market_value;
    std::string provider_id;

    Position() = default;
    Position(std::string t, Quantity qty, std::string ccy, std::string provider)
        : ticker(std::move(t)),
          quantity(qty),
          currency(std::move(ccy)),
          provider_id(std::move(provider)) {}

    bool is_cash() const;
};

/**
 * @brief Provider-agnostic position after consolidation
 */
struct CanonicalPosition {
    std::string ticker;
    Quantity quantity{0.0};
    std::string currency;
    SecurityType security_type{SecurityType::UNKNOWN};
    std::string security_type_hint;
    std::optional<double> cost_basis;
    std::string account_id;
    std::optional<double> market_value;
    std::set<std::string> contributing_providers;
    bool is_cash{false};

    /**
     * @brief Ticker without the currency-guard suffix ("AAPL__EUR" -> "AAPL")
     */
    std::string base_ticker() const;

    /**
     * @brief Comma-joined contributing providers, e.g. "plaid,snaptrade"
     */
    std::string position_source() const;
};

/**
 * @brief True when the ticker carries the cash prefix
 */
bool is_cash_ticker(const std::string& ticker);

/**
 * @brief Upper-case and trim a currency code; empty stays empty
 */
std::string normalize_currency(const std::string& currency);

/**
 * @brief Upper-case and trim a ticker symbol
 */
std::string normalize_ticker(const std::string& ticker);

}  // namespace holdings_ngin
