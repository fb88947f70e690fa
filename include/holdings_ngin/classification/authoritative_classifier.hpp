// include/holdings_ngin/classification/authoritative_classifier.hpp
#pragma once

#include <string>
#include "holdings_ngin/core/error.hpp"
#include "holdings_ngin/core/types.hpp"

namespace holdings_ngin {

/**
 * @brief Instrument flags reported by an external reference-data source
 */
struct AuthoritativeClassification {
    bool is_etf{false};
    bool is_fund{false};
    bool is_cash_marker{false};
    bool is_bond{false};
    bool is_crypto{false};
    std::string description;  // free text from the source, for logging only

    /**
     * @brief Canonical type: cash marker, then ETF, fund, bond, crypto, else equity
     */
    SecurityType to_security_type() const {
        if (is_cash_marker)
            return SecurityType::CASH;
        if (is_etf)
            return SecurityType::ETF;
        if (is_fund)
            return SecurityType::MUTUAL_FUND;
        if (is_bond)
            return SecurityType::BOND;
        if (is_crypto)
            return SecurityType::CRYPTO;
        return SecurityType::EQUITY;
    }
};

/**
 * @brief External classification lookup
 *
 * lookup() is called concurrently from worker threads and may block on I/O.
 * Errors: DATA_NOT_FOUND for unknown tickers, TIMEOUT_ERROR / CONNECTION_ERROR /
 * API_ERROR for transport problems.
 */
class AuthoritativeClassifier {
public:
    virtual ~AuthoritativeClassifier() = default;

    virtual Result<AuthoritativeClassification> lookup(const std::string& ticker) = 0;

    virtual std::string name() const = 0;
};

}  // namespace holdings_ngin
