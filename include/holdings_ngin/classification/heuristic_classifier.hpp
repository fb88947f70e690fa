// include/holdings_ngin/classification/heuristic_classifier.hpp
#pragma once

#include <string>
#include "holdings_ngin/core/types.hpp"

namespace holdings_ngin {

/**
 * @brief Last-resort classification from the ticker string and provider hint
 *
 * Rules, first match wins:
 *   CUR: prefix                       -> cash
 *   canonical provider hint           -> that type
 *   5 letters ending in XX (SWVXX)    -> cash (money market)
 *   5 letters ending in X (VFIAX)     -> mutual_fund
 *   OCC option symbol                 -> derivative
 *   -USD pair (BTC-USD)               -> crypto
 *   warrant suffix (.WS, -WT, +)      -> warrant
 *   anything else                     -> equity
 */
class HeuristicClassifier {
public:
    SecurityType classify(const std::string& ticker, const std::string& hint = "") const;
};

}  // namespace holdings_ngin
