// src/classification/heuristic_classifier.cpp
#include "holdings_ngin/classification/heuristic_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace holdings_ngin {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool all_alpha(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isalpha(c) != 0; });
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

SecurityType HeuristicClassifier::classify(const std::string& raw_ticker,
                                           const std::string& hint) const {
    static const std::regex occ_option(R"(^[A-Z]{1,6}\s*\d{6}[CP]\d{8}$)");
    static const std::regex warrant(R"(^[A-Z]+([.\-/ ](WS|WT|W)(\.[A-Z])?|\+)$)");

    const std::string ticker = normalize_ticker(raw_ticker);

    if (is_cash_ticker(ticker)) {
        return SecurityType::CASH;
    }

    if (!hint.empty()) {
        auto hinted = security_type_from_string(to_lower(hint));
        if (hinted && *hinted != SecurityType::UNKNOWN) {
            return *hinted;
        }
    }

    if (ticker.size() == 5 && all_alpha(ticker)) {
        if (ends_with(ticker, "XX"))
            return SecurityType::CASH;
        if (ends_with(ticker, "X"))
            return SecurityType::MUTUAL_FUND;
    }

    if (std::regex_match(ticker, occ_option)) {
        return SecurityType::DERIVATIVE;
    }

    if (ends_with(ticker, "-USD") && ticker.size() > 4) {
        return SecurityType::CRYPTO;
    }

    if (std::regex_match(ticker, warrant)) {
        return SecurityType::WARRANT;
    }

    return SecurityType::EQUITY;
}

}  // namespace holdings_ngin
