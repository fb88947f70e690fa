// src/consolidation/position_consolidator.cpp
#include "holdings_ngin/consolidation/position_consolidator.hpp"
#include <cmath>
#include <set>
#include <unordered_map>
#include <utility>
#include "holdings_ngin/core/logger.hpp"

namespace holdings_ngin {

namespace {

struct Group {
    CanonicalPosition position;
    int winner_priority{0};
    bool has_winner{false};
};

class GroupTable {
public:
    Group& get_or_create(const std::string& key) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            return groups_[it->second];
        }
        index_.emplace(key, groups_.size());
        groups_.emplace_back();
        groups_.back().position.ticker = key;
        return groups_.back();
    }

    std::vector<Group>& groups() {
        return groups_;
    }

private:
    std::vector<Group> groups_;
    std::unordered_map<std::string, size_t> index_;
};

void merge_into(Group& group, const Position& record, int priority) {
    auto& canonical = group.position;
    canonical.quantity += record.quantity;
    canonical.contributing_providers.insert(record.provider_id);

    if (record.market_value && std::isfinite(*record.market_value)) {
        canonical.market_value = canonical.market_value.value_or(0.0) + *record.market_value;
    }

    // Strictly greater: ties keep the first-seen record
    if (!group.has_winner || priority > group.winner_priority) {
        group.has_winner = true;
        group.winner_priority = priority;
        canonical.account_id = record.account_id;
        canonical.cost_basis = record.cost_basis;
        canonical.security_type_hint = record.security_type_hint;
        if (!record.currency.empty()) {
            canonical.currency = record.currency;
        }
    }
}

}  // namespace

PositionConsolidator::PositionConsolidator(std::string default_currency)
    : default_currency_(normalize_currency(default_currency)) {
    if (default_currency_.empty()) {
        default_currency_ = "USD";
    }
}

std::string PositionConsolidator::cash_currency_of(const Position& position) const {
    auto ticker = normalize_ticker(position.ticker);
    if (is_cash_ticker(ticker)) {
        auto suffix = ticker.substr(std::string(CASH_TICKER_PREFIX).size());
        if (!suffix.empty()) {
            return suffix;
        }
    }
    auto currency = normalize_currency(position.currency);
    return currency.empty() ? default_currency_ : currency;
}

ConsolidationResult PositionConsolidator::consolidate(
    const std::vector<Position>& positions, const ProviderPriorityConfig& priorities) const {
    ConsolidationResult result;
    GroupTable cash_groups;
    GroupTable security_groups;

    // ticker -> currency that owns the plain key
    std::unordered_map<std::string, std::string> key_owner;
    std::set<std::pair<std::string, std::string>> reported_conflicts;

    for (const auto& record : positions) {
        auto ticker = normalize_ticker(record.ticker);
        if (ticker.empty() || !std::isfinite(record.quantity)) {
            WARN("MalformedRecord: skipping position from " << record.provider_id
                                                              << " with missing ticker or quantity");
            result.warnings.push_back(Warning{WarningCode::MALFORMED_RECORD,
                                              "Position without usable ticker or quantity skipped",
                                              ticker, record.provider_id});
            continue;
        }

        const int priority = priorities.priority_of(record.provider_id);

        if (record.is_cash()) {
            auto currency = cash_currency_of(record);
            Position cash = record;
            cash.currency = currency;

            auto& group = cash_groups.get_or_create(std::string(CASH_TICKER_PREFIX) + currency);
            group.position.is_cash = true;
            group.position.security_type = SecurityType::CASH;
            merge_into(group, cash, priority);
            group.position.currency = currency;
            continue;
        }

        Position security = record;
        security.ticker = ticker;
        security.currency = normalize_currency(record.currency);
        if (security.currency.empty()) {
            security.currency = default_currency_;
        }

        auto owner = key_owner.emplace(ticker, security.currency).first;
        std::string key = ticker;
        if (owner->second != security.currency) {
            key = ticker + CURRENCY_KEY_SEPARATOR + security.currency;
            if (reported_conflicts.emplace(ticker, security.currency).second) {
                WARN("MixedCurrencySameTicker: " << ticker << " held in " << owner->second
                                                 << " and " << security.currency << ", keeping "
                                                 << key << " separate");
                result.warnings.push_back(
                    Warning{WarningCode::MIXED_CURRENCY_SAME_TICKER,
                            ticker + " reported in " + owner->second + " and " +
                                security.currency + "; kept separately as " + key,
                            ticker, record.provider_id});
            }
        }

        auto& group = security_groups.get_or_create(key);
        merge_into(group, security, priority);
        group.position.currency = security.currency;
    }

    result.positions.reserve(cash_groups.groups().size() + security_groups.groups().size());
    for (auto& group : cash_groups.groups()) {
        result.positions.push_back(std::move(group.position));
    }
    for (auto& group : security_groups.groups()) {
        result.positions.push_back(std::move(group.position));
    }

    DEBUG("Consolidated " << positions.size() << " positions into " << result.positions.size()
                          << " canonical positions");
    return result;
}

std::vector<Position> to_positions(const std::vector<CanonicalPosition>& canonical,
                                   const std::string& provider_id) {
    std::vector<Position> positions;
    positions.reserve(canonical.size());
    for (const auto& c : canonical) {
        Position p(c.ticker, c.quantity, c.currency, provider_id);
        p.security_type_hint = c.is_cash ? "cash" : c.security_type_hint;
        p.account_id = c.account_id;
        p.cost_basis = c.cost_basis;
        p.market_value = c.market_value;
        positions.push_back(std::move(p));
    }
    return positions;
}

}  // namespace holdings_ngin
