// src/classification/postgres_classification_store.cpp
#include "holdings_ngin/classification/postgres_classification_store.hpp"
#include <cctype>
#include <cstdint>
#include "holdings_ngin/core/logger.hpp"
#include "holdings_ngin/core/state_manager.hpp"

namespace holdings_ngin {

namespace {

ClassificationTier tier_from_string(const std::string& name) {
    if (name == "authoritative")
        return ClassificationTier::AUTHORITATIVE;
    if (name == "persistent")
        return ClassificationTier::PERSISTENT;
    if (name == "memory")
        return ClassificationTier::MEMORY;
    return ClassificationTier::HEURISTIC;
}

int64_t to_epoch_seconds(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

bool is_valid_table_name(const std::string& name) {
    if (name.empty())
        return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.')
            return false;
    }
    return true;
}

}  // namespace

PostgresClassificationStore::PostgresClassificationStore(std::string connection_string,
                                                         std::string table_name)
    : connection_string_(std::move(connection_string)),
      table_name_(std::move(table_name)),
      connection_(nullptr) {
    Logger::register_component("ClassificationStore");
}

PostgresClassificationStore::~PostgresClassificationStore() {
    disconnect();
}

Result<void> PostgresClassificationStore::connect() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_valid_table_name(table_name_)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid table name: " + table_name_, "ClassificationStore");
    }

    try {
        connection_ = std::make_unique<pqxx::connection>(connection_string_);
        if (!connection_->is_open()) {
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection", "ClassificationStore");
        }

        std::string unique_id = StateManager::next_component_id("CLASSIFICATION_STORE");
        ComponentInfo info{ComponentType::CLASSIFICATION_STORE,
                           ComponentState::INITIALIZED,
                           unique_id,
                           "",
                           std::chrono::system_clock::now(),
                           {}};

        auto register_result = StateManager::instance().register_component(info);
        if (register_result.is_error()) {
            WARN("Failed to register classification store with StateManager: "
                 << register_result.error()->what());
        } else {
            component_id_ = unique_id;
            (void)StateManager::instance().update_state(component_id_, ComponentState::RUNNING);
        }

        INFO("Connected classification store to " << table_name_);
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()),
                                "ClassificationStore");
    }
}

void PostgresClassificationStore::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_ && connection_->is_open()) {
        connection_->close();
        connection_.reset();

        if (!component_id_.empty()) {
            (void)StateManager::instance().update_state(component_id_, ComponentState::STOPPED);
            (void)StateManager::instance().unregister_component(component_id_);
            component_id_.clear();
        }

        INFO("Disconnected classification store");
    }
}

bool PostgresClassificationStore::is_connected() const {
    return connection_ && connection_->is_open();
}

Result<void> PostgresClassificationStore::validate_connection() const {
    if (!is_connected()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                "ClassificationStore");
    }
    return Result<void>();
}

Result<std::optional<ClassificationCacheEntry>> PostgresClassificationStore::get(
    const std::string& ticker) {
    using ReturnType = std::optional<ClassificationCacheEntry>;
    std::lock_guard<std::mutex> lock(mutex_);

    auto validation = validate_connection();
    if (validation.is_error()) {
        return make_error<ReturnType>(validation.error()->code(), validation.error()->what(),
                                      "ClassificationStore");
    }

    try {
        pqxx::work txn(*connection_);
        std::string query =
            "SELECT ticker, security_type, source_tier, "
            "EXTRACT(EPOCH FROM resolved_at)::bigint AS resolved_epoch, ttl_seconds "
            "FROM " + table_name_ + " WHERE ticker = $1";
        auto result = txn.exec_params(query, ticker);
        txn.commit();

        if (result.empty()) {
            return ReturnType{};
        }

        const auto& row = result[0];
        auto type = security_type_from_string(row["security_type"].as<std::string>());
        if (!type) {
            WARN("Ignoring stored classification for " << ticker << " with unknown type '"
                                                       << row["security_type"].as<std::string>()
                                                       << "'");
            return ReturnType{};
        }

        ClassificationCacheEntry entry;
        entry.ticker = row["ticker"].as<std::string>();
        entry.security_type = *type;
        entry.source_tier = tier_from_string(row["source_tier"].as<std::string>());
        entry.resolved_at =
            Timestamp(std::chrono::seconds(row["resolved_epoch"].as<int64_t>()));
        entry.ttl = std::chrono::seconds(row["ttl_seconds"].as<int64_t>());
        return ReturnType(std::move(entry));

    } catch (const pqxx::broken_connection& e) {
        return make_error<ReturnType>(ErrorCode::CONNECTION_ERROR,
                                      "Lost database connection: " + std::string(e.what()),
                                      "ClassificationStore");
    } catch (const std::exception& e) {
        return make_error<ReturnType>(ErrorCode::DATABASE_ERROR,
                                      "Failed to read classification for " + ticker + ": " +
                                          std::string(e.what()),
                                      "ClassificationStore");
    }
}

Result<void> PostgresClassificationStore::put(const ClassificationCacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto validation = validate_connection();
    if (validation.is_error())
        return validation;

    try {
        pqxx::work txn(*connection_);
        std::string query =
            "INSERT INTO " + table_name_ +
            " (ticker, security_type, source_tier, resolved_at, ttl_seconds) "
            "VALUES ($1, $2, $3, to_timestamp($4), $5) "
            "ON CONFLICT (ticker) DO UPDATE SET "
            "security_type = EXCLUDED.security_type, source_tier = EXCLUDED.source_tier, "
            "resolved_at = EXCLUDED.resolved_at, ttl_seconds = EXCLUDED.ttl_seconds";
        txn.exec_params(query, entry.ticker, security_type_to_string(entry.security_type),
                        classification_tier_to_string(entry.source_tier),
                        to_epoch_seconds(entry.resolved_at),
                        static_cast<int64_t>(entry.ttl.count()));
        txn.commit();
        DEBUG("Stored classification " << entry.ticker << " -> "
                                       << security_type_to_string(entry.security_type));
        return Result<void>();

    } catch (const pqxx::broken_connection& e) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Lost database connection: " + std::string(e.what()),
                                "ClassificationStore");
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to store classification for " + entry.ticker + ": " +
                                    std::string(e.what()),
                                "ClassificationStore");
    }
}

Result<std::vector<std::string>> PostgresClassificationStore::list_stale(
    std::chrono::seconds max_age, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto validation = validate_connection();
    if (validation.is_error()) {
        return make_error<std::vector<std::string>>(validation.error()->code(),
                                                    validation.error()->what(),
                                                    "ClassificationStore");
    }

    try {
        pqxx::work txn(*connection_);
        std::string query = "SELECT ticker FROM " + table_name_ +
                            " WHERE resolved_at < to_timestamp($1) ORDER BY resolved_at, ticker";
        auto result = txn.exec_params(query, to_epoch_seconds(now - max_age));
        txn.commit();

        std::vector<std::string> tickers;
        tickers.reserve(result.size());
        for (const auto& row : result) {
            tickers.push_back(row["ticker"].as<std::string>());
        }
        return tickers;

    } catch (const pqxx::broken_connection& e) {
        return make_error<std::vector<std::string>>(
            ErrorCode::CONNECTION_ERROR, "Lost database connection: " + std::string(e.what()),
            "ClassificationStore");
    } catch (const std::exception& e) {
        return make_error<std::vector<std::string>>(
            ErrorCode::DATABASE_ERROR, "Failed to list stale classifications: " + std::string(e.what()),
            "ClassificationStore");
    }
}

}  // namespace holdings_ngin
