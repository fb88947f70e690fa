// include/holdings_ngin/classification/postgres_classification_store.hpp
#pragma once

#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include "holdings_ngin/classification/classification_store.hpp"

namespace holdings_ngin {

/**
 * @brief ClassificationStore backed by the reference.security_types table
 */
class PostgresClassificationStore : public ClassificationStore {
public:
    /**
     * @param connection_string libpq connection string
     * @param table_name Fully qualified table name
     */
    explicit PostgresClassificationStore(std::string connection_string,
                                         std::string table_name = "reference.security_types");

    ~PostgresClassificationStore() override;

    PostgresClassificationStore(const PostgresClassificationStore&) = delete;
    PostgresClassificationStore& operator=(const PostgresClassificationStore&) = delete;

    Result<void> connect();
    void disconnect();
    bool is_connected() const;

    Result<std::optional<ClassificationCacheEntry>> get(const std::string& ticker) override;
    Result<void> put(const ClassificationCacheEntry& entry) override;
    Result<std::vector<std::string>> list_stale(std::chrono::seconds max_age,
                                                Timestamp now) override;

private:
    Result<void> validate_connection() const;

    std::string connection_string_;
    std::string table_name_;
    std::unique_ptr<pqxx::connection> connection_;
    std::string component_id_;
    mutable std::mutex mutex_;
};

}  // namespace holdings_ngin
