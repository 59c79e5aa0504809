#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <vectra/client/embedded_engine.h>

namespace vectra {

// Reference in-process engine keeping tables, indexes and subscriptions in
// memory. Inserting into an unknown table creates it with an empty schema.
class InMemoryEngine final : public IEmbeddedEngine {
public:
    InMemoryEngine();

    Result<nlohmann::json> executeQuery(const std::string& sql) override;
    Result<nlohmann::json> vectorSearch(const std::string& query, std::size_t limit) override;
    Result<std::string> subscribe(const std::string& topic) override;
    Result<void> unsubscribe(const std::string& subscriptionId) override;

    Result<void> createTable(const std::string& name, const std::string& schema) override;
    Result<void> insert(const std::string& table, const nlohmann::json& row) override;

    Result<std::string> createIndex(const std::string& table, const std::string& column) override;
    Result<nlohmann::json> searchIndex(const std::string& indexId, const std::vector<float>& vector,
                                       std::size_t limit) override;
    Result<void> insertVector(const std::string& indexId, std::uint64_t id,
                              const std::vector<float>& vector) override;
    Result<void> dropIndex(const std::string& indexId) override;

    Result<std::vector<std::string>> listTables() override;
    Result<TableInfo> tableInfo(const std::string& table) override;
    Result<StorageStats> stats() override;
    Result<HealthStatus> health() override;

    std::size_t subscriptionCount() const;
    // Vectors stored in `indexId`; 0 for an unknown index.
    std::size_t vectorCount(const std::string& indexId) const;

private:
    struct Table {
        std::string schema;
        std::vector<std::string> rows; // serialized JSON
        std::uint64_t sizeBytes{0};
        std::string createdAt;
    };

    struct Index {
        std::string table;
        std::string column;
        std::map<std::uint64_t, std::vector<float>> vectors;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Table> tables_;
    std::map<std::string, Index> indexes_;
    std::map<std::string, std::string> subscriptions_; // id -> topic
    std::atomic<std::uint64_t> nextSubscription_{1};
};

// Registers an InMemoryEngine factory with EmbeddedEngineHost. Every acquire
// shares the same engine instance.
void registerInMemoryEngine();

} // namespace vectra
