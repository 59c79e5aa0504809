#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <vectra/client/client_config.h>
#include <vectra/client/payloads.h>
#include <vectra/core/types.h>

namespace vectra {

// Contract an in-process engine binding must satisfy to back the EMBEDDED
// transport. Implementations must be thread-safe. They may report failures
// either as errors or by throwing std::exception.
class IEmbeddedEngine {
public:
    virtual ~IEmbeddedEngine() = default;

    virtual Result<nlohmann::json> executeQuery(const std::string& sql) = 0;
    // Returns the hit list, at most `limit` entries.
    virtual Result<nlohmann::json> vectorSearch(const std::string& query, std::size_t limit) = 0;
    virtual Result<std::string> subscribe(const std::string& topic) = 0;
    virtual Result<void> unsubscribe(const std::string& subscriptionId) = 0;

    virtual Result<void> createTable(const std::string& name, const std::string& schema) = 0;
    virtual Result<void> insert(const std::string& table, const nlohmann::json& row) = 0;

    virtual Result<std::string> createIndex(const std::string& table,
                                            const std::string& column) = 0;
    virtual Result<nlohmann::json> searchIndex(const std::string& indexId,
                                               const std::vector<float>& vector,
                                               std::size_t limit) = 0;
    // Adds or replaces the vector stored under `id`.
    virtual Result<void> insertVector(const std::string& indexId, std::uint64_t id,
                                      const std::vector<float>& vector) = 0;
    virtual Result<void> dropIndex(const std::string& indexId) = 0;

    virtual Result<std::vector<std::string>> listTables() = 0;
    virtual Result<TableInfo> tableInfo(const std::string& table) = 0;
    virtual Result<StorageStats> stats() = 0;
    virtual Result<HealthStatus> health() = 0;
};

// Process-wide registry for the in-process engine. A binding registers its
// factory at startup; the EMBEDDED transport acquires an engine from it.
class EmbeddedEngineHost {
public:
    using Factory =
        std::function<Result<std::shared_ptr<IEmbeddedEngine>>(const ClientConfig& config)>;

    static void registerFactory(Factory factory);
    static void clearFactory();
    static bool hasFactory();

    static Result<std::shared_ptr<IEmbeddedEngine>> acquire(const ClientConfig& config);
};

// Checked once at startup; store the answer in
// ClientConfig::embeddedAvailable. VECTRA_DISABLE_EMBEDDED=1 forces false.
bool detectEmbeddedCapability();

} // namespace vectra
