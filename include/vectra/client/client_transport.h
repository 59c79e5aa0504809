#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <vectra/client/payloads.h>
#include <vectra/core/types.h>

namespace vectra {

// One way of executing client operations (in-process engine, HTTP, placeholder).
// Implementations are shared read-only across benchmark workers and must be
// safe to call concurrently. Every failure is returned as
// ErrorCode::TransportError with "<operation>: <cause>"; nothing is retried.
class IClientTransport {
public:
    virtual ~IClientTransport() = default;

    virtual std::string_view name() const noexcept = 0;

    virtual Result<nlohmann::json> executeQuery(const std::string& sql) = 0;
    virtual Result<SearchResult> vectorSearch(const std::string& query, std::size_t limit) = 0;
    virtual Result<SubscriptionRef> subscribeStream(const std::string& topic) = 0;
    virtual Result<void> unsubscribe(const SubscriptionRef& subscription) = 0;

    virtual Result<void> createTable(const std::string& name, const std::string& schema) = 0;
    virtual Result<void> insertData(const std::string& table, const nlohmann::json& payload) = 0;

    virtual Result<IndexRef> createVectorIndex(const std::string& table,
                                               const std::string& column) = 0;
    virtual Result<SearchResult> searchIndex(const IndexRef& index,
                                             const std::vector<float>& vector,
                                             std::size_t limit) = 0;
    virtual Result<void> insertVector(const IndexRef& index, std::uint64_t id,
                                      const std::vector<float>& vector) = 0;
    virtual Result<void> deleteIndex(const IndexRef& index) = 0;

    virtual Result<std::vector<std::string>> listTables() = 0;
    virtual Result<TableInfo> getTableInfo(const std::string& table) = 0;
    virtual Result<StorageStats> getStats() = 0;
    virtual Result<HealthStatus> healthCheck() = 0;
};

} // namespace vectra
