#pragma once

#include <vectra/client/client_transport.h>

namespace vectra {

// Transport that talks to nothing. Administrative calls log one line and
// succeed; reads return fixed sample data. Used for demos, unit tests, and as
// the administrative delegate of HttpTransport, which has no such endpoints.
// Every call is idempotent and never fails.
class PlaceholderTransport final : public IClientTransport {
public:
    std::string_view name() const noexcept override { return "placeholder"; }

    Result<nlohmann::json> executeQuery(const std::string& sql) override;
    Result<SearchResult> vectorSearch(const std::string& query, std::size_t limit) override;
    Result<SubscriptionRef> subscribeStream(const std::string& topic) override;
    Result<void> unsubscribe(const SubscriptionRef& subscription) override;

    Result<void> createTable(const std::string& name, const std::string& schema) override;
    Result<void> insertData(const std::string& table, const nlohmann::json& payload) override;

    Result<IndexRef> createVectorIndex(const std::string& table,
                                       const std::string& column) override;
    Result<SearchResult> searchIndex(const IndexRef& index, const std::vector<float>& vector,
                                     std::size_t limit) override;
    Result<void> insertVector(const IndexRef& index, std::uint64_t id,
                              const std::vector<float>& vector) override;
    Result<void> deleteIndex(const IndexRef& index) override;

    Result<std::vector<std::string>> listTables() override;
    Result<TableInfo> getTableInfo(const std::string& table) override;
    Result<StorageStats> getStats() override;
    Result<HealthStatus> healthCheck() override;
};

} // namespace vectra
