#pragma once

#include <memory>

#include <vectra/client/client_transport.h>
#include <vectra/client/embedded_engine.h>

namespace vectra {

// EMBEDDED transport: calls an in-process engine directly. Engine errors and
// exceptions are converted into TransportError per call.
class InProcessTransport final : public IClientTransport {
public:
    explicit InProcessTransport(std::shared_ptr<IEmbeddedEngine> engine)
        : engine_(std::move(engine)) {}

    std::string_view name() const noexcept override { return "embedded"; }

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

private:
    std::shared_ptr<IEmbeddedEngine> engine_;
};

} // namespace vectra
