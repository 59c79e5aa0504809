#pragma once

#include <memory>

#include <vectra/client/client_config.h>
#include <vectra/client/client_transport.h>
#include <vectra/client/http_adapter.h>

namespace vectra {

// REMOTE transport: JSON over HTTP against the engine's server.
//
//   POST /query           {query}          -> result object, returned as-is
//   POST /vector/search   {query, limit}   -> {results, query, limit}
//   POST /stream/subscribe {topic}         -> {subscriptionId, status}
//   GET  /health                           -> {status}
//
// The server exposes no administrative endpoints. Administrative calls are
// forwarded to `admin`, normally a PlaceholderTransport, so their behaviour is
// whatever that delegate documents.
class HttpTransport final : public IClientTransport {
public:
    HttpTransport(ClientConfig config, std::shared_ptr<IHttpAdapter> http,
                  std::shared_ptr<IClientTransport> admin);

    std::string_view name() const noexcept override { return "remote"; }

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
    Result<nlohmann::json> exchange(const char* method, const std::string& path,
                                    const nlohmann::json* body, std::chrono::milliseconds timeout,
                                    std::string_view operation);

    ClientConfig config_;
    std::string baseAddress_;
    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<IClientTransport> admin_;
};

} // namespace vectra
