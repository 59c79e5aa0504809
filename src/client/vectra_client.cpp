#include <vectra/client/vectra_client.h>

#include <vectra/client/embedded_engine.h>
#include <vectra/client/http_transport.h>
#include <vectra/client/in_process_transport.h>
#include <vectra/client/placeholder_transport.h>

#include <spdlog/spdlog.h>

namespace vectra {

Result<VectraClient> VectraClient::create(const ClientConfig& config) {
    std::shared_ptr<IClientTransport> transport;
    switch (config.transportMode) {
        case TransportMode::Embedded: {
            if (!config.embeddedAvailable) {
                return Error{ErrorCode::TransportUnavailable,
                             "Embedded transport requested but no in-process engine is available"};
            }
            auto engine = EmbeddedEngineHost::acquire(config);
            if (!engine) {
                return Error{ErrorCode::TransportUnavailable,
                             "Embedded transport requested but " + engine.error().message};
            }
            transport = std::make_shared<InProcessTransport>(std::move(engine).value());
            break;
        }
        case TransportMode::Remote:
            transport = std::make_shared<HttpTransport>(config, makeCurlHttpAdapter(),
                                                        std::make_shared<PlaceholderTransport>());
            break;
        case TransportMode::Placeholder:
            transport = std::make_shared<PlaceholderTransport>();
            break;
    }
    spdlog::debug("vectra client using {} transport ({})", transport->name(),
                  config.baseAddress());
    return VectraClient(config, std::move(transport));
}

VectraClient::VectraClient(ClientConfig config, std::shared_ptr<IClientTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {}

Result<nlohmann::json> VectraClient::executeQuery(const std::string& sql) const {
    return transport_->executeQuery(sql);
}

Result<SearchResult> VectraClient::vectorSearch(const std::string& query,
                                                std::size_t limit) const {
    if (limit == 0) {
        return Error{ErrorCode::ValidationError, "search limit must be at least 1"};
    }
    return transport_->vectorSearch(query, limit);
}

Result<SubscriptionHandle> VectraClient::subscribeStream(const std::string& topic) const {
    auto ref = transport_->subscribeStream(topic);
    if (!ref)
        return ref.error();
    return SubscriptionHandle(std::move(ref).value(), transport_);
}

Result<void> VectraClient::createTable(const std::string& name, const std::string& schema) const {
    return transport_->createTable(name, schema);
}

Result<void> VectraClient::insertData(const std::string& table,
                                      const nlohmann::json& payload) const {
    return transport_->insertData(table, payload);
}

Result<IndexHandle> VectraClient::createVectorIndex(const std::string& table,
                                                    const std::string& column) const {
    auto ref = transport_->createVectorIndex(table, column);
    if (!ref)
        return ref.error();
    return IndexHandle(std::move(ref).value(), transport_);
}

Result<std::vector<std::string>> VectraClient::listTables() const {
    return transport_->listTables();
}

Result<TableInfo> VectraClient::getTableInfo(const std::string& table) const {
    return transport_->getTableInfo(table);
}

Result<StorageStats> VectraClient::getStats() const {
    return transport_->getStats();
}

Result<HealthStatus> VectraClient::healthCheck() const {
    return transport_->healthCheck();
}

} // namespace vectra
