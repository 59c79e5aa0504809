#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <vectra/client/client_config.h>
#include <vectra/client/client_transport.h>
#include <vectra/client/payloads.h>
#include <vectra/client/resource_handles.h>
#include <vectra/core/types.h>

namespace vectra {

// Client facade over exactly one transport, chosen once from
// ClientConfig::transportMode. Stateless after construction; safe to share
// across threads. No reconnects and no retries.
class VectraClient {
public:
    // Fails with TransportUnavailable when EMBEDDED is requested but no
    // in-process engine can be acquired. Never falls back to REMOTE.
    static Result<VectraClient> create(const ClientConfig& config);

    VectraClient(ClientConfig config, std::shared_ptr<IClientTransport> transport);

    const ClientConfig& config() const noexcept { return config_; }
    std::string baseAddress() const { return config_.baseAddress(); }
    IClientTransport& transport() const noexcept { return *transport_; }

    Result<nlohmann::json> executeQuery(const std::string& sql) const;
    Result<SearchResult> vectorSearch(const std::string& query, std::size_t limit = 10) const;
    Result<SubscriptionHandle> subscribeStream(const std::string& topic) const;

    Result<void> createTable(const std::string& name, const std::string& schema) const;
    Result<void> insertData(const std::string& table, const nlohmann::json& payload) const;
    Result<IndexHandle> createVectorIndex(const std::string& table,
                                          const std::string& column) const;

    Result<std::vector<std::string>> listTables() const;
    Result<TableInfo> getTableInfo(const std::string& table) const;
    Result<StorageStats> getStats() const;
    Result<HealthStatus> healthCheck() const;

private:
    ClientConfig config_;
    std::shared_ptr<IClientTransport> transport_;
};

} // namespace vectra
