#include <vectra/client/in_process_transport.h>

#include <spdlog/spdlog.h>

namespace vectra {

namespace {

// Runs one engine call, converting engine errors and exceptions into
// TransportError tagged with `operation`.
template <typename Fn>
auto guarded(std::string_view operation, IEmbeddedEngine* engine, Fn&& fn)
    -> decltype(fn(*engine)) {
    if (!engine) {
        return makeTransportError(operation, "in-process engine unavailable");
    }
    try {
        auto r = fn(*engine);
        if (!r) {
            return makeTransportError(operation, r.error().message);
        }
        return r;
    } catch (const std::exception& e) {
        spdlog::debug("in-process engine threw during '{}': {}", operation, e.what());
        return makeTransportError(operation, e.what());
    }
}

} // namespace

Result<nlohmann::json> InProcessTransport::executeQuery(const std::string& sql) {
    auto res = guarded("Failed to execute query", engine_.get(),
                       [&](IEmbeddedEngine& e) { return e.executeQuery(sql); });
    if (res && res.value().is_null()) {
        return makeTransportError("Failed to execute query", "engine returned no result");
    }
    return res;
}

Result<SearchResult> InProcessTransport::vectorSearch(const std::string& query,
                                                      std::size_t limit) {
    auto hits = guarded("Failed to perform vector search", engine_.get(),
                        [&](IEmbeddedEngine& e) { return e.vectorSearch(query, limit); });
    if (!hits)
        return hits.error();
    SearchResult out;
    out.results = hits.value().is_array() ? hits.value() : nlohmann::json::array();
    out.query = query;
    out.limit = limit;
    return out;
}

Result<SubscriptionRef> InProcessTransport::subscribeStream(const std::string& topic) {
    auto id = guarded("Failed to subscribe to stream", engine_.get(),
                      [&](IEmbeddedEngine& e) { return e.subscribe(topic); });
    if (!id)
        return id.error();
    return SubscriptionRef{id.value(), topic, "active"};
}

Result<void> InProcessTransport::unsubscribe(const SubscriptionRef& subscription) {
    return guarded("Failed to unsubscribe", engine_.get(),
                   [&](IEmbeddedEngine& e) { return e.unsubscribe(subscription.id); });
}

Result<void> InProcessTransport::createTable(const std::string& name, const std::string& schema) {
    return guarded("Failed to create table", engine_.get(),
                   [&](IEmbeddedEngine& e) { return e.createTable(name, schema); });
}

Result<void> InProcessTransport::insertData(const std::string& table,
                                            const nlohmann::json& payload) {
    return guarded("Failed to insert data", engine_.get(), [&](IEmbeddedEngine& e) {
        if (payload.is_array()) {
            for (const auto& row : payload) {
                if (auto r = e.insert(table, row); !r)
                    return r;
            }
            return Result<void>();
        }
        return e.insert(table, payload);
    });
}

Result<IndexRef> InProcessTransport::createVectorIndex(const std::string& table,
                                                       const std::string& column) {
    auto id = guarded("Failed to create vector index", engine_.get(),
                      [&](IEmbeddedEngine& e) { return e.createIndex(table, column); });
    if (!id)
        return id.error();
    return IndexRef{id.value(), table, column, "created"};
}

Result<SearchResult> InProcessTransport::searchIndex(const IndexRef& index,
                                                     const std::vector<float>& vector,
                                                     std::size_t limit) {
    auto hits = guarded("Failed to search index", engine_.get(), [&](IEmbeddedEngine& e) {
        return e.searchIndex(index.id, vector, limit);
    });
    if (!hits)
        return hits.error();
    SearchResult out;
    out.results = hits.value().is_array() ? hits.value() : nlohmann::json::array();
    out.limit = limit;
    return out;
}

Result<void> InProcessTransport::insertVector(const IndexRef& index, std::uint64_t id,
                                              const std::vector<float>& vector) {
    return guarded("Failed to insert vector", engine_.get(),
                   [&](IEmbeddedEngine& e) { return e.insertVector(index.id, id, vector); });
}

Result<void> InProcessTransport::deleteIndex(const IndexRef& index) {
    return guarded("Failed to delete index", engine_.get(),
                   [&](IEmbeddedEngine& e) { return e.dropIndex(index.id); });
}

Result<std::vector<std::string>> InProcessTransport::listTables() {
    return guarded("Failed to list tables", engine_.get(),
                   [](IEmbeddedEngine& e) { return e.listTables(); });
}

Result<TableInfo> InProcessTransport::getTableInfo(const std::string& table) {
    return guarded("Failed to get table info", engine_.get(),
                   [&](IEmbeddedEngine& e) { return e.tableInfo(table); });
}

Result<StorageStats> InProcessTransport::getStats() {
    return guarded("Failed to get stats", engine_.get(),
                   [](IEmbeddedEngine& e) { return e.stats(); });
}

Result<HealthStatus> InProcessTransport::healthCheck() {
    return guarded("Health check failed", engine_.get(),
                   [](IEmbeddedEngine& e) { return e.health(); });
}

} // namespace vectra
