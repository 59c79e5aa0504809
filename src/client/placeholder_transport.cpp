#include <vectra/client/placeholder_transport.h>

#include <spdlog/spdlog.h>

namespace vectra {

namespace {

nlohmann::json sample_hits() {
    return nlohmann::json::array(
        {{{"id", 1}, {"score", 0.95}, {"metadata", {{"text", "Sample result"}}}},
         {{"id", 2}, {"score", 0.87}, {"metadata", {{"text", "Another result"}}}}});
}

} // namespace

Result<nlohmann::json> PlaceholderTransport::executeQuery(const std::string& sql) {
    spdlog::info("[placeholder] execute query: {}", sql);
    return nlohmann::json{{"rows", 0}, {"sql", sql}, {"status", "placeholder"}};
}

Result<SearchResult> PlaceholderTransport::vectorSearch(const std::string& query,
                                                        std::size_t limit) {
    spdlog::info("[placeholder] vector search '{}' (limit {})", query, limit);
    SearchResult out;
    out.results = sample_hits();
    if (out.results.size() > limit)
        out.results.erase(out.results.begin() + static_cast<std::ptrdiff_t>(limit),
                          out.results.end());
    out.query = query;
    out.limit = limit;
    return out;
}

Result<SubscriptionRef> PlaceholderTransport::subscribeStream(const std::string& topic) {
    spdlog::info("[placeholder] subscribe to topic: {}", topic);
    return SubscriptionRef{"sub_" + topic, topic, "active"};
}

Result<void> PlaceholderTransport::unsubscribe(const SubscriptionRef& subscription) {
    spdlog::info("[placeholder] unsubscribing from topic: {}", subscription.topic);
    return Result<void>();
}

Result<void> PlaceholderTransport::createTable(const std::string& name,
                                               const std::string& schema) {
    spdlog::info("[placeholder] creating table '{}' with schema: {}", name, schema);
    return Result<void>();
}

Result<void> PlaceholderTransport::insertData(const std::string& table,
                                              const nlohmann::json& payload) {
    // Payloads can be large; log the size only.
    spdlog::info("[placeholder] inserting {} bytes into table '{}'", payload.dump().size(),
                 table);
    return Result<void>();
}

Result<IndexRef> PlaceholderTransport::createVectorIndex(const std::string& table,
                                                         const std::string& column) {
    spdlog::info("[placeholder] creating vector index on {}.{}", table, column);
    return IndexRef{"idx_" + table + "_" + column, table, column, "created"};
}

Result<SearchResult> PlaceholderTransport::searchIndex(const IndexRef& index,
                                                       const std::vector<float>& vector,
                                                       std::size_t limit) {
    spdlog::info("[placeholder] searching index {} with {}-dim vector", index.id, vector.size());
    SearchResult out;
    out.results = sample_hits();
    if (out.results.size() > limit)
        out.results.erase(out.results.begin() + static_cast<std::ptrdiff_t>(limit),
                          out.results.end());
    out.limit = limit;
    return out;
}

Result<void> PlaceholderTransport::insertVector(const IndexRef& index, std::uint64_t id,
                                                const std::vector<float>&) {
    spdlog::info("[placeholder] inserting vector {} into index {}.{}", id, index.table,
                 index.column);
    return Result<void>();
}

Result<void> PlaceholderTransport::deleteIndex(const IndexRef& index) {
    spdlog::info("[placeholder] deleting index on {}.{}", index.table, index.column);
    return Result<void>();
}

Result<std::vector<std::string>> PlaceholderTransport::listTables() {
    return std::vector<std::string>{"docs", "users", "products"};
}

Result<TableInfo> PlaceholderTransport::getTableInfo(const std::string& table) {
    return TableInfo{table, 1000, 1024000, "2024-01-01T00:00:00Z"};
}

Result<StorageStats> PlaceholderTransport::getStats() {
    return StorageStats{3, 5000, 5120000};
}

Result<HealthStatus> PlaceholderTransport::healthCheck() {
    return HealthStatus{"healthy", "", ""};
}

} // namespace vectra
