#include <vectra/client/http_transport.h>

#include <spdlog/spdlog.h>

namespace vectra {

namespace {

constexpr std::string_view kQueryOp = "Failed to execute query";
constexpr std::string_view kSearchOp = "Failed to perform vector search";
constexpr std::string_view kSubscribeOp = "Failed to subscribe to stream";
constexpr std::string_view kHealthOp = "Health check failed";

std::string string_field(const nlohmann::json& j, const char* key, const char* fallback) {
    if (auto it = j.find(key); it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return fallback;
}

std::string body_excerpt(const std::string& body) {
    constexpr std::size_t kMax = 200;
    if (body.size() <= kMax)
        return body;
    return body.substr(0, kMax) + "...";
}

} // namespace

HttpTransport::HttpTransport(ClientConfig config, std::shared_ptr<IHttpAdapter> http,
                             std::shared_ptr<IClientTransport> admin)
    : config_(std::move(config)), baseAddress_(config_.baseAddress()), http_(std::move(http)),
      admin_(std::move(admin)) {}

Result<nlohmann::json> HttpTransport::exchange(const char* method, const std::string& path,
                                               const nlohmann::json* body,
                                               std::chrono::milliseconds timeout,
                                               std::string_view operation) {
    if (!http_) {
        return makeTransportError(operation, "no HTTP adapter configured");
    }

    HttpRequest req;
    req.method = method;
    req.url = baseAddress_ + path;
    req.timeout = timeout;
    req.headers.push_back({"Accept", "application/json"});
    if (body) {
        req.body = body->dump();
        req.headers.push_back({"Content-Type", "application/json"});
    }

    auto res = http_->send(req);
    if (!res) {
        const auto& err = res.error();
        if (err.code == ErrorCode::Timeout) {
            return makeTransportError(operation, "request timed out (" + err.message + ")");
        }
        return makeTransportError(operation, err.message);
    }

    const auto& resp = res.value();
    if (resp.status < 200 || resp.status >= 300) {
        std::string cause = "HTTP status " + std::to_string(resp.status);
        if (!resp.body.empty())
            cause += ": " + body_excerpt(resp.body);
        spdlog::debug("{} {} returned {}", method, path, resp.status);
        return makeTransportError(operation, cause);
    }

    auto parsed = nlohmann::json::parse(resp.body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return makeTransportError(operation, "malformed response body: " + body_excerpt(resp.body));
    }
    return parsed;
}

Result<nlohmann::json> HttpTransport::executeQuery(const std::string& sql) {
    nlohmann::json body{{"query", sql}};
    auto res = exchange("POST", "/query", &body, config_.queryTimeout, kQueryOp);
    if (!res)
        return res.error();
    if (res.value().is_null()) {
        return makeTransportError(kQueryOp, "empty result");
    }
    return res;
}

Result<SearchResult> HttpTransport::vectorSearch(const std::string& query, std::size_t limit) {
    nlohmann::json body{{"query", query}, {"limit", limit}};
    auto res = exchange("POST", "/vector/search", &body, config_.queryTimeout, kSearchOp);
    if (!res)
        return res.error();

    const auto& j = res.value();
    if (!j.is_object()) {
        return makeTransportError(kSearchOp, "response is not an object");
    }
    SearchResult out;
    out.query = string_field(j, "query", query.c_str());
    out.limit = limit;
    if (auto it = j.find("limit"); it != j.end() && it->is_number_unsigned()) {
        out.limit = it->get<std::size_t>();
    }
    if (auto it = j.find("results"); it != j.end()) {
        if (!it->is_array()) {
            return makeTransportError(kSearchOp, "'results' is not an array");
        }
        out.results = *it;
    }
    return out;
}

Result<SubscriptionRef> HttpTransport::subscribeStream(const std::string& topic) {
    nlohmann::json body{{"topic", topic}};
    auto res = exchange("POST", "/stream/subscribe", &body, config_.queryTimeout, kSubscribeOp);
    if (!res)
        return res.error();

    const auto& j = res.value();
    if (!j.is_object()) {
        return makeTransportError(kSubscribeOp, "acknowledgement is not an object");
    }
    SubscriptionRef ref;
    ref.topic = topic;
    // Older servers acknowledge with snake_case.
    ref.id = string_field(j, "subscriptionId", "");
    if (ref.id.empty())
        ref.id = string_field(j, "subscription_id", "unknown");
    ref.status = string_field(j, "status", "unknown");
    return ref;
}

Result<HealthStatus> HttpTransport::healthCheck() {
    auto res = exchange("GET", "/health", nullptr, config_.healthTimeout, kHealthOp);
    if (!res)
        return res.error();

    const auto& j = res.value();
    if (!j.is_object()) {
        return makeTransportError(kHealthOp, "response is not an object");
    }
    HealthStatus health;
    health.status = string_field(j, "status", "unknown");
    health.version = string_field(j, "version", "");
    health.timestamp = string_field(j, "timestamp", "");
    return health;
}

// Administrative calls: no server endpoints exist, forward to the delegate.

Result<void> HttpTransport::unsubscribe(const SubscriptionRef& subscription) {
    if (!admin_)
        return makeTransportError("Failed to unsubscribe", "no administrative endpoint");
    return admin_->unsubscribe(subscription);
}

Result<void> HttpTransport::createTable(const std::string& name, const std::string& schema) {
    if (!admin_)
        return makeTransportError("Failed to create table", "no administrative endpoint");
    return admin_->createTable(name, schema);
}

Result<void> HttpTransport::insertData(const std::string& table, const nlohmann::json& payload) {
    if (!admin_)
        return makeTransportError("Failed to insert data", "no administrative endpoint");
    return admin_->insertData(table, payload);
}

Result<IndexRef> HttpTransport::createVectorIndex(const std::string& table,
                                                  const std::string& column) {
    if (!admin_)
        return makeTransportError("Failed to create vector index", "no administrative endpoint");
    return admin_->createVectorIndex(table, column);
}

Result<SearchResult> HttpTransport::searchIndex(const IndexRef& index,
                                                const std::vector<float>& vector,
                                                std::size_t limit) {
    if (!admin_)
        return makeTransportError("Failed to search index", "no administrative endpoint");
    return admin_->searchIndex(index, vector, limit);
}

Result<void> HttpTransport::insertVector(const IndexRef& index, std::uint64_t id,
                                         const std::vector<float>& vector) {
    if (!admin_)
        return makeTransportError("Failed to insert vector", "no administrative endpoint");
    return admin_->insertVector(index, id, vector);
}

Result<void> HttpTransport::deleteIndex(const IndexRef& index) {
    if (!admin_)
        return makeTransportError("Failed to delete index", "no administrative endpoint");
    return admin_->deleteIndex(index);
}

Result<std::vector<std::string>> HttpTransport::listTables() {
    if (!admin_)
        return makeTransportError("Failed to list tables", "no administrative endpoint");
    return admin_->listTables();
}

Result<TableInfo> HttpTransport::getTableInfo(const std::string& table) {
    if (!admin_)
        return makeTransportError("Failed to get table info", "no administrative endpoint");
    return admin_->getTableInfo(table);
}

Result<StorageStats> HttpTransport::getStats() {
    if (!admin_)
        return makeTransportError("Failed to get stats", "no administrative endpoint");
    return admin_->getStats();
}

} // namespace vectra
