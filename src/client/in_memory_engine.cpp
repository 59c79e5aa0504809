#include <vectra/client/in_memory_engine.h>
#include <vectra/version.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <string_view>

namespace vectra {

namespace {

std::string iso8601_now() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string lowercase(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Name following the first FROM keyword, or empty.
std::string referenced_table(const std::string& sql) {
    const auto lower = lowercase(sql);
    std::size_t pos = 0;
    while ((pos = lower.find("from", pos)) != std::string::npos) {
        const bool startOk = pos == 0 || std::isspace(static_cast<unsigned char>(lower[pos - 1]));
        const bool endOk =
            pos + 4 < lower.size() && std::isspace(static_cast<unsigned char>(lower[pos + 4]));
        if (startOk && endOk)
            break;
        pos += 4;
    }
    if (pos == std::string::npos)
        return {};

    std::size_t b = pos + 4;
    while (b < sql.size() && std::isspace(static_cast<unsigned char>(sql[b])))
        ++b;
    std::size_t e = b;
    while (e < sql.size() &&
           (std::isalnum(static_cast<unsigned char>(sql[e])) || sql[e] == '_' || sql[e] == '.'))
        ++e;
    return sql.substr(b, e - b);
}

nlohmann::json scored_hits(std::size_t count) {
    auto hits = nlohmann::json::array();
    for (std::size_t i = 0; i < count; ++i) {
        hits.push_back({{"id", i + 1}, {"score", 1.0 - 0.05 * static_cast<double>(i + 1)}});
    }
    return hits;
}

constexpr std::size_t kMaxHits = 3;

} // namespace

InMemoryEngine::InMemoryEngine() = default;

Result<nlohmann::json> InMemoryEngine::executeQuery(const std::string& sql) {
    const auto table = referenced_table(sql);
    std::uint64_t rows = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = tables_.find(table); it != tables_.end())
            rows = it->second.rows.size();
    }
    return nlohmann::json{{"rows", rows}, {"sql", sql}, {"status", "success"}};
}

Result<nlohmann::json> InMemoryEngine::vectorSearch(const std::string& query, std::size_t limit) {
    spdlog::trace("in-memory vector search '{}' limit {}", query, limit);
    return scored_hits(std::min(limit, kMaxHits));
}

Result<std::string> InMemoryEngine::subscribe(const std::string& topic) {
    std::string id = "sub_" + std::to_string(nextSubscription_.fetch_add(1));
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_[id] = topic;
    return id;
}

Result<void> InMemoryEngine::unsubscribe(const std::string& subscriptionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.erase(subscriptionId);
    return Result<void>();
}

Result<void> InMemoryEngine::createTable(const std::string& name, const std::string& schema) {
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument, "table name is empty"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& table = tables_[name];
    table.schema = schema;
    if (table.createdAt.empty())
        table.createdAt = iso8601_now();
    return Result<void>();
}

Result<void> InMemoryEngine::insert(const std::string& table, const nlohmann::json& row) {
    if (table.empty()) {
        return Error{ErrorCode::InvalidArgument, "table name is empty"};
    }
    auto serialized = row.dump();
    std::lock_guard<std::mutex> lock(mutex_);
    auto& t = tables_[table];
    if (t.createdAt.empty())
        t.createdAt = iso8601_now();
    t.sizeBytes += serialized.size();
    t.rows.push_back(std::move(serialized));
    return Result<void>();
}

Result<std::string> InMemoryEngine::createIndex(const std::string& table,
                                                const std::string& column) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tables_.find(table) == tables_.end()) {
        return Error{ErrorCode::NotFound, "table '" + table + "' does not exist"};
    }
    std::string id = "idx_" + table + "_" + column;
    indexes_[id] = Index{table, column};
    return id;
}

Result<nlohmann::json> InMemoryEngine::searchIndex(const std::string& indexId,
                                                   const std::vector<float>& vector,
                                                   std::size_t limit) {
    std::size_t rows = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = indexes_.find(indexId);
        if (it == indexes_.end()) {
            return Error{ErrorCode::NotFound, "index '" + indexId + "' does not exist"};
        }
        if (auto t = tables_.find(it->second.table); t != tables_.end())
            rows = t->second.rows.size();
    }
    if (vector.empty()) {
        return Error{ErrorCode::InvalidArgument, "query vector is empty"};
    }
    return scored_hits(std::min({limit, kMaxHits, std::max<std::size_t>(rows, 1)}));
}

Result<void> InMemoryEngine::insertVector(const std::string& indexId, std::uint64_t id,
                                          const std::vector<float>& vector) {
    if (vector.empty()) {
        return Error{ErrorCode::InvalidArgument, "vector is empty"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = indexes_.find(indexId);
    if (it == indexes_.end()) {
        return Error{ErrorCode::NotFound, "index '" + indexId + "' does not exist"};
    }
    auto& vectors = it->second.vectors;
    if (!vectors.empty() && vectors.begin()->second.size() != vector.size()) {
        return Error{ErrorCode::InvalidArgument,
                     "vector has " + std::to_string(vector.size()) + " dimensions, index '" +
                         indexId + "' holds " +
                         std::to_string(vectors.begin()->second.size())};
    }
    vectors[id] = vector;
    return Result<void>();
}

std::size_t InMemoryEngine::vectorCount(const std::string& indexId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = indexes_.find(indexId);
    return it == indexes_.end() ? 0 : it->second.vectors.size();
}

Result<void> InMemoryEngine::dropIndex(const std::string& indexId) {
    std::lock_guard<std::mutex> lock(mutex_);
    indexes_.erase(indexId);
    return Result<void>();
}

Result<std::vector<std::string>> InMemoryEngine::listTables() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tables_.size());
    for (const auto& [name, _] : tables_)
        names.push_back(name);
    return names;
}

Result<TableInfo> InMemoryEngine::tableInfo(const std::string& table) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tables_.find(table);
    if (it == tables_.end()) {
        return Error{ErrorCode::NotFound, "table '" + table + "' does not exist"};
    }
    return TableInfo{table, it->second.rows.size(), it->second.sizeBytes, it->second.createdAt};
}

Result<StorageStats> InMemoryEngine::stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    StorageStats s;
    s.totalTables = tables_.size();
    for (const auto& [_, t] : tables_) {
        s.totalRows += t.rows.size();
        s.totalSizeBytes += t.sizeBytes;
    }
    return s;
}

Result<HealthStatus> InMemoryEngine::health() {
    return HealthStatus{"healthy", VECTRA_VERSION_STRING, iso8601_now()};
}

std::size_t InMemoryEngine::subscriptionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

void registerInMemoryEngine() {
    auto engine = std::make_shared<InMemoryEngine>();
    EmbeddedEngineHost::registerFactory(
        [engine](const ClientConfig&) -> Result<std::shared_ptr<IEmbeddedEngine>> {
            return std::shared_ptr<IEmbeddedEngine>(engine);
        });
}

} // namespace vectra
