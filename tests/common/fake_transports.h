#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <vectra/client/client_transport.h>
#include <vectra/client/http_adapter.h>

namespace vectra::tests {

// Transport whose calls either all succeed with canned data or all fail with
// a TransportError. Counts calls so tests can check dispatch.
class FakeTransport final : public IClientTransport {
public:
    explicit FakeTransport(bool succeed = true) : succeed_(succeed) {}

    void setSucceed(bool succeed) { succeed_ = succeed; }
    // Runs on the calling thread at the start of every transport call. Set
    // it before any call is in flight.
    void setOnCall(std::function<void()> hook) { onCall_ = std::move(hook); }
    std::size_t calls() const { return calls_.load(); }

    std::string_view name() const noexcept override { return "fake"; }

    Result<nlohmann::json> executeQuery(const std::string& sql) override {
        if (auto e = check("Failed to execute query"))
            return *e;
        return nlohmann::json{{"sql", sql}, {"rows", 1}};
    }
    Result<SearchResult> vectorSearch(const std::string& query, std::size_t limit) override {
        if (auto e = check("Failed to perform vector search"))
            return *e;
        SearchResult r;
        r.results = nlohmann::json::array({{{"id", 1}, {"score", 0.9}}});
        r.query = query;
        r.limit = limit;
        return r;
    }
    Result<SubscriptionRef> subscribeStream(const std::string& topic) override {
        if (auto e = check("Failed to subscribe to stream"))
            return *e;
        return SubscriptionRef{"sub_fake", topic, "active"};
    }
    Result<void> unsubscribe(const SubscriptionRef&) override {
        if (auto e = check("Failed to unsubscribe"))
            return *e;
        return Result<void>();
    }
    Result<void> createTable(const std::string&, const std::string&) override {
        if (auto e = check("Failed to create table"))
            return *e;
        return Result<void>();
    }
    Result<void> insertData(const std::string& table, const nlohmann::json&) override {
        if (auto e = check("Failed to insert data"))
            return *e;
        std::lock_guard<std::mutex> lock(mutex_);
        insertedTables_.push_back(table);
        return Result<void>();
    }
    Result<IndexRef> createVectorIndex(const std::string& table,
                                       const std::string& column) override {
        if (auto e = check("Failed to create vector index"))
            return *e;
        return IndexRef{"idx_fake", table, column, "created"};
    }
    Result<SearchResult> searchIndex(const IndexRef&, const std::vector<float>&,
                                     std::size_t limit) override {
        if (auto e = check("Failed to search index"))
            return *e;
        SearchResult r;
        r.results = nlohmann::json::array({{{"id", 1}}});
        r.limit = limit;
        return r;
    }
    Result<void> insertVector(const IndexRef&, std::uint64_t id,
                              const std::vector<float>&) override {
        if (auto e = check("Failed to insert vector"))
            return *e;
        std::lock_guard<std::mutex> lock(mutex_);
        insertedVectors_.push_back(id);
        return Result<void>();
    }
    Result<void> deleteIndex(const IndexRef&) override {
        if (auto e = check("Failed to delete index"))
            return *e;
        return Result<void>();
    }
    Result<std::vector<std::string>> listTables() override {
        if (auto e = check("Failed to list tables"))
            return *e;
        return std::vector<std::string>{"fake"};
    }
    Result<TableInfo> getTableInfo(const std::string& table) override {
        if (auto e = check("Failed to get table info"))
            return *e;
        return TableInfo{table, 1, 1, "2024-01-01T00:00:00Z"};
    }
    Result<StorageStats> getStats() override {
        if (auto e = check("Failed to get stats"))
            return *e;
        return StorageStats{1, 1, 1};
    }
    Result<HealthStatus> healthCheck() override {
        if (auto e = check("Health check failed"))
            return *e;
        return HealthStatus{"healthy", "test", ""};
    }

    std::vector<std::string> insertedTables() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return insertedTables_;
    }

    std::vector<std::uint64_t> insertedVectors() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return insertedVectors_;
    }

private:
    std::optional<Error> check(std::string_view op) {
        calls_.fetch_add(1);
        if (onCall_)
            onCall_();
        if (succeed_.load())
            return std::nullopt;
        return makeTransportError(op, "simulated failure");
    }

    std::atomic<bool> succeed_;
    std::atomic<std::size_t> calls_{0};
    mutable std::mutex mutex_;
    std::vector<std::string> insertedTables_;
    std::vector<std::uint64_t> insertedVectors_;
    std::function<void()> onCall_;
};

// HTTP adapter returning scripted responses in order and recording requests.
class FakeHttpAdapter final : public IHttpAdapter {
public:
    void respond(long status, std::string body) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(HttpResponse{status, std::move(body)});
    }
    void failWith(Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(std::move(error));
    }

    Result<HttpResponse> send(const HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (script_.empty())
            return Error{ErrorCode::NetworkError, "connection refused"};
        auto next = std::move(script_.front());
        script_.pop_front();
        if (auto* err = std::get_if<Error>(&next))
            return *err;
        return std::get<HttpResponse>(std::move(next));
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<std::variant<HttpResponse, Error>> script_;
    std::vector<HttpRequest> requests_;
};

} // namespace vectra::tests
