#include <vectra/benchmark/benchmark_harness.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>

namespace vectra::benchmark {

namespace {

constexpr const char* kInsertTable = "perf_test_table";
constexpr const char* kMemoryTable = "memory_test_table";
constexpr const char* kStressTable = "stress_test_table";

// Times one client call into `samples`. Failures are counted and remembered,
// never recorded as latency.
template <typename Fn> void timed(LatencySamples& samples, Error& lastError, const char* what,
                                  Fn&& fn) {
    const auto t0 = std::chrono::steady_clock::now();
    auto r = fn();
    const auto t1 = std::chrono::steady_clock::now();
    if (r) {
        samples.add(std::chrono::duration<double, std::milli>(t1 - t0).count());
    } else {
        samples.fail();
        lastError = r.error();
        spdlog::warn("{} failed: {}", what, r.error().message);
    }
}

Error no_samples(const char* phase, const Error& lastError) {
    if (lastError.code != ErrorCode::Success) {
        return Error{lastError.code,
                     fmt::format("{} phase produced no result: {}", phase, lastError.message)};
    }
    return Error{ErrorCode::InternalError, fmt::format("{} phase produced no result", phase)};
}

} // namespace

const char* phaseName(Phase phase) noexcept {
    switch (phase) {
        case Phase::Connection: return "connection";
        case Phase::TableOps: return "table_ops";
        case Phase::Insertion: return "insertion";
        case Phase::Query: return "query";
        case Phase::VectorSearch: return "vector_search";
        case Phase::Concurrency: return "concurrency";
        case Phase::Memory: return "memory";
        case Phase::Stress: return "stress";
        case Phase::Done: return "done";
    }
    return "unknown";
}

std::optional<Phase> parsePhase(std::string_view name) {
    std::string lower;
    for (unsigned char c : name)
        lower.push_back(c == '-' ? '_' : static_cast<char>(std::tolower(c)));
    for (Phase p : benchmarkPhases()) {
        if (lower == phaseName(p))
            return p;
    }
    return std::nullopt;
}

const std::vector<Phase>& benchmarkPhases() {
    static const std::vector<Phase> phases{Phase::Connection,   Phase::TableOps,
                                           Phase::Insertion,    Phase::Query,
                                           Phase::VectorSearch, Phase::Concurrency,
                                           Phase::Memory,       Phase::Stress};
    return phases;
}

Result<void> HarnessOptions::validate() const {
    auto invalid = [](std::string msg) { return Error{ErrorCode::ValidationError, std::move(msg)}; };

    if (connectionIterations == 0)
        return invalid("connection iterations must be at least 1");
    if (tableCount == 0)
        return invalid("table count must be at least 1");
    if (iterations == 0)
        return invalid("iterations must be at least 1");
    if (queries.empty())
        return invalid("at least one query is required");
    if (std::find(searchLimits.begin(), searchLimits.end(), 0u) != searchLimits.end())
        return invalid("search limits must be at least 1");
    if (std::find(concurrencyLevels.begin(), concurrencyLevels.end(), 0u) !=
        concurrencyLevels.end())
        return invalid("concurrency levels must be at least 1");
    if (workload.searchLimit == 0)
        return invalid("workload search limit must be at least 1");
    if (memoryInsertCount > memoryBatchSize)
        return invalid(fmt::format("memory insert count {} exceeds batch size {}",
                                   memoryInsertCount, memoryBatchSize));
    if (rapidIterations == 0 || largeIterations == 0)
        return invalid("stress iterations must be at least 1");
    return Result<void>();
}

nlohmann::json makeSizedPayload(std::size_t targetBytes, std::size_t overhead) {
    if (targetBytes <= overhead) {
        return nlohmann::json{{"id", 1}, {"data", "small"}};
    }
    return nlohmann::json{{"id", 1},
                          {"data", std::string(targetBytes - overhead, 'x')},
                          {"timestamp", "2024-01-01T00:00:00Z"}};
}

BenchmarkHarness::BenchmarkHarness(const VectraClient& client, ResultStore& store,
                                   HarnessOptions options)
    : client_(client), store_(store), options_(std::move(options)) {
    for (Phase p : benchmarkPhases())
        status_[p] = PhaseStatus::Pending;
}

PhaseStatus BenchmarkHarness::phaseStatus(Phase phase) const {
    auto it = status_.find(phase);
    return it == status_.end() ? PhaseStatus::Pending : it->second;
}

Result<void> BenchmarkHarness::runAll() {
    if (auto v = options_.validate(); !v)
        return v;

    for (Phase phase : benchmarkPhases()) {
        if (stopRequested()) {
            spdlog::warn("Stop requested, not starting {} phase", phaseName(phase));
            break;
        }
        if (options_.skip.count(phase)) {
            status_[phase] = PhaseStatus::Skipped;
            spdlog::info("Skipping {} phase", phaseName(phase));
            continue;
        }

        current_ = phase;
        spdlog::info("Running {} phase", phaseName(phase));
        Result<void> r;
        try {
            r = runPhase(phase);
        } catch (const std::exception& e) {
            r = Error{ErrorCode::InternalError,
                      fmt::format("{} phase threw: {}", phaseName(phase), e.what())};
        }
        if (r) {
            status_[phase] = PhaseStatus::Completed;
            spdlog::info("Finished {} phase", phaseName(phase));
        } else {
            status_[phase] = PhaseStatus::Failed;
            spdlog::error("{}", r.error().message);
        }
    }
    current_ = Phase::Done;
    return Result<void>();
}

Result<void> BenchmarkHarness::runPhase(Phase phase) {
    switch (phase) {
        case Phase::Connection: return runConnection();
        case Phase::TableOps: return runTableOps();
        case Phase::Insertion: return runInsertion();
        case Phase::Query: return runQuery();
        case Phase::VectorSearch: return runVectorSearch();
        case Phase::Concurrency: return runConcurrency();
        case Phase::Memory: return runMemory();
        case Phase::Stress: return runStress();
        case Phase::Done: break;
    }
    return Error{ErrorCode::InvalidArgument, "no work for the done phase"};
}

Result<void> BenchmarkHarness::runConnection() {
    LatencySamples samples;
    Error lastError;
    for (std::size_t i = 0; i < options_.connectionIterations; ++i)
        timed(samples, lastError, "health check", [&] { return client_.healthCheck(); });

    if (samples.empty())
        return no_samples("connection", lastError);
    store_.record(samples.toResult("connection", /*withRange=*/true));
    return Result<void>();
}

Result<void> BenchmarkHarness::runTableOps() {
    LatencySamples samples;
    Error lastError;
    for (std::size_t i = 0; i < options_.tableCount; ++i) {
        const auto name = fmt::format("perf_test_table_{}", i);
        timed(samples, lastError, "create table",
              [&] { return client_.createTable(name, options_.tableSchema); });
    }

    if (samples.empty())
        return no_samples("table_ops", lastError);
    store_.record(samples.toResult("table_creation"));
    return Result<void>();
}

Result<void> BenchmarkHarness::runInsertion() {
    Error lastError;
    std::size_t recorded = 0;
    for (std::size_t size : options_.payloadSizes) {
        const auto payload = makeSizedPayload(size, options_.payloadOverhead);
        LatencySamples samples;
        for (std::size_t i = 0; i < options_.iterations; ++i)
            timed(samples, lastError, "insert",
                  [&] { return client_.insertData(kInsertTable, payload); });
        if (samples.empty())
            continue;

        auto result = samples.toResult(fmt::format("data_insertion_{}b", size));
        const double kb = static_cast<double>(size) / 1024.0;
        result.extra["throughput_kbs"] = result.avgMs > 0.0 ? kb / (result.avgMs / 1000.0) : 0.0;
        result.extra["size_bytes"] = size;
        store_.record(std::move(result));
        ++recorded;
    }

    if (recorded == 0)
        return no_samples("insertion", lastError);
    return Result<void>();
}

Result<void> BenchmarkHarness::runQuery() {
    Error lastError;
    std::size_t recorded = 0;
    for (std::size_t q = 0; q < options_.queries.size(); ++q) {
        const auto& sql = options_.queries[q];
        LatencySamples samples;
        for (std::size_t i = 0; i < options_.iterations; ++i)
            timed(samples, lastError, "query", [&] { return client_.executeQuery(sql); });
        if (samples.empty())
            continue;

        auto result = samples.toResult(fmt::format("query_{}", q + 1));
        result.extra["query"] = sql;
        store_.record(std::move(result));
        ++recorded;
    }

    if (recorded == 0)
        return no_samples("query", lastError);
    return Result<void>();
}

Result<void> BenchmarkHarness::runVectorSearch() {
    Error lastError;
    std::size_t recorded = 0;
    for (std::size_t limit : options_.searchLimits) {
        LatencySamples samples;
        for (std::size_t i = 0; i < options_.iterations; ++i)
            timed(samples, lastError, "vector search",
                  [&] { return client_.vectorSearch(options_.searchQuery, limit); });
        if (samples.empty())
            continue;

        auto result = samples.toResult(fmt::format("vector_search_{}", limit));
        result.extra["limit"] = limit;
        store_.record(std::move(result));
        ++recorded;
    }

    if (recorded == 0)
        return no_samples("vector_search", lastError);
    return Result<void>();
}

Result<void> BenchmarkHarness::runConcurrency() {
    ConcurrentLoadGenerator generator(client_, options_.workload);
    for (std::size_t level : options_.concurrencyLevels) {
        if (stopRequested()) {
            spdlog::warn("Stop requested, skipping concurrency level {}", level);
            break;
        }
        auto outcome = generator.run(level);
        if (!outcome)
            return outcome.error();

        const auto& o = outcome.value();
        if (o.failed > 0)
            spdlog::warn("concurrency {}: {} of {} workers failed", level, o.failed, level);

        // Recorded even when every worker failed (samples 0, failures = level).
        BenchmarkResult result;
        result.name = fmt::format("concurrent_{}", level);
        result.avgMs = o.avgLatencyMs;
        result.samples = o.completed;
        result.failures = o.failed;
        result.extra["concurrency_level"] = level;
        result.extra["total_time_s"] = o.elapsedSeconds;
        result.extra["completed_operations"] = o.completed;
        result.extra["failed_operations"] = o.failed;
        result.extra["throughput_ops_per_sec"] = o.throughput;
        store_.record(std::move(result));
    }
    return Result<void>();
}

Result<void> BenchmarkHarness::runMemory() {
    if (options_.memoryInsertCount > options_.memoryBatchSize) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("memory insert count {} exceeds batch size {}",
                                 options_.memoryInsertCount, options_.memoryBatchSize)};
    }

    std::vector<nlohmann::json> batch;
    batch.reserve(options_.memoryBatchSize);
    const std::vector<float> vec(options_.memoryVectorDim, 0.1f);
    for (std::size_t i = 0; i < options_.memoryBatchSize; ++i) {
        batch.push_back(nlohmann::json{{"id", i},
                                       {"data", std::string(options_.memoryItemBytes, 'x')},
                                       {"vector", vec}});
    }

    LatencySamples samples;
    Error lastError;
    const std::size_t inserts = std::min(options_.memoryInsertCount, batch.size());
    for (std::size_t i = 0; i < inserts; ++i)
        timed(samples, lastError, "memory insert",
              [&] { return client_.insertData(kMemoryTable, batch[i]); });

    const double approxBytes =
        static_cast<double>(options_.memoryBatchSize) *
        static_cast<double>(options_.memoryItemBytes + options_.memoryVectorDim * sizeof(float));
    batch.clear();
    batch.shrink_to_fit();

    if (inserts > 0 && samples.empty())
        return no_samples("memory", lastError);

    auto result = samples.toResult("memory_usage");
    result.extra["test_data_size_mb"] = approxBytes / (1024.0 * 1024.0);
    result.extra["status"] = "completed";
    store_.record(std::move(result));
    return Result<void>();
}

Result<void> BenchmarkHarness::runStress() {
    Error lastError;
    std::size_t recorded = 0;

    LatencySamples rapid;
    for (std::size_t i = 0; i < options_.rapidIterations; ++i)
        timed(rapid, lastError, "get stats", [&] { return client_.getStats(); });
    if (!rapid.empty()) {
        store_.record(rapid.toResult("stress_rapid_operations"));
        ++recorded;
    }

    const nlohmann::json large{{"id", 1}, {"data", std::string(options_.largePayloadBytes, 'x')}};
    LatencySamples bulk;
    for (std::size_t i = 0; i < options_.largeIterations; ++i)
        timed(bulk, lastError, "large insert",
              [&] { return client_.insertData(kStressTable, large); });
    if (!bulk.empty()) {
        auto result = bulk.toResult("stress_large_data");
        result.extra["data_size_kb"] = options_.largePayloadBytes / 1024;
        store_.record(std::move(result));
        ++recorded;
    }

    if (recorded == 0)
        return no_samples("stress", lastError);
    return Result<void>();
}

} // namespace vectra::benchmark
