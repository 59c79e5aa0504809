#pragma once

#include <atomic>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <vectra/benchmark/load_generator.h>
#include <vectra/benchmark/result_store.h>
#include <vectra/client/vectra_client.h>
#include <vectra/core/types.h>

namespace vectra::benchmark {

enum class Phase {
    Connection,
    TableOps,
    Insertion,
    Query,
    VectorSearch,
    Concurrency,
    Memory,
    Stress,
    Done
};

const char* phaseName(Phase phase) noexcept;
std::optional<Phase> parsePhase(std::string_view name);

// Phases in execution order, Done excluded.
const std::vector<Phase>& benchmarkPhases();

enum class PhaseStatus { Pending, Completed, Failed, Skipped };

struct HarnessOptions {
    std::size_t connectionIterations{10};
    std::size_t tableCount{5};
    std::string tableSchema{"id INT, name TEXT, data TEXT"};
    std::size_t iterations{10}; // per insertion size, query and search limit
    std::vector<std::size_t> payloadSizes{100, 1000, 10000};
    std::size_t payloadOverhead{50};
    std::vector<std::string> queries{"SELECT * FROM perf_test_table LIMIT 10",
                                     "SELECT COUNT(*) FROM perf_test_table",
                                     "SELECT * FROM perf_test_table WHERE id > 5"};
    std::string searchQuery{"test query"};
    std::vector<std::size_t> searchLimits{5, 10, 20, 50};
    std::vector<std::size_t> concurrencyLevels{5, 10, 20};
    WorkloadMix workload;
    std::size_t memoryBatchSize{1000};
    std::size_t memoryInsertCount{100};
    std::size_t memoryItemBytes{1000};
    std::size_t memoryVectorDim{384};
    std::size_t rapidIterations{50};
    std::size_t largePayloadBytes{100 * 1024};
    std::size_t largeIterations{10};
    std::set<Phase> skip;

    Result<void> validate() const;
};

// Builds an insert payload whose serialized size is close to `targetBytes`.
// The string field is padded to targetBytes - overhead; at or below the
// overhead a minimal payload is returned instead.
nlohmann::json makeSizedPayload(std::size_t targetBytes, std::size_t overhead = 50);

// Drives the fixed phase sequence against one client. Phases run one after
// another on the calling thread. A failed call is counted and the phase
// continues; a phase that ends with no successful sample, or throws, records
// nothing and the run moves on. Concurrency levels are the exception: each
// level that ran is recorded, even one where every worker failed. Nothing is
// retried.
class BenchmarkHarness {
public:
    BenchmarkHarness(const VectraClient& client, ResultStore& store, HarnessOptions options = {});

    // Runs every phase not listed in options.skip. Only invalid options make
    // this fail; phase failures are reported through phaseStatus().
    Result<void> runAll();

    Result<void> runPhase(Phase phase);

    Result<void> runConnection();
    Result<void> runTableOps();
    Result<void> runInsertion();
    Result<void> runQuery();
    Result<void> runVectorSearch();
    Result<void> runConcurrency();
    // ValidationError when memoryInsertCount exceeds memoryBatchSize.
    Result<void> runMemory();
    Result<void> runStress();

    // Safe to call from a signal handler or another thread. The current
    // phase (or concurrency batch) finishes; nothing further is started.
    void requestStop() noexcept { stopRequested_.store(true, std::memory_order_relaxed); }
    bool stopRequested() const noexcept { return stopRequested_.load(std::memory_order_relaxed); }

    Phase currentPhase() const noexcept { return current_; }
    PhaseStatus phaseStatus(Phase phase) const;
    const HarnessOptions& options() const noexcept { return options_; }

private:
    const VectraClient& client_;
    ResultStore& store_;
    HarnessOptions options_;
    Phase current_{Phase::Connection};
    std::map<Phase, PhaseStatus> status_;
    std::atomic<bool> stopRequested_{false};
};

} // namespace vectra::benchmark
