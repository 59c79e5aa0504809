#pragma once

#include <cstddef>
#include <string>
#include <utility>

#include <vectra/client/vectra_client.h>
#include <vectra/core/types.h>

namespace vectra::benchmark {

struct ConcurrencyOutcome {
    std::size_t level{0};
    std::size_t completed{0};
    std::size_t failed{0};
    double elapsedSeconds{0.0};
    double throughput{0.0};   // completed / elapsedSeconds
    double avgLatencyMs{0.0}; // mean over completed workers
};

// Operations replayed by the workers.
struct WorkloadMix {
    std::string query{"SELECT * FROM perf_test_table LIMIT 1"};
    std::string searchText{"test"};
    std::size_t searchLimit{5};
};

// Runs `level` workers at once on a pool of `level` threads, one operation
// each. Worker i runs executeQuery, vectorSearch or getStats by i % 3. A
// failing worker never affects its siblings, and run() only returns after
// every worker has finished, so completed + failed == level always holds.
class ConcurrentLoadGenerator {
public:
    explicit ConcurrentLoadGenerator(const VectraClient& client, WorkloadMix mix = {})
        : client_(client), mix_(std::move(mix)) {}

    Result<ConcurrencyOutcome> run(std::size_t level) const;

private:
    bool runOne(std::size_t workerIndex) const;

    const VectraClient& client_;
    WorkloadMix mix_;
};

} // namespace vectra::benchmark
