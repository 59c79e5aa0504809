#include <vectra/benchmark/load_generator.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <vector>

namespace vectra::benchmark {

bool ConcurrentLoadGenerator::runOne(std::size_t workerIndex) const {
    switch (workerIndex % 3) {
        case 0: {
            auto r = client_.executeQuery(mix_.query);
            if (!r)
                spdlog::debug("worker {}: {}", workerIndex, r.error().message);
            return static_cast<bool>(r);
        }
        case 1: {
            auto r = client_.vectorSearch(mix_.searchText, mix_.searchLimit);
            if (!r)
                spdlog::debug("worker {}: {}", workerIndex, r.error().message);
            return static_cast<bool>(r);
        }
        default: {
            auto r = client_.getStats();
            if (!r)
                spdlog::debug("worker {}: {}", workerIndex, r.error().message);
            return static_cast<bool>(r);
        }
    }
}

Result<ConcurrencyOutcome> ConcurrentLoadGenerator::run(std::size_t level) const {
    if (level == 0) {
        return Error{ErrorCode::ValidationError, "Concurrency level must be at least 1"};
    }

    std::atomic<std::size_t> completed{0};
    std::atomic<std::size_t> failed{0};
    // One slot per worker; each worker writes only its own slot.
    std::vector<double> latencies(level, -1.0);

    const auto start = std::chrono::steady_clock::now();
    {
        boost::asio::thread_pool pool(level);
        for (std::size_t i = 0; i < level; ++i) {
            boost::asio::post(pool, [this, i, &completed, &failed, &latencies] {
                const auto t0 = std::chrono::steady_clock::now();
                bool ok = false;
                try {
                    ok = runOne(i);
                } catch (const std::exception& e) {
                    spdlog::warn("worker {} threw: {}", i, e.what());
                }
                if (ok) {
                    latencies[i] = std::chrono::duration<double, std::milli>(
                                       std::chrono::steady_clock::now() - t0)
                                       .count();
                    completed.fetch_add(1, std::memory_order_relaxed);
                } else {
                    failed.fetch_add(1, std::memory_order_relaxed);
                }
            });
        }
        pool.join();
    }
    const auto elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    ConcurrencyOutcome out;
    out.level = level;
    out.completed = completed.load();
    out.failed = failed.load();
    out.elapsedSeconds = elapsed;
    out.throughput = elapsed > 0.0 ? static_cast<double>(out.completed) / elapsed : 0.0;

    double sum = 0.0;
    std::size_t n = 0;
    for (double ms : latencies) {
        if (ms >= 0.0) {
            sum += ms;
            ++n;
        }
    }
    out.avgLatencyMs = n ? sum / static_cast<double>(n) : 0.0;

    spdlog::debug("concurrency {}: {} completed, {} failed in {:.3f}s", level, out.completed,
                  out.failed, elapsed);
    return out;
}

} // namespace vectra::benchmark
