#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace vectra::benchmark {

// One named measurement. avgMs is the mean of successful samples only;
// failures counts calls that did not complete.
struct BenchmarkResult {
    std::string name;
    double avgMs{0.0};
    std::optional<double> minMs;
    std::optional<double> maxMs;
    std::size_t samples{0};
    std::size_t failures{0};
    std::map<std::string, nlohmann::json> extra;

    nlohmann::json toJSON() const;
    static BenchmarkResult fromJSON(const std::string& name, const nlohmann::json& j);

    bool operator==(const BenchmarkResult&) const = default;
};

// Latency accumulator for one phase or sub-case.
class LatencySamples {
public:
    void add(double ms) {
        if (ms < 0.0)
            ms = 0.0;
        if (count_ == 0 || ms < min_)
            min_ = ms;
        if (count_ == 0 || ms > max_)
            max_ = ms;
        sum_ += ms;
        ++count_;
    }
    void fail() { ++failures_; }

    std::size_t count() const { return count_; }
    std::size_t failures() const { return failures_; }
    bool empty() const { return count_ == 0; }
    double mean() const { return count_ ? sum_ / static_cast<double>(count_) : 0.0; }
    double min() const { return min_; }
    double max() const { return max_; }

    // Result with avg/samples/failures filled in; min/max only when requested.
    BenchmarkResult toResult(std::string name, bool withRange = false) const;

private:
    double sum_{0.0};
    double min_{0.0};
    double max_{0.0};
    std::size_t count_{0};
    std::size_t failures_{0};
};

} // namespace vectra::benchmark
