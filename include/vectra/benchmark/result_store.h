#pragma once

#include <filesystem>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <vectra/benchmark/benchmark_result.h>
#include <vectra/core/types.h>

namespace vectra::benchmark {

// Named benchmark results. Recording a name twice keeps the later result.
class ResultStore {
public:
    void record(BenchmarkResult result);
    void record(const std::string& name, BenchmarkResult result);

    bool contains(const std::string& name) const { return results_.count(name) != 0; }
    std::optional<BenchmarkResult> find(const std::string& name) const;
    std::size_t size() const { return results_.size(); }
    bool empty() const { return results_.empty(); }
    const std::map<std::string, BenchmarkResult>& results() const { return results_; }

    // Pretty-printed JSON object keyed by result name; keys and fields are
    // emitted in sorted order so repeated runs diff cleanly.
    void serialize(std::ostream& out) const;
    Result<void> save(const std::filesystem::path& path) const;

    static Result<ResultStore> load(std::istream& in);
    static Result<ResultStore> loadFile(const std::filesystem::path& path);

    // Display lines for the known categories in a fixed order. Custom result
    // names are left out.
    std::vector<std::string> summarize() const;

private:
    std::map<std::string, BenchmarkResult> results_;
};

} // namespace vectra::benchmark
