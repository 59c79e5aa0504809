#include <vectra/benchmark/result_store.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <istream>
#include <ostream>
#include <string_view>

namespace vectra::benchmark {

namespace {

// Numeric suffix of `name` after `prefix`, ignoring an optional trailing unit
// such as the "b" of data_insertion_100b.
std::optional<std::size_t> numeric_suffix(const std::string& name, std::string_view prefix) {
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0)
        return std::nullopt;
    const char* first = name.data() + prefix.size();
    const char* last = name.data() + name.size();
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr == first)
        return std::nullopt;
    if (ptr != last && std::string_view(ptr, last - ptr) != "b")
        return std::nullopt;
    return value;
}

std::vector<std::pair<std::size_t, const BenchmarkResult*>>
numbered(const std::map<std::string, BenchmarkResult>& results, std::string_view prefix) {
    std::vector<std::pair<std::size_t, const BenchmarkResult*>> out;
    for (const auto& [name, result] : results) {
        if (auto n = numeric_suffix(name, prefix))
            out.emplace_back(*n, &result);
    }
    std::sort(out.begin(), out.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return out;
}

double extra_number(const BenchmarkResult& r, const std::string& key) {
    auto it = r.extra.find(key);
    if (it == r.extra.end() || !it->second.is_number())
        return 0.0;
    return it->second.get<double>();
}

std::string failure_note(const BenchmarkResult& r) {
    if (r.failures == 0)
        return {};
    return fmt::format(" ({} failed)", r.failures);
}

} // namespace

void ResultStore::record(BenchmarkResult result) {
    auto name = result.name;
    record(name, std::move(result));
}

void ResultStore::record(const std::string& name, BenchmarkResult result) {
    result.name = name;
    if (results_.count(name))
        spdlog::debug("Overwriting benchmark result '{}'", name);
    results_.insert_or_assign(name, std::move(result));
}

std::optional<BenchmarkResult> ResultStore::find(const std::string& name) const {
    auto it = results_.find(name);
    if (it == results_.end())
        return std::nullopt;
    return it->second;
}

void ResultStore::serialize(std::ostream& out) const {
    // nlohmann::json objects keep keys sorted.
    nlohmann::json doc = nlohmann::json::object();
    for (const auto& [name, result] : results_)
        doc[name] = result.toJSON();
    out << doc.dump(2) << '\n';
}

Result<void> ResultStore::save(const std::filesystem::path& path) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::WriteError,
                     fmt::format("Cannot open '{}' for writing", path.string())};
    }
    serialize(out);
    out.flush();
    if (!out) {
        return Error{ErrorCode::WriteError, fmt::format("Failed to write '{}'", path.string())};
    }
    spdlog::debug("Wrote {} benchmark results to {}", results_.size(), path.string());
    return Result<void>();
}

Result<ResultStore> ResultStore::load(std::istream& in) {
    auto doc = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return Error{ErrorCode::InvalidData, "Benchmark report is not valid JSON"};
    }
    if (!doc.is_object()) {
        return Error{ErrorCode::InvalidData, "Benchmark report must be a JSON object"};
    }

    ResultStore store;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        try {
            store.record(BenchmarkResult::fromJSON(it.key(), it.value()));
        } catch (const nlohmann::json::exception& e) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Invalid benchmark result '{}': {}", it.key(), e.what())};
        }
    }
    return store;
}

Result<ResultStore> ResultStore::loadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, fmt::format("Cannot open '{}'", path.string())};
    }
    return load(in);
}

std::vector<std::string> ResultStore::summarize() const {
    std::vector<std::string> lines;

    if (auto r = find("connection")) {
        std::string range;
        if (r->minMs && r->maxMs)
            range = fmt::format(" (min {:.2f} ms, max {:.2f} ms)", *r->minMs, *r->maxMs);
        lines.push_back(
            fmt::format("Connection: {:.2f} ms avg{}{}", r->avgMs, range, failure_note(*r)));
    }
    if (auto r = find("table_creation")) {
        lines.push_back(
            fmt::format("Table creation: {:.2f} ms avg{}", r->avgMs, failure_note(*r)));
    }
    for (const auto& [size, r] : numbered(results_, "data_insertion_")) {
        lines.push_back(fmt::format("Insertion {} B: {:.2f} ms avg, {:.2f} KB/s{}", size, r->avgMs,
                                    extra_number(*r, "throughput_kbs"), failure_note(*r)));
    }
    for (const auto& [n, r] : numbered(results_, "query_")) {
        std::string text;
        if (auto it = r->extra.find("query"); it != r->extra.end() && it->second.is_string())
            text = " [" + it->second.get<std::string>() + "]";
        lines.push_back(
            fmt::format("Query {}: {:.2f} ms avg{}{}", n, r->avgMs, text, failure_note(*r)));
    }
    for (const auto& [limit, r] : numbered(results_, "vector_search_")) {
        lines.push_back(fmt::format("Vector search (limit {}): {:.2f} ms avg{}", limit, r->avgMs,
                                    failure_note(*r)));
    }
    for (const auto& [level, r] : numbered(results_, "concurrent_")) {
        lines.push_back(fmt::format(
            "Concurrency {}: {:.0f}/{} completed, {:.2f} ops/s", level,
            extra_number(*r, "completed_operations"), level,
            extra_number(*r, "throughput_ops_per_sec")));
    }
    if (auto r = find("stress_rapid_operations")) {
        lines.push_back(
            fmt::format("Stress rapid operations: {:.2f} ms avg{}", r->avgMs, failure_note(*r)));
    }
    if (auto r = find("stress_large_data")) {
        lines.push_back(fmt::format("Stress large data ({:.0f} KB): {:.2f} ms avg{}",
                                    extra_number(*r, "data_size_kb"), r->avgMs,
                                    failure_note(*r)));
    }
    return lines;
}

} // namespace vectra::benchmark
