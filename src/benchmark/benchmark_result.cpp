#include <vectra/benchmark/benchmark_result.h>

namespace vectra::benchmark {

nlohmann::json BenchmarkResult::toJSON() const {
    nlohmann::json j;
    j["avg_time_ms"] = avgMs;
    if (minMs)
        j["min_time_ms"] = *minMs;
    if (maxMs)
        j["max_time_ms"] = *maxMs;
    j["samples"] = samples;
    j["failures"] = failures;
    auto ex = nlohmann::json::object();
    for (const auto& [key, value] : extra)
        ex[key] = value;
    j["extra"] = std::move(ex);
    return j;
}

BenchmarkResult BenchmarkResult::fromJSON(const std::string& name, const nlohmann::json& j) {
    BenchmarkResult r;
    r.name = name;
    r.avgMs = j.at("avg_time_ms").get<double>();
    if (auto it = j.find("min_time_ms"); it != j.end() && !it->is_null())
        r.minMs = it->get<double>();
    if (auto it = j.find("max_time_ms"); it != j.end() && !it->is_null())
        r.maxMs = it->get<double>();
    r.samples = j.value("samples", std::size_t{0});
    r.failures = j.value("failures", std::size_t{0});
    if (auto it = j.find("extra"); it != j.end() && it->is_object()) {
        for (auto e = it->begin(); e != it->end(); ++e)
            r.extra[e.key()] = e.value();
    }
    return r;
}

BenchmarkResult LatencySamples::toResult(std::string name, bool withRange) const {
    BenchmarkResult r;
    r.name = std::move(name);
    r.avgMs = mean();
    r.samples = count_;
    r.failures = failures_;
    if (withRange && count_ > 0) {
        r.minMs = min_;
        r.maxMs = max_;
    }
    return r;
}

} // namespace vectra::benchmark
