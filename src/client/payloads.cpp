#include <vectra/client/client_config.h>
#include <vectra/client/payloads.h>

#include <algorithm>
#include <cctype>

namespace vectra {

void to_json(nlohmann::json& j, const SearchResult& r) {
    j = nlohmann::json{{"results", r.results}, {"query", r.query}, {"limit", r.limit}};
}

void to_json(nlohmann::json& j, const TableInfo& info) {
    j = nlohmann::json{{"name", info.name},
                       {"rows", info.rows},
                       {"size_bytes", info.sizeBytes},
                       {"created_at", info.createdAt}};
}

void to_json(nlohmann::json& j, const StorageStats& stats) {
    j = nlohmann::json{{"total_tables", stats.totalTables},
                       {"total_rows", stats.totalRows},
                       {"total_size_bytes", stats.totalSizeBytes}};
}

void to_json(nlohmann::json& j, const HealthStatus& health) {
    j = nlohmann::json{{"status", health.status}};
    if (!health.version.empty())
        j["version"] = health.version;
    if (!health.timestamp.empty())
        j["timestamp"] = health.timestamp;
}

const char* transportModeName(TransportMode mode) noexcept {
    switch (mode) {
        case TransportMode::Embedded:
            return "embedded";
        case TransportMode::Remote:
            return "remote";
        case TransportMode::Placeholder:
            return "placeholder";
    }
    return "remote";
}

std::optional<TransportMode> parseTransportMode(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "embedded" || lower == "native")
        return TransportMode::Embedded;
    if (lower == "remote" || lower == "http")
        return TransportMode::Remote;
    if (lower == "placeholder" || lower == "mock")
        return TransportMode::Placeholder;
    return std::nullopt;
}

} // namespace vectra
