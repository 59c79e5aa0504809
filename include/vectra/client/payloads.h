#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vectra {

struct SearchResult {
    nlohmann::json results = nlohmann::json::array();
    std::string query;
    std::size_t limit{0};
};

struct TableInfo {
    std::string name;
    std::uint64_t rows{0};
    std::uint64_t sizeBytes{0};
    std::string createdAt;
};

struct StorageStats {
    std::uint64_t totalTables{0};
    std::uint64_t totalRows{0};
    std::uint64_t totalSizeBytes{0};
};

struct HealthStatus {
    std::string status;
    std::string version;
    std::string timestamp;
};

// Server-side resource descriptors returned by transports. Handles wrap these.
struct IndexRef {
    std::string id;
    std::string table;
    std::string column;
    std::string status;
};

struct SubscriptionRef {
    std::string id;
    std::string topic;
    std::string status;
};

void to_json(nlohmann::json& j, const SearchResult& r);
void to_json(nlohmann::json& j, const TableInfo& info);
void to_json(nlohmann::json& j, const StorageStats& stats);
void to_json(nlohmann::json& j, const HealthStatus& health);

} // namespace vectra
