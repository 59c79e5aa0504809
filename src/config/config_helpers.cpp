#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <vectra/config/config_helpers.h>

#include <spdlog/spdlog.h>

namespace vectra::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside of quotes
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos)
                v.erase(close + 1);
        } else if (!v.empty()) {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        if ((currentSection == section && k == key) || k == section + "." + key) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("VECTRA_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path(".config") / "vectra" / "config.toml";
    }

    return configHome / "vectra" / "config.toml";
}

std::optional<long> parse_integer(std::string_view s) {
    long value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

namespace {

Result<void> apply_port(ClientConfig& config, const std::string& raw, std::string_view origin) {
    auto port = parse_integer(raw);
    if (!port || *port <= 0 || *port > std::numeric_limits<std::uint16_t>::max()) {
        return Error{ErrorCode::InvalidArgument,
                     "invalid port '" + raw + "' from " + std::string(origin)};
    }
    config.port = static_cast<std::uint16_t>(*port);
    return Result<void>();
}

Result<void> apply_mode(ClientConfig& config, const std::string& raw, std::string_view origin) {
    auto mode = parseTransportMode(raw);
    if (!mode) {
        return Error{ErrorCode::InvalidArgument,
                     "invalid transport '" + raw + "' from " + std::string(origin)};
    }
    config.transportMode = *mode;
    return Result<void>();
}

Result<void> apply_timeout(std::chrono::milliseconds& target, const std::string& raw,
                           std::string_view key) {
    auto ms = parse_integer(raw);
    if (!ms || *ms <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     "invalid " + std::string(key) + " '" + raw + "' in config file"};
    }
    target = std::chrono::milliseconds(*ms);
    return Result<void>();
}

} // namespace

Result<void> apply_config_file(ClientConfig& config, const std::filesystem::path& config_path) {
    std::error_code ec;
    if (config_path.empty() || !std::filesystem::exists(config_path, ec)) {
        spdlog::debug("No config file at '{}'", config_path.string());
        return Result<void>();
    }
    spdlog::debug("Loading client config from {}", config_path.string());

    if (auto host = parse_config_value(config_path, "client", "host"); !host.empty())
        config.host = host;
    if (auto port = parse_config_value(config_path, "client", "port"); !port.empty()) {
        if (auto r = apply_port(config, port, "config file"); !r)
            return r;
    }
    if (auto mode = parse_config_value(config_path, "client", "transport"); !mode.empty()) {
        if (auto r = apply_mode(config, mode, "config file"); !r)
            return r;
    }
    if (auto v = parse_config_value(config_path, "client", "query_timeout_ms"); !v.empty()) {
        if (auto r = apply_timeout(config.queryTimeout, v, "query_timeout_ms"); !r)
            return r;
    }
    if (auto v = parse_config_value(config_path, "client", "health_timeout_ms"); !v.empty()) {
        if (auto r = apply_timeout(config.healthTimeout, v, "health_timeout_ms"); !r)
            return r;
    }
    return Result<void>();
}

Result<void> apply_env_overrides(ClientConfig& config) {
    if (const char* host = std::getenv("VECTRA_HOST"); host && *host)
        config.host = host;
    if (const char* port = std::getenv("VECTRA_PORT"); port && *port) {
        if (auto r = apply_port(config, port, "VECTRA_PORT"); !r)
            return r;
    }
    if (const char* mode = std::getenv("VECTRA_TRANSPORT"); mode && *mode) {
        if (auto r = apply_mode(config, mode, "VECTRA_TRANSPORT"); !r)
            return r;
    }
    return Result<void>();
}

} // namespace vectra::config
