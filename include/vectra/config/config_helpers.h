#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <vectra/client/client_config.h>
#include <vectra/core/types.h>

namespace vectra::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Parse a value from a TOML config file. Accepts "[section] key = v" and
// "section.key = v". Returns empty when the file or key is missing.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Config file location: override > $VECTRA_CONFIG > $XDG_CONFIG_HOME/vectra/config.toml
// > ~/.config/vectra/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

std::optional<long> parse_integer(std::string_view s);

// Applies [client] keys from the config file. Unknown or malformed values are
// rejected with InvalidArgument; missing keys leave `config` unchanged.
Result<void> apply_config_file(ClientConfig& config, const std::filesystem::path& config_path);

// Applies VECTRA_HOST, VECTRA_PORT and VECTRA_TRANSPORT.
Result<void> apply_env_overrides(ClientConfig& config);

} // namespace vectra::config
