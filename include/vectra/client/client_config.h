#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vectra {

enum class TransportMode {
    Embedded,
    Remote,
    // Performs no server interaction; for demos and tests.
    Placeholder
};

const char* transportModeName(TransportMode mode) noexcept;
std::optional<TransportMode> parseTransportMode(std::string_view name);

struct ClientConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{8080};
    TransportMode transportMode{TransportMode::Remote};
    // Result of detectEmbeddedCapability(), checked once at startup.
    bool embeddedAvailable{false};
    std::chrono::milliseconds queryTimeout{30000};
    std::chrono::milliseconds healthTimeout{10000};

    std::string baseAddress() const { return "http://" + host + ":" + std::to_string(port); }
};

} // namespace vectra
