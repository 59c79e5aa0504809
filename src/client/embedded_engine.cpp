#include <vectra/client/embedded_engine.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <mutex>
#include <string_view>

namespace vectra {

namespace {

std::mutex& registry_mutex() {
    static std::mutex m;
    return m;
}

EmbeddedEngineHost::Factory& registry_factory() {
    static EmbeddedEngineHost::Factory factory;
    return factory;
}

} // namespace

void EmbeddedEngineHost::registerFactory(Factory factory) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    registry_factory() = std::move(factory);
}

void EmbeddedEngineHost::clearFactory() {
    std::lock_guard<std::mutex> lock(registry_mutex());
    registry_factory() = nullptr;
}

bool EmbeddedEngineHost::hasFactory() {
    std::lock_guard<std::mutex> lock(registry_mutex());
    return static_cast<bool>(registry_factory());
}

Result<std::shared_ptr<IEmbeddedEngine>> EmbeddedEngineHost::acquire(const ClientConfig& config) {
    Factory factory;
    {
        std::lock_guard<std::mutex> lock(registry_mutex());
        factory = registry_factory();
    }
    if (!factory) {
        return Error{ErrorCode::TransportUnavailable, "no in-process engine is registered"};
    }
    try {
        auto engine = factory(config);
        if (!engine)
            return Error{ErrorCode::TransportUnavailable,
                         "in-process engine failed to start: " + engine.error().message};
        if (!engine.value())
            return Error{ErrorCode::TransportUnavailable, "in-process engine factory returned null"};
        return engine;
    } catch (const std::exception& e) {
        return Error{ErrorCode::TransportUnavailable,
                     std::string("in-process engine failed to start: ") + e.what()};
    }
}

bool detectEmbeddedCapability() {
    if (const char* env = std::getenv("VECTRA_DISABLE_EMBEDDED"); env && *env) {
        std::string_view v(env);
        if (v != "0" && v != "false") {
            spdlog::debug("Embedded transport disabled by VECTRA_DISABLE_EMBEDDED");
            return false;
        }
    }
    const bool available = EmbeddedEngineHost::hasFactory();
    spdlog::debug("Embedded transport capability: {}", available ? "available" : "unavailable");
    return available;
}

} // namespace vectra
