#include <vectra/benchmark/benchmark_harness.h>
#include <vectra/benchmark/result_store.h>
#include <vectra/client/embedded_engine.h>
#include <vectra/client/in_memory_engine.h>
#include <vectra/client/vectra_client.h>
#include <vectra/config/config_helpers.h>
#include <vectra/config/logging.h>
#include <vectra/version.hpp>

#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::atomic<vectra::benchmark::BenchmarkHarness*> g_harness{nullptr};
std::atomic<bool> g_interrupted{false};

void signalHandler(int) {
    g_interrupted = true;
    if (auto* harness = g_harness.load())
        harness->requestStop();
}

bool setupLogging(const std::string& level, const std::string& logFile) {
    if (auto r = vectra::config::setup_logging("vectra-bench", level, logFile); !r) {
        std::cerr << "Error: " << r.error().message << std::endl;
        return false;
    }
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"vectra-bench - latency and throughput benchmark for vectra engines"};
    app.set_version_flag("--version", VECTRA_VERSION_STRING);

    std::string host;
    int port = 0;
    bool embedded = false;
    bool placeholder = false;
    std::string output = "performance_results.json";
    std::vector<std::string> skip;
    std::size_t iterations = 0;
    std::string configPath;
    std::string logLevel = "info";
    std::string logFile;

    app.add_option("--host", host, "Server host");
    app.add_option("--port", port, "Server port")->check(CLI::Range(1, 65535));
    auto* embeddedFlag = app.add_flag("--embedded", embedded, "Use the in-process engine");
    app.add_flag("--placeholder", placeholder, "Use the placeholder transport (no server)")
        ->excludes(embeddedFlag);
    auto* outputOpt = app.add_option("--output,-o", output, "Report file")
                          ->default_val("performance_results.json");
    app.add_option("--skip", skip, "Phases to skip")
        ->check(CLI::IsMember({"connection", "table_ops", "insertion", "query", "vector_search",
                               "concurrency", "memory", "stress"}));
    auto* iterationsOpt =
        app.add_option("--iterations", iterations, "Repetitions per insertion, query and search case")
            ->check(CLI::PositiveNumber);
    app.add_option("--config", configPath, "Configuration file path");
    app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error/off)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}))
        ->default_val("info");
    app.add_option("--log-file", logFile, "Log file path");

    CLI11_PARSE(app, argc, argv);

    if (!setupLogging(logLevel, logFile))
        return 1;

    vectra::registerInMemoryEngine();

    vectra::ClientConfig config;
    config.embeddedAvailable = vectra::detectEmbeddedCapability();

    const auto path = vectra::config::get_config_path(configPath);
    if (auto r = vectra::config::apply_config_file(config, path); !r) {
        std::cerr << "Error: " << r.error().message << std::endl;
        return 1;
    }
    if (auto r = vectra::config::apply_env_overrides(config); !r) {
        std::cerr << "Error: " << r.error().message << std::endl;
        return 1;
    }
    if (!host.empty())
        config.host = host;
    if (port > 0)
        config.port = static_cast<std::uint16_t>(port);
    if (embedded)
        config.transportMode = vectra::TransportMode::Embedded;
    else if (placeholder)
        config.transportMode = vectra::TransportMode::Placeholder;

    vectra::benchmark::HarnessOptions options;
    if (outputOpt->count() == 0) {
        if (auto v = vectra::config::parse_config_value(path, "benchmark", "output"); !v.empty())
            output = v;
    }
    if (iterationsOpt->count() > 0) {
        options.iterations = iterations;
    } else if (auto v = vectra::config::parse_config_value(path, "benchmark", "iterations");
               !v.empty()) {
        auto n = vectra::config::parse_integer(v);
        if (!n || *n <= 0) {
            std::cerr << "Error: invalid benchmark iterations '" << v << "' in config file"
                      << std::endl;
            return 1;
        }
        options.iterations = static_cast<std::size_t>(*n);
    }
    for (const auto& name : skip) {
        if (auto phase = vectra::benchmark::parsePhase(name))
            options.skip.insert(*phase);
    }

    auto client = vectra::VectraClient::create(config);
    if (!client) {
        std::cerr << "Error: " << client.error().message << std::endl;
        return 1;
    }

    spdlog::info("vectra-bench {} using {} transport at {}", VECTRA_VERSION_STRING,
                 vectra::transportModeName(config.transportMode), config.baseAddress());

    vectra::benchmark::ResultStore store;
    vectra::benchmark::BenchmarkHarness harness(client.value(), store, options);
    g_harness = &harness;
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto run = harness.runAll();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_harness = nullptr;

    if (!run) {
        std::cerr << "Error: " << run.error().message << std::endl;
        return 1;
    }

    std::cout << "\n=== Benchmark summary ===\n";
    for (const auto& line : store.summarize())
        std::cout << "  " << line << "\n";
    std::cout << std::flush;

    if (auto saved = store.save(output); !saved) {
        std::cerr << "Error: " << saved.error().message << std::endl;
        return 1;
    }
    std::cout << "Results written to " << output << std::endl;

    return g_interrupted ? 1 : 0;
}
