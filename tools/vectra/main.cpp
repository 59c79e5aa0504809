#include <vectra/client/embedded_engine.h>
#include <vectra/client/in_memory_engine.h>
#include <vectra/client/vectra_client.h>
#include <vectra/config/config_helpers.h>
#include <vectra/config/logging.h>
#include <vectra/version.hpp>

#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <cctype>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace {

bool setupLogging(const std::string& level, const std::string& logFile) {
    if (auto r = vectra::config::setup_logging("vectra", level, logFile); !r) {
        std::cerr << "Error: " << r.error().message << std::endl;
        return false;
    }
    return true;
}

int fail(const vectra::Error& error) {
    std::cerr << "Error: " << error.message << std::endl;
    return 1;
}

void printJson(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

const char* kInteractiveHelp = R"(Commands:
  SELECT / CREATE / INSERT / UPDATE / DELETE ...   run a statement
  help                                             show this help
  quit, exit                                       leave)";

bool isStatement(const std::string& line) {
    std::string word;
    for (char c : line) {
        if (std::isspace(static_cast<unsigned char>(c)))
            break;
        word.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return word == "select" || word == "create" || word == "insert" || word == "update" ||
           word == "delete";
}

int runInteractive(const vectra::VectraClient& client) {
    std::cout << "vectra " << VECTRA_VERSION_STRING << " connected via "
              << client.transport().name() << ". Type 'help' for commands." << std::endl;
    std::string line;
    while (true) {
        std::cout << "vectra> " << std::flush;
        if (!std::getline(std::cin, line))
            break;
        vectra::config::trim(line);
        if (line.empty())
            continue;
        if (line == "quit" || line == "exit")
            break;
        if (line == "help") {
            std::cout << kInteractiveHelp << std::endl;
            continue;
        }
        if (!isStatement(line)) {
            std::cout << "Unknown command. Type 'help' for available commands." << std::endl;
            continue;
        }
        auto result = client.executeQuery(line);
        if (!result) {
            std::cerr << "Error: " << result.error().message << std::endl;
            continue;
        }
        printJson(result.value());
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"vectra - command line client for vectra engines"};
    app.set_version_flag("--version", VECTRA_VERSION_STRING);
    app.require_subcommand(1);

    std::string host;
    int port = 0;
    bool embedded = false;
    bool placeholder = false;
    std::string configPath;
    std::string logLevel = "warn";
    std::string logFile;

    app.add_option("--host", host, "Server host");
    app.add_option("--port", port, "Server port")->check(CLI::Range(1, 65535));
    auto* embeddedFlag = app.add_flag("--embedded", embedded, "Use the in-process engine");
    app.add_flag("--placeholder", placeholder, "Use the placeholder transport (no server)")
        ->excludes(embeddedFlag);
    app.add_option("--config", configPath, "Configuration file path");
    app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error/off)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}))
        ->default_val("warn");
    app.add_option("--log-file", logFile, "Log file path");

    // Each subcommand stores the action to run once the client exists.
    std::function<int(const vectra::VectraClient&)> action;

    std::string sql;
    auto* query = app.add_subcommand("query", "Execute a statement");
    query->add_option("sql", sql, "Statement text")->required();
    query->callback([&] {
        action = [&](const vectra::VectraClient& c) {
            auto r = c.executeQuery(sql);
            if (!r)
                return fail(r.error());
            printJson(r.value());
            return 0;
        };
    });

    std::string searchText;
    std::size_t limit = 10;
    auto* search = app.add_subcommand("search", "Vector similarity search");
    search->add_option("query", searchText, "Query text")->required();
    search->add_option("--limit,-k", limit, "Maximum results")
        ->default_val(10)
        ->check(CLI::PositiveNumber);
    search->callback([&] {
        action = [&](const vectra::VectraClient& c) {
            auto r = c.vectorSearch(searchText, limit);
            if (!r)
                return fail(r.error());
            printJson(r.value());
            return 0;
        };
    });

    std::string topic;
    auto* subscribe = app.add_subcommand("subscribe", "Subscribe to a stream topic");
    subscribe->add_option("topic", topic, "Topic name")->required();
    subscribe->callback([&] {
        action = [&](const vectra::VectraClient& c) {
            auto r = c.subscribeStream(topic);
            if (!r)
                return fail(r.error());
            printJson({{"subscriptionId", r.value().id()},
                       {"topic", r.value().topic()},
                       {"status", r.value().status()}});
            return 0;
        };
    });

    std::string table;
    std::string schema;
    auto* createTable = app.add_subcommand("create-table", "Create a table");
    createTable->add_option("name", table, "Table name")->required();
    createTable->add_option("schema", schema, "Column definitions")->required();
    createTable->callback([&] {
        action = [&](const vectra::VectraClient& c) {
            auto r = c.createTable(table, schema);
            if (!r)
                return fail(r.error());
            std::cout << "Created table " << table << std::endl;
            return 0;
        };
    });

    std::string payload;
    auto* insert = app.add_subcommand("insert", "Insert a JSON row or array of rows");
    insert->add_option("table", table, "Table name")->required();
    insert->add_option("json", payload, "Row payload")->required();
    insert->callback([&] {
        action = [&](const vectra::VectraClient& c) {
            auto row = nlohmann::json::parse(payload, nullptr, /*allow_exceptions=*/false);
            if (row.is_discarded())
                return fail(vectra::Error{vectra::ErrorCode::InvalidArgument,
                                          "insert payload is not valid JSON"});
            auto r = c.insertData(table, row);
            if (!r)
                return fail(r.error());
            std::cout << "Inserted into " << table << std::endl;
            return 0;
        };
    });

    std::string column;
    auto* createIndex = app.add_subcommand("create-index", "Create a vector index");
    createIndex->add_option("table", table, "Table name")->required();
    createIndex->add_option("column", column, "Vector column")->required();
    createIndex->callback([&] {
        action = [&](const vectra::VectraClient& c) {
            auto r = c.createVectorIndex(table, column);
            if (!r)
                return fail(r.error());
            printJson({{"id", r.value().id()},
                       {"table", r.value().table()},
                       {"column", r.value().column()},
                       {"status", r.value().status()}});
            return 0;
        };
    });

    auto* listTables = app.add_subcommand("list-tables", "List tables");
    listTables->callback([&] {
        action = [](const vectra::VectraClient& c) {
            auto r = c.listTables();
            if (!r)
                return fail(r.error());
            for (const auto& name : r.value())
                std::cout << name << "\n";
            std::cout << std::flush;
            return 0;
        };
    });

    auto* tableInfo = app.add_subcommand("table-info", "Show table details");
    tableInfo->add_option("name", table, "Table name")->required();
    tableInfo->callback([&] {
        action = [&](const vectra::VectraClient& c) {
            auto r = c.getTableInfo(table);
            if (!r)
                return fail(r.error());
            printJson(r.value());
            return 0;
        };
    });

    auto* stats = app.add_subcommand("stats", "Show storage statistics");
    stats->callback([&] {
        action = [](const vectra::VectraClient& c) {
            auto r = c.getStats();
            if (!r)
                return fail(r.error());
            printJson(r.value());
            return 0;
        };
    });

    auto* health = app.add_subcommand("health", "Check engine health");
    health->callback([&] {
        action = [](const vectra::VectraClient& c) {
            auto r = c.healthCheck();
            if (!r)
                return fail(r.error());
            printJson(r.value());
            return 0;
        };
    });

    auto* interactive = app.add_subcommand("interactive", "Read statements from stdin");
    interactive->callback([&] { action = runInteractive; });

    CLI11_PARSE(app, argc, argv);

    if (!setupLogging(logLevel, logFile))
        return 1;

    vectra::registerInMemoryEngine();

    vectra::ClientConfig config;
    config.embeddedAvailable = vectra::detectEmbeddedCapability();
    if (auto r = vectra::config::apply_config_file(config,
                                                   vectra::config::get_config_path(configPath));
        !r)
        return fail(r.error());
    if (auto r = vectra::config::apply_env_overrides(config); !r)
        return fail(r.error());
    if (!host.empty())
        config.host = host;
    if (port > 0)
        config.port = static_cast<std::uint16_t>(port);
    if (embedded)
        config.transportMode = vectra::TransportMode::Embedded;
    else if (placeholder)
        config.transportMode = vectra::TransportMode::Placeholder;

    auto client = vectra::VectraClient::create(config);
    if (!client)
        return fail(client.error());

    if (!action)
        return 1;
    return action(client.value());
}
