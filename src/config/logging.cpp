#include <vectra/config/logging.h>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace vectra::config {

Result<void> setup_logging(const std::string& name, const std::string& level,
                           const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!logFile.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true));
        } catch (const spdlog::spdlog_ex& e) {
            return Error{ErrorCode::WriteError,
                         "cannot open log file '" + logFile + "': " + e.what()};
        }
    }
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
    return Result<void>();
}

} // namespace vectra::config
