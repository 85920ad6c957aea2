#include <bpmn_layout/logging.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace bpmn_layout {

namespace {

const char* const logger_name = "bpmn_layout";
const char* const log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

std::shared_ptr<spdlog::logger> create_logger() {
    if (auto existing = spdlog::get(logger_name)) return existing;
    try {
        auto logger = spdlog::stderr_color_mt(logger_name);
        logger->set_level(spdlog::level::info);
        logger->set_pattern(log_pattern);
        return logger;
    } catch (const spdlog::spdlog_ex&) {
        return spdlog::default_logger();
    }
}

} // namespace

std::shared_ptr<spdlog::logger> layout_logger() {
    static const std::shared_ptr<spdlog::logger> logger = create_logger();
    return logger;
}

bool configure_logging(spdlog::level::level_enum level, const std::string& log_file) {
    auto logger = layout_logger();
    logger->set_level(level);
    if (log_file.empty()) return true;

    try {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
        file_sink->set_pattern(log_pattern);
        logger->sinks().push_back(file_sink);
        logger->flush_on(spdlog::level::warn);
        logger->info("Logging to file={}", log_file);
    } catch (const spdlog::spdlog_ex& e) {
        logger->warn("Could not open log file {}: {}", log_file, e.what());
        return false;
    }
    return true;
}

} // namespace bpmn_layout
