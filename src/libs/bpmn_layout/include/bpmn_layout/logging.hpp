#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace bpmn_layout {

// Logger shared by the layout engine ("bpmn_layout", stderr).
std::shared_ptr<spdlog::logger> layout_logger();

// Sets the engine log level and, if log_file is non-empty, also writes to that file (truncated).
// Returns false when the file sink could not be created; console logging keeps working.
bool configure_logging(spdlog::level::level_enum level, const std::string& log_file = {});

} // namespace bpmn_layout
