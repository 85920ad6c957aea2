#pragma once

#include <bpmn_layout/types.hpp>
#include <spdlog/common.h>
#include <functional>
#include <istream>
#include <optional>
#include <string>

namespace bpmn_loaders {

// Everything the command line front end can configure.
struct LayoutSettings {
    bpmn_layout::LayoutOptions layout;
    std::string graphviz_path = "dot";
    bool use_external = true;
    spdlog::level::level_enum log_level = spdlog::level::info;
    std::string log_file;
};

// Reads `layout`, `direction`, `graphviz_path`, `log_level` and `log_file` on top of `base`.
// nullopt (reason logged) on malformed JSON or an unknown value.
std::optional<LayoutSettings> load_settings_from_json(std::istream& in, LayoutSettings base = {});
std::optional<LayoutSettings> load_settings_from_json_file(const std::string& path, LayoutSettings base = {});

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Process environment.
std::optional<std::string> getenv_lookup(const std::string& name);

// BPMN_LAYOUT_MODE, BPMN_LAYOUT_DIRECTION, BPMN_LAYOUT_GRAPHVIZ_PATH override `base`.
// Unknown values are logged and ignored.
LayoutSettings apply_environment(LayoutSettings base, const EnvLookup& lookup = getenv_lookup);

// "trace" .. "off", as spdlog names them.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

} // namespace bpmn_loaders
