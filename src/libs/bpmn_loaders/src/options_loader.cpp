#include <bpmn_loaders/options_loader.hpp>
#include <bpmn_layout/logging.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <utility>

namespace bpmn_loaders {

namespace {

std::optional<LayoutSettings> parse_settings(const nlohmann::json& j, LayoutSettings s) {
    auto logger = bpmn_layout::layout_logger();
    if (!j.is_object()) {
        logger->error("Config: top level must be an object");
        return std::nullopt;
    }

    if (j.contains("layout")) {
        const auto mode = j["layout"].is_string() ? bpmn_layout::parse_layout_mode(j["layout"].get<std::string>()) : std::nullopt;
        if (!mode) {
            logger->error("Config: invalid \"layout\" {}", j["layout"].dump());
            return std::nullopt;
        }
        s.layout.mode = *mode;
    }
    if (j.contains("direction")) {
        const auto dir = j["direction"].is_string() ? bpmn_layout::parse_direction(j["direction"].get<std::string>()) : std::nullopt;
        if (!dir) {
            logger->error("Config: invalid \"direction\" {}", j["direction"].dump());
            return std::nullopt;
        }
        s.layout.direction = *dir;
    }
    if (j.contains("graphviz_path") && j["graphviz_path"].is_string()) s.graphviz_path = j["graphviz_path"].get<std::string>();
    if (j.contains("log_file") && j["log_file"].is_string()) s.log_file = j["log_file"].get<std::string>();
    if (j.contains("log_level")) {
        const auto level = j["log_level"].is_string() ? parse_log_level(j["log_level"].get<std::string>()) : std::nullopt;
        if (!level) {
            logger->error("Config: invalid \"log_level\" {}", j["log_level"].dump());
            return std::nullopt;
        }
        s.log_level = *level;
    }
    return s;
}

} // namespace

std::optional<LayoutSettings> load_settings_from_json(std::istream& in, LayoutSettings base) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_settings(j, std::move(base));
    } catch (const nlohmann::json::exception& e) {
        bpmn_layout::layout_logger()->error("Config: {}", e.what());
        return std::nullopt;
    }
}

std::optional<LayoutSettings> load_settings_from_json_file(const std::string& path, LayoutSettings base) {
    std::ifstream f(path);
    if (!f) {
        bpmn_layout::layout_logger()->error("Cannot open config file {}", path);
        return std::nullopt;
    }
    return load_settings_from_json(f, std::move(base));
}

std::optional<std::string> getenv_lookup(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

LayoutSettings apply_environment(LayoutSettings s, const EnvLookup& lookup) {
    auto logger = bpmn_layout::layout_logger();
    if (const auto v = lookup("BPMN_LAYOUT_MODE")) {
        if (const auto mode = bpmn_layout::parse_layout_mode(*v))
            s.layout.mode = *mode;
        else
            logger->warn("Ignoring BPMN_LAYOUT_MODE={}", *v);
    }
    if (const auto v = lookup("BPMN_LAYOUT_DIRECTION")) {
        if (const auto dir = bpmn_layout::parse_direction(*v))
            s.layout.direction = *dir;
        else
            logger->warn("Ignoring BPMN_LAYOUT_DIRECTION={}", *v);
    }
    if (const auto v = lookup("BPMN_LAYOUT_GRAPHVIZ_PATH")) s.graphviz_path = *v;
    return s;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off.
    if (level == spdlog::level::off && name != "off") return std::nullopt;
    return level;
}

} // namespace bpmn_loaders
