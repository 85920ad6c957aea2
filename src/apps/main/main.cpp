// BPMN layout command line: reads a JSON model, resolves positions, writes JSON (C++20)
#include <bpmn_layout/external_layout.hpp>
#include <bpmn_layout/logging.hpp>
#include <bpmn_layout/position_resolver.hpp>
#include <bpmn_loaders/json_loader.hpp>
#include <bpmn_loaders/options_loader.hpp>
#include <cstdio>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

const int exit_ok = 0;
const int exit_usage = 1;
const int exit_input = 2;
const int exit_output = 3;

void print_usage(const char* program)
{
    (void)fprintf(stderr,
        "usage: %s [options] <model.json | ->\n"
        "  -o <file>              write the resolved model to <file> (default: stdout)\n"
        "  --layout <mode>        graphviz | preserve\n"
        "  --direction <dir>      LR | TB | RL | BT\n"
        "  --graphviz-path <exe>  Graphviz dot executable (default: dot)\n"
        "  --no-external          never run Graphviz, use the built-in layout\n"
        "  --config <file>        JSON settings file\n"
        "  --log-level <level>    trace | debug | info | warn | error | critical | off\n"
        "  --log-file <file>      also write the log to <file>\n",
        program);
}

// Command line values; unset ones leave config and environment in charge.
struct CommandLine {
    std::string input;
    std::string output;
    std::string config;
    std::optional<std::string> layout;
    std::optional<std::string> direction;
    std::optional<std::string> graphviz_path;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    bool no_external = false;
    bool help = false;
};

std::optional<CommandLine> parse_command_line(int argc, char* argv[])
{
    CommandLine cl;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                (void)fprintf(stderr, "%s needs a value\n", flag);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            cl.help = true;
        } else if (arg == "--no-external") {
            cl.no_external = true;
        } else if (arg == "-o" || arg == "--config" || arg == "--layout" || arg == "--direction"
            || arg == "--graphviz-path" || arg == "--log-level" || arg == "--log-file") {
            auto v = value(arg.c_str());
            if (!v) return std::nullopt;
            if (arg == "-o") cl.output = *v;
            else if (arg == "--config") cl.config = *v;
            else if (arg == "--layout") cl.layout = *v;
            else if (arg == "--direction") cl.direction = *v;
            else if (arg == "--graphviz-path") cl.graphviz_path = *v;
            else if (arg == "--log-level") cl.log_level = *v;
            else cl.log_file = *v;
        } else if (arg.size() > 1 && arg[0] == '-') {
            (void)fprintf(stderr, "unknown option %s\n", arg.c_str());
            return std::nullopt;
        } else if (cl.input.empty()) {
            cl.input = arg;
        } else {
            (void)fprintf(stderr, "more than one input given\n");
            return std::nullopt;
        }
    }
    if (!cl.help && cl.input.empty()) {
        (void)fprintf(stderr, "no input model given\n");
        return std::nullopt;
    }
    return cl;
}

// defaults < config file < environment < command line
std::optional<bpmn_loaders::LayoutSettings> build_settings(const CommandLine& cl)
{
    bpmn_loaders::LayoutSettings settings;
    if (!cl.config.empty()) {
        auto loaded = bpmn_loaders::load_settings_from_json_file(cl.config, settings);
        if (!loaded) return std::nullopt;
        settings = *loaded;
    }
    settings = bpmn_loaders::apply_environment(settings);

    if (cl.layout) {
        const auto mode = bpmn_layout::parse_layout_mode(*cl.layout);
        if (!mode) {
            (void)fprintf(stderr, "invalid --layout %s\n", cl.layout->c_str());
            return std::nullopt;
        }
        settings.layout.mode = *mode;
    }
    if (cl.direction) {
        const auto dir = bpmn_layout::parse_direction(*cl.direction);
        if (!dir) {
            (void)fprintf(stderr, "invalid --direction %s\n", cl.direction->c_str());
            return std::nullopt;
        }
        settings.layout.direction = *dir;
    }
    if (cl.log_level) {
        const auto level = bpmn_loaders::parse_log_level(*cl.log_level);
        if (!level) {
            (void)fprintf(stderr, "invalid --log-level %s\n", cl.log_level->c_str());
            return std::nullopt;
        }
        settings.log_level = *level;
    }
    if (cl.graphviz_path) settings.graphviz_path = *cl.graphviz_path;
    if (cl.log_file) settings.log_file = *cl.log_file;
    if (cl.no_external) settings.use_external = false;
    return settings;
}

} // namespace

int main(int argc, char* argv[])
{
    const auto cl = parse_command_line(argc, argv);
    if (!cl) {
        print_usage(argv[0]);
        return exit_usage;
    }
    if (cl->help) {
        print_usage(argv[0]);
        return exit_ok;
    }

    const auto settings = build_settings(*cl);
    if (!settings) return exit_usage;
    auto logger = bpmn_layout::layout_logger();
    if (!bpmn_layout::configure_logging(settings->log_level, settings->log_file))
        logger->warn("Continuing with console logging only");

    const auto model = cl->input == "-"
        ? bpmn_loaders::load_model_from_json(std::cin)
        : bpmn_loaders::load_model_from_json_file(cl->input);
    if (!model) {
        logger->error("Could not load model from {}", cl->input == "-" ? "stdin" : cl->input);
        return exit_input;
    }

    std::unique_ptr<bpmn_layout::GraphvizLayoutEngine> engine;
    if (settings->use_external)
        engine = std::make_unique<bpmn_layout::GraphvizLayoutEngine>(settings->graphviz_path);

    logger->info("Resolving {} shapes (layout={}, direction={})", model->shapes.size(),
        bpmn_layout::to_string(settings->layout.mode), bpmn_layout::to_string(settings->layout.direction));
    const bpmn_model::Model resolved = bpmn_layout::resolve_positions(*model, settings->layout, engine.get());

    const bool written = cl->output.empty()
        ? bpmn_loaders::write_model_to_json(resolved, std::cout)
        : bpmn_loaders::write_model_to_json_file(resolved, cl->output);
    if (!written) {
        logger->error("Could not write the resolved model");
        return exit_output;
    }
    return exit_ok;
}
