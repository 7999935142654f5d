#include <slip/config.h>
#include <slip/element.h>
#include <slip/interpreter.h>
#include <slip/order.h>
#include <slip/text-preview.h>
#include <args.hxx>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <yaml-cpp/yaml.h>

#include <iostream>
#include <optional>
#include <string>

using namespace slip;

// JSON is a subset of YAML flow syntax, so one loader covers both
static Result<YAML::Node> loadStructuredFile(const std::string& path) {
    try {
        return Ok(YAML::LoadFile(path));
    } catch (const YAML::BadFile&) {
        return Err<YAML::Node>("cannot open " + path);
    } catch (const YAML::Exception& e) {
        return Err<YAML::Node>("cannot parse " + path + ": " + e.what());
    }
}

static void printCommands(const CommandList& commands) {
    for (const auto& cmd : commands) {
        std::cout << toString(cmd) << "\n";
    }
}

int main(int argc, const char** argv) {
    args::ArgumentParser parser(
        "slip-render - render a receipt design into printer commands",
        "Formats:\n"
        "  commands   one command per line, e.g. Text(\"Total: $9.99\", bold)\n"
        "  preview    monospace preview of the printed receipt\n"
        "  yaml       command list as YAML for a printer driver\n"
        "\n"
        "Examples:\n"
        "  slip-render --design receipt.json --order order.json\n"
        "  slip-render -d receipt.json -f preview -w 42\n"
    );

    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});
    args::ValueFlag<std::string> designPath(parser, "file",
        "Design document (JSON or YAML)", {'d', "design"}, args::Options::Required);
    args::ValueFlag<std::string> orderPath(parser, "file",
        "Order data (JSON or YAML); omitted means defaults for every field", {'o', "order"});
    args::ValueFlag<std::string> configPath(parser, "file",
        "Config file (default: $XDG_CONFIG_HOME/slip/config.yaml)", {'c', "config"});
    args::MapFlag<std::string, std::string> format(parser, "format",
        "Output format: commands, preview, yaml", {'f', "format"},
        {{"commands", "commands"}, {"preview", "preview"}, {"yaml", "yaml"}}, "commands");
    args::ValueFlag<int> width(parser, "columns", "Preview width", {'w', "width"});
    args::Flag verbose(parser, "verbose", "Debug logging", {'v', "verbose"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::Error& e) {
        std::cerr << e.what() << "\n";
        std::cerr << parser;
        return 1;
    }

    // stdout carries the rendered output
    spdlog::set_default_logger(spdlog::stderr_color_mt("slip-render"));

    // Command line wins over file and environment
    YAML::Node overrides(YAML::NodeType::Map);
    if (width) {
        overrides["preview"]["width"] = args::get(width);
    }
    if (verbose) {
        overrides["log"]["level"] = "debug";
    }

    auto configRes = Config::create(configPath ? args::get(configPath) : "", overrides);
    if (!configRes) {
        std::cerr << "error: " << error_msg(configRes) << "\n";
        return 1;
    }
    const Config::Ptr config = *configRes;
    if (auto level = parseLogLevel(config->logLevel())) {
        spdlog::set_level(*level);
    } else {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("Unknown log level '{}', using info", config->logLevel());
    }

    auto designRes = loadStructuredFile(args::get(designPath));
    if (!designRes) {
        std::cerr << "error: " << error_msg(designRes) << "\n";
        return 1;
    }
    spdlog::info("Loaded design from {}", args::get(designPath));

    std::optional<Order> order;
    if (orderPath) {
        auto orderNode = loadStructuredFile(args::get(orderPath));
        if (!orderNode) {
            std::cerr << "error: " << error_msg(orderNode) << "\n";
            return 1;
        }
        auto decoded = decodeOrder(*orderNode);
        if (!decoded) {
            std::cerr << "error: " << args::get(orderPath) << ": " << error_msg(decoded) << "\n";
            return 1;
        }
        order = std::move(*decoded);
        spdlog::info("Loaded order {} ({} items)", order->orderId, order->items.size());
    }

    Interpreter interpreter(config->renderOptions());
    CommandList commands = interpreter.render(*designRes, order ? &*order : nullptr);

    const std::string mode = args::get(format);
    if (mode == "preview") {
        std::cout << renderTextPreview(commands, config->previewWidth());
    } else if (mode == "yaml") {
        std::cout << encodeCommands(commands) << "\n";
    } else {
        printCommands(commands);
    }
    return 0;
}
