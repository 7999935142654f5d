#include <slip/config.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace slip {

namespace {

// Split a slash-separated path into components
std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

} // namespace

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map), _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<void> Config::init() noexcept {
    try {
        return initLayers();
    } catch (const YAML::Exception& e) {
        return Err(std::string("Invalid configuration: ") + e.what());
    }
}

Result<void> Config::initLayers() {
    loadDefaults();

    if (!_configPath.empty()) {
        if (auto res = loadFile(_configPath); !res) {
            return res;
        }
        _loadedPath = _configPath;
    } else {
        auto xdgPath = getXDGConfigPath();
        std::error_code ec;
        if (std::filesystem::exists(xdgPath, ec)) {
            if (auto res = loadFile(xdgPath.string()); !res) {
                spdlog::warn("Failed to load config file {}: {}", xdgPath.string(), error_msg(res));
            } else {
                _loadedPath = xdgPath.string();
            }
        }
    }
    if (!_loadedPath.empty()) {
        spdlog::debug("Loaded config from: {}", _loadedPath);
    }

    applyEnvOverrides(_config, "");

    if (_cmdOverrides && _cmdOverrides.IsMap()) {
        mergeNodes(_config, _cmdOverrides);
    }
    return Ok();
}

void Config::loadDefaults() {
    YAML::Node render(YAML::NodeType::Map);
    render["currency-symbol"] = "$";
    render["utc-offset-minutes"] = 0;
    render["error-text"] = "Error occurred";
    _config["render"] = render;

    YAML::Node preview(YAML::NodeType::Map);
    preview["width"] = 32;
    _config["preview"] = preview;

    YAML::Node log(YAML::NodeType::Map);
    log["level"] = "info";
    _config["log"] = log;
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        YAML::Node fileConfig = YAML::LoadFile(path);
        if (!fileConfig || fileConfig.IsNull()) {
            return Ok();
        }
        if (!fileConfig.IsMap()) {
            return Err("Config file is not a map: " + path);
        }
        mergeNodes(_config, fileConfig);
        return Ok();
    } catch (const YAML::BadFile&) {
        return Err("Cannot open config file: " + path);
    } catch (const YAML::Exception& e) {
        return Err("YAML parse error in " + path + ": " + std::string(e.what()));
    }
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    std::vector<std::string> keys;
    for (auto it = node.begin(); it != node.end(); ++it) {
        keys.push_back(it->first.as<std::string>());
    }

    for (const auto& key : keys) {
        std::string fullPath = prefix.empty() ? key : prefix + "/" + key;
        YAML::Node child = node[key];

        if (child.IsMap()) {
            applyEnvOverrides(child, fullPath);
            continue;
        }

        std::string envVar = pathToEnvVar(fullPath);
        if (const char* val = std::getenv(envVar.c_str())) {
            node[key] = std::string(val);
            spdlog::debug("Config override from env: {}={}", envVar, val);
        }
    }
}

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);

    // Copies only; assigning one YAML::Node to another rebinds the shared node
    std::vector<YAML::Node> chain;
    chain.push_back(_config);
    for (const auto& part : parts) {
        const YAML::Node& current = chain.back();
        if (!current.IsMap()) return YAML::Node();
        YAML::Node next = current[part];
        if (!next) return YAML::Node();
        chain.push_back(next);
    }
    return chain.back();
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '/' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;

        YAML::Node existing = target[key];
        if (value.IsMap() && existing.IsMap()) {
            mergeNodes(existing, value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        configDir = xdg;
    } else if (const char* home = std::getenv("HOME")) {
        configDir = std::filesystem::path(home) / ".config";
    } else {
        configDir = std::filesystem::current_path();
    }
    return configDir / "slip" / "config.yaml";
}

// ─── Typed accessors ────────────────────────────────────────────────────────

RenderOptions Config::renderOptions() const {
    RenderOptions options;
    options.resolver.currencySymbol = get<std::string>(KEY_CURRENCY_SYMBOL, "$");
    options.resolver.utcOffsetMinutes = get<int>(KEY_UTC_OFFSET_MINUTES, 0);
    options.errorText = get<std::string>(KEY_ERROR_TEXT, "Error occurred");
    return options;
}

int Config::previewWidth() const {
    return std::clamp(get<int>(KEY_PREVIEW_WIDTH, 32), 8, 256);
}

std::string Config::logLevel() const {
    return get<std::string>(KEY_LOG_LEVEL, "info");
}

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view name) {
    // from_str maps anything it doesn't know to off
    auto level = spdlog::level::from_str(std::string(name));
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

} // namespace slip
