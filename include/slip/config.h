#pragma once

#include <slip/interpreter.h>
#include <slip/result.hpp>
#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace slip {

/**
 * Config - layered settings for the renderer and its tools.
 *
 * Layers, later wins:
 *   1. built-in defaults
 *   2. YAML file (explicit path, else $XDG_CONFIG_HOME/slip/config.yaml)
 *   3. environment: SLIP_<PATH>, e.g. render/currency-symbol -> SLIP_RENDER_CURRENCY_SYMBOL
 *   4. command line overrides
 *
 * Paths are slash separated: "render/error-text".
 */
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    // Non-copyable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Returns nullopt if the key doesn't exist or doesn't convert
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    // Path of the file that was loaded, empty if none
    const std::string& loadedPath() const { return _loadedPath; }

    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "SLIP_";

    static constexpr const char* KEY_CURRENCY_SYMBOL = "render/currency-symbol";
    static constexpr const char* KEY_UTC_OFFSET_MINUTES = "render/utc-offset-minutes";
    static constexpr const char* KEY_ERROR_TEXT = "render/error-text";
    static constexpr const char* KEY_PREVIEW_WIDTH = "preview/width";
    static constexpr const char* KEY_LOG_LEVEL = "log/level";

    RenderOptions renderOptions() const;
    int previewWidth() const;
    std::string logLevel() const;

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;
    Result<void> initLayers();

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    // "render/error-text" -> "SLIP_RENDER_ERROR_TEXT"
    static std::string pathToEnvVar(const std::string& path);

    // Merge source into target, recursing into maps
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    std::string _loadedPath;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

// spdlog level by name ("debug", "warn", ...), nullopt if unknown
std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view name);

} // namespace slip
