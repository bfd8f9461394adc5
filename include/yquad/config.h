#pragma once

#include <yquad/result.hpp>
#include <yaml-cpp/yaml.h>
#include <array>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace yquad {

//-----------------------------------------------------------------------------
// Config - layered YAML configuration
//
// Precedence, lowest first: built-in defaults, config file, environment
// (YQUAD_<PATH>), command-line overrides.
//-----------------------------------------------------------------------------
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Factory method following the create pattern. An empty configPath falls
    // back to the XDG location when that file exists.
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    // Defaults + YAML text, no file/env lookup (tests, embedded configs)
    static Result<Ptr> fromString(const std::string& yaml) noexcept;

    ~Config() = default;

    // Non-copyable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g., "culling.enabled")
    // Returns nullopt if key doesn't exist or has the wrong type
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    // Get a value with default fallback
    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }
    const std::string& loadedPath() const { return _loadedPath; }

    static std::filesystem::path getXDGConfigPath();

    // Environment variable prefix
    static constexpr const char* ENV_PREFIX = "YQUAD_";

    // Config keys
    static constexpr const char* KEY_WINDOW_WIDTH = "window.width";
    static constexpr const char* KEY_WINDOW_HEIGHT = "window.height";
    static constexpr const char* KEY_CULLING_ENABLED = "culling.enabled";
    static constexpr const char* KEY_CULLING_VALIDATE = "culling.validate-records";
    static constexpr const char* KEY_CULLING_CPU_THREADS = "culling.cpu-threads";
    static constexpr const char* KEY_RENDER_CLEAR_COLOR = "render.clear-color";
    static constexpr const char* KEY_SHADERS_DIR = "shaders.dir";
    static constexpr const char* KEY_DEMO_COLUMNS = "demo.columns";
    static constexpr const char* KEY_DEMO_ROWS = "demo.rows";
    static constexpr const char* KEY_DEMO_STATS_INTERVAL = "demo.stats-interval";

    // Typed accessors
    uint32_t windowWidth() const;
    uint32_t windowHeight() const;
    bool cullingEnabled() const;
    bool validateRecords() const;
    uint32_t cpuThreads() const;
    std::array<double, 4> clearColor() const;
    std::string shaderDir() const;

    // Convert dotted path to env var name ("culling.cpu-threads" -> "YQUAD_CULLING_CPU_THREADS")
    static std::string pathToEnvVar(const std::string& path);

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    Result<void> loadString(const std::string& yaml);
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    // Merge YAML nodes (source into target)
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    std::string _loadedPath;
    YAML::Node _cmdOverrides;
};

// Template implementations
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

} // namespace yquad
