#include "yquad/config.h"
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

#ifndef YQUAD_SHADER_DIR
#define YQUAD_SHADER_DIR CMAKE_SOURCE_DIR "/src/yquad/shaders"
#endif

namespace yquad {

// ─── Helpers ─────────────────────────────────────────────────────────────────

// Split a dotted path into components
static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// ─── Factory ─────────────────────────────────────────────────────────────────

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<Config::Ptr> Config::fromString(const std::string& yaml) noexcept {
    auto config = Ptr(new Config("", YAML::Node()));
    if (auto res = config->loadString(yaml); !res) {
        return Err<Ptr>("Failed to parse config", res);
    }
    return Ok(std::move(config));
}

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map)
    , _configPath(configPath)
    , _cmdOverrides(cmdOverrides) {
    loadDefaults();
}

Result<void> Config::init() noexcept {
    std::string effectivePath = _configPath;
    if (effectivePath.empty()) {
        std::error_code ec;
        auto xdgPath = getXDGConfigPath();
        if (std::filesystem::exists(xdgPath, ec)) {
            effectivePath = xdgPath.string();
        }
    }

    if (!effectivePath.empty()) {
        if (auto res = loadFile(effectivePath); !res) {
            // An explicitly requested file must load
            if (!_configPath.empty()) {
                return Err("Cannot load config file " + effectivePath, res);
            }
            ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
        } else {
            _loadedPath = effectivePath;
            yinfo("Loaded config from: {}", effectivePath);
        }
    }

    applyEnvOverrides(_config, "");

    if (_cmdOverrides && _cmdOverrides.IsMap()) {
        mergeNodes(_config, _cmdOverrides);
    }
    return Ok();
}

// ─── Loading ─────────────────────────────────────────────────────────────────

void Config::loadDefaults() {
    _config["window"]["width"] = 1280;
    _config["window"]["height"] = 800;

    _config["culling"]["enabled"] = true;
    _config["culling"]["validate-records"] = true;
    _config["culling"]["cpu-threads"] = 0;

    YAML::Node clear(YAML::NodeType::Sequence);
    clear.push_back(0.08);
    clear.push_back(0.08);
    clear.push_back(0.1);
    clear.push_back(1.0);
    _config["render"]["clear-color"] = clear;

    _config["shaders"]["dir"] = std::string(YQUAD_SHADER_DIR);

    _config["demo"]["columns"] = 48;
    _config["demo"]["rows"] = 32;
    _config["demo"]["stats-interval"] = 120;
}

Result<void> Config::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadString(buffer.str());
}

Result<void> Config::loadString(const std::string& yaml) {
    try {
        YAML::Node fileConfig = YAML::Load(yaml);
        if (!fileConfig || fileConfig.IsNull()) {
            return Ok();
        }
        if (!fileConfig.IsMap()) {
            return Err<void>("config root must be a mapping");
        }
        mergeNodes(_config, fileConfig);
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    std::vector<std::string> keys;
    for (auto it = node.begin(); it != node.end(); ++it) {
        keys.push_back(it->first.as<std::string>());
    }

    for (const auto& key : keys) {
        std::string fullPath = prefix.empty() ? key : prefix + "." + key;
        YAML::Node child = node[key];
        if (child.IsMap()) {
            applyEnvOverrides(child, fullPath);
            continue;
        }

        std::string envVar = pathToEnvVar(fullPath);
        const char* val = std::getenv(envVar.c_str());
        if (!val) continue;

        try {
            node[key] = YAML::Load(val);
            ydebug("Config override from env: {}={}", envVar, val);
        } catch (const YAML::Exception& e) {
            ywarn("Ignoring {}: {}", envVar, e.what());
        }
    }
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        if (value.IsMap() && target[key] && target[key].IsMap()) {
            mergeNodes(target[key], value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

// ─── Lookup ──────────────────────────────────────────────────────────────────

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);
    if (parts.empty()) {
        return YAML::Node();
    }

    // Node assignment writes through in yaml-cpp; rebind with reset()
    YAML::Node current;
    current.reset(_config);
    for (const auto& p : parts) {
        if (!current.IsMap()) {
            return YAML::Node();
        }
        const YAML::Node& constCurrent = current;
        YAML::Node next = constCurrent[p];
        if (!next) {
            return YAML::Node();
        }
        current.reset(next);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node.IsDefined() && !node.IsNull();
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }
    return configDir / "yquad" / "config.yaml";
}

// ─── Typed accessors ─────────────────────────────────────────────────────────

uint32_t Config::windowWidth() const {
    return get<uint32_t>(KEY_WINDOW_WIDTH, 1280);
}

uint32_t Config::windowHeight() const {
    return get<uint32_t>(KEY_WINDOW_HEIGHT, 800);
}

bool Config::cullingEnabled() const {
    return get<bool>(KEY_CULLING_ENABLED, true);
}

bool Config::validateRecords() const {
    return get<bool>(KEY_CULLING_VALIDATE, true);
}

uint32_t Config::cpuThreads() const {
    return get<uint32_t>(KEY_CULLING_CPU_THREADS, 0);
}

std::array<double, 4> Config::clearColor() const {
    std::array<double, 4> color = {0.08, 0.08, 0.1, 1.0};
    auto values = get<std::vector<double>>(KEY_RENDER_CLEAR_COLOR);
    if (values && values->size() >= 3) {
        for (size_t i = 0; i < std::min<size_t>(values->size(), 4); ++i) {
            color[i] = (*values)[i];
        }
    }
    return color;
}

std::string Config::shaderDir() const {
    return get<std::string>(KEY_SHADERS_DIR, YQUAD_SHADER_DIR);
}

} // namespace yquad
