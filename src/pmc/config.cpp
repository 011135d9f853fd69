#include <pmc/config.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace pmc {

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize config", res);
    }
    return Ok(config);
}

Config::Ptr Config::createDefaults() noexcept {
    return Ptr(new Config("", YAML::Node()));
}

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _configPath(configPath), _cmdOverrides(cmdOverrides) {
    loadDefaults();
}

void Config::loadDefaults() {
    _config = YAML::Load(R"(
layout:
  header-height: 1
  status-height: 1
  command-height: 1
render:
  truecolor: true
input:
  escape-timeout-ms: 25
  resize-debounce-ms: 120
keys:
  toggle: Ctrl+T
  quit: Ctrl+Q
  edit: F2
  complete: Tab
store:
  auto-save: true
  id-attempts: 5
log:
  level: info
theme:
  header:
    fg: bright-white
    bg: blue
  grid-header:
    fg: bright-yellow
    bg: default
  row:
    fg: default
    bg: default
  selected-row:
    fg: black
    bg: cyan
  selected-cell:
    fg: black
    bg: bright-cyan
  edit-cell:
    fg: bright-white
    bg: magenta
  status:
    fg: black
    bg: white
  command:
    fg: default
    bg: default
  command-focused:
    fg: bright-white
    bg: default
)");
}

Result<void> Config::init() noexcept {
    std::string effectivePath = _configPath;
    if (effectivePath.empty()) {
        auto xdgPath = getXDGConfigPath();
        std::error_code ec;
        if (std::filesystem::exists(xdgPath, ec)) {
            effectivePath = xdgPath.string();
        }
    }

    if (!effectivePath.empty()) {
        if (auto res = loadFile(effectivePath); !res) {
            // An explicitly requested file must exist and parse
            if (!_configPath.empty()) {
                return res;
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

Result<void> Config::loadFile(const std::string& path) {
    try {
        YAML::Node loaded = YAML::LoadFile(path);
        if (!loaded || loaded.IsNull()) {
            return Ok();
        }
        if (!loaded.IsMap()) {
            return Err<void>("config root must be a map: " + path);
        }
        mergeNodes(_config, loaded);
        return Ok();
    } catch (const YAML::BadFile&) {
        return Err<void>("Cannot open config file: " + path);
    } catch (const YAML::Exception& e) {
        return Err<void>(std::string("YAML parse error: ") + e.what());
    }
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    if (!node.IsMap()) return;
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string path = prefix.empty() ? key : prefix + "." + key;
        YAML::Node child = it->second;
        if (child.IsMap()) {
            applyEnvOverrides(child, path);
            continue;
        }
        std::string envName = pathToEnvVar(path);
        if (const char* env = std::getenv(envName.c_str())) {
            ydebug("Config: {} overridden by {}", path, envName);
            node[key] = std::string(env);
        }
    }
}

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);
    if (parts.empty()) return YAML::Node();

    const YAML::Node& root = _config;
    YAML::Node current;
    current.reset(root);
    for (const auto& part : parts) {
        if (!current.IsMap()) return YAML::Node();
        const YAML::Node& cref = current;
        YAML::Node next = cref[part];
        if (!next) return YAML::Node();
        current.reset(next);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

std::filesystem::path Config::getXDGConfigPath() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "pmc" / "config.yaml";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "pmc" / "config.yaml";
    }
    return {};
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string result = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') {
            result += '_';
        } else {
            result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return result;
}

std::vector<std::string> Config::splitPath(const std::string& path) {
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

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    if (!source.IsMap()) return;
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        YAML::Node existing = target[key];
        if (value.IsMap() && existing.IsMap()) {
            mergeNodes(existing, value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

} // namespace pmc
