#pragma once

#include <pmc/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pmc {

class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Defaults, then file (explicit path or XDG), then PMC_* env, then overrides
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    // Defaults only; no file, no environment
    static Ptr createDefaults() noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g., "layout.header-height")
    // Returns nullopt if key doesn't exist or has the wrong type
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    // Set a scalar at a dotted path, creating intermediate maps
    template<typename T>
    void set(const std::string& path, const T& value);

    const YAML::Node& root() const { return _config; }

    // Path of the file that was loaded, empty if none
    const std::string& loadedPath() const { return _loadedPath; }

    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "PMC_";

    static constexpr const char* KEY_LAYOUT_HEADER_HEIGHT = "layout.header-height";
    static constexpr const char* KEY_LAYOUT_STATUS_HEIGHT = "layout.status-height";
    static constexpr const char* KEY_LAYOUT_COMMAND_HEIGHT = "layout.command-height";
    static constexpr const char* KEY_RENDER_TRUECOLOR = "render.truecolor";
    static constexpr const char* KEY_INPUT_ESCAPE_TIMEOUT = "input.escape-timeout-ms";
    static constexpr const char* KEY_INPUT_RESIZE_DEBOUNCE = "input.resize-debounce-ms";
    static constexpr const char* KEY_KEYS_TOGGLE = "keys.toggle";
    static constexpr const char* KEY_KEYS_QUIT = "keys.quit";
    static constexpr const char* KEY_KEYS_EDIT = "keys.edit";
    static constexpr const char* KEY_KEYS_COMPLETE = "keys.complete";
    static constexpr const char* KEY_STORE_AUTO_SAVE = "store.auto-save";
    static constexpr const char* KEY_STORE_ID_ATTEMPTS = "store.id-attempts";
    static constexpr const char* KEY_LOG_LEVEL = "log.level";

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);

    // Walk every leaf of the current tree and replace it from PMC_* if set
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    // "layout.header-height" -> "PMC_LAYOUT_HEADER_HEIGHT"
    static std::string pathToEnvVar(const std::string& path);

    static std::vector<std::string> splitPath(const std::string& path);

    // Merge YAML nodes (source into target)
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    std::string _loadedPath;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull() || !node.IsScalar()) {
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

template<typename T>
void Config::set(const std::string& path, const T& value) {
    auto parts = splitPath(path);
    if (parts.empty()) return;
    YAML::Node current = _config;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node next = current[parts[i]];
        if (!next.IsMap()) {
            next = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(next);
    }
    current[parts.back()] = value;
}

} // namespace pmc
