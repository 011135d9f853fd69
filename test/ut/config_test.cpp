//=============================================================================
// Config / Theme Tests
//=============================================================================

#include <boost/ut.hpp>
#include <pmc/config.h>
#include <pmc/theme.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

using namespace boost::ut;
using namespace pmc;

namespace {

// Points XDG_CONFIG_HOME at an empty directory so a real user config
// never leaks into the tests
struct IsolatedConfigHome {
    std::filesystem::path dir;

    IsolatedConfigHome() {
        dir = std::filesystem::temp_directory_path() / ("pmc-config-" + std::to_string(getpid()));
        std::filesystem::create_directories(dir);
        setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
    }
    ~IsolatedConfigHome() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        unsetenv("XDG_CONFIG_HOME");
    }

    std::string write(const std::string& name, const std::string& content) const {
        auto path = dir / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }
};

// Sets an environment variable for the lifetime of the object
struct ScopedEnv {
    std::string name;
    ScopedEnv(std::string n, const std::string& value) : name(std::move(n)) {
        setenv(name.c_str(), value.c_str(), 1);
    }
    ~ScopedEnv() { unsetenv(name.c_str()); }
};

} // namespace

suite config_tests = [] {
    "defaults"_test = [] {
        auto config = Config::createDefaults();
        expect(config->get<int>(Config::KEY_LAYOUT_HEADER_HEIGHT, 0) == 1_i);
        expect(config->get<int>(Config::KEY_INPUT_ESCAPE_TIMEOUT, 0) == 25_i);
        expect(config->get<int>(Config::KEY_INPUT_RESIZE_DEBOUNCE, 0) == 120_i);
        expect(config->get<std::string>(Config::KEY_KEYS_TOGGLE, "") == "Ctrl+T");
        expect(config->get<bool>(Config::KEY_STORE_AUTO_SAVE, false));
        expect(config->get<std::string>("theme.status.bg", "") == "white");
        expect(!config->get<int>("no.such.key").has_value());
        expect(!config->get<int>(Config::KEY_KEYS_TOGGLE).has_value()) << "wrong type";
        expect(!config->has("layout.nothing"));
        expect(config->has("layout"));
    };

    "config file merges over defaults"_test = [] {
        IsolatedConfigHome home;
        auto path = home.write("custom.yaml",
                               "layout:\n"
                               "  header-height: 2\n"
                               "keys:\n"
                               "  quit: Ctrl+X\n");
        auto config = Config::create(path);
        expect(config.has_value() >> fatal);
        expect((*config)->get<int>(Config::KEY_LAYOUT_HEADER_HEIGHT, 0) == 2_i);
        expect((*config)->get<int>(Config::KEY_LAYOUT_STATUS_HEIGHT, 0) == 1_i) << "sibling kept";
        expect((*config)->get<std::string>(Config::KEY_KEYS_QUIT, "") == "Ctrl+X");
        expect((*config)->loadedPath() == path);
    };

    "the XDG config is picked up"_test = [] {
        IsolatedConfigHome home;
        std::filesystem::create_directories(home.dir / "pmc");
        home.write("pmc/config.yaml", "store:\n  id-attempts: 11\n");
        auto config = Config::create();
        expect(config.has_value() >> fatal);
        expect((*config)->get<int>(Config::KEY_STORE_ID_ATTEMPTS, 0) == 11_i);
    };

    "an explicit file must exist and parse"_test = [] {
        IsolatedConfigHome home;
        expect(!Config::create((home.dir / "missing.yaml").string()));
        auto bad = home.write("bad.yaml", "layout: [1, 2\n");
        expect(!Config::create(bad));
        auto list = home.write("list.yaml", "- a\n- b\n");
        expect(!Config::create(list));
    };

    "environment beats the file, overrides beat both"_test = [] {
        IsolatedConfigHome home;
        auto path = home.write("env.yaml", "store:\n  id-attempts: 7\n  auto-save: true\n");
        ScopedEnv attempts("PMC_STORE_ID_ATTEMPTS", "9");
        ScopedEnv autosave("PMC_STORE_AUTO_SAVE", "false");

        auto fromEnv = Config::create(path);
        expect(fromEnv.has_value() >> fatal);
        expect((*fromEnv)->get<int>(Config::KEY_STORE_ID_ATTEMPTS, 0) == 9_i);
        expect(!(*fromEnv)->get<bool>(Config::KEY_STORE_AUTO_SAVE, true));

        YAML::Node overrides;
        overrides["store"]["id-attempts"] = 3;
        auto overridden = Config::create(path, overrides);
        expect(overridden.has_value() >> fatal);
        expect((*overridden)->get<int>(Config::KEY_STORE_ID_ATTEMPTS, 0) == 3_i);
        expect(!(*overridden)->get<bool>(Config::KEY_STORE_AUTO_SAVE, true)) << "env still applies";
    };

    "set creates intermediate maps"_test = [] {
        auto config = Config::createDefaults();
        config->set<int>("layout.header-height", 4);
        config->set<std::string>("plugin.name.value", "x");
        expect(config->get<int>(Config::KEY_LAYOUT_HEADER_HEIGHT, 0) == 4_i);
        expect(config->get<std::string>("plugin.name.value", "") == "x");
        expect(config->get<int>(Config::KEY_LAYOUT_STATUS_HEIGHT, 0) == 1_i);
    };
};

suite theme_tests = [] {
    "parse colors"_test = [] {
        expect(*parseColor("default") == Color::defaultColor());
        expect(*parseColor("") == Color::defaultColor());
        expect(*parseColor("Red") == Color::named(colors::RED));
        expect(*parseColor("bright-cyan") == Color::bright(colors::CYAN));
        expect(*parseColor("#FF8000") == Color::rgb(255, 128, 0));
        expect(!parseColor("#12345"));
        expect(!parseColor("#gg0000"));
        expect(!parseColor("bright-pink"));
        expect(!parseColor("octarine"));
    };

    "defaults match the built-in theme"_test = [] {
        Theme fromDefaults = Theme::fromConfig(*Config::createDefaults());
        Theme builtIn;
        expect(fromDefaults.header == builtIn.header);
        expect(fromDefaults.selectedCell.bg == builtIn.selectedCell.bg);
        expect(fromDefaults.status == builtIn.status);
        expect(fromDefaults.commandFocused.fg == builtIn.commandFocused.fg);
    };

    "config colors replace the defaults, bad ones are ignored"_test = [] {
        auto config = Config::createDefaults();
        config->set<std::string>("theme.status.bg", "#102030");
        config->set<std::string>("theme.header.fg", "not-a-color");
        Theme theme = Theme::fromConfig(*config);
        expect(theme.status.bg == Color::rgb(0x10, 0x20, 0x30));
        expect(theme.header.fg == Theme{}.header.fg);
        expect(theme.header.attrs == ATTR_BOLD) << "attributes are not configurable";
    };
};
