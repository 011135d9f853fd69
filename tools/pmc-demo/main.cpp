// pmc-demo: task grid on the pmc terminal engine
//
// Usage:
//   pmc-demo [--data tasks.yaml] [--config config.yaml] [--log-file path]
//            [--log-level debug] [--no-autosave]

#include "tasks.h"

#include <pmc/app.h>
#include <pmc/base/event-loop.h>
#include <pmc/config.h>
#include <pmc/persistence.h>
#include <pmc/runner.h>
#include <pmc/store.h>
#include <pmc/terminal.h>
#include <pmc/theme.h>

#include <args.hxx>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>

#include <cstdio>
#include <iostream>
#include <string>

#include <unistd.h>

using namespace pmc;

namespace {

void setupLogging(const std::string& logPath) {
    // The terminal belongs to the UI, so logs always go to a file
    auto fileLogger = spdlog::basic_logger_mt("pmc", logPath, true);
    spdlog::set_default_logger(fileLogger);
    spdlog::flush_on(spdlog::level::warn);
}

} // namespace

int main(int argc, char** argv) {
    args::ArgumentParser parser("pmc-demo", "Task grid on the pmc terminal engine");
    parser.Prog("pmc-demo");
    args::HelpFlag helpFlag(parser, "help", "Show this help", {'h', "help"});
    args::ValueFlag<std::string> configFlag(parser, "path", "Config file path", {'c', "config"});
    args::ValueFlag<std::string> dataFlag(parser, "path", "Task data file (default: pmc-tasks.yaml)",
                                          {'d', "data"}, "pmc-tasks.yaml");
    args::ValueFlag<std::string> logFileFlag(parser, "path", "Log file (default: /tmp/pmc-demo-<pid>.log)",
                                             {"log-file"});
    args::ValueFlag<std::string> logLevelFlag(parser, "level", "trace, debug, info, warn, error, off",
                                              {"log-level"});
    args::Flag noAutosaveFlag(parser, "no-autosave", "Only save on 'save' and at exit", {"no-autosave"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::Error& e) {
        std::cerr << e.what() << "\n" << parser;
        return 1;
    }

    std::string logPath;
    if (logFileFlag) {
        logPath = args::get(logFileFlag);
    } else {
        char buf[256];
        std::snprintf(buf, sizeof(buf), "/tmp/pmc-demo-%d.log", static_cast<int>(getpid()));
        logPath = buf;
    }
    try {
        setupLogging(logPath);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "cannot open log file " << logPath << ": " << e.what() << "\n";
        return 1;
    }

    YAML::Node overrides;
    if (noAutosaveFlag) {
        overrides["store"]["auto-save"] = false;
    }
    if (logLevelFlag) {
        overrides["log"]["level"] = args::get(logLevelFlag);
    }

    auto configResult = Config::create(configFlag ? args::get(configFlag) : "", overrides);
    if (!configResult) {
        std::cerr << "pmc-demo: " << error_msg(configResult) << "\n";
        return 1;
    }
    auto config = *configResult;

    spdlog::set_level(spdlog::level::from_str(config->get<std::string>(Config::KEY_LOG_LEVEL, "info")));
    spdlog::cfg::load_env_levels();
    yinfo("pmc-demo: starting, pid={}, log={}", getpid(), logPath);

    StoreOptions storeOptions;
    storeOptions.autoSave = config->get<bool>(Config::KEY_STORE_AUTO_SAVE, true);
    storeOptions.idAttempts = config->get<int>(Config::KEY_STORE_ID_ATTEMPTS, 5);

    const std::string dataPath = args::get(dataFlag);
    auto storeResult = Store::create(YamlFilePersistence::create(dataPath), demo::tasksSchema(), storeOptions);
    if (!storeResult) {
        yerror("pmc-demo: {}", error_msg(storeResult));
        std::cerr << "pmc-demo: cannot load " << dataPath << ": " << error_msg(storeResult) << "\n";
        return 1;
    }
    auto store = *storeResult;

    auto terminalResult = Terminal::create(STDIN_FILENO, STDOUT_FILENO);
    if (!terminalResult) {
        std::cerr << "pmc-demo: " << error_msg(terminalResult) << "\n";
        return 1;
    }
    auto terminal = *terminalResult;
    auto size = terminal->size();

    auto appResult = App::create(store, demo::TASKS, demo::tasksColumns, terminal->output(),
                                 size.width, size.height,
                                 AppOptions::fromConfig(*config), Theme::fromConfig(*config));
    if (!appResult) {
        terminal->restore();
        std::cerr << "pmc-demo: " << error_msg(appResult) << "\n";
        return 1;
    }
    auto app = *appResult;

    demo::TaskCommands commands(*store, app->viewer(), [&app](const std::string& msg) { app->setStatus(msg); });
    app->setCommandExecutor([&commands](const std::string& line) { commands.execute(line); });
    app->setCompletionProvider([&commands](const std::string& line, size_t cursor) {
        return commands.complete(line, cursor);
    });

    auto loopResult = base::EventLoop::create();
    if (!loopResult) {
        terminal->restore();
        std::cerr << "pmc-demo: " << error_msg(loopResult) << "\n";
        return 1;
    }

    auto runnerResult = Runner::create(terminal, app, *loopResult, RunnerOptions::fromConfig(*config));
    if (!runnerResult) {
        terminal->restore();
        std::cerr << "pmc-demo: " << error_msg(runnerResult) << "\n";
        return 1;
    }

    auto runResult = (*runnerResult)->run();

    int exitCode = 0;
    if (auto res = store->flush(); !res) {
        yerror("pmc-demo: final save failed: {}", error_msg(res));
        exitCode = 1;
    }
    terminal->restore();

    if (!runResult) {
        std::cerr << "pmc-demo: " << error_msg(runResult) << "\n";
        return 1;
    }
    if (exitCode != 0) {
        std::cerr << "pmc-demo: unsaved changes, see " << logPath << "\n";
    }
    yinfo("pmc-demo: bye");
    return exitCode;
}
