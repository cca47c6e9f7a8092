#include "Replay.hpp"
#include "config/ConfigManager.hpp"
#include "debug/log/Logger.hpp"

#include <hyprutils/memory/Casts.hpp>

#include <cstdlib>
#include <print>
#include <span>
#include <string>
#include <string_view>

using namespace Hyprutils::Memory;

static void help() {
    std::println("usage: hyprpull-replay [arg [...]] TRACE_FILE\n");
    std::println(R"#(Arguments:
    --help              -h       - Show this message again
    --config FILE       -c FILE  - Read pull options from a hyprlang config file
    --trace                      - Enable trace logging (same as HYPRPULL_TRACE=1))#");
}

int main(int argc, char** argv) {
    std::string configPath;
    std::string tracePath;

    if (argc > 1) {
        std::span<char*> args{argv + 1, sc<std::size_t>(argc - 1)};

        for (auto it = args.begin(); it != args.end(); it++) {
            std::string_view value = *it;

            if (value == "-c" || value == "--config") {
                if (std::next(it) == args.end()) {
                    help();

                    return 1;
                }

                configPath = *std::next(it);
                it++;
            } else if (value == "--trace") {
                // read once by the logger, has to happen before anything logs
                setenv("HYPRPULL_TRACE", "1", 1);
            } else if (value == "-h" || value == "--help") {
                help();

                return 0;
            } else if (value.starts_with("-")) {
                std::println(stderr, "[ ERROR ] Unknown option '{}' !", value);
                help();

                return 1;
            } else if (tracePath.empty())
                tracePath = value;
            else {
                std::println(stderr, "[ ERROR ] Only one trace file can be replayed at a time");
                help();

                return 1;
            }
        }
    }

    if (tracePath.empty()) {
        std::println(stderr, "[ ERROR ] No trace file given");
        help();

        return 1;
    }

    SPullConfig config;

    if (!configPath.empty()) {
        CConfigManager configManager;

        auto           result = configManager.loadFile(configPath);
        if (!result) {
            std::println(stderr, "[ ERROR ] Config error: {}", result.error());
            return 1;
        }

        config = *result;
        Log::logger->configure(configManager.loggerOptions());

        Log::logger->log(Log::DEBUG, "Using config '{}'", configPath);
    }

    CReplay replay(config);

    if (auto ret = replay.runFile(tracePath); !ret) {
        std::println(stderr, "[ ERROR ] {}", ret.error());
        return 1;
    }

    if (replay.failures() > 0) {
        std::println(stderr, "{} expectation(s) failed", replay.failures());
        return 1;
    }

    std::println("all expectations met");
    return 0;
}
