#pragma once

#include <csignal>
#include <print>
#include <string>

#include "debug/log/Logger.hpp"

#define RASSERT(expr, reason, ...)                                                                                                                                                 \
    if (!(expr)) {                                                                                                                                                                 \
        Log::logger->log(Log::CRIT, "\n==========================================================================================\nASSERTION FAILED! \n\n{}\n\nat: line {} in {}", \
                         std::format(reason, ##__VA_ARGS__), __LINE__,                                                                                                             \
                         ([]() constexpr -> std::string { return std::string(__FILE__).substr(std::string(__FILE__).find_last_of('/') + 1); })());                                 \
        std::println(stderr, "Assertion failed! See the hyprpull log for more info.");                                                                                             \
        raise(SIGABRT);                                                                                                                                                            \
    }
