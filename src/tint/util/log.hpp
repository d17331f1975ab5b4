#pragma once

#include <fmt/core.h>

#include <string_view>

namespace tint::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

inline level current_log_level = level::info;

void log_print(level l, std::string_view s) noexcept;

void init_logger() noexcept;

template <typename T>
concept formattable = requires(const T item) {
    fmt::format("{}", item);
};

/// Format and print unconditionally. Use `tint_log`, which checks the level first.
template <formattable... Args>
void log(level l, std::string_view s, const Args&... args) noexcept {
    log_print(l, fmt::format(fmt::runtime(s), args...));
}

#define tint_log(Level, str, ...)                                                                  \
    do {                                                                                           \
        if (int(tint::log::level::Level) >= int(tint::log::current_log_level)) {                   \
            ::tint::log::log(::tint::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);           \
        }                                                                                          \
    } while (0)

}  // namespace tint::log
