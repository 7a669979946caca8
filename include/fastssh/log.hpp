#pragma once

// log.hpp - leveled diagnostics formatted with fmt
// quiet unless FASTSSH_LOG says otherwise

#include <fmt/format.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>

namespace fastssh::log
{

    enum class level : std::uint8_t
    {
        trace,
        debug,
        info,
        warn,
        error,
        off,
    };

    using sink = std::function<void(level, std::string_view)>;

    [[nodiscard]] auto to_string(level l) noexcept -> std::string_view;

    // accepts trace|debug|info|warn|error|off
    [[nodiscard]] auto parse_level(std::string_view text) noexcept -> std::optional<level>;

    // first call reads FASTSSH_LOG
    [[nodiscard]] auto current_level() noexcept -> level;
    auto set_level(level l) noexcept -> void;

    // empty sink restores the stderr default
    auto set_sink(sink s) -> void;

    [[nodiscard]] inline auto enabled(level const l) noexcept -> bool
    {
        return l != level::off && l >= current_level();
    }

    auto write(level l, std::string_view message) -> void;

    template <typename... Args>
    auto trace(fmt::format_string<Args...> format, Args &&...args) -> void
    {
        if (enabled(level::trace))
        {
            write(level::trace, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    auto debug(fmt::format_string<Args...> format, Args &&...args) -> void
    {
        if (enabled(level::debug))
        {
            write(level::debug, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    auto info(fmt::format_string<Args...> format, Args &&...args) -> void
    {
        if (enabled(level::info))
        {
            write(level::info, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    auto warn(fmt::format_string<Args...> format, Args &&...args) -> void
    {
        if (enabled(level::warn))
        {
            write(level::warn, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    auto error(fmt::format_string<Args...> format, Args &&...args) -> void
    {
        if (enabled(level::error))
        {
            write(level::error, fmt::format(format, std::forward<Args>(args)...));
        }
    }

} // namespace fastssh::log
