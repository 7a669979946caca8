// log.cpp - level state and the default stderr sink

#include "fastssh/log.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace fastssh::log
{

    namespace
    {

        constexpr std::uint8_t level_unset = 0xFF;

        std::atomic<std::uint8_t> g_level{level_unset};

        [[nodiscard]] auto sink_mutex() -> std::mutex &
        {
            static std::mutex instance;
            return instance;
        }

        [[nodiscard]] auto sink_slot() -> sink &
        {
            static sink instance;
            return instance;
        }

        [[nodiscard]] auto level_from_environment() noexcept -> level
        {
            char const *value = std::getenv("FASTSSH_LOG");
            if (value == nullptr)
            {
                return level::off;
            }
            return parse_level(value).value_or(level::off);
        }

    } // namespace

    auto to_string(level const l) noexcept -> std::string_view
    {
        switch (l)
        {
        case level::trace:
            return "TRACE";
        case level::debug:
            return "DEBUG";
        case level::info:
            return "INFO";
        case level::warn:
            return "WARN";
        case level::error:
            return "ERROR";
        case level::off:
            return "OFF";
        }
        return "UNKNOWN";
    }

    auto parse_level(std::string_view const text) noexcept -> std::optional<level>
    {
        if (text == "trace")
        {
            return level::trace;
        }
        if (text == "debug")
        {
            return level::debug;
        }
        if (text == "info")
        {
            return level::info;
        }
        if (text == "warn")
        {
            return level::warn;
        }
        if (text == "error")
        {
            return level::error;
        }
        if (text == "off" || text == "0")
        {
            return level::off;
        }
        return std::nullopt;
    }

    auto current_level() noexcept -> level
    {
        auto raw = g_level.load(std::memory_order_relaxed);
        if (raw == level_unset)
        {
            auto const from_env = static_cast<std::uint8_t>(level_from_environment());
            // a concurrent set_level wins over the environment
            g_level.compare_exchange_strong(raw, from_env);
            raw = g_level.load(std::memory_order_relaxed);
        }
        return static_cast<level>(raw);
    }

    auto set_level(level const l) noexcept -> void
    {
        g_level.store(static_cast<std::uint8_t>(l), std::memory_order_relaxed);
    }

    auto set_sink(sink s) -> void
    {
        std::lock_guard lock{sink_mutex()};
        sink_slot() = std::move(s);
    }

    auto write(level const l, std::string_view const message) -> void
    {
        std::lock_guard lock{sink_mutex()};
        if (auto const &custom = sink_slot())
        {
            custom(l, message);
            return;
        }
        fmt::print(stderr, "[fastssh][{}] {}\n", to_string(l), message);
    }

} // namespace fastssh::log
