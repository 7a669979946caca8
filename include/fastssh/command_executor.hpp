#pragma once

// command_executor.hpp - blocking command execution and the shared output drain loop

#include "common.hpp"
#include "config.hpp"
#include "execution_result.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace fastssh
{

    // =============================================================================
    // drain loop
    // =============================================================================

    using chunk_sink = std::function<void(output_stream, std::span<std::uint8_t const>)>;

    struct drain_options
    {
        std::chrono::milliseconds poll_interval{50};
        std::size_t chunk_size{32 * 1024};
        std::optional<std::chrono::steady_clock::time_point> deadline{};
        std::atomic<bool> const *cancel{nullptr};
    };

    // reads stdout and stderr alternately until both reach end-of-stream, handing every
    // non-empty chunk to sink in arrival order. fails with timeout past the deadline and
    // with channel_closed once cancel is raised
    [[nodiscard]] auto drain_output(exec_channel &channel, chunk_sink const &sink, drain_options const &options)
        -> void_result;

    // "a", "b" -> "a; b"
    [[nodiscard]] auto join_commands(std::span<std::string const> commands) -> std::string;

    // =============================================================================
    // command executor
    // =============================================================================

    class command_executor
    {
    public:
        // keeps a finished command's channel reachable for execution_result::flush
        using retain_fn = std::function<void(std::shared_ptr<exec_channel>)>;

        command_executor(transport &link, session_config const &config, retain_fn retain = {}) noexcept;

        // blocks until both output streams are drained and the exit status is known
        [[nodiscard]] auto execute(std::string_view command, exec_options const &options = {})
            -> result<execution_result>;

    private:
        transport &link_;
        session_config config_;
        retain_fn retain_;
    };

} // namespace fastssh
