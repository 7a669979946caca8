#pragma once

// async_executor.hpp - streamed command execution on a dedicated worker thread

#include "common.hpp"
#include "config.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <span>
#include <string_view>
#include <thread>

namespace fastssh
{

    // callbacks run on the worker thread, one chunk at a time, in arrival order
    using output_callback = std::function<void(std::span<std::uint8_t const>)>;

    enum class async_phase : std::uint8_t
    {
        starting,
        streaming,
        finished,
    };

    [[nodiscard]] auto to_string(async_phase p) noexcept -> std::string_view;

    namespace detail
    {
        struct async_state
        {
            std::atomic<async_phase> phase{async_phase::starting};
            std::atomic<bool> cancel_requested{false};
            std::weak_ptr<exec_channel> channel;
            std::promise<result<int>> completion;
            std::shared_future<result<int>> outcome{completion.get_future().share()};
        };
    } // namespace detail

    // =============================================================================
    // async execution handle - optional completion signal, safe to ignore
    // =============================================================================

    class async_execution
    {
    public:
        async_execution() = default;

        [[nodiscard]] auto valid() const noexcept -> bool { return state_ != nullptr; }
        [[nodiscard]] auto phase() const noexcept -> async_phase;
        [[nodiscard]] auto done() const noexcept -> bool;

        // exit status of the remote process, or why streaming stopped early
        [[nodiscard]] auto wait() const -> result<int>;
        [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) const -> bool;

        // asks the worker to stop; wait() then reports channel_closed
        auto cancel() const noexcept -> void;

        // stdin of the running command, same contract as execution_result::flush
        [[nodiscard]] auto flush(std::string_view text) const -> void_result;
        [[nodiscard]] auto flush(std::span<std::uint8_t const> data) const -> void_result;

        // sends EOF so commands reading stdin to the end can finish
        [[nodiscard]] auto close_input() const -> void_result;

    private:
        friend class async_task;
        explicit async_execution(std::shared_ptr<detail::async_state> state) noexcept : state_{std::move(state)} {}

        std::shared_ptr<detail::async_state> state_;
    };

    // =============================================================================
    // async task - owns the worker thread of one async_exec call
    // =============================================================================

    class async_task
    {
    public:
        ~async_task();

        async_task(async_task const &) = delete;
        auto operator=(async_task const &) -> async_task & = delete;
        async_task(async_task &&) = delete;
        auto operator=(async_task &&) -> async_task & = delete;

        // channel must already run the command; on_stderr may be empty (stderr is then discarded)
        [[nodiscard]] static auto start(std::shared_ptr<exec_channel> channel, output_callback on_stdout,
                                        output_callback on_stderr, session_config const &config)
            -> std::unique_ptr<async_task>;

        [[nodiscard]] auto handle() const noexcept -> async_execution { return async_execution{state_}; }
        [[nodiscard]] auto finished() const noexcept -> bool;

        // cancel and join
        auto stop() noexcept -> void;

    private:
        async_task() = default;

        static auto run(std::shared_ptr<detail::async_state> const &state, std::shared_ptr<exec_channel> channel,
                        output_callback on_stdout, output_callback on_stderr, session_config config) noexcept -> void;

        std::shared_ptr<detail::async_state> state_{std::make_shared<detail::async_state>()};
        std::thread worker_{};
    };

    // =============================================================================
    // async executor
    // =============================================================================

    class async_executor
    {
    public:
        async_executor(transport &link, session_config const &config) noexcept;

        // returns once the channel is open and the worker is running
        [[nodiscard]] auto start(std::string_view command, output_callback on_stdout, output_callback on_stderr = {},
                                 exec_options const &options = {}) -> result<std::unique_ptr<async_task>>;

    private:
        transport &link_;
        session_config config_;
    };

} // namespace fastssh
