// async_executor.cpp - worker thread that streams command output to callbacks

#include "fastssh/async_executor.hpp"
#include "fastssh/command_executor.hpp"
#include "fastssh/execution_result.hpp"
#include "fastssh/log.hpp"

#include <exception>

namespace fastssh
{

    auto to_string(async_phase const p) noexcept -> std::string_view
    {
        switch (p)
        {
        case async_phase::starting:
            return "starting";
        case async_phase::streaming:
            return "streaming";
        case async_phase::finished:
            return "finished";
        }
        return "unknown";
    }

    // =============================================================================
    // async_execution
    // =============================================================================

    auto async_execution::phase() const noexcept -> async_phase
    {
        return state_ ? state_->phase.load() : async_phase::finished;
    }

    auto async_execution::done() const noexcept -> bool
    {
        return phase() == async_phase::finished;
    }

    auto async_execution::wait() const -> result<int>
    {
        if (!state_)
        {
            return std::unexpected(error::channel_closed);
        }
        return state_->outcome.get();
    }

    auto async_execution::wait_for(std::chrono::milliseconds const timeout) const -> bool
    {
        if (!state_)
        {
            return true;
        }
        return state_->outcome.wait_for(timeout) == std::future_status::ready;
    }

    auto async_execution::cancel() const noexcept -> void
    {
        if (state_)
        {
            state_->cancel_requested.store(true);
        }
    }

    auto async_execution::flush(std::string_view const text) const -> void_result
    {
        auto const line = terminated_line(text);
        return flush(as_byte_span(line));
    }

    auto async_execution::flush(std::span<std::uint8_t const> const data) const -> void_result
    {
        if (!state_)
        {
            return std::unexpected(error::channel_closed);
        }
        return write_input(state_->channel, data);
    }

    auto async_execution::close_input() const -> void_result
    {
        auto channel = state_ ? state_->channel.lock() : nullptr;
        if (!channel || !channel->accepts_input())
        {
            return std::unexpected(error::channel_closed);
        }
        return channel->send_eof();
    }

    // =============================================================================
    // async_task
    // =============================================================================

    async_task::~async_task()
    {
        stop();
    }

    auto async_task::start(std::shared_ptr<exec_channel> channel, output_callback on_stdout, output_callback on_stderr,
                           session_config const &config) -> std::unique_ptr<async_task>
    {
        auto task = std::unique_ptr<async_task>(new async_task{});
        task->state_->channel = channel;
        // the worker only shares state_, so a detached worker never touches a destroyed task
        task->worker_ = std::thread{[state = task->state_, channel = std::move(channel), out = std::move(on_stdout),
                                     err = std::move(on_stderr), config]() mutable
                                    {
                                        run(state, std::move(channel), std::move(out), std::move(err), config);
                                    }};
        return task;
    }

    auto async_task::finished() const noexcept -> bool
    {
        return state_->phase.load() == async_phase::finished;
    }

    auto async_task::stop() noexcept -> void
    {
        state_->cancel_requested.store(true);
        if (worker_.joinable())
        {
            if (worker_.get_id() == std::this_thread::get_id())
            {
                // stopped from inside a callback; the loop exits on its own
                worker_.detach();
                return;
            }
            worker_.join();
        }
    }

    auto async_task::run(std::shared_ptr<detail::async_state> const &state, std::shared_ptr<exec_channel> channel,
                         output_callback on_stdout, output_callback on_stderr, session_config config) noexcept -> void
    {
        state->phase.store(async_phase::streaming);

        bool callback_failed = false;
        auto const deliver = [&](output_callback const &callback, std::span<std::uint8_t const> const chunk)
        {
            if (!callback || callback_failed)
            {
                return;
            }
            try
            {
                callback(chunk);
            }
            catch (std::exception const &e)
            {
                log::error("output callback threw, stopping stream: {}", e.what());
                callback_failed = true;
            }
            catch (...)
            {
                log::error("output callback threw a non-standard exception, stopping stream");
                callback_failed = true;
            }

            if (callback_failed)
            {
                state->cancel_requested.store(true);
            }
        };

        auto const sink = [&](output_stream const which, std::span<std::uint8_t const> const chunk)
        { deliver(which == output_stream::out ? on_stdout : on_stderr, chunk); };

        auto drained = drain_output(*channel, sink,
                                    drain_options{.poll_interval = config.poll_interval,
                                                  .chunk_size = config.read_chunk_size,
                                                  .deadline = std::nullopt,
                                                  .cancel = &state->cancel_requested});

        result<int> outcome = std::unexpected(error::channel_closed);
        if (callback_failed)
        {
            outcome = std::unexpected(error::callback_failed);
        }
        else if (drained.has_value())
        {
            outcome = channel->exit_status();
        }
        else
        {
            outcome = std::unexpected(drained.error());
            log::debug("async stream ended early: {}", drained.error());
        }

        channel->close();
        state->phase.store(async_phase::finished);
        state->completion.set_value(std::move(outcome));
    }

    // =============================================================================
    // async_executor
    // =============================================================================

    async_executor::async_executor(transport &link, session_config const &config) noexcept
        : link_{link}, config_{config}
    {
    }

    auto async_executor::start(std::string_view const command, output_callback on_stdout, output_callback on_stderr,
                               exec_options const &options) -> result<std::unique_ptr<async_task>>
    {
        if (command.empty())
        {
            return std::unexpected(error::invalid_argument);
        }

        auto channel = link_.open_exec(command, options.environment);
        if (!channel.has_value())
        {
            return std::unexpected(channel.error());
        }

        log::trace("async exec: {}", command);

        return async_task::start(std::move(*channel), std::move(on_stdout), std::move(on_stderr), config_);
    }

} // namespace fastssh
