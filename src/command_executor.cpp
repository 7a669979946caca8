// command_executor.cpp - drain loop and blocking exec

#include "fastssh/command_executor.hpp"
#include "fastssh/log.hpp"

#include <fmt/format.h>
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wtautological-compare"
#include <fmt/ranges.h>
#pragma GCC diagnostic pop

#include <algorithm>
#include <array>
#include <vector>

namespace fastssh
{

    auto drain_output(exec_channel &channel, chunk_sink const &sink, drain_options const &options) -> void_result
    {
        std::vector<std::uint8_t> buffer(std::max<std::size_t>(options.chunk_size, 1));
        std::array<bool, 2> finished{false, false};
        constexpr std::array streams{output_stream::out, output_stream::err};

        while (!(finished[0] && finished[1]))
        {
            if (options.cancel != nullptr && options.cancel->load())
            {
                return std::unexpected(error::channel_closed);
            }

            auto wait = options.poll_interval;
            if (options.deadline.has_value())
            {
                auto const now = std::chrono::steady_clock::now();
                if (now >= *options.deadline)
                {
                    return std::unexpected(error::timeout);
                }
                wait = std::min(wait, std::chrono::ceil<std::chrono::milliseconds>(*options.deadline - now));
            }

            bool progressed = false;
            for (auto const which : streams)
            {
                auto const index = static_cast<std::size_t>(which);
                if (finished[index])
                {
                    continue;
                }

                auto nbytes = channel.read_some(which, buffer);
                if (!nbytes.has_value())
                {
                    return std::unexpected(nbytes.error());
                }

                if (*nbytes > 0)
                {
                    sink(which, std::span<std::uint8_t const>{buffer.data(), *nbytes});
                    progressed = true;
                }
                else if (channel.at_eof(which))
                {
                    finished[index] = true;
                }
            }

            if (!progressed && !(finished[0] && finished[1]))
            {
                if (auto waited = channel.wait_readable(wait); !waited.has_value())
                {
                    return waited;
                }
            }
        }

        return {};
    }

    auto join_commands(std::span<std::string const> const commands) -> std::string
    {
        return fmt::format("{}", fmt::join(commands, "; "));
    }

    command_executor::command_executor(transport &link, session_config const &config, retain_fn retain) noexcept
        : link_{link}, config_{config}, retain_{std::move(retain)}
    {
    }

    auto command_executor::execute(std::string_view const command, exec_options const &options)
        -> result<execution_result>
    {
        if (command.empty())
        {
            return std::unexpected(error::invalid_argument);
        }

        auto deadline = std::optional<std::chrono::steady_clock::time_point>{};
        if (options.timeout.has_value())
        {
            deadline = std::chrono::steady_clock::now() + *options.timeout;
        }

        auto channel = link_.open_exec(command, options.environment);
        if (!channel.has_value())
        {
            return std::unexpected(channel.error());
        }

        log::trace("exec: {}", command);

        bytes stdout_data;
        bytes stderr_data;
        auto const sink = [&](output_stream const which, std::span<std::uint8_t const> const chunk)
        {
            auto &target = which == output_stream::out ? stdout_data : stderr_data;
            target.insert(target.end(), chunk.begin(), chunk.end());
        };

        auto drained = drain_output(**channel, sink,
                                    drain_options{.poll_interval = config_.poll_interval,
                                                  .chunk_size = config_.read_chunk_size,
                                                  .deadline = deadline,
                                                  .cancel = nullptr});
        if (!drained.has_value())
        {
            log::warn("exec aborted: {}", drained.error());
            (*channel)->close();
            return std::unexpected(drained.error());
        }

        auto status = (*channel)->exit_status();
        if (!status.has_value())
        {
            (*channel)->close();
            return std::unexpected(status.error());
        }

        log::debug("exec finished with status {} ({} bytes stdout, {} bytes stderr)", *status, stdout_data.size(),
                   stderr_data.size());

        if (retain_)
        {
            retain_(*channel);
        }

        return execution_result{std::move(stdout_data), std::move(stderr_data), *status, *channel};
    }

} // namespace fastssh
