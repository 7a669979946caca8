// execution_result.cpp - decoding accessors and stdin flush

#include "fastssh/execution_result.hpp"
#include "fastssh/log.hpp"
#include "fastssh/text.hpp"

namespace fastssh
{

    auto terminated_line(std::string_view const text) -> std::string
    {
        std::string line{text};
        if (line.empty() || line.back() != '\n')
        {
            line.push_back('\n');
        }
        return line;
    }

    auto write_input(std::weak_ptr<exec_channel> const &channel, std::span<std::uint8_t const> const data)
        -> void_result
    {
        auto target = channel.lock();
        if (!target || !target->accepts_input())
        {
            log::debug("flush of {} bytes rejected, remote input is closed", data.size());
            return std::unexpected(error::channel_closed);
        }

        return target->write(data);
    }

    execution_result::execution_result(bytes stdout_data, bytes stderr_data, int const exit_code,
                                       std::weak_ptr<exec_channel> channel) noexcept
        : stdout_{std::move(stdout_data)}, stderr_{std::move(stderr_data)}, exit_code_{exit_code},
          channel_{std::move(channel)}
    {
    }

    auto execution_result::get_stdout() const -> std::string
    {
        return decode_text(stdout_);
    }

    auto execution_result::get_stderr() const -> std::string
    {
        return decode_text(stderr_);
    }

    auto execution_result::get_stdout_lines() const -> std::vector<std::string>
    {
        return split_lines(get_stdout());
    }

    auto execution_result::get_stderr_lines() const -> std::vector<std::string>
    {
        return split_lines(get_stderr());
    }

    auto execution_result::flush(std::string_view const text) -> void_result
    {
        auto const line = terminated_line(text);
        return flush(as_byte_span(line));
    }

    auto execution_result::flush(std::span<std::uint8_t const> const data) -> void_result
    {
        return write_input(channel_, data);
    }

    auto execution_result::accepts_input() const -> bool
    {
        auto channel = channel_.lock();
        return channel && channel->accepts_input();
    }

} // namespace fastssh
