#pragma once

// execution_result.hpp - captured outcome of a blocking command

#include "common.hpp"
#include "transport.hpp"

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fastssh
{

    // text with a trailing '\n' guaranteed
    [[nodiscard]] auto terminated_line(std::string_view text) -> std::string;

    // writes to the remote stdin while the process still takes input, else channel_closed
    [[nodiscard]] auto write_input(std::weak_ptr<exec_channel> const &channel, std::span<std::uint8_t const> data)
        -> void_result;

    class execution_result
    {
    public:
        execution_result() = default;
        execution_result(bytes stdout_data, bytes stderr_data, int exit_code,
                         std::weak_ptr<exec_channel> channel = {}) noexcept;

        // non-zero exit status is data, not an error
        [[nodiscard]] auto is_fail() const noexcept -> bool { return exit_code_ != 0; }
        [[nodiscard]] auto get_exit_code() const noexcept -> int { return exit_code_; }

        [[nodiscard]] auto get_stdout() const -> std::string;
        [[nodiscard]] auto get_stderr() const -> std::string;

        [[nodiscard]] auto get_stdout_bytes() const noexcept -> bytes const & { return stdout_; }
        [[nodiscard]] auto get_stderr_bytes() const noexcept -> bytes const & { return stderr_; }

        [[nodiscard]] auto get_stdout_lines() const -> std::vector<std::string>;
        [[nodiscard]] auto get_stderr_lines() const -> std::vector<std::string>;

        // writes text to the remote stdin, adding '\n' unless text already ends with one.
        // fails with channel_closed once the remote process stopped taking input, which
        // for a result of a blocking exec means the exit status was already collected
        [[nodiscard]] auto flush(std::string_view text) -> void_result;

        // raw variant, no terminator added
        [[nodiscard]] auto flush(std::span<std::uint8_t const> data) -> void_result;

        [[nodiscard]] auto accepts_input() const -> bool;

    private:
        bytes stdout_;
        bytes stderr_;
        int exit_code_{0};
        std::weak_ptr<exec_channel> channel_;
    };

} // namespace fastssh
