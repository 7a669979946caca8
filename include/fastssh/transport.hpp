#pragma once

// transport.hpp - the seam between the session core and the wire
// libssh in production, a scripted in-memory remote in tests

#include "common.hpp"
#include "config.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace fastssh
{

    enum class output_stream : std::uint8_t
    {
        out,
        err,
    };

    // =============================================================================
    // exec channel - one remote process
    // =============================================================================

    class exec_channel
    {
    public:
        exec_channel() = default;
        virtual ~exec_channel() = default;

        exec_channel(exec_channel const &) = delete;
        auto operator=(exec_channel const &) -> exec_channel & = delete;
        exec_channel(exec_channel &&) = delete;
        auto operator=(exec_channel &&) -> exec_channel & = delete;

        // never blocks; returns 0 when nothing is buffered for that stream
        [[nodiscard]] virtual auto read_some(output_stream which, std::span<std::uint8_t> buffer)
            -> result<std::size_t> = 0;

        // remote sent EOF and every buffered byte of that stream was consumed
        [[nodiscard]] virtual auto at_eof(output_stream which) -> bool = 0;

        // waits up to timeout for more output or EOF on either stream
        [[nodiscard]] virtual auto wait_readable(std::chrono::milliseconds timeout) -> void_result = 0;

        [[nodiscard]] virtual auto write(std::span<std::uint8_t const> data) -> void_result = 0;

        [[nodiscard]] virtual auto send_eof() -> void_result = 0;

        // blocks until the remote reports an exit status; -1 if the channel closed without one
        [[nodiscard]] virtual auto exit_status() -> result<int> = 0;

        // the remote process can still take input
        [[nodiscard]] virtual auto accepts_input() -> bool = 0;

        virtual auto close() noexcept -> void = 0;
    };

    // =============================================================================
    // sftp - remote file handles on a subsystem channel
    // =============================================================================

    class remote_file
    {
    public:
        remote_file() = default;
        virtual ~remote_file() = default;

        remote_file(remote_file const &) = delete;
        auto operator=(remote_file const &) -> remote_file & = delete;
        remote_file(remote_file &&) = delete;
        auto operator=(remote_file &&) -> remote_file & = delete;

        // returns bytes written, may be short
        [[nodiscard]] virtual auto write(std::span<std::uint8_t const> data) -> result<std::size_t> = 0;

        // returns 0 at end of file
        [[nodiscard]] virtual auto read(std::span<std::uint8_t> buffer) -> result<std::size_t> = 0;
    };

    class sftp_channel
    {
    public:
        sftp_channel() = default;
        virtual ~sftp_channel() = default;

        sftp_channel(sftp_channel const &) = delete;
        auto operator=(sftp_channel const &) -> sftp_channel & = delete;
        sftp_channel(sftp_channel &&) = delete;
        auto operator=(sftp_channel &&) -> sftp_channel & = delete;

        // create or truncate
        [[nodiscard]] virtual auto open_for_write(std::string_view remote_path, int mode)
            -> result<std::unique_ptr<remote_file>> = 0;

        [[nodiscard]] virtual auto open_for_read(std::string_view remote_path)
            -> result<std::unique_ptr<remote_file>> = 0;

        [[nodiscard]] virtual auto file_size(std::string_view remote_path) -> result<std::uint64_t> = 0;

        [[nodiscard]] virtual auto remove(std::string_view remote_path) -> void_result = 0;
    };

    // =============================================================================
    // transport - one authenticated connection
    // =============================================================================

    class transport
    {
    public:
        using environment = std::map<std::string, std::string>;

        transport() = default;
        virtual ~transport() = default;

        transport(transport const &) = delete;
        auto operator=(transport const &) -> transport & = delete;
        transport(transport &&) = delete;
        auto operator=(transport &&) -> transport & = delete;

        [[nodiscard]] virtual auto connect(credentials const &creds, session_config const &config) -> void_result = 0;

        // invalidates every channel handed out so far
        virtual auto disconnect() noexcept -> void = 0;

        [[nodiscard]] virtual auto is_connected() const noexcept -> bool = 0;

        [[nodiscard]] virtual auto open_exec(std::string_view command, environment const &env)
            -> result<std::shared_ptr<exec_channel>> = 0;

        [[nodiscard]] virtual auto open_sftp() -> result<std::unique_ptr<sftp_channel>> = 0;
    };

    using transport_factory = std::function<std::unique_ptr<transport>()>;

} // namespace fastssh
