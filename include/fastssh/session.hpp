#pragma once

// session.hpp - one authenticated connection to one host
// exec, streamed exec and file transfer all open their own channel on it

#include "async_executor.hpp"
#include "common.hpp"
#include "config.hpp"
#include "execution_result.hpp"
#include "file_transfer.hpp"
#include "transport.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace fastssh
{

    // =============================================================================
    // session
    // =============================================================================

    // Operations on one session are not serialized against each other: a caller
    // driving the same session from several threads must serialize exec, async_exec
    // and transfer calls itself. Workers started by async_exec are the exception,
    // they run alongside the caller by design.
    class session
    {
    public:
        // credentials are checked lazily, on open()
        explicit session(credentials creds, session_config config = {});
        session(credentials creds, session_config config, transport_factory factory);
        session(std::string host, std::string username, std::string password);
        ~session();

        // move-only type
        session(session const &) = delete;
        auto operator=(session const &) -> session & = delete;
        session(session &&) noexcept;
        auto operator=(session &&) noexcept -> session &;

        // -------------------------------------------------------------------------
        // lifecycle
        // -------------------------------------------------------------------------

        // constructs and opens; the returned session closes itself when it leaves scope
        [[nodiscard]] static auto connect(credentials creds, session_config config = {}) -> result<session>;

        [[nodiscard]] static auto connect(credentials creds, session_config config, transport_factory factory)
            -> result<session>;

        // no-op when already open
        [[nodiscard]] auto open() -> void_result;

        // stops async workers, closes channels, releases the connection; safe to repeat
        auto close() noexcept -> void;

        [[nodiscard]] auto is_open() const noexcept -> bool;
        [[nodiscard]] auto host() const noexcept -> std::string_view;
        [[nodiscard]] auto user() const noexcept -> std::string_view;
        [[nodiscard]] auto port() const noexcept -> int;

        // -------------------------------------------------------------------------
        // command execution
        // -------------------------------------------------------------------------

        [[nodiscard]] auto exec(std::string_view command, exec_options const &options = {})
            -> result<execution_result>;

        // commands joined with "; "
        [[nodiscard]] auto exec(std::span<std::string const> commands, exec_options const &options = {})
            -> result<execution_result>;

        // returns as soon as the worker streams; the handle may be ignored
        [[nodiscard]] auto async_exec(std::string_view command, output_callback on_output,
                                      exec_options const &options = {}) -> result<async_execution>;

        [[nodiscard]] auto async_exec(std::string_view command, output_callback on_stdout, output_callback on_stderr,
                                      exec_options const &options = {}) -> result<async_execution>;

        // -------------------------------------------------------------------------
        // file transfer (SFTP)
        // -------------------------------------------------------------------------

        [[nodiscard]] auto send_file(std::string_view remote_path, transfer_payload const &content, int mode = 0644)
            -> void_result;

        [[nodiscard]] auto send_file(std::string_view remote_path, std::span<std::uint8_t const> content,
                                     int mode = 0644) -> void_result;

        [[nodiscard]] auto download_file(std::string_view remote_path) -> result<bytes>;

        [[nodiscard]] auto remove_file(std::string_view remote_path) -> void_result;

        [[nodiscard]] auto file_matches(std::string_view remote_path, std::filesystem::path const &local)
            -> result<bool>;

        [[nodiscard]] auto edit_file(std::string_view remote_path, file_transfer_channel::edit_fn const &edit)
            -> void_result;

        [[nodiscard]] auto edit_file_replace(std::string_view remote_path, std::string_view old_text,
                                             std::string_view new_text, std::size_t count = replace_all)
            -> void_result;

        [[nodiscard]] auto edit_file_regex_replace(std::string_view remote_path, std::string const &pattern,
                                                   std::string const &replacement, std::size_t count = replace_all)
            -> void_result;

    private:
        class impl;
        std::unique_ptr<impl> impl_;

        [[nodiscard]] auto transfer() -> result<file_transfer_channel>;
    };

} // namespace fastssh
