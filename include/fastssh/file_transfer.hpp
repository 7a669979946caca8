#pragma once

// file_transfer.hpp - whole-file upload/download over an SFTP sub-channel

#include "common.hpp"
#include "transport.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace fastssh
{

    // =============================================================================
    // transfer payload - raw bytes or a local file, never guessed
    // =============================================================================

    struct raw_bytes
    {
        bytes data;
    };

    struct local_path
    {
        std::filesystem::path path;
    };

    using transfer_payload = std::variant<raw_bytes, local_path>;

    // an existing local regular file becomes local_path, anything else is raw bytes.
    // callers whose byte content may collide with a path must build the variant themselves
    [[nodiscard]] auto resolve_payload(std::string_view content) -> transfer_payload;

    inline constexpr std::size_t replace_all = std::numeric_limits<std::size_t>::max();

    // =============================================================================
    // file transfer channel
    // =============================================================================

    class file_transfer_channel
    {
    public:
        using edit_fn = std::function<bytes(bytes)>;

        explicit file_transfer_channel(transport &link) noexcept : link_{link} {}

        // overwrites; a failed upload may leave the remote file truncated
        [[nodiscard]] auto send_file(std::string_view remote_path, transfer_payload const &payload, int mode = 0644)
            -> void_result;

        [[nodiscard]] auto send_file(std::string_view remote_path, std::span<std::uint8_t const> data,
                                     int mode = 0644) -> void_result;

        // whole file buffered in memory
        [[nodiscard]] auto download_file(std::string_view remote_path) -> result<bytes>;

        [[nodiscard]] auto remove_file(std::string_view remote_path) -> void_result;

        // byte-for-byte comparison of remote and local content
        [[nodiscard]] auto file_matches(std::string_view remote_path, std::filesystem::path const &local)
            -> result<bool>;

        // download, transform, upload
        [[nodiscard]] auto edit_file(std::string_view remote_path, edit_fn const &edit) -> void_result;

        [[nodiscard]] auto edit_file_replace(std::string_view remote_path, std::string_view old_text,
                                             std::string_view new_text, std::size_t count = replace_all)
            -> void_result;

        // RE2 syntax, \1-style back references; linear in the file size
        [[nodiscard]] auto edit_file_regex_replace(std::string_view remote_path, std::string const &pattern,
                                                   std::string const &replacement, std::size_t count = replace_all)
            -> void_result;

    private:
        transport &link_;
    };

    // pure helpers behind the edit_file_* operations
    [[nodiscard]] auto replace_text(std::string_view text, std::string_view old_text, std::string_view new_text,
                                    std::size_t count = replace_all) -> std::string;

    [[nodiscard]] auto regex_replace_text(std::string const &text, std::string const &pattern,
                                          std::string const &replacement, std::size_t count = replace_all)
        -> result<std::string>;

    // reads a local file, mapping failures onto the transfer taxonomy
    [[nodiscard]] auto read_local_file(std::filesystem::path const &path) -> result<bytes>;

} // namespace fastssh
