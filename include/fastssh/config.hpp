#pragma once

// config.hpp - credentials and tunables for one session
// plain aggregates, fill them with designated initializers

#include "common.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace fastssh
{

    // =============================================================================
    // private key sources
    // =============================================================================

    struct key_file
    {
        std::filesystem::path path;
    };

    // inline PEM / OpenSSH key text
    struct key_material
    {
        std::string text;
    };

    using key_source = std::variant<key_file, key_material>;

    struct private_key
    {
        key_source source;
        std::optional<std::string> passphrase; // falls back to credentials::password when unset
    };

    // =============================================================================
    // credentials - immutable once handed to a session
    // =============================================================================

    struct credentials
    {
        std::string host;
        int port{22};
        std::string username;
        std::string password; // optional when a key is given
        std::optional<private_key> key;
    };

    // host/username non-empty, port in range
    [[nodiscard]] auto validate(credentials const &creds) noexcept -> void_result;

    // passphrase to unlock the key, if any
    [[nodiscard]] auto key_passphrase(credentials const &creds) -> std::optional<std::string>;

    // =============================================================================
    // session tunables
    // =============================================================================

    struct session_config
    {
        std::chrono::seconds connect_timeout{30};
        bool strict_host_key_checking{false}; // set true for production
        int verbosity{0};                     // 0=quiet, 1+=libssh protocol logging
        std::chrono::milliseconds poll_interval{50};
        std::size_t read_chunk_size{32 * 1024};
    };

    // =============================================================================
    // per-command options
    // =============================================================================

    struct exec_options
    {
        std::map<std::string, std::string> environment;
        std::optional<std::chrono::milliseconds> timeout; // blocking exec only
    };

} // namespace fastssh
