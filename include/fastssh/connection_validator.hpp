#pragma once

// connection_validator.hpp - one-shot credential check, keeps no session

#include "common.hpp"
#include "config.hpp"
#include "transport.hpp"

#include <string>

namespace fastssh
{

    // true when the host accepts the credentials, false when it rejects them.
    // invalid_argument and transport failures (unreachable host, DNS) propagate as errors
    [[nodiscard]] auto is_valid_connection(credentials const &creds, session_config const &config = {})
        -> result<bool>;

    [[nodiscard]] auto is_valid_connection(credentials const &creds, session_config const &config,
                                           transport_factory const &factory) -> result<bool>;

    [[nodiscard]] auto is_valid_connection(std::string host, std::string username, std::string password)
        -> result<bool>;

} // namespace fastssh
