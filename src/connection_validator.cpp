// connection_validator.cpp - authenticate, tear down, report

#include "fastssh/connection_validator.hpp"
#include "fastssh/libssh_transport.hpp"
#include "fastssh/log.hpp"

namespace fastssh
{

    auto is_valid_connection(credentials const &creds, session_config const &config) -> result<bool>
    {
        return is_valid_connection(creds, config, [] { return make_libssh_transport(); });
    }

    auto is_valid_connection(credentials const &creds, session_config const &config,
                             transport_factory const &factory) -> result<bool>
    {
        if (auto valid = validate(creds); !valid.has_value())
        {
            return std::unexpected(valid.error());
        }

        auto link = factory ? factory() : nullptr;
        if (!link)
        {
            return std::unexpected(error::transport_failed);
        }

        auto const connected = link->connect(creds, config);
        link->disconnect();

        if (connected.has_value())
        {
            return true;
        }

        if (kind_of(connected.error()) == error_kind::authentication)
        {
            log::debug("credentials rejected by {}: {}", creds.host, connected.error());
            return false;
        }

        return std::unexpected(connected.error());
    }

    auto is_valid_connection(std::string host, std::string username, std::string password) -> result<bool>
    {
        return is_valid_connection(credentials{.host = std::move(host),
                                               .port = 22,
                                               .username = std::move(username),
                                               .password = std::move(password),
                                               .key = std::nullopt});
    }

} // namespace fastssh
