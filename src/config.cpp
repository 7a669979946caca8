// config.cpp - credential checks

#include "fastssh/config.hpp"

namespace fastssh
{

    auto validate(credentials const &creds) noexcept -> void_result
    {
        if (creds.host.empty() || creds.username.empty())
        {
            return std::unexpected(error::invalid_argument);
        }

        if (creds.port <= 0 || creds.port > 65535)
        {
            return std::unexpected(error::invalid_argument);
        }

        return {};
    }

    auto key_passphrase(credentials const &creds) -> std::optional<std::string>
    {
        if (!creds.key.has_value())
        {
            return std::nullopt;
        }

        if (creds.key->passphrase.has_value())
        {
            return creds.key->passphrase;
        }

        // the account password doubles as passphrase
        if (!creds.password.empty())
        {
            return creds.password;
        }

        return std::nullopt;
    }

} // namespace fastssh
