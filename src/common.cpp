// common.cpp - error category for std::error_code integration

#include "fastssh/common.hpp"

#include <fmt/format.h>

namespace fastssh
{

    namespace
    {

        class fastssh_error_category_impl : public std::error_category
        {
        public:
            [[nodiscard]] auto name() const noexcept -> char const * override { return "fastssh"; }

            [[nodiscard]] auto message(int ev) const -> std::string override
            {
                switch (static_cast<error>(ev))
                {
                case error::success:
                    return "success";
                case error::invalid_argument:
                    return "invalid argument (host and username must not be empty)";
                case error::authentication_failed:
                    return "SSH authentication failed";
                case error::key_passphrase_required:
                    return "private key is encrypted and requires a valid passphrase";
                case error::key_load_failed:
                    return "failed to load private key";
                case error::host_key_verification_failed:
                    return "SSH host key verification failed";
                case error::transport_failed:
                    return "SSH connection failed";
                case error::timeout:
                    return "SSH operation timed out";
                case error::channel_open_failed:
                    return "failed to open SSH channel";
                case error::channel_exec_failed:
                    return "failed to execute command on SSH channel";
                case error::connection_closed:
                    return "SSH session is closed";
                case error::channel_closed:
                    return "remote process no longer accepts input";
                case error::callback_failed:
                    return "output callback threw, stream stopped";
                case error::transfer_not_found:
                    return "file transfer failed: no such file";
                case error::transfer_permission_denied:
                    return "file transfer failed: permission denied";
                case error::transfer_io_failure:
                    return "file transfer failed: I/O error";
                default:
                    return fmt::format("unknown fastssh error ({})", ev);
                }
            }
        };

        [[nodiscard]] auto fastssh_error_category() noexcept -> std::error_category const &
        {
            static fastssh_error_category_impl const instance;
            return instance;
        }

    } // namespace

    auto make_error_code(error e) noexcept -> std::error_code
    {
        return {static_cast<int>(e), fastssh_error_category()};
    }

    auto to_string(error e) -> std::string
    {
        return fastssh_error_category().message(static_cast<int>(e));
    }

    auto to_string(error_kind k) noexcept -> std::string_view
    {
        switch (k)
        {
        case error_kind::none:
            return "none";
        case error_kind::invalid_argument:
            return "invalid_argument";
        case error_kind::authentication:
            return "authentication";
        case error_kind::transport:
            return "transport";
        case error_kind::connection_closed:
            return "connection_closed";
        case error_kind::channel_closed:
            return "channel_closed";
        case error_kind::callback:
            return "callback";
        case error_kind::transfer:
            return "transfer";
        }
        return "unknown";
    }

} // namespace fastssh
