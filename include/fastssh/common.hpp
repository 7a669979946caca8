// common.hpp - error taxonomy, result aliases and byte helpers shared by every module

#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fastssh
{

    // =============================================================================
    // error codes
    // =============================================================================

    enum class error
    {
        success = 0,
        invalid_argument,

        // authentication
        authentication_failed,
        key_passphrase_required,
        key_load_failed,
        host_key_verification_failed,

        // transport
        transport_failed,
        timeout,
        channel_open_failed,
        channel_exec_failed,

        // lifecycle
        connection_closed,
        channel_closed,
        callback_failed,

        // file transfer
        transfer_not_found,
        transfer_permission_denied,
        transfer_io_failure,
    };

    // coarse grouping so callers can branch on the reason without listing every code
    enum class error_kind : std::uint8_t
    {
        none,
        invalid_argument,
        authentication,
        transport,
        connection_closed,
        channel_closed,
        callback,
        transfer,
    };

    enum class transfer_failure : std::uint8_t
    {
        not_found,
        permission_denied,
        io_failure,
    };

    [[nodiscard]] auto make_error_code(error e) noexcept -> std::error_code;

    /// @brief Convert error to human-readable string
    [[nodiscard]] auto to_string(error e) -> std::string;

    [[nodiscard]] auto to_string(error_kind k) noexcept -> std::string_view;

    [[nodiscard]] constexpr auto kind_of(error const e) noexcept -> error_kind
    {
        switch (e)
        {
        case error::success:
            return error_kind::none;
        case error::invalid_argument:
            return error_kind::invalid_argument;
        case error::authentication_failed:
        case error::key_passphrase_required:
        case error::key_load_failed:
        case error::host_key_verification_failed:
            return error_kind::authentication;
        case error::transport_failed:
        case error::timeout:
        case error::channel_open_failed:
        case error::channel_exec_failed:
            return error_kind::transport;
        case error::connection_closed:
            return error_kind::connection_closed;
        case error::channel_closed:
            return error_kind::channel_closed;
        case error::callback_failed:
            return error_kind::callback;
        case error::transfer_not_found:
        case error::transfer_permission_denied:
        case error::transfer_io_failure:
            return error_kind::transfer;
        }
        return error_kind::transport;
    }

    [[nodiscard]] constexpr auto is_transfer_error(error const e) noexcept -> bool
    {
        return kind_of(e) == error_kind::transfer;
    }

    [[nodiscard]] constexpr auto transfer_kind(error const e) noexcept -> std::optional<transfer_failure>
    {
        switch (e)
        {
        case error::transfer_not_found:
            return transfer_failure::not_found;
        case error::transfer_permission_denied:
            return transfer_failure::permission_denied;
        case error::transfer_io_failure:
            return transfer_failure::io_failure;
        default:
            return std::nullopt;
        }
    }

    [[nodiscard]] constexpr auto to_error(transfer_failure const f) noexcept -> error
    {
        switch (f)
        {
        case transfer_failure::not_found:
            return error::transfer_not_found;
        case transfer_failure::permission_denied:
            return error::transfer_permission_denied;
        case transfer_failure::io_failure:
            return error::transfer_io_failure;
        }
        return error::transfer_io_failure;
    }

} // namespace fastssh

// enable std::error_code integration
template <>
struct std::is_error_code_enum<fastssh::error> : std::true_type
{
};

template <>
struct fmt::formatter<fastssh::error> : fmt::formatter<std::string_view>
{
    auto format(fastssh::error const e, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(fastssh::to_string(e), ctx);
    }
};

template <>
struct fmt::formatter<fastssh::error_kind> : fmt::formatter<std::string_view>
{
    auto format(fastssh::error_kind const k, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(fastssh::to_string(k), ctx);
    }
};

namespace fastssh
{

    // =============================================================================
    // result type aliases
    // =============================================================================

    template <typename T>
    using result = std::expected<T, error>;

    using void_result = std::expected<void, error>;

    // =============================================================================
    // byte helpers
    // =============================================================================

    using bytes = std::vector<std::uint8_t>;

    [[nodiscard]] inline auto to_bytes(std::string_view const text) -> bytes
    {
        return bytes{text.begin(), text.end()};
    }

    [[nodiscard]] inline auto as_string_view(std::span<std::uint8_t const> const data) noexcept -> std::string_view
    {
        return {reinterpret_cast<char const *>(data.data()), data.size()};
    }

    [[nodiscard]] inline auto as_byte_span(std::string_view const text) noexcept -> std::span<std::uint8_t const>
    {
        return {reinterpret_cast<std::uint8_t const *>(text.data()), text.size()};
    }

} // namespace fastssh
