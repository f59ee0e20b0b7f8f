#pragma once

// common.hpp - error kinds and result aliases shared by every sshpool module

#include <cstdint>
#include <expected>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <system_error>

namespace sshpool
{

    // ============================================================================
    // error handling - values, not exceptions
    // ============================================================================

    enum class error : std::uint8_t
    {
        success = 0,

        // recovered inside the library
        needs_reconnect,
        kex_init,
        no_common_kex_algorithm,
        no_common_key_algorithm,
        no_common_cipher,

        // terminal, reported to the caller
        authorization,
        negative_reply,
        not_found,
        disconnected,
        io,
        timeout,
        connection_failed,
        host_key_rejected,
        key_decode_failed,
        channel_open_failed,
        unsupported,
    };

    [[nodiscard]] auto make_error_code(error e) noexcept -> std::error_code;

    /// @brief Convert error to human-readable string
    [[nodiscard]] auto to_string(error e) -> std::string;

    /// @brief True for the handshake failures that are retried once with the legacy algorithm set
    [[nodiscard]] constexpr auto is_negotiation_failure(error const e) noexcept -> bool
    {
        switch (e)
        {
        case error::kex_init:
        case error::no_common_kex_algorithm:
        case error::no_common_key_algorithm:
        case error::no_common_cipher:
            return true;
        default:
            return false;
        }
    }

    template <typename T>
    using result = std::expected<T, error>;

    using void_result = std::expected<void, error>;

} // namespace sshpool

// enable std::error_code integration
template <>
struct std::is_error_code_enum<sshpool::error> : std::true_type
{
};

template <>
struct fmt::formatter<sshpool::error> : fmt::formatter<std::string_view>
{
    auto format(sshpool::error const e, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(sshpool::to_string(e), ctx);
    }
};
