#pragma once

// devmode.hpp - developer mode token probe for webOS devices

#include "common.hpp"
#include "device.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace sshpool
{

    class session_manager;

    namespace devmode
    {

        inline constexpr std::string_view token_path = "/var/luna/preferences/devmode_enabled";

        // the developer mode account; tokens only exist for it
        inline constexpr std::string_view devmode_user = "prisoner";

        /// @brief True when text is non-empty and strictly alphanumeric
        [[nodiscard]] auto is_valid_token(std::string_view text) noexcept -> bool;

        /// @brief Read the token file through the session manager
        /// @return nullopt when the content does not look like a token
        [[nodiscard]] auto read_token(session_manager &manager, device const &dev) -> result<std::optional<std::string>>;

        /// @brief The device's developer mode token
        /// @return unsupported for non-devmode accounts or when no valid token exists
        [[nodiscard]] auto token(session_manager &manager, device const &dev) -> result<std::string>;

    } // namespace devmode

} // namespace sshpool
