#pragma once

// device.hpp - connection target and credentials
// plain data: everything else in sshpool consumes it, nothing here does work

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace sshpool
{

    // ============================================================================
    // private key material
    // ============================================================================

    struct key_file
    {
        std::filesystem::path path;
    };

    struct key_data
    {
        std::string text; // OpenSSH or PEM encoded
    };

    using key_material = std::variant<key_file, key_data>;

    // ============================================================================
    // device
    // ============================================================================

    struct device
    {
        std::string name; // pool key
        std::string host;
        std::uint16_t port{22};
        std::string username;
        std::optional<std::string> password{};
        std::optional<key_material> private_key{};
        std::optional<std::string> passphrase{};
        bool is_new{false}; // bypass the pool, always use a disposable connection
    };

    enum class auth_method : std::uint8_t
    {
        publickey,
        password,
        none,
    };

    // private key > password > none, strictly
    [[nodiscard]] constexpr auto auth_method_for(device const &dev) noexcept -> auth_method
    {
        if (dev.private_key.has_value())
        {
            return auth_method::publickey;
        }
        if (dev.password.has_value())
        {
            return auth_method::password;
        }
        return auth_method::none;
    }

    [[nodiscard]] constexpr auto to_string(auth_method const method) noexcept -> std::string_view
    {
        switch (method)
        {
        case auth_method::publickey:
            return "publickey";
        case auth_method::password:
            return "password";
        case auth_method::none:
            return "none";
        }
        return "unknown";
    }

} // namespace sshpool
