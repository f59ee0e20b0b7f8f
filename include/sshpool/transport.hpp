#pragma once

// transport.hpp - the SSH capability sshpool consumes
// sshpool never speaks the wire protocol itself; it drives whatever sits behind these interfaces

#include "common.hpp"
#include "device.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sshpool::transport
{

    using channel_id = std::uint32_t;

    // ============================================================================
    // negotiation
    // ============================================================================

    enum class signature_hash : std::uint8_t
    {
        sha1,
        sha2_256,
        sha2_512,
    };

    [[nodiscard]] auto to_string(signature_hash hash) noexcept -> std::string_view;

    struct algorithm_set
    {
        std::vector<std::string> kex{};       // empty = library defaults
        std::vector<std::string> host_keys{}; // empty = library defaults

        [[nodiscard]] static auto modern() -> algorithm_set { return {}; }

        // older kex groups and signature algorithms for outdated daemons on embedded targets
        [[nodiscard]] static auto legacy() -> algorithm_set
        {
            return {
                .kex = {"diffie-hellman-group14-sha1", "diffie-hellman-group1-sha1",
                        "diffie-hellman-group14-sha256", "curve25519-sha256"},
                .host_keys = {"ssh-rsa", "rsa-sha2-512", "rsa-sha2-256", "ssh-ed25519"},
            };
        }

        [[nodiscard]] auto is_legacy() const noexcept -> bool { return !kex.empty() || !host_keys.empty(); }

        auto operator==(algorithm_set const &) const -> bool = default;
    };

    struct connect_options
    {
        algorithm_set algorithms{};
        std::chrono::seconds timeout{3};
    };

    struct server_key_info
    {
        std::string algorithm;   // host key algorithm, e.g. "rsa-sha2-256"
        std::string fingerprint; // SHA256:...
    };

    // ============================================================================
    // channel traffic
    // ============================================================================

    enum class signal : std::uint8_t
    {
        abort,
        alarm,
        fpe,
        hangup,
        illegal,
        interrupt,
        kill,
        pipe,
        quit,
        segv,
        terminate,
        usr1,
        usr2,
    };

    // RFC 4254 signal name without the SIG prefix
    [[nodiscard]] auto signal_name(signal sig) noexcept -> std::string_view;

    namespace event
    {
        struct data
        {
            std::vector<std::uint8_t> bytes;
            std::uint32_t ext{0}; // 0 = primary stream, 1 = stderr
        };

        struct eof
        {
        };

        struct closed
        {
        };
    } // namespace event

    using channel_event = std::variant<event::data, event::eof, event::closed>;

    // ============================================================================
    // protocol events raised by the transport
    // ============================================================================

    class session_handler
    {
    public:
        virtual ~session_handler() = default;

        // called once per handshake, before authentication; false aborts the connection
        [[nodiscard]] virtual auto check_server_key(server_key_info const &info) -> bool = 0;

        virtual auto on_disconnect() -> void = 0;
        virtual auto on_channel_close(channel_id id) -> void = 0;
    };

    // ============================================================================
    // capabilities
    // ============================================================================

    class channel
    {
    public:
        virtual ~channel() = default;

        [[nodiscard]] virtual auto id() const noexcept -> channel_id = 0;

        // requests wait for the peer's reply: true = success, false = failure reply
        [[nodiscard]] virtual auto request_exec(std::string_view command) -> result<bool> = 0;
        [[nodiscard]] virtual auto request_pty(std::string_view term, std::uint16_t cols, std::uint16_t rows)
            -> result<bool> = 0;
        [[nodiscard]] virtual auto request_shell() -> result<bool> = 0;

        [[nodiscard]] virtual auto window_change(std::uint16_t cols, std::uint16_t rows) -> void_result = 0;
        [[nodiscard]] virtual auto send_signal(signal sig) -> void_result = 0;
        [[nodiscard]] virtual auto send_eof() -> void_result = 0;
        [[nodiscard]] virtual auto write(std::span<std::uint8_t const> data) -> void_result = 0;

        // nullopt timeout blocks until an event arrives; an empty optional means the wait timed out
        [[nodiscard]] virtual auto next_event(std::optional<std::chrono::milliseconds> timeout)
            -> result<std::optional<channel_event>> = 0;

        virtual auto close() noexcept -> void = 0;
    };

    class session
    {
    public:
        virtual ~session() = default;

        // results: true = accepted, false = refused by the server
        [[nodiscard]] virtual auto authenticate_publickey(std::string_view user, key_material const &key,
                                                          std::optional<std::string> const &passphrase,
                                                          std::optional<signature_hash> hash) -> result<bool> = 0;
        [[nodiscard]] virtual auto authenticate_password(std::string_view user, std::string_view password)
            -> result<bool> = 0;
        [[nodiscard]] virtual auto authenticate_none(std::string_view user) -> result<bool> = 0;

        [[nodiscard]] virtual auto open_channel() -> result<std::unique_ptr<channel>> = 0;

        [[nodiscard]] virtual auto is_connected() const noexcept -> bool = 0;
        virtual auto disconnect() noexcept -> void = 0;
    };

    class connector
    {
    public:
        virtual ~connector() = default;

        // negotiation failures come back as the error kinds is_negotiation_failure() recognises
        [[nodiscard]] virtual auto connect(device const &dev, connect_options const &options,
                                           std::shared_ptr<session_handler> handler)
            -> result<std::unique_ptr<session>> = 0;
    };

} // namespace sshpool::transport
