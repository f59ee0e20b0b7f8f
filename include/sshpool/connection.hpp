#pragma once

// connection.hpp - one authenticated SSH session and the channels opened on it
// pooled by device name; evicts itself once its session is found dead

#include "common.hpp"
#include "device.hpp"
#include "fwd.hpp"
#include "spawned.hpp"
#include "transport.hpp"

#include <boost/uuid/uuid.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sshpool
{

    class client_handler;

    struct connection_options
    {
        std::chrono::seconds connect_timeout{3};
        std::string terminal{"xterm"};
        pump_options pump{};
    };

    class connection : public std::enable_shared_from_this<connection>
    {
        // only open() can name it
        struct private_tag
        {
            explicit private_tag() = default;
        };

    public:
        /// @brief Connect and authenticate
        /// @note a negotiation failure is retried once with the legacy algorithm set
        [[nodiscard]] static auto open(device dev, transport::connector &connector, connection_options options,
                                       std::weak_ptr<connection_registry> pool, std::weak_ptr<shell_registry> shells)
            -> result<std::shared_ptr<connection>>;

        connection(private_tag, boost::uuids::uuid id, device dev, connection_options options,
                   std::shared_ptr<client_handler> handler, std::unique_ptr<transport::session> session,
                   std::weak_ptr<connection_registry> pool);
        ~connection();

        connection(connection const &) = delete;
        auto operator=(connection const &) -> connection & = delete;

        [[nodiscard]] auto id() const noexcept -> boost::uuids::uuid const & { return id_; }
        [[nodiscard]] auto device_info() const noexcept -> device const & { return device_; }
        [[nodiscard]] auto is_alive() const noexcept -> bool;

        // runs to completion, returns everything the command wrote to stdout
        [[nodiscard]] auto exec(std::string_view command, std::optional<std::vector<std::uint8_t>> const &stdin_data)
            -> result<std::vector<std::uint8_t>>;

        // the returned proc is pumping but idle until proc::start()
        [[nodiscard]] auto spawn(std::string_view command) -> result<std::shared_ptr<proc>>;

        [[nodiscard]] auto open_shell(std::uint16_t cols, std::uint16_t rows) -> result<std::shared_ptr<shell>>;

        // drops the pool entry, but only if it still points at this connection
        auto evict() -> void;

    private:
        [[nodiscard]] auto open_channel() -> result<std::unique_ptr<transport::channel>>;

        // a failure on a session that is gone becomes needs_reconnect, after eviction
        [[nodiscard]] auto channel_failure(error e) -> error;

        boost::uuids::uuid id_;
        device device_;
        connection_options options_;
        std::shared_ptr<client_handler> handler_;
        std::unique_ptr<transport::session> session_;
        std::weak_ptr<connection_registry> pool_;
    };

} // namespace sshpool
