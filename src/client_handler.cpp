// client_handler.cpp - routes transport events into pool and shell cleanup

#include "sshpool/client_handler.hpp"
#include "sshpool/connection.hpp"
#include "sshpool/log.hpp"
#include "sshpool/shell.hpp"

#include <boost/uuid/uuid_io.hpp>

namespace sshpool
{

    auto signature_hash_for(std::string_view const algorithm) noexcept -> std::optional<transport::signature_hash>
    {
        if (algorithm == "ssh-rsa")
        {
            return transport::signature_hash::sha1;
        }
        if (algorithm == "rsa-sha2-256")
        {
            return transport::signature_hash::sha2_256;
        }
        if (algorithm == "rsa-sha2-512")
        {
            return transport::signature_hash::sha2_512;
        }
        return std::nullopt;
    }

    client_handler::client_handler(boost::uuids::uuid connection_id, std::string device_name,
                                   std::weak_ptr<connection_registry> pool, std::weak_ptr<shell_registry> shells)
        : connection_id_(connection_id), device_name_(std::move(device_name)), pool_(std::move(pool)),
          shells_(std::move(shells))
    {
    }

    auto client_handler::check_server_key(transport::server_key_info const &info) -> bool
    {
        logger().debug("{}: server key {} {}", device_name_, info.algorithm, info.fingerprint);

        auto const hash = signature_hash_for(info.algorithm);
        if (hash.has_value())
        {
            logger().debug("{}: server signs with {}", device_name_, transport::to_string(*hash));
        }

        std::lock_guard lock{hash_mutex_};
        signature_hash_ = hash;
        return true;
    }

    auto client_handler::on_disconnect() -> void
    {
        logger().info("{}: connection {} disconnected", device_name_, boost::uuids::to_string(connection_id_));

        if (auto pool = pool_.lock())
        {
            auto const evicted = pool->remove_if(device_name_, [this](connection const &conn)
                                                 { return conn.id() == connection_id_; });
            if (evicted)
            {
                logger().debug("{}: evicted from pool", device_name_);
            }
        }
        if (auto shells = shells_.lock())
        {
            auto const dropped =
                shells->erase_if([this](shell const &sh) { return sh.connection_id() == connection_id_; });
            if (dropped > 0)
            {
                logger().debug("{}: dropped {} shell(s)", device_name_, dropped);
            }
        }
    }

    auto client_handler::on_channel_close(transport::channel_id const id) -> void
    {
        logger().debug("{}: channel {} closed", device_name_, id);

        if (auto shells = shells_.lock())
        {
            shells->erase_if([this, id](shell const &sh)
                             { return sh.connection_id() == connection_id_ && sh.channel_id() == id; });
        }
    }

    auto client_handler::signature_hash() const -> std::optional<transport::signature_hash>
    {
        std::lock_guard lock{hash_mutex_};
        return signature_hash_;
    }

} // namespace sshpool
