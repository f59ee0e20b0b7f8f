// connection.cpp - connect, authenticate, open channels

#include "sshpool/connection.hpp"
#include "sshpool/client_handler.hpp"
#include "sshpool/log.hpp"
#include "sshpool/proc.hpp"
#include "sshpool/shell.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace sshpool
{

    namespace
    {

        [[nodiscard]] auto authenticate(transport::session &session, device const &dev,
                                        std::optional<transport::signature_hash> const hash) -> void_result
        {
            auto const method = auth_method_for(dev);
            logger().debug("{}: authenticating as {} ({})", dev.name, dev.username, to_string(method));

            result<bool> accepted = false;
            char const *refusal = "Device refused authorization";
            switch (method)
            {
            case auth_method::publickey:
                accepted = session.authenticate_publickey(dev.username, *dev.private_key, dev.passphrase, hash);
                refusal = "Device refused pubkey authorization";
                break;
            case auth_method::password:
                accepted = session.authenticate_password(dev.username, *dev.password);
                refusal = "Device refused password authorization";
                break;
            case auth_method::none:
                accepted = session.authenticate_none(dev.username);
                break;
            }

            if (!accepted)
            {
                return std::unexpected(accepted.error());
            }
            if (!*accepted)
            {
                logger().warn("{}: {}", dev.name, refusal);
                return std::unexpected(error::authorization);
            }
            return {};
        }

    } // namespace

    // ============================================================================
    // establishment
    // ============================================================================

    auto connection::open(device dev, transport::connector &connector, connection_options options,
                          std::weak_ptr<connection_registry> pool, std::weak_ptr<shell_registry> shells)
        -> result<std::shared_ptr<connection>>
    {
        auto const id = boost::uuids::random_generator{}();
        auto handler = std::make_shared<client_handler>(id, dev.name, pool, std::move(shells));

        transport::connect_options connect_opts{
            .algorithms = transport::algorithm_set::modern(),
            .timeout = options.connect_timeout,
        };

        logger().debug("{}: connecting to {}:{}", dev.name, dev.host, dev.port);
        auto session = connector.connect(dev, connect_opts, handler);
        if (!session && is_negotiation_failure(session.error()))
        {
            logger().debug("{}: {}, retrying with legacy algorithms", dev.name, session.error());
            connect_opts.algorithms = transport::algorithm_set::legacy();
            session = connector.connect(dev, connect_opts, handler);
        }
        if (!session)
        {
            logger().debug("{}: connect failed: {}", dev.name, session.error());
            return std::unexpected(session.error());
        }

        logger().debug("{}: connected, signature hash {}", dev.name,
                       handler->signature_hash().has_value() ? transport::to_string(*handler->signature_hash())
                                                             : "default");

        if (auto authed = authenticate(**session, dev, handler->signature_hash()); !authed)
        {
            return std::unexpected(authed.error());
        }
        logger().debug("{}: authenticated", dev.name);

        return std::make_shared<connection>(private_tag{}, id, std::move(dev), std::move(options), std::move(handler),
                                            std::move(*session), std::move(pool));
    }

    connection::connection(private_tag /*tag*/, boost::uuids::uuid id, device dev, connection_options options,
                           std::shared_ptr<client_handler> handler, std::unique_ptr<transport::session> session,
                           std::weak_ptr<connection_registry> pool)
        : id_(id), device_(std::move(dev)), options_(std::move(options)), handler_(std::move(handler)),
          session_(std::move(session)), pool_(std::move(pool))
    {
    }

    connection::~connection()
    {
        logger().debug("{}: connection {} dropped", device_.name, boost::uuids::to_string(id_));
    }

    auto connection::is_alive() const noexcept -> bool
    {
        return session_->is_connected();
    }

    auto connection::evict() -> void
    {
        if (auto pool = pool_.lock())
        {
            auto const evicted = pool->remove_if(device_.name, [this](connection const &conn) { return conn.id() == id_; });
            if (evicted)
            {
                logger().info("{}: connection {} evicted", device_.name, boost::uuids::to_string(id_));
            }
        }
    }

    auto connection::open_channel() -> result<std::unique_ptr<transport::channel>>
    {
        auto channel = session_->open_channel();
        if (channel)
        {
            return channel;
        }
        if (channel.error() == error::disconnected || !session_->is_connected())
        {
            evict();
            return std::unexpected(error::needs_reconnect);
        }
        return std::unexpected(channel.error());
    }

    auto connection::channel_failure(error const e) -> error
    {
        if (session_->is_connected())
        {
            return e;
        }
        logger().info("{}: session lost mid-operation ({})", device_.name, e);
        evict();
        return error::needs_reconnect;
    }

    // ============================================================================
    // channel operations
    // ============================================================================

    auto connection::exec(std::string_view command, std::optional<std::vector<std::uint8_t>> const &stdin_data)
        -> result<std::vector<std::uint8_t>>
    {
        auto channel = open_channel();
        if (!channel)
        {
            return std::unexpected(channel.error());
        }
        auto &ch = **channel;

        auto const accepted = ch.request_exec(command);
        if (!accepted)
        {
            return std::unexpected(channel_failure(accepted.error()));
        }
        if (!*accepted)
        {
            return std::unexpected(error::negative_reply);
        }

        if (stdin_data.has_value())
        {
            if (auto written = ch.write(*stdin_data); !written)
            {
                return std::unexpected(channel_failure(written.error()));
            }
            if (auto eof = ch.send_eof(); !eof)
            {
                return std::unexpected(channel_failure(eof.error()));
            }
        }

        std::vector<std::uint8_t> output;
        for (;;)
        {
            auto event = ch.next_event(std::nullopt);
            if (!event)
            {
                return std::unexpected(channel_failure(event.error()));
            }
            if (!event->has_value())
            {
                continue;
            }
            if (auto *chunk = std::get_if<transport::event::data>(&**event))
            {
                if (chunk->ext == 0)
                {
                    output.insert(output.end(), chunk->bytes.begin(), chunk->bytes.end());
                }
                else
                {
                    logger().debug("{}: '{}' stderr: {} bytes", device_.name, command, chunk->bytes.size());
                }
            }
            else if (std::holds_alternative<transport::event::closed>(**event))
            {
                break;
            }
        }
        ch.close();
        return output;
    }

    auto connection::spawn(std::string_view command) -> result<std::shared_ptr<proc>>
    {
        auto channel = open_channel();
        if (!channel)
        {
            return std::unexpected(channel.error());
        }

        auto spawned_proc = std::make_shared<proc>(std::string(command), std::move(*channel), shared_from_this());
        spawned_proc->attach_pump(start_pump(spawned_proc, options_.pump));
        return spawned_proc;
    }

    auto connection::open_shell(std::uint16_t const cols, std::uint16_t const rows) -> result<std::shared_ptr<shell>>
    {
        auto channel = open_channel();
        if (!channel)
        {
            return std::unexpected(channel.error());
        }
        auto &ch = **channel;

        auto const pty = ch.request_pty(options_.terminal, cols, rows);
        if (!pty)
        {
            return std::unexpected(channel_failure(pty.error()));
        }
        if (!*pty)
        {
            return std::unexpected(error::negative_reply);
        }

        auto const started = ch.request_shell();
        if (!started)
        {
            return std::unexpected(channel_failure(started.error()));
        }
        if (!*started)
        {
            return std::unexpected(error::negative_reply);
        }

        auto opened = std::make_shared<shell>(std::move(*channel), shared_from_this(),
                                              terminal_size{.cols = cols, .rows = rows});
        opened->attach_pump(start_pump(opened, options_.pump));
        logger().debug("{}: shell {} opened ({}x{})", device_.name, opened->token().str(), cols, rows);
        return opened;
    }

} // namespace sshpool
