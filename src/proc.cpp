// proc.cpp - remote process channel

#include "sshpool/proc.hpp"
#include "sshpool/connection.hpp"
#include "sshpool/log.hpp"

namespace sshpool
{

    proc::proc(std::string command, std::unique_ptr<transport::channel> channel, std::shared_ptr<connection> conn)
        : command_(std::move(command)), connection_(std::move(conn)), channel_(std::move(channel))
    {
    }

    proc::~proc()
    {
        release_pump(pump_);
    }

    auto proc::connection_id() const noexcept -> boost::uuids::uuid const &
    {
        return connection_->id();
    }

    auto proc::start() -> void_result
    {
        auto channel = channel_.lock();
        if (!channel)
        {
            return std::unexpected(error::disconnected);
        }

        auto const accepted = channel->request_exec(command_);
        if (!accepted)
        {
            return std::unexpected(accepted.error());
        }
        if (!*accepted)
        {
            logger().debug("{}: exec refused: {}", connection_->device_info().name, command_);
            return std::unexpected(error::negative_reply);
        }
        return {};
    }

    auto proc::signal(transport::signal const sig) -> void_result
    {
        std::lock_guard lock{sender_mutex_};
        if (!sender_.has_value())
        {
            logger().info("signal {} to '{}' lost: channel has no sender", transport::signal_name(sig), command_);
            return std::unexpected(error::disconnected);
        }
        if (auto sent = sender_->send(msg::signal{sig}); !sent)
        {
            logger().info("signal {} to '{}' lost: {}", transport::signal_name(sig), command_, sent.error());
            return sent;
        }
        return sender_->send(msg::eof{});
    }

    auto proc::data(std::span<std::uint8_t const> const bytes) -> void_result
    {
        return enqueue(msg::data{.bytes = {bytes.begin(), bytes.end()}});
    }

    auto proc::set_callback(rx_callback callback) -> void
    {
        std::lock_guard lock{callback_mutex_};
        callback_ = std::move(callback);
    }

    auto proc::enqueue(channel_msg message) -> void_result
    {
        std::lock_guard lock{sender_mutex_};
        if (!sender_.has_value())
        {
            return std::unexpected(error::disconnected);
        }
        return sender_->send(std::move(message));
    }

    auto proc::tx_ready(outbound_sender sender) -> void
    {
        std::lock_guard lock{sender_mutex_};
        sender_ = std::move(sender);
    }

    auto proc::on_rx(std::uint32_t const ext, std::span<std::uint8_t const> const bytes) -> void
    {
        rx_callback callback;
        {
            std::lock_guard lock{callback_mutex_};
            callback = callback_;
        }
        // outside the lock, so a callback may replace itself
        if (callback)
        {
            callback(ext, bytes);
        }
    }

    auto proc::send_msg(transport::channel &channel, channel_msg const &message) -> void_result
    {
        if (auto const *chunk = std::get_if<msg::data>(&message))
        {
            return channel.write(chunk->bytes);
        }
        if (auto const *sig = std::get_if<msg::signal>(&message))
        {
            return channel.send_signal(sig->sig);
        }
        if (std::holds_alternative<msg::eof>(message))
        {
            return channel.send_eof();
        }
        // no terminal on a proc channel
        return std::unexpected(error::unsupported);
    }

} // namespace sshpool
