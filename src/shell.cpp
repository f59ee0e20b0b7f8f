// shell.cpp - interactive shell channel

#include "sshpool/shell.hpp"
#include "sshpool/connection.hpp"
#include "sshpool/log.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace sshpool
{

    auto shell_token::generate() -> shell_token
    {
        thread_local boost::uuids::random_generator generator;
        return shell_token{boost::uuids::to_string(generator())};
    }

    shell::shell(std::unique_ptr<transport::channel> channel, std::shared_ptr<connection> conn,
                 terminal_size const size)
        : token_(shell_token::generate()), created_at_(std::chrono::system_clock::now()), channel_id_(channel->id()),
          connection_(std::move(conn)), channel_(std::move(channel)), size_(size)
    {
    }

    shell::~shell()
    {
        release_pump(pump_);
    }

    auto shell::size() const -> terminal_size
    {
        std::lock_guard lock{size_mutex_};
        return size_;
    }

    auto shell::connection_id() const noexcept -> boost::uuids::uuid const &
    {
        return connection_->id();
    }

    auto shell::data(std::span<std::uint8_t const> const bytes) -> void_result
    {
        return enqueue(msg::data{.bytes = {bytes.begin(), bytes.end()}});
    }

    auto shell::resize(std::uint16_t const cols, std::uint16_t const rows) -> void_result
    {
        if (auto queued = enqueue(msg::window_change{.cols = cols, .rows = rows}); !queued)
        {
            return queued;
        }
        std::lock_guard lock{size_mutex_};
        size_ = {.cols = cols, .rows = rows};
        return {};
    }

    auto shell::set_callback(rx_callback callback) -> void
    {
        std::lock_guard lock{callback_mutex_};
        callback_ = std::move(callback);
    }

    auto shell::close() -> void_result
    {
        auto channel = channel_.lock();
        if (!channel)
        {
            return std::unexpected(error::disconnected);
        }
        auto const eof = channel->send_eof();
        channel->close();
        channel.reset();
        logger().debug("shell {} closed", token_.str());
        return eof;
    }

    auto shell::enqueue(channel_msg message) -> void_result
    {
        std::lock_guard lock{sender_mutex_};
        if (!sender_.has_value())
        {
            return std::unexpected(error::disconnected);
        }
        return sender_->send(std::move(message));
    }

    auto shell::tx_ready(outbound_sender sender) -> void
    {
        std::lock_guard lock{sender_mutex_};
        sender_ = std::move(sender);
    }

    auto shell::on_rx(std::uint32_t const ext, std::span<std::uint8_t const> const bytes) -> void
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

    auto shell::send_msg(transport::channel &channel, channel_msg const &message) -> void_result
    {
        if (auto const *chunk = std::get_if<msg::data>(&message))
        {
            return channel.write(chunk->bytes);
        }
        if (auto const *change = std::get_if<msg::window_change>(&message))
        {
            return channel.window_change(change->cols, change->rows);
        }
        if (auto const *sig = std::get_if<msg::signal>(&message))
        {
            return channel.send_signal(sig->sig);
        }
        return channel.send_eof();
    }

} // namespace sshpool
