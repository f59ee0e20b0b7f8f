#pragma once

// proc.hpp - a long-running remote command on its own channel

#include "common.hpp"
#include "spawned.hpp"

#include <boost/uuid/uuid.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>

namespace sshpool
{

    class connection;

    // ext: 0 = stdout, 1 = stderr
    using rx_callback = std::function<void(std::uint32_t ext, std::span<std::uint8_t const> bytes)>;

    class proc final : public spawned
    {
    public:
        proc(std::string command, std::unique_ptr<transport::channel> channel, std::shared_ptr<connection> conn);
        ~proc() override;

        proc(proc const &) = delete;
        auto operator=(proc const &) -> proc & = delete;

        /// @brief Send the command and wait for the server's reply
        /// @return negative_reply when the server refuses it
        [[nodiscard]] auto start() -> void_result;

        // queues the signal followed by EOF
        [[nodiscard]] auto signal(transport::signal sig) -> void_result;
        [[nodiscard]] auto data(std::span<std::uint8_t const> bytes) -> void_result;

        auto set_callback(rx_callback callback) -> void;

        [[nodiscard]] auto command() const noexcept -> std::string const & { return command_; }
        [[nodiscard]] auto connection_id() const noexcept -> boost::uuids::uuid const &;
        [[nodiscard]] auto is_running() const -> bool { return channel_.is_open(); }
        auto wait_closed(std::optional<std::chrono::milliseconds> timeout = std::nullopt) -> bool
        {
            return channel_.wait_closed(timeout);
        }

        auto attach_pump(std::thread pump) -> void { pump_ = std::move(pump); }

        // spawned
        [[nodiscard]] auto lock_channel() -> channel_slot::guard override { return channel_.lock(); }
        auto tx_ready(outbound_sender sender) -> void override;
        auto on_rx(std::uint32_t ext, std::span<std::uint8_t const> bytes) -> void override;
        [[nodiscard]] auto send_msg(transport::channel &channel, channel_msg const &message) -> void_result override;

    private:
        [[nodiscard]] auto enqueue(channel_msg message) -> void_result;

        std::string command_;
        std::shared_ptr<connection> connection_;
        channel_slot channel_;

        std::mutex sender_mutex_;
        std::optional<outbound_sender> sender_;

        std::mutex callback_mutex_;
        rx_callback callback_;

        std::thread pump_;
    };

} // namespace sshpool
