#pragma once

// shell.hpp - interactive terminal session on its own channel

#include "common.hpp"
#include "proc.hpp"
#include "spawned.hpp"

#include <boost/uuid/uuid.hpp>

#include <chrono>
#include <compare>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>

namespace sshpool
{

    class connection;

    // random, never reused
    class shell_token
    {
    public:
        [[nodiscard]] static auto generate() -> shell_token;

        explicit shell_token(std::string value) : value_(std::move(value)) {}

        [[nodiscard]] auto str() const noexcept -> std::string const & { return value_; }

        auto operator<=>(shell_token const &) const = default;

    private:
        std::string value_;
    };

    struct terminal_size
    {
        std::uint16_t cols{80};
        std::uint16_t rows{24};

        auto operator==(terminal_size const &) const -> bool = default;
    };

    struct shell_info
    {
        shell_token token;
        std::chrono::system_clock::time_point created_at;
    };

    class shell final : public spawned
    {
    public:
        shell(std::unique_ptr<transport::channel> channel, std::shared_ptr<connection> conn, terminal_size size);
        ~shell() override;

        shell(shell const &) = delete;
        auto operator=(shell const &) -> shell & = delete;

        [[nodiscard]] auto token() const noexcept -> shell_token const & { return token_; }
        [[nodiscard]] auto created_at() const noexcept -> std::chrono::system_clock::time_point { return created_at_; }
        [[nodiscard]] auto info() const -> shell_info { return {token_, created_at_}; }
        [[nodiscard]] auto size() const -> terminal_size;

        [[nodiscard]] auto channel_id() const noexcept -> transport::channel_id { return channel_id_; }
        [[nodiscard]] auto connection_id() const noexcept -> boost::uuids::uuid const &;

        [[nodiscard]] auto data(std::span<std::uint8_t const> bytes) -> void_result;
        [[nodiscard]] auto resize(std::uint16_t cols, std::uint16_t rows) -> void_result;
        auto set_callback(rx_callback callback) -> void;

        // EOF, close, drop the channel; the pump stops on its next turn
        [[nodiscard]] auto close() -> void_result;

        [[nodiscard]] auto is_open() const -> bool { return channel_.is_open(); }
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

        shell_token token_;
        std::chrono::system_clock::time_point created_at_;
        transport::channel_id channel_id_;
        std::shared_ptr<connection> connection_;
        channel_slot channel_;

        mutable std::mutex size_mutex_;
        terminal_size size_;

        std::mutex sender_mutex_;
        std::optional<outbound_sender> sender_;

        std::mutex callback_mutex_;
        rx_callback callback_;

        std::thread pump_;
    };

} // namespace sshpool
