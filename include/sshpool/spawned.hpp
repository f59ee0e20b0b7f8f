#pragma once

// spawned.hpp - what procs and shells have in common: a channel slot,
// an outbound queue and one pump thread shuttling between them

#include "common.hpp"
#include "transport.hpp"
#include "unbounded_queue.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace sshpool
{

    // ============================================================================
    // outbound messages
    // ============================================================================

    namespace msg
    {
        struct data
        {
            std::vector<std::uint8_t> bytes;
        };

        struct signal
        {
            transport::signal sig;
        };

        struct eof
        {
        };

        struct window_change
        {
            std::uint16_t cols;
            std::uint16_t rows;
        };
    } // namespace msg

    using channel_msg = std::variant<msg::data, msg::signal, msg::eof, msg::window_change>;
    using outbound_sender = queue_sender<channel_msg>;

    // ============================================================================
    // channel slot - the channel behind a mutex, empty once closed
    // ============================================================================

    class channel_slot
    {
    public:
        class guard
        {
        public:
            guard(channel_slot &slot, std::unique_lock<std::mutex> lock) noexcept : slot_(&slot), lock_(std::move(lock))
            {
            }

            [[nodiscard]] auto get() const noexcept -> transport::channel * { return slot_->channel_.get(); }
            [[nodiscard]] auto operator->() const noexcept -> transport::channel * { return get(); }
            [[nodiscard]] auto operator*() const noexcept -> transport::channel & { return *get(); }
            [[nodiscard]] explicit operator bool() const noexcept { return get() != nullptr; }

            // drops the channel; wakes wait_closed()
            auto reset() noexcept -> void;

        private:
            channel_slot *slot_;
            std::unique_lock<std::mutex> lock_;
        };

        explicit channel_slot(std::unique_ptr<transport::channel> channel) noexcept;

        channel_slot(channel_slot const &) = delete;
        auto operator=(channel_slot const &) -> channel_slot & = delete;

        [[nodiscard]] auto lock() -> guard;
        [[nodiscard]] auto is_open() const -> bool;

        // true once the slot is empty, false on timeout
        auto wait_closed(std::optional<std::chrono::milliseconds> timeout) -> bool;

    private:
        mutable std::mutex mutex_;
        std::condition_variable closed_;
        std::unique_ptr<transport::channel> channel_;
    };

    // ============================================================================
    // spawned contract
    // ============================================================================

    class spawned
    {
    public:
        virtual ~spawned() = default;

        [[nodiscard]] virtual auto lock_channel() -> channel_slot::guard = 0;

        // hands over the producer side of the outbound queue, once, before the pump starts
        virtual auto tx_ready(outbound_sender sender) -> void = 0;

        // inbound chunk; ext 0 = stdout, 1 = stderr. called without the channel lock
        virtual auto on_rx(std::uint32_t ext, std::span<std::uint8_t const> bytes) -> void = 0;

        // called with the channel lock held
        [[nodiscard]] virtual auto send_msg(transport::channel &channel, channel_msg const &message) -> void_result = 0;
    };

    struct pump_options
    {
        std::chrono::milliseconds poll_interval{10};
    };

    /// @brief Start the pump thread for a spawned channel
    /// @return the thread; the owner keeps it and joins it on destruction
    /// @note the thread holds a strong reference to the owner until the channel ends
    [[nodiscard]] auto start_pump(std::shared_ptr<spawned> owner, pump_options options = {}) -> std::thread;

    // joins a pump thread, or detaches it when the owner dies on the pump itself
    auto release_pump(std::thread &pump) noexcept -> void;

} // namespace sshpool
