// spawned.cpp - channel slot and the pump shared by procs and shells
// one thread per spawned channel, polling both directions

#include "sshpool/spawned.hpp"
#include "sshpool/log.hpp"

namespace sshpool
{

    // ============================================================================
    // channel slot
    // ============================================================================

    auto channel_slot::guard::reset() noexcept -> void
    {
        slot_->channel_.reset();
        slot_->closed_.notify_all();
    }

    channel_slot::channel_slot(std::unique_ptr<transport::channel> channel) noexcept : channel_(std::move(channel)) {}

    auto channel_slot::lock() -> guard
    {
        return guard{*this, std::unique_lock{mutex_}};
    }

    auto channel_slot::is_open() const -> bool
    {
        std::lock_guard lock{mutex_};
        return channel_ != nullptr;
    }

    auto channel_slot::wait_closed(std::optional<std::chrono::milliseconds> const timeout) -> bool
    {
        std::unique_lock lock{mutex_};
        auto const closed = [this] { return channel_ == nullptr; };
        if (!timeout.has_value())
        {
            closed_.wait(lock, closed);
            return true;
        }
        return closed_.wait_for(lock, *timeout, closed);
    }

    // ============================================================================
    // pump
    // ============================================================================

    namespace
    {

        // receiver first, so nothing can be queued against a slot that is about to empty
        auto finish(spawned &owner, queue_receiver<channel_msg> &rx) -> void
        {
            rx.close();
            auto channel = owner.lock_channel();
            channel.reset();
        }

        auto run_pump(spawned &owner, queue_receiver<channel_msg> &rx, pump_options const &options) -> void
        {
            for (;;)
            {
                bool busy = false;

                while (auto message = rx.try_receive())
                {
                    busy = true;
                    auto channel = owner.lock_channel();
                    if (!channel)
                    {
                        rx.close();
                        return;
                    }
                    if (auto sent = owner.send_msg(*channel, *message); !sent)
                    {
                        logger().debug("channel {}: outbound message dropped: {}", channel->id(), sent.error());
                    }
                }

                std::optional<transport::channel_event> event;
                {
                    auto channel = owner.lock_channel();
                    if (!channel)
                    {
                        rx.close();
                        return;
                    }
                    auto polled = channel->next_event(std::chrono::milliseconds{0});
                    if (!polled)
                    {
                        logger().debug("channel {}: {}", channel->id(), polled.error());
                        rx.close();
                        channel.reset();
                        return;
                    }
                    event = std::move(*polled);
                }

                if (event.has_value())
                {
                    busy = true;
                    if (auto *chunk = std::get_if<transport::event::data>(&*event))
                    {
                        owner.on_rx(chunk->ext, chunk->bytes);
                    }
                    else
                    {
                        finish(owner, rx);
                        return;
                    }
                }

                if (!busy)
                {
                    rx.wait_for(options.poll_interval);
                }
            }
        }

    } // namespace

    auto start_pump(std::shared_ptr<spawned> owner, pump_options const options) -> std::thread
    {
        auto [tx, rx] = make_unbounded_queue<channel_msg>();
        owner->tx_ready(std::move(tx));

        return std::thread(
            [owner = std::move(owner), rx = std::move(rx), options]() mutable
            {
                run_pump(*owner, rx, options);
                // may be the last reference; the owner then dies on this thread
                owner.reset();
            });
    }

    auto release_pump(std::thread &pump) noexcept -> void
    {
        if (!pump.joinable())
        {
            return;
        }
        if (pump.get_id() == std::this_thread::get_id())
        {
            pump.detach();
        }
        else
        {
            pump.join();
        }
    }

} // namespace sshpool
