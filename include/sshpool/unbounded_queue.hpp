#pragma once

// unbounded_queue.hpp - multi-producer, single-consumer outbound queue
// producers never block; once the receiving side is closed every send reports disconnected

#include "common.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace sshpool
{

    namespace detail
    {
        template <typename T>
        struct queue_state
        {
            std::mutex mutex;
            std::condition_variable ready;
            std::deque<T> items;
            bool closed{false};
        };
    } // namespace detail

    template <typename T>
    class queue_sender
    {
    public:
        queue_sender() = default;
        explicit queue_sender(std::shared_ptr<detail::queue_state<T>> state) : state_(std::move(state)) {}

        [[nodiscard]] auto send(T item) -> void_result
        {
            if (!state_)
            {
                return std::unexpected(error::disconnected);
            }
            {
                std::lock_guard lock{state_->mutex};
                if (state_->closed)
                {
                    return std::unexpected(error::disconnected);
                }
                state_->items.push_back(std::move(item));
            }
            state_->ready.notify_one();
            return {};
        }

        [[nodiscard]] auto is_closed() const -> bool
        {
            if (!state_)
            {
                return true;
            }
            std::lock_guard lock{state_->mutex};
            return state_->closed;
        }

    private:
        std::shared_ptr<detail::queue_state<T>> state_;
    };

    template <typename T>
    class queue_receiver
    {
    public:
        queue_receiver() = default;
        explicit queue_receiver(std::shared_ptr<detail::queue_state<T>> state) : state_(std::move(state)) {}

        ~queue_receiver() { close(); }

        queue_receiver(queue_receiver const &) = delete;
        auto operator=(queue_receiver const &) -> queue_receiver & = delete;
        queue_receiver(queue_receiver &&) noexcept = default;

        auto operator=(queue_receiver &&other) noexcept -> queue_receiver &
        {
            if (this != &other)
            {
                close();
                state_ = std::move(other.state_);
            }
            return *this;
        }

        [[nodiscard]] auto try_receive() -> std::optional<T>
        {
            if (!state_)
            {
                return std::nullopt;
            }
            std::lock_guard lock{state_->mutex};
            if (state_->items.empty())
            {
                return std::nullopt;
            }
            auto item = std::move(state_->items.front());
            state_->items.pop_front();
            return item;
        }

        // true when an item is pending; returns early on close
        auto wait_for(std::chrono::milliseconds const timeout) -> bool
        {
            if (!state_)
            {
                return false;
            }
            std::unique_lock lock{state_->mutex};
            state_->ready.wait_for(lock, timeout, [this] { return !state_->items.empty() || state_->closed; });
            return !state_->items.empty();
        }

        // pending items are dropped; later sends fail
        auto close() noexcept -> void
        {
            if (!state_)
            {
                return;
            }
            {
                std::lock_guard lock{state_->mutex};
                state_->closed = true;
                state_->items.clear();
            }
            state_->ready.notify_all();
        }

    private:
        std::shared_ptr<detail::queue_state<T>> state_;
    };

    template <typename T>
    [[nodiscard]] auto make_unbounded_queue() -> std::pair<queue_sender<T>, queue_receiver<T>>
    {
        auto state = std::make_shared<detail::queue_state<T>>();
        return {queue_sender<T>{state}, queue_receiver<T>{state}};
    }

} // namespace sshpool
