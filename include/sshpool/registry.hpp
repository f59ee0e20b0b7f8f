#pragma once

// registry.hpp - mutex-guarded key -> shared_ptr<value> map
// the pool and the shell registry are both one of these. the mutex is only
// held for the map operation itself; removed values are destroyed after unlock

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace sshpool
{

    template <typename Key, typename Value>
    class registry
    {
    public:
        using value_ptr = std::shared_ptr<Value>;

        [[nodiscard]] auto find(Key const &key) const -> value_ptr
        {
            std::lock_guard lock{mutex_};
            auto const it = entries_.find(key);
            return it == entries_.end() ? nullptr : it->second;
        }

        // replaces any previous entry under the same key
        auto insert(Key key, value_ptr value) -> void
        {
            value_ptr previous;
            {
                std::lock_guard lock{mutex_};
                auto &slot = entries_[std::move(key)];
                previous = std::exchange(slot, std::move(value));
            }
        }

        auto remove(Key const &key) -> value_ptr
        {
            std::lock_guard lock{mutex_};
            auto const it = entries_.find(key);
            if (it == entries_.end())
            {
                return nullptr;
            }
            auto value = std::move(it->second);
            entries_.erase(it);
            return value;
        }

        // removes the entry only when pred(value) holds
        template <typename Pred>
        auto remove_if(Key const &key, Pred &&pred) -> value_ptr
        {
            std::lock_guard lock{mutex_};
            auto const it = entries_.find(key);
            if (it == entries_.end() || !pred(*it->second))
            {
                return nullptr;
            }
            auto value = std::move(it->second);
            entries_.erase(it);
            return value;
        }

        template <typename Pred>
        auto erase_if(Pred &&pred) -> std::size_t
        {
            std::vector<value_ptr> removed;
            {
                std::lock_guard lock{mutex_};
                for (auto it = entries_.begin(); it != entries_.end();)
                {
                    if (pred(*it->second))
                    {
                        removed.push_back(std::move(it->second));
                        it = entries_.erase(it);
                    }
                    else
                    {
                        ++it;
                    }
                }
            }
            return removed.size();
        }

        [[nodiscard]] auto snapshot() const -> std::vector<value_ptr>
        {
            std::lock_guard lock{mutex_};
            std::vector<value_ptr> values;
            values.reserve(entries_.size());
            for (auto const &[key, value] : entries_)
            {
                values.push_back(value);
            }
            return values;
        }

        [[nodiscard]] auto size() const -> std::size_t
        {
            std::lock_guard lock{mutex_};
            return entries_.size();
        }

    private:
        mutable std::mutex mutex_;
        std::map<Key, value_ptr> entries_;
    };

} // namespace sshpool
