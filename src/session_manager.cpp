// session_manager.cpp - pooling and the reconnect loop

#include "sshpool/session_manager.hpp"
#include "sshpool/log.hpp"

#include <algorithm>
#include <utility>

namespace sshpool
{

    session_manager::session_manager(std::shared_ptr<transport::connector> connector, session_manager_config config)
        : connector_(std::move(connector)), config_(std::move(config)), pool_(std::make_shared<connection_registry>()),
          shells_(std::make_shared<shell_registry>())
    {
    }

    session_manager::~session_manager()
    {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard lock{close_tasks_mutex_};
            pending.swap(close_tasks_);
        }
        for (auto &task : pending)
        {
            task.wait();
        }
    }

    // ============================================================================
    // retry policy
    // ============================================================================

    template <typename Op>
    auto session_manager::with_reconnect(device const &dev, Op &&op) -> decltype(op(std::declval<connection &>()))
    {
        for (;;)
        {
            auto conn = conn_obtain(dev);
            if (!conn)
            {
                return std::unexpected(conn.error());
            }
            auto outcome = op(**conn);
            if (outcome || outcome.error() != error::needs_reconnect)
            {
                return outcome;
            }
            logger().info("{}: retry connection", dev.name);
        }
    }

    auto session_manager::exec(device const &dev, std::string_view command,
                               std::optional<std::vector<std::uint8_t>> const &stdin_data)
        -> result<std::vector<std::uint8_t>>
    {
        return with_reconnect(dev, [&](connection &conn) { return conn.exec(command, stdin_data); });
    }

    auto session_manager::spawn(device const &dev, std::string_view command) -> result<std::shared_ptr<proc>>
    {
        return with_reconnect(dev, [&](connection &conn) { return conn.spawn(command); });
    }

    auto session_manager::shell_open(device const &dev, std::uint16_t const cols, std::uint16_t const rows)
        -> result<std::shared_ptr<shell>>
    {
        auto opened = with_reconnect(dev, [&](connection &conn) { return conn.open_shell(cols, rows); });
        if (opened)
        {
            shells_->insert((*opened)->token(), *opened);
        }
        return opened;
    }

    // ============================================================================
    // shell registry
    // ============================================================================

    auto session_manager::shell_close(shell_token const &token) -> void_result
    {
        auto closing = shells_->remove(token);
        if (!closing)
        {
            return {};
        }

        prune_close_tasks();
        auto task = std::async(std::launch::async,
                               [closing = std::move(closing)]
                               {
                                   if (auto closed = closing->close(); !closed)
                                   {
                                       logger().info("shell {}: close failed: {}", closing->token().str(),
                                                     closed.error());
                                   }
                               });

        std::lock_guard lock{close_tasks_mutex_};
        close_tasks_.push_back(std::move(task));
        return {};
    }

    auto session_manager::shell_find(shell_token const &token) const -> result<std::shared_ptr<shell>>
    {
        auto found = shells_->find(token);
        if (!found)
        {
            return std::unexpected(error::not_found);
        }
        return found;
    }

    auto session_manager::shell_list() const -> std::vector<shell_info>
    {
        auto const shells = shells_->snapshot();

        std::vector<shell_info> list;
        list.reserve(shells.size());
        for (auto const &sh : shells)
        {
            list.push_back(sh->info());
        }
        std::ranges::stable_sort(list, {}, &shell_info::created_at);
        return list;
    }

    auto session_manager::prune_close_tasks() -> void
    {
        std::lock_guard lock{close_tasks_mutex_};
        std::erase_if(close_tasks_, [](std::future<void> const &task)
                      { return task.wait_for(std::chrono::seconds{0}) == std::future_status::ready; });
    }

    // ============================================================================
    // pool
    // ============================================================================

    auto session_manager::conn_obtain(device const &dev) -> result<std::shared_ptr<connection>>
    {
        if (dev.is_new)
        {
            return conn_new(dev);
        }

        if (auto pooled = pool_->find(dev.name))
        {
            return pooled;
        }

        std::lock_guard creation{creation_mutex_};
        // someone may have finished creating it while we waited
        if (auto pooled = pool_->find(dev.name))
        {
            return pooled;
        }

        auto created = conn_new(dev);
        if (!created)
        {
            return created;
        }
        pool_->insert(dev.name, *created);
        logger().info("Connection to {} has been created", dev.name);
        return created;
    }

    auto session_manager::conn_new(device const &dev) -> result<std::shared_ptr<connection>>
    {
        connection_options options{
            .connect_timeout = config_.connect_timeout,
            .terminal = config_.terminal,
            .pump = config_.pump,
        };
        return connection::open(dev, *connector_, std::move(options), pool_, shells_);
    }

} // namespace sshpool
