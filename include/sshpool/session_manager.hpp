#pragma once

// session_manager.hpp - the facade: connection pool, shell registry, reconnect-and-retry
//
// exec/spawn/shell_open loop until the operation either succeeds or fails with
// something other than needs_reconnect. there is no retry cap and no backoff;
// a device that keeps dropping keeps the caller busy

#include "common.hpp"
#include "connection.hpp"
#include "device.hpp"
#include "fwd.hpp"
#include "proc.hpp"
#include "shell.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sshpool
{

    struct session_manager_config
    {
        std::chrono::seconds connect_timeout{3};
        std::string terminal{"xterm"};
        pump_options pump{};
    };

    class session_manager
    {
    public:
        explicit session_manager(std::shared_ptr<transport::connector> connector,
                                 session_manager_config config = {});

        // waits for in-flight shell closes
        ~session_manager();

        session_manager(session_manager const &) = delete;
        auto operator=(session_manager const &) -> session_manager & = delete;

        [[nodiscard]] auto exec(device const &dev, std::string_view command,
                                std::optional<std::vector<std::uint8_t>> const &stdin_data = std::nullopt)
            -> result<std::vector<std::uint8_t>>;

        [[nodiscard]] auto spawn(device const &dev, std::string_view command) -> result<std::shared_ptr<proc>>;

        [[nodiscard]] auto shell_open(device const &dev, std::uint16_t cols, std::uint16_t rows)
            -> result<std::shared_ptr<shell>>;

        // unregisters now, closes in the background; close errors are logged only
        [[nodiscard]] auto shell_close(shell_token const &token) -> void_result;

        [[nodiscard]] auto shell_find(shell_token const &token) const -> result<std::shared_ptr<shell>>;

        // ascending created_at
        [[nodiscard]] auto shell_list() const -> std::vector<shell_info>;

        [[nodiscard]] auto pooled_connections() const -> std::size_t { return pool_->size(); }

    private:
        template <typename Op>
        [[nodiscard]] auto with_reconnect(device const &dev, Op &&op) -> decltype(op(std::declval<connection &>()));

        [[nodiscard]] auto conn_obtain(device const &dev) -> result<std::shared_ptr<connection>>;
        [[nodiscard]] auto conn_new(device const &dev) -> result<std::shared_ptr<connection>>;

        auto prune_close_tasks() -> void;

        std::shared_ptr<transport::connector> connector_;
        session_manager_config config_;
        std::shared_ptr<connection_registry> pool_;
        std::shared_ptr<shell_registry> shells_;

        // at most one connection under construction at a time
        std::mutex creation_mutex_;

        std::mutex close_tasks_mutex_;
        std::vector<std::future<void>> close_tasks_;
    };

} // namespace sshpool
