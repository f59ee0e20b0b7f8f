#pragma once

// libssh_transport.hpp - the production transport, on top of libssh
// one ssh_session per connection, every libssh call serialized by a per-session mutex

#include "transport.hpp"

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace sshpool::transport
{

    class libssh_connector final : public connector
    {
    public:
        libssh_connector();
        ~libssh_connector() override;

        libssh_connector(libssh_connector const &) = delete;
        auto operator=(libssh_connector const &) -> libssh_connector & = delete;

        [[nodiscard]] auto connect(device const &dev, connect_options const &options,
                                   std::shared_ptr<session_handler> handler)
            -> result<std::unique_ptr<session>> override;

    private:
        struct library_handle;
        std::unique_ptr<library_handle> library_;
    };

    // inbound chunks of one channel, stdout and stderr interleaved as they arrived
    // adjacent chunks of the same stream are merged
    class arrival_buffer
    {
    public:
        auto append(std::uint32_t ext, std::span<std::uint8_t const> bytes) -> void;
        [[nodiscard]] auto pop() -> std::optional<event::data>;
        [[nodiscard]] auto empty() const noexcept -> bool { return chunks_.empty(); }

    private:
        std::deque<event::data> chunks_;
    };

    /// @brief Map a libssh connect error message onto an error kind
    /// @note libssh reports negotiation failures only as text
    [[nodiscard]] auto classify_connect_error(std::string_view message) noexcept -> error;

} // namespace sshpool::transport
