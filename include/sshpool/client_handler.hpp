#pragma once

// client_handler.hpp - per-connection protocol events: host key, disconnect, channel close

#include "fwd.hpp"
#include "transport.hpp"

#include <boost/uuid/uuid.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace sshpool
{

    class client_handler final : public transport::session_handler
    {
    public:
        client_handler(boost::uuids::uuid connection_id, std::string device_name,
                       std::weak_ptr<connection_registry> pool, std::weak_ptr<shell_registry> shells);

        // accepts any host key; remembers which signature hash the server signs with
        [[nodiscard]] auto check_server_key(transport::server_key_info const &info) -> bool override;

        auto on_disconnect() -> void override;
        auto on_channel_close(transport::channel_id id) -> void override;

        [[nodiscard]] auto signature_hash() const -> std::optional<transport::signature_hash>;
        [[nodiscard]] auto connection_id() const noexcept -> boost::uuids::uuid const & { return connection_id_; }

    private:
        boost::uuids::uuid connection_id_;
        std::string device_name_;
        std::weak_ptr<connection_registry> pool_;
        std::weak_ptr<shell_registry> shells_;

        mutable std::mutex hash_mutex_;
        std::optional<transport::signature_hash> signature_hash_;
    };

    /// @brief Signature hash implied by a host key algorithm name
    /// @return nullopt for non-RSA algorithms
    [[nodiscard]] auto signature_hash_for(std::string_view algorithm) noexcept -> std::optional<transport::signature_hash>;

} // namespace sshpool
