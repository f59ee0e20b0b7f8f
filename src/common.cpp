// common.cpp - error category for sshpool::error

#include "sshpool/common.hpp"

namespace sshpool
{

    namespace
    {

        class error_category_impl : public std::error_category
        {
        public:
            [[nodiscard]] auto name() const noexcept -> char const * override { return "sshpool"; }

            [[nodiscard]] auto message(int ev) const -> std::string override
            {
                switch (static_cast<error>(ev))
                {
                case error::success:
                    return "success";
                case error::needs_reconnect:
                    return "connection needs reconnect";
                case error::kex_init:
                    return "key exchange init failed";
                case error::no_common_kex_algorithm:
                    return "no common key exchange algorithm";
                case error::no_common_key_algorithm:
                    return "no common host key algorithm";
                case error::no_common_cipher:
                    return "no common cipher";
                case error::authorization:
                    return "device refused authorization";
                case error::negative_reply:
                    return "device rejected channel request";
                case error::not_found:
                    return "not found";
                case error::disconnected:
                    return "channel disconnected";
                case error::io:
                    return "I/O error";
                case error::timeout:
                    return "operation timed out";
                case error::connection_failed:
                    return "SSH connection failed";
                case error::host_key_rejected:
                    return "server host key rejected";
                case error::key_decode_failed:
                    return "failed to decode private key";
                case error::channel_open_failed:
                    return "failed to open SSH channel";
                case error::unsupported:
                    return "unsupported";
                default:
                    return fmt::format("unknown sshpool error ({})", ev);
                }
            }
        };

        [[nodiscard]] auto error_category() noexcept -> std::error_category const &
        {
            static error_category_impl const instance;
            return instance;
        }

    } // namespace

    auto make_error_code(error e) noexcept -> std::error_code
    {
        return {static_cast<int>(e), error_category()};
    }

    auto to_string(error e) -> std::string
    {
        return error_category().message(static_cast<int>(e));
    }

} // namespace sshpool
