// libssh_transport.cpp - transport implementation on libssh
// blocking libssh API; the per-session io mutex is held only around each call

#include "sshpool/libssh_transport.hpp"
#include "sshpool/log.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <new>
#include <string>
#include <thread>
#include <utility>

#include <libssh/callbacks.h>
#include <libssh/libssh.h>

namespace sshpool::transport
{

    namespace
    {

        // =============================================================================
        // RAII guards
        // =============================================================================

        struct key_guard
        {
            ssh_key key{nullptr};

            key_guard() = default;
            explicit key_guard(ssh_key k) : key(k) {}
            ~key_guard()
            {
                if (key != nullptr)
                {
                    ssh_key_free(key);
                }
            }

            key_guard(key_guard const &) = delete;
            auto operator=(key_guard const &) -> key_guard & = delete;
            key_guard(key_guard &&) = delete;
            auto operator=(key_guard &&) -> key_guard & = delete;

            [[nodiscard]] auto get() const noexcept -> ssh_key { return key; }
            [[nodiscard]] auto out() noexcept -> ssh_key * { return &key; }
            [[nodiscard]] explicit operator bool() const noexcept { return key != nullptr; }
        };

        // ssh_init/ssh_finalize are reference counted; every session keeps the library up
        struct library_guard
        {
            library_guard() { ssh_init(); }
            ~library_guard() { ssh_finalize(); }

            library_guard(library_guard const &) = delete;
            auto operator=(library_guard const &) -> library_guard & = delete;
        };

        constexpr auto POLL_SLICE = std::chrono::milliseconds{10};

        [[nodiscard]] auto lowercase(std::string_view text) -> std::string
        {
            std::string out(text);
            std::ranges::transform(out, out.begin(),
                                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        [[nodiscard]] auto set_algorithm_list(ssh_session ssh, ssh_options_e option,
                                              std::vector<std::string> const &names) -> bool
        {
            if (names.empty())
            {
                return true;
            }
            auto const list = fmt::format("{}", fmt::join(names, ","));
            return ssh_options_set(ssh, option, list.c_str()) == SSH_OK;
        }

        [[nodiscard]] auto accepted_rsa_type(signature_hash const hash) noexcept -> char const *
        {
            switch (hash)
            {
            case signature_hash::sha1:
                return "ssh-rsa";
            case signature_hash::sha2_256:
                return "rsa-sha2-256";
            case signature_hash::sha2_512:
                return "rsa-sha2-512";
            }
            return "rsa-sha2-256";
        }

        // =============================================================================
        // shared session state - outlives every channel opened on it
        // =============================================================================

        struct session_state
        {
            std::shared_ptr<library_guard> library;
            ssh_session ssh{nullptr};
            std::mutex io;
            std::shared_ptr<session_handler> handler;
            std::atomic<channel_id> next_channel_id{0};
            std::atomic<bool> disconnect_reported{false};

            session_state(std::shared_ptr<library_guard> lib, ssh_session s, std::shared_ptr<session_handler> h)
                : library(std::move(lib)), ssh(s), handler(std::move(h))
            {
            }

            ~session_state()
            {
                if (ssh != nullptr)
                {
                    ssh_disconnect(ssh);
                    ssh_free(ssh);
                }
            }

            session_state(session_state const &) = delete;
            auto operator=(session_state const &) -> session_state & = delete;

            [[nodiscard]] auto connected() -> bool
            {
                std::lock_guard lock{io};
                return ssh_is_connected(ssh) != 0;
            }

            // at most once per session, never under the io lock
            auto report_disconnect() -> void
            {
                if (disconnect_reported.exchange(true))
                {
                    return;
                }
                logger().debug("libssh: session lost");
                if (handler)
                {
                    handler->on_disconnect();
                }
            }

            // SSH_ERROR on a live session means the peer answered with a failure reply
            [[nodiscard]] auto request_outcome(int const rc) -> result<bool>
            {
                if (rc == SSH_OK)
                {
                    return true;
                }
                if (connected())
                {
                    return false;
                }
                report_disconnect();
                return std::unexpected(error::disconnected);
            }

            [[nodiscard]] auto send_outcome(int const rc) -> void_result
            {
                if (rc != SSH_ERROR)
                {
                    return {};
                }
                if (connected())
                {
                    return std::unexpected(error::io);
                }
                report_disconnect();
                return std::unexpected(error::disconnected);
            }
        };

        // =============================================================================
        // channel
        // =============================================================================

        class libssh_channel final : public channel
        {
        public:
            libssh_channel(std::shared_ptr<session_state> state, ssh_channel handle)
                : state_(std::move(state)), handle_(handle), id_(state_->next_channel_id.fetch_add(1))
            {
                ssh_callbacks_init(&callbacks_);
                callbacks_.userdata = this;
                callbacks_.channel_data_function = &libssh_channel::on_data;

                std::lock_guard lock{state_->io};
                ssh_set_channel_callbacks(handle_, &callbacks_);
            }

            ~libssh_channel() override
            {
                close();
                std::lock_guard lock{state_->io};
                ssh_remove_channel_callbacks(handle_, &callbacks_);
                ssh_channel_free(handle_);
            }

            libssh_channel(libssh_channel const &) = delete;
            auto operator=(libssh_channel const &) -> libssh_channel & = delete;

            [[nodiscard]] auto id() const noexcept -> channel_id override { return id_; }

            [[nodiscard]] auto request_exec(std::string_view command) -> result<bool> override
            {
                int rc = SSH_ERROR;
                {
                    std::lock_guard lock{state_->io};
                    rc = ssh_channel_request_exec(handle_, std::string(command).c_str());
                }
                return state_->request_outcome(rc);
            }

            [[nodiscard]] auto request_pty(std::string_view term, std::uint16_t cols, std::uint16_t rows)
                -> result<bool> override
            {
                int rc = SSH_ERROR;
                {
                    std::lock_guard lock{state_->io};
                    rc = ssh_channel_request_pty_size(handle_, std::string(term).c_str(), cols, rows);
                }
                return state_->request_outcome(rc);
            }

            [[nodiscard]] auto request_shell() -> result<bool> override
            {
                int rc = SSH_ERROR;
                {
                    std::lock_guard lock{state_->io};
                    rc = ssh_channel_request_shell(handle_);
                }
                return state_->request_outcome(rc);
            }

            [[nodiscard]] auto window_change(std::uint16_t cols, std::uint16_t rows) -> void_result override
            {
                int rc = SSH_ERROR;
                {
                    std::lock_guard lock{state_->io};
                    rc = ssh_channel_change_pty_size(handle_, cols, rows);
                }
                return state_->send_outcome(rc);
            }

            [[nodiscard]] auto send_signal(signal sig) -> void_result override
            {
                std::string const name(signal_name(sig));
                int rc = SSH_ERROR;
                {
                    std::lock_guard lock{state_->io};
                    rc = ssh_channel_request_send_signal(handle_, name.c_str());
                }
                return state_->send_outcome(rc);
            }

            [[nodiscard]] auto send_eof() -> void_result override
            {
                int rc = SSH_ERROR;
                {
                    std::lock_guard lock{state_->io};
                    rc = ssh_channel_send_eof(handle_);
                }
                return state_->send_outcome(rc);
            }

            [[nodiscard]] auto write(std::span<std::uint8_t const> data) -> void_result override
            {
                std::size_t offset = 0;
                while (offset < data.size())
                {
                    int rc = SSH_ERROR;
                    {
                        std::lock_guard lock{state_->io};
                        rc = ssh_channel_write(handle_, data.data() + offset,
                                               static_cast<std::uint32_t>(data.size() - offset));
                    }
                    if (rc == SSH_ERROR)
                    {
                        return state_->send_outcome(rc);
                    }
                    offset += static_cast<std::size_t>(rc);
                }
                return {};
            }

            [[nodiscard]] auto next_event(std::optional<std::chrono::milliseconds> timeout)
                -> result<std::optional<channel_event>> override
            {
                auto const deadline =
                    timeout.has_value() ? std::optional{std::chrono::steady_clock::now() + *timeout} : std::nullopt;

                for (;;)
                {
                    bool remote_closed = false;
                    bool alive = true;
                    {
                        std::lock_guard lock{state_->io};
                        if (auto chunk = inbound_.pop())
                        {
                            return std::move(*chunk);
                        }
                        // processes pending packets; on_data fills inbound_
                        if (ssh_channel_poll_timeout(handle_, 0, 0) == SSH_ERROR)
                        {
                            logger().debug("libssh: channel {} poll failed: {}", id_, ssh_get_error(state_->ssh));
                        }
                        if (auto chunk = inbound_.pop())
                        {
                            return std::move(*chunk);
                        }
                        if (!eof_reported_ && ssh_channel_is_eof(handle_) != 0)
                        {
                            eof_reported_ = true;
                            return event::eof{};
                        }
                        remote_closed = ssh_channel_is_closed(handle_) != 0;
                        alive = ssh_is_connected(state_->ssh) != 0;
                    }

                    if (remote_closed && alive)
                    {
                        if (!std::exchange(close_reported_, true) && state_->handler)
                        {
                            state_->handler->on_channel_close(id_);
                        }
                        return event::closed{};
                    }
                    if (!alive)
                    {
                        state_->report_disconnect();
                        return std::unexpected(error::disconnected);
                    }

                    auto const now = std::chrono::steady_clock::now();
                    if (deadline.has_value() && now >= *deadline)
                    {
                        return std::nullopt;
                    }
                    auto slice = POLL_SLICE;
                    if (deadline.has_value())
                    {
                        slice = std::min(slice, std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now));
                    }
                    std::this_thread::sleep_for(slice);
                }
            }

            auto close() noexcept -> void override
            {
                std::lock_guard lock{state_->io};
                if (ssh_channel_is_open(handle_) != 0)
                {
                    ssh_channel_close(handle_);
                }
            }

        private:
            // runs inside whichever libssh call processes the packet, so always under the io lock
            static auto on_data(ssh_session /*session*/, ssh_channel /*channel*/, void *data, std::uint32_t len,
                                int is_stderr, void *userdata) -> int
            {
                auto *self = static_cast<libssh_channel *>(userdata);
                self->inbound_.append(is_stderr != 0 ? 1U : 0U, {static_cast<std::uint8_t const *>(data), len});
                return static_cast<int>(len);
            }

            std::shared_ptr<session_state> state_;
            ssh_channel handle_;
            channel_id id_;
            ssh_channel_callbacks_struct callbacks_{};
            arrival_buffer inbound_;
            bool eof_reported_{false};
            bool close_reported_{false};
        };

        // =============================================================================
        // session
        // =============================================================================

        class libssh_session final : public session
        {
        public:
            explicit libssh_session(std::shared_ptr<session_state> state) : state_(std::move(state)) {}

            [[nodiscard]] auto authenticate_publickey(std::string_view /*user*/, key_material const &key,
                                                      std::optional<std::string> const &passphrase,
                                                      std::optional<signature_hash> hash) -> result<bool> override
            {
                char const *const secret = passphrase.has_value() ? passphrase->c_str() : nullptr;
                key_guard private_key;

                int rc = SSH_ERROR;
                if (auto const *file = std::get_if<key_file>(&key))
                {
                    rc = ssh_pki_import_privkey_file(file->path.c_str(), secret, nullptr, nullptr, private_key.out());
                }
                else
                {
                    auto const &inline_key = std::get<key_data>(key);
                    rc = ssh_pki_import_privkey_base64(inline_key.text.c_str(), secret, nullptr, nullptr,
                                                       private_key.out());
                }
                if (rc != SSH_OK || !private_key)
                {
                    return std::unexpected(error::key_decode_failed);
                }

                std::lock_guard lock{state_->io};
                auto const type = ssh_key_type(private_key.get());
                if (type == SSH_KEYTYPE_RSA && hash.has_value())
                {
                    logger().debug("libssh: signing with {}", accepted_rsa_type(*hash));
                    ssh_options_set(state_->ssh, SSH_OPTIONS_PUBLICKEY_ACCEPTED_TYPES, accepted_rsa_type(*hash));
                }
                return auth_outcome(ssh_userauth_publickey(state_->ssh, nullptr, private_key.get()));
            }

            [[nodiscard]] auto authenticate_password(std::string_view /*user*/, std::string_view password)
                -> result<bool> override
            {
                std::lock_guard lock{state_->io};
                return auth_outcome(ssh_userauth_password(state_->ssh, nullptr, std::string(password).c_str()));
            }

            [[nodiscard]] auto authenticate_none(std::string_view /*user*/) -> result<bool> override
            {
                std::lock_guard lock{state_->io};
                return auth_outcome(ssh_userauth_none(state_->ssh, nullptr));
            }

            [[nodiscard]] auto open_channel() -> result<std::unique_ptr<channel>> override
            {
                ssh_channel handle = nullptr;
                bool opened = false;
                {
                    std::lock_guard lock{state_->io};
                    handle = ssh_channel_new(state_->ssh);
                    if (handle != nullptr)
                    {
                        opened = ssh_channel_open_session(handle) == SSH_OK;
                        if (!opened)
                        {
                            ssh_channel_free(handle);
                        }
                    }
                }
                if (handle != nullptr && opened)
                {
                    return std::make_unique<libssh_channel>(state_, handle);
                }
                if (!state_->connected())
                {
                    state_->report_disconnect();
                    return std::unexpected(error::disconnected);
                }
                return std::unexpected(error::channel_open_failed);
            }

            [[nodiscard]] auto is_connected() const noexcept -> bool override
            {
                std::lock_guard lock{state_->io};
                return ssh_is_connected(state_->ssh) != 0;
            }

            auto disconnect() noexcept -> void override
            {
                std::lock_guard lock{state_->io};
                ssh_disconnect(state_->ssh);
            }

        private:
            // called with the io lock held
            [[nodiscard]] auto auth_outcome(int const rc) const -> result<bool>
            {
                switch (rc)
                {
                case SSH_AUTH_SUCCESS:
                    return true;
                case SSH_AUTH_DENIED:
                case SSH_AUTH_PARTIAL:
                    return false;
                default:
                    break;
                }
                logger().debug("libssh: authentication error: {}", ssh_get_error(state_->ssh));
                if (ssh_is_connected(state_->ssh) == 0)
                {
                    return std::unexpected(error::disconnected);
                }
                return std::unexpected(error::io);
            }

            std::shared_ptr<session_state> state_;
        };

        [[nodiscard]] auto describe_server_key(ssh_session ssh, algorithm_set const &algorithms) -> server_key_info
        {
            server_key_info info{};

            key_guard server_key;
            if (ssh_get_server_publickey(ssh, server_key.out()) != SSH_OK)
            {
                return info;
            }

            unsigned char *hash = nullptr;
            std::size_t hash_len = 0;
            if (ssh_get_publickey_hash(server_key.get(), SSH_PUBLICKEY_HASH_SHA256, &hash, &hash_len) == SSH_OK)
            {
                if (char *fingerprint = ssh_get_fingerprint_hash(SSH_PUBLICKEY_HASH_SHA256, hash, hash_len))
                {
                    info.fingerprint = fingerprint;
                    ssh_string_free_char(fingerprint);
                }
                ssh_clean_pubkey_hash(&hash);
            }

            auto const type = ssh_key_type(server_key.get());
            if (type == SSH_KEYTYPE_RSA)
            {
                // libssh does not expose the negotiated signature; prefer the first RSA entry we offered
                auto const it = std::ranges::find_if(algorithms.host_keys, [](std::string const &name)
                                                     { return name.starts_with("ssh-rsa") || name.starts_with("rsa-"); });
                info.algorithm = it != algorithms.host_keys.end() ? *it : "rsa-sha2-256";
            }
            else if (char const *name = ssh_key_type_to_char(type))
            {
                info.algorithm = name;
            }
            return info;
        }

    } // namespace

    // =============================================================================
    // arrival buffer
    // =============================================================================

    auto arrival_buffer::append(std::uint32_t const ext, std::span<std::uint8_t const> const bytes) -> void
    {
        if (bytes.empty())
        {
            return;
        }
        if (!chunks_.empty() && chunks_.back().ext == ext)
        {
            chunks_.back().bytes.insert(chunks_.back().bytes.end(), bytes.begin(), bytes.end());
            return;
        }
        chunks_.push_back(event::data{.bytes = {bytes.begin(), bytes.end()}, .ext = ext});
    }

    auto arrival_buffer::pop() -> std::optional<event::data>
    {
        if (chunks_.empty())
        {
            return std::nullopt;
        }
        auto chunk = std::move(chunks_.front());
        chunks_.pop_front();
        return chunk;
    }

    // =============================================================================
    // connector
    // =============================================================================

    auto classify_connect_error(std::string_view const message) noexcept -> error
    {
        try
        {
            auto const text = lowercase(message);
            if (text.contains("kex algos"))
            {
                return error::no_common_kex_algorithm;
            }
            if (text.contains("server host key algo"))
            {
                return error::no_common_key_algorithm;
            }
            if (text.contains("encryption"))
            {
                return error::no_common_cipher;
            }
            if (text.contains("kexinit") || text.contains("kex error"))
            {
                return error::kex_init;
            }
            if (text.contains("timeout") || text.contains("timed out"))
            {
                return error::timeout;
            }
        }
        catch (std::bad_alloc const &)
        {
            return error::connection_failed;
        }
        return error::connection_failed;
    }

    struct libssh_connector::library_handle
    {
        std::shared_ptr<library_guard> guard{std::make_shared<library_guard>()};
    };

    libssh_connector::libssh_connector() : library_(std::make_unique<library_handle>()) {}

    libssh_connector::~libssh_connector() = default;

    auto libssh_connector::connect(device const &dev, connect_options const &options,
                                   std::shared_ptr<session_handler> handler) -> result<std::unique_ptr<session>>
    {
        ssh_session ssh = ssh_new();
        if (ssh == nullptr)
        {
            return std::unexpected(error::connection_failed);
        }
        // owns ssh from here on, frees it on every early return
        auto state = std::make_shared<session_state>(library_->guard, ssh, std::move(handler));

        unsigned int port = dev.port;
        auto timeout_secs = static_cast<long>(options.timeout.count());
        bool process_config = false;

        ssh_options_set(ssh, SSH_OPTIONS_HOST, dev.host.c_str());
        ssh_options_set(ssh, SSH_OPTIONS_PORT, &port);
        ssh_options_set(ssh, SSH_OPTIONS_USER, dev.username.c_str());
        ssh_options_set(ssh, SSH_OPTIONS_TIMEOUT, &timeout_secs);
        ssh_options_set(ssh, SSH_OPTIONS_PROCESS_CONFIG, &process_config);

        if (!set_algorithm_list(ssh, SSH_OPTIONS_KEY_EXCHANGE, options.algorithms.kex) ||
            !set_algorithm_list(ssh, SSH_OPTIONS_HOSTKEYS, options.algorithms.host_keys) ||
            !set_algorithm_list(ssh, SSH_OPTIONS_PUBLICKEY_ACCEPTED_TYPES, options.algorithms.host_keys))
        {
            logger().warn("libssh: algorithm list rejected: {}", ssh_get_error(ssh));
            return std::unexpected(error::connection_failed);
        }

        logger().debug("libssh: connecting to {}:{}", dev.host, dev.port);
        if (ssh_connect(ssh) != SSH_OK)
        {
            std::string_view const reason = ssh_get_error(ssh);
            auto const kind = classify_connect_error(reason);
            logger().debug("libssh: connect to {} failed ({}): {}", dev.host, kind, reason);
            return std::unexpected(kind);
        }

        auto const key_info = describe_server_key(ssh, options.algorithms);
        if (state->handler && !state->handler->check_server_key(key_info))
        {
            return std::unexpected(error::host_key_rejected);
        }

        return std::make_unique<libssh_session>(std::move(state));
    }

} // namespace sshpool::transport
