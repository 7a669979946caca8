// libssh_transport.cpp - transport implementation using libssh channels and SFTP
// every libssh call goes through connection_state::mutex since libssh sessions are not thread-safe

#include "fastssh/libssh_transport.hpp"
#include "fastssh/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>
#include <limits>
#include <mutex>
#include <sstream>

// libssh headers - order matters due to internal dependencies
#include <libssh/libssh.h>
#include <libssh/sftp.h>

// some libssh versions have issues with fcntl.h order
#include <fcntl.h>

namespace fastssh
{

    namespace
    {

        // =============================================================================
        // shared connection state
        // =============================================================================

        // channels and sftp handles outlive nothing: once handle is null, libssh
        // has already released them together with the session
        struct connection_state
        {
            std::mutex mutex;
            ssh_session handle{nullptr};

            ~connection_state() { release(); }

            auto release() noexcept -> void
            {
                if (handle != nullptr)
                {
                    ssh_disconnect(handle);
                    ssh_free(handle);
                    handle = nullptr;
                }
            }
        };

        using state_ptr = std::shared_ptr<connection_state>;

        // =============================================================================
        // RAII guards
        // =============================================================================

        struct key_guard
        {
            ssh_key key{nullptr};

            key_guard() = default;
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
        };

        struct channel_guard
        {
            ssh_channel channel{nullptr};

            channel_guard() = default;
            explicit channel_guard(ssh_channel c) : channel(c) {}
            ~channel_guard()
            {
                if (channel != nullptr)
                {
                    ssh_channel_close(channel);
                    ssh_channel_free(channel);
                }
            }

            channel_guard(channel_guard const &) = delete;
            auto operator=(channel_guard const &) -> channel_guard & = delete;
            channel_guard(channel_guard &&) = delete;
            auto operator=(channel_guard &&) -> channel_guard & = delete;

            [[nodiscard]] auto get() const noexcept -> ssh_channel { return channel; }
            [[nodiscard]] explicit operator bool() const noexcept { return channel != nullptr; }

            auto release() noexcept -> ssh_channel
            {
                auto c = channel;
                channel = nullptr;
                return c;
            }
        };

        // SFTP chunk size - 32KB is safe for most servers
        constexpr std::size_t SFTP_CHUNK_SIZE = 32 * 1024;

        [[nodiscard]] auto clamp_count(std::size_t const size) noexcept -> std::uint32_t
        {
            return static_cast<std::uint32_t>(std::min<std::size_t>(size, std::numeric_limits<std::uint32_t>::max()));
        }

        [[nodiscard]] auto sftp_failure(sftp_session sftp) noexcept -> error
        {
            switch (sftp_get_error(sftp))
            {
            case SSH_FX_NO_SUCH_FILE:
            case SSH_FX_NO_SUCH_PATH:
                return error::transfer_not_found;
            case SSH_FX_PERMISSION_DENIED:
                return error::transfer_permission_denied;
            default:
                return error::transfer_io_failure;
            }
        }

        // =============================================================================
        // exec channel
        // =============================================================================

        class libssh_exec_channel final : public exec_channel
        {
        public:
            libssh_exec_channel(state_ptr state, ssh_channel channel) noexcept
                : state_{std::move(state)}, channel_{channel}
            {
            }

            ~libssh_exec_channel() override { close(); }

            auto read_some(output_stream const which, std::span<std::uint8_t> buffer) -> result<std::size_t> override
            {
                std::lock_guard lock{state_->mutex};
                if (state_->handle == nullptr || channel_ == nullptr)
                {
                    return std::unexpected(error::connection_closed);
                }

                auto const index = static_cast<std::size_t>(which);
                if (eof_[index])
                {
                    return 0;
                }

                auto const rc = ssh_channel_read_nonblocking(channel_, buffer.data(), clamp_count(buffer.size()),
                                                             which == output_stream::err ? 1 : 0);
                if (rc == SSH_EOF)
                {
                    eof_[index] = true;
                    return 0;
                }
                if (rc < 0)
                {
                    log::error("channel read failed: {}", ssh_get_error(state_->handle));
                    return std::unexpected(error::transport_failed);
                }

                return static_cast<std::size_t>(rc);
            }

            auto at_eof(output_stream const which) -> bool override
            {
                std::lock_guard lock{state_->mutex};
                return eof_[static_cast<std::size_t>(which)];
            }

            auto wait_readable(std::chrono::milliseconds const timeout) -> void_result override
            {
                std::lock_guard lock{state_->mutex};
                if (state_->handle == nullptr || channel_ == nullptr)
                {
                    return std::unexpected(error::connection_closed);
                }

                auto const rc = ssh_channel_poll_timeout(channel_, static_cast<int>(timeout.count()), 0);
                if (rc == SSH_ERROR)
                {
                    return std::unexpected(error::transport_failed);
                }

                return {};
            }

            auto write(std::span<std::uint8_t const> data) -> void_result override
            {
                std::lock_guard lock{state_->mutex};
                if (!accepts_input_locked())
                {
                    return std::unexpected(error::channel_closed);
                }

                std::size_t offset = 0;
                while (offset < data.size())
                {
                    auto const written =
                        ssh_channel_write(channel_, data.data() + offset, clamp_count(data.size() - offset));
                    if (written < 0)
                    {
                        return std::unexpected(ssh_channel_is_open(channel_) != 0 ? error::transport_failed
                                                                                  : error::channel_closed);
                    }
                    offset += static_cast<std::size_t>(written);
                }

                return {};
            }

            auto send_eof() -> void_result override
            {
                std::lock_guard lock{state_->mutex};
                if (state_->handle == nullptr || channel_ == nullptr)
                {
                    return std::unexpected(error::connection_closed);
                }
                if (eof_sent_)
                {
                    return {};
                }

                eof_sent_ = true;
                if (ssh_channel_send_eof(channel_) != SSH_OK)
                {
                    return std::unexpected(error::channel_closed);
                }

                return {};
            }

            auto exit_status() -> result<int> override
            {
                std::lock_guard lock{state_->mutex};
                if (exit_code_.has_value())
                {
                    return *exit_code_;
                }
                if (state_->handle == nullptr || channel_ == nullptr)
                {
                    return std::unexpected(error::connection_closed);
                }

                // blocks until exit-status, channel close or the session timeout
                exit_code_ = ssh_channel_get_exit_status(channel_);
                return *exit_code_;
            }

            auto accepts_input() -> bool override
            {
                std::lock_guard lock{state_->mutex};
                return accepts_input_locked();
            }

            auto close() noexcept -> void override
            {
                std::lock_guard lock{state_->mutex};
                if (channel_ != nullptr && state_->handle != nullptr)
                {
                    ssh_channel_close(channel_);
                    ssh_channel_free(channel_);
                }
                channel_ = nullptr;
            }

        private:
            [[nodiscard]] auto accepts_input_locked() -> bool
            {
                if (state_->handle == nullptr || channel_ == nullptr || eof_sent_ || exit_code_.has_value())
                {
                    return false;
                }

                // process pending packets so a remote close is seen
                (void)ssh_channel_poll(channel_, 0);
                return ssh_channel_is_open(channel_) != 0 && ssh_channel_is_closed(channel_) == 0;
            }

            state_ptr state_;
            ssh_channel channel_{nullptr};
            std::array<bool, 2> eof_{false, false};
            bool eof_sent_{false};
            std::optional<int> exit_code_;
        };

        // =============================================================================
        // sftp
        // =============================================================================

        struct sftp_state
        {
            state_ptr connection;
            sftp_session sftp{nullptr};

            ~sftp_state()
            {
                std::lock_guard lock{connection->mutex};
                if (sftp != nullptr && connection->handle != nullptr)
                {
                    sftp_free(sftp);
                }
            }
        };

        using sftp_state_ptr = std::shared_ptr<sftp_state>;

        class libssh_remote_file final : public remote_file
        {
        public:
            libssh_remote_file(sftp_state_ptr state, sftp_file file) noexcept : state_{std::move(state)}, file_{file} {}

            ~libssh_remote_file() override
            {
                std::lock_guard lock{state_->connection->mutex};
                if (file_ != nullptr && state_->connection->handle != nullptr)
                {
                    sftp_close(file_);
                }
            }

            auto write(std::span<std::uint8_t const> data) -> result<std::size_t> override
            {
                std::lock_guard lock{state_->connection->mutex};
                if (state_->connection->handle == nullptr)
                {
                    return std::unexpected(error::connection_closed);
                }

                auto const chunk_size = std::min(SFTP_CHUNK_SIZE, data.size());
                auto const written = sftp_write(file_, data.data(), chunk_size);
                if (written < 0)
                {
                    return std::unexpected(sftp_failure(state_->sftp));
                }

                return static_cast<std::size_t>(written);
            }

            auto read(std::span<std::uint8_t> buffer) -> result<std::size_t> override
            {
                std::lock_guard lock{state_->connection->mutex};
                if (state_->connection->handle == nullptr)
                {
                    return std::unexpected(error::connection_closed);
                }

                auto const nbytes = sftp_read(file_, buffer.data(), std::min(SFTP_CHUNK_SIZE, buffer.size()));
                if (nbytes < 0)
                {
                    return std::unexpected(sftp_failure(state_->sftp));
                }

                return static_cast<std::size_t>(nbytes);
            }

        private:
            sftp_state_ptr state_;
            sftp_file file_{nullptr};
        };

        class libssh_sftp_channel final : public sftp_channel
        {
        public:
            explicit libssh_sftp_channel(sftp_state_ptr state) noexcept : state_{std::move(state)} {}

            auto open_for_write(std::string_view const remote_path, int const mode)
                -> result<std::unique_ptr<remote_file>> override
            {
                return open(remote_path, O_WRONLY | O_CREAT | O_TRUNC, mode);
            }

            auto open_for_read(std::string_view const remote_path) -> result<std::unique_ptr<remote_file>> override
            {
                return open(remote_path, O_RDONLY, 0);
            }

            auto file_size(std::string_view const remote_path) -> result<std::uint64_t> override
            {
                std::lock_guard lock{state_->connection->mutex};
                if (state_->connection->handle == nullptr)
                {
                    return std::unexpected(error::connection_closed);
                }

                sftp_attributes attrs = sftp_stat(state_->sftp, std::string(remote_path).c_str());
                if (attrs == nullptr)
                {
                    return std::unexpected(sftp_failure(state_->sftp));
                }
                auto const size = attrs->size;
                sftp_attributes_free(attrs);

                return size;
            }

            auto remove(std::string_view const remote_path) -> void_result override
            {
                std::lock_guard lock{state_->connection->mutex};
                if (state_->connection->handle == nullptr)
                {
                    return std::unexpected(error::connection_closed);
                }

                if (sftp_unlink(state_->sftp, std::string(remote_path).c_str()) != SSH_OK)
                {
                    return std::unexpected(sftp_failure(state_->sftp));
                }

                return {};
            }

        private:
            auto open(std::string_view const remote_path, int const access, int const mode)
                -> result<std::unique_ptr<remote_file>>
            {
                std::lock_guard lock{state_->connection->mutex};
                if (state_->connection->handle == nullptr)
                {
                    return std::unexpected(error::connection_closed);
                }

                sftp_file file =
                    sftp_open(state_->sftp, std::string(remote_path).c_str(), access, static_cast<mode_t>(mode));
                if (file == nullptr)
                {
                    auto const failure = sftp_failure(state_->sftp);
                    log::debug("sftp open '{}' failed: {}", remote_path, failure);
                    return std::unexpected(failure);
                }

                return std::make_unique<libssh_remote_file>(state_, file);
            }

            sftp_state_ptr state_;
        };

        // =============================================================================
        // authentication helpers
        // =============================================================================

        struct passphrase_request
        {
            bool requested{false};
        };

        // libssh asks through this callback only when the key is encrypted and no passphrase was given
        auto record_passphrase_request(char const * /*prompt*/, char * /*buf*/, std::size_t /*len*/, int /*echo*/,
                                       int /*verify*/, void *userdata) -> int
        {
            static_cast<passphrase_request *>(userdata)->requested = true;
            return -1;
        }

        [[nodiscard]] auto read_key_text(key_source const &source) -> result<std::string>
        {
            if (auto const *material = std::get_if<key_material>(&source))
            {
                return material->text;
            }

            auto const &path = std::get<key_file>(source).path;
            std::ifstream file(path, std::ios::binary);
            if (!file)
            {
                log::error("cannot open private key file '{}'", path.string());
                return std::unexpected(error::key_load_failed);
            }

            std::ostringstream contents;
            contents << file.rdbuf();
            return contents.str();
        }

        [[nodiscard]] auto authenticate_with_key(ssh_session ssh, credentials const &creds) -> result<bool>
        {
            auto text = read_key_text(creds.key->source);
            if (!text.has_value())
            {
                return std::unexpected(text.error());
            }

            auto const passphrase = key_passphrase(creds);
            passphrase_request request;
            key_guard key;

            auto const rc =
                ssh_pki_import_privkey_base64(text->c_str(), passphrase.has_value() ? passphrase->c_str() : nullptr,
                                              record_passphrase_request, &request, &key.key);
            if (rc != SSH_OK || key.key == nullptr)
            {
                if (request.requested && !passphrase.has_value())
                {
                    return std::unexpected(error::key_passphrase_required);
                }
                return std::unexpected(error::key_load_failed);
            }

            auto const auth = ssh_userauth_publickey(ssh, nullptr, key.key);
            if (auth == SSH_AUTH_ERROR)
            {
                log::error("public key authentication error: {}", ssh_get_error(ssh));
                return std::unexpected(error::transport_failed);
            }

            return auth == SSH_AUTH_SUCCESS;
        }

        // =============================================================================
        // transport
        // =============================================================================

        class libssh_transport final : public transport
        {
        public:
            libssh_transport() : state_{std::make_shared<connection_state>()} {}

            ~libssh_transport() override { disconnect(); }

            auto connect(credentials const &creds, session_config const &config) -> void_result override
            {
                if (auto valid = validate(creds); !valid.has_value())
                {
                    return valid;
                }

                // channels opened on an earlier connection keep its state and see the null handle
                disconnect();
                state_ = std::make_shared<connection_state>();

                std::lock_guard lock{state_->mutex};

                ssh_session ssh = ssh_new();
                if (ssh == nullptr)
                {
                    return std::unexpected(error::transport_failed);
                }
                state_->handle = ssh;

                // set connection options
                ssh_options_set(ssh, SSH_OPTIONS_HOST, creds.host.c_str());
                ssh_options_set(ssh, SSH_OPTIONS_PORT, &creds.port);
                ssh_options_set(ssh, SSH_OPTIONS_USER, creds.username.c_str());

                auto timeout_secs = static_cast<long>(config.connect_timeout.count());
                ssh_options_set(ssh, SSH_OPTIONS_TIMEOUT, &timeout_secs);

                if (config.verbosity > 0)
                {
                    int verbosity = SSH_LOG_PROTOCOL;
                    ssh_options_set(ssh, SSH_OPTIONS_LOG_VERBOSITY, &verbosity);
                }

                // host key checking
                if (!config.strict_host_key_checking)
                {
                    // accept any host key - use only for development/testing!
                    int strict = 0;
                    ssh_options_set(ssh, SSH_OPTIONS_STRICTHOSTKEYCHECK, &strict);
                }

                log::debug("connecting to {}@{}:{}", creds.username, creds.host, creds.port);

                if (ssh_connect(ssh) != SSH_OK)
                {
                    log::warn("connection to {}:{} failed: {}", creds.host, creds.port, ssh_get_error(ssh));
                    state_->release();
                    return std::unexpected(error::transport_failed);
                }

                // verify host key (if strict checking enabled)
                if (config.strict_host_key_checking)
                {
                    auto const known = ssh_session_is_known_server(ssh);
                    if (known != SSH_KNOWN_HOSTS_OK)
                    {
                        state_->release();
                        return std::unexpected(error::host_key_verification_failed);
                    }
                }

                auto authenticated = authenticate(ssh, creds);
                if (!authenticated.has_value() || !*authenticated)
                {
                    state_->release();
                    if (!authenticated.has_value())
                    {
                        return std::unexpected(authenticated.error());
                    }
                    log::info("authentication rejected for {}@{}", creds.username, creds.host);
                    return std::unexpected(error::authentication_failed);
                }

                log::debug("authenticated as {} on {}", creds.username, creds.host);
                return {};
            }

            auto disconnect() noexcept -> void override
            {
                std::lock_guard lock{state_->mutex};
                state_->release();
            }

            auto is_connected() const noexcept -> bool override
            {
                std::lock_guard lock{state_->mutex};
                return state_->handle != nullptr && ssh_is_connected(state_->handle) != 0;
            }

            auto open_exec(std::string_view const command, environment const &env)
                -> result<std::shared_ptr<exec_channel>> override
            {
                std::lock_guard lock{state_->mutex};
                if (state_->handle == nullptr)
                {
                    return std::unexpected(error::connection_closed);
                }

                channel_guard channel{ssh_channel_new(state_->handle)};
                if (!channel)
                {
                    return std::unexpected(error::channel_open_failed);
                }

                if (ssh_channel_open_session(channel.get()) != SSH_OK)
                {
                    return std::unexpected(error::channel_open_failed);
                }

                for (auto const &[name, value] : env)
                {
                    // servers commonly refuse variables outside AcceptEnv
                    if (ssh_channel_request_env(channel.get(), name.c_str(), value.c_str()) != SSH_OK)
                    {
                        log::warn("remote refused environment variable {}", name);
                    }
                }

                if (ssh_channel_request_exec(channel.get(), std::string(command).c_str()) != SSH_OK)
                {
                    return std::unexpected(error::channel_exec_failed);
                }

                return std::make_shared<libssh_exec_channel>(state_, channel.release());
            }

            auto open_sftp() -> result<std::unique_ptr<sftp_channel>> override
            {
                std::lock_guard lock{state_->mutex};
                if (state_->handle == nullptr)
                {
                    return std::unexpected(error::connection_closed);
                }

                sftp_session raw = sftp_new(state_->handle);
                if (raw == nullptr)
                {
                    return std::unexpected(error::transfer_io_failure);
                }

                if (sftp_init(raw) != SSH_OK)
                {
                    log::error("sftp subsystem init failed: {}", ssh_get_error(state_->handle));
                    sftp_free(raw);
                    return std::unexpected(error::transfer_io_failure);
                }

                // sftp_state locks the connection on destruction, build it only once nothing can fail
                auto sftp = std::make_shared<sftp_state>();
                sftp->connection = state_;
                sftp->sftp = raw;

                return std::make_unique<libssh_sftp_channel>(std::move(sftp));
            }

        private:
            [[nodiscard]] static auto authenticate(ssh_session ssh, credentials const &creds) -> result<bool>
            {
                // explicit key first
                if (creds.key.has_value())
                {
                    return authenticate_with_key(ssh, creds);
                }

                if (!creds.password.empty())
                {
                    auto const auth = ssh_userauth_password(ssh, nullptr, creds.password.c_str());
                    if (auth == SSH_AUTH_ERROR)
                    {
                        log::error("password authentication error: {}", ssh_get_error(ssh));
                        return std::unexpected(error::transport_failed);
                    }
                    return auth == SSH_AUTH_SUCCESS;
                }

                // no secret given - agent and default keys
                return ssh_userauth_publickey_auto(ssh, nullptr, nullptr) == SSH_AUTH_SUCCESS;
            }

            state_ptr state_;
        };

    } // namespace

    auto make_libssh_transport() -> std::unique_ptr<transport>
    {
        return std::make_unique<libssh_transport>();
    }

} // namespace fastssh
