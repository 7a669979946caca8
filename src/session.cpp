// session.cpp - session lifecycle and delegation to the executors and the transfer channel

#include "fastssh/session.hpp"
#include "fastssh/command_executor.hpp"
#include "fastssh/libssh_transport.hpp"
#include "fastssh/log.hpp"

#include <algorithm>
#include <vector>

namespace fastssh
{

    // =============================================================================
    // session implementation
    // =============================================================================

    class session::impl
    {
    public:
        credentials creds_;
        session_config config_;
        transport_factory factory_;
        std::unique_ptr<transport> link_;
        bool open_{false};

        // channels kept reachable for execution_result::flush
        std::vector<std::shared_ptr<exec_channel>> retained_;
        std::vector<std::unique_ptr<async_task>> tasks_;

        impl(credentials creds, session_config config, transport_factory factory)
            : creds_{std::move(creds)}, config_{config}, factory_{std::move(factory)}
        {
        }

        ~impl() { close(); }

        impl(impl const &) = delete;
        auto operator=(impl const &) -> impl & = delete;
        impl(impl &&) = delete;
        auto operator=(impl &&) -> impl & = delete;

        [[nodiscard]] auto usable() const noexcept -> bool { return open_ && link_ && link_->is_connected(); }

        auto prune() -> void
        {
            std::erase_if(retained_, [](auto const &channel) { return !channel->accepts_input(); });
            std::erase_if(tasks_, [](auto const &task) { return task->finished(); });
        }

        auto close() noexcept -> void
        {
            // workers first, they still read from their channels
            for (auto &task : tasks_)
            {
                task->stop();
            }
            tasks_.clear();

            for (auto &channel : retained_)
            {
                channel->close();
            }
            retained_.clear();

            if (link_)
            {
                link_->disconnect();
            }

            if (open_)
            {
                log::info("closed session to {}@{}", creds_.username, creds_.host);
            }
            open_ = false;
        }
    };

    session::session(credentials creds, session_config config)
        : session(std::move(creds), config, [] { return make_libssh_transport(); })
    {
    }

    session::session(credentials creds, session_config config, transport_factory factory)
        : impl_(std::make_unique<impl>(std::move(creds), config, std::move(factory)))
    {
    }

    session::session(std::string host, std::string username, std::string password)
        : session(credentials{.host = std::move(host),
                              .port = 22,
                              .username = std::move(username),
                              .password = std::move(password),
                              .key = std::nullopt})
    {
    }

    session::~session() = default;

    session::session(session &&other) noexcept = default;

    auto session::operator=(session &&other) noexcept -> session & = default;

    // -------------------------------------------------------------------------
    // lifecycle
    // -------------------------------------------------------------------------

    auto session::connect(credentials creds, session_config config) -> result<session>
    {
        session s{std::move(creds), config};
        if (auto opened = s.open(); !opened.has_value())
        {
            return std::unexpected(opened.error());
        }
        return s;
    }

    auto session::connect(credentials creds, session_config config, transport_factory factory) -> result<session>
    {
        session s{std::move(creds), config, std::move(factory)};
        if (auto opened = s.open(); !opened.has_value())
        {
            return std::unexpected(opened.error());
        }
        return s;
    }

    auto session::open() -> void_result
    {
        if (!impl_)
        {
            return std::unexpected(error::connection_closed);
        }

        if (impl_->usable())
        {
            return {};
        }

        if (auto valid = validate(impl_->creds_); !valid.has_value())
        {
            return valid;
        }

        // a dropped or closed connection is reopened on a fresh transport, so channels
        // handed out earlier never see the new connection
        impl_->close();
        impl_->link_ = impl_->factory_ ? impl_->factory_() : nullptr;
        if (!impl_->link_)
        {
            return std::unexpected(error::transport_failed);
        }

        if (auto connected = impl_->link_->connect(impl_->creds_, impl_->config_); !connected.has_value())
        {
            log::warn("cannot open session to {}@{}: {}", impl_->creds_.username, impl_->creds_.host,
                      connected.error());
            return connected;
        }

        impl_->open_ = true;
        log::info("opened session to {}@{}:{}", impl_->creds_.username, impl_->creds_.host, impl_->creds_.port);
        return {};
    }

    auto session::close() noexcept -> void
    {
        if (impl_)
        {
            impl_->close();
        }
    }

    auto session::is_open() const noexcept -> bool
    {
        return impl_ && impl_->usable();
    }

    auto session::host() const noexcept -> std::string_view
    {
        return impl_ ? impl_->creds_.host : std::string_view{};
    }

    auto session::user() const noexcept -> std::string_view
    {
        return impl_ ? impl_->creds_.username : std::string_view{};
    }

    auto session::port() const noexcept -> int
    {
        return impl_ ? impl_->creds_.port : 0;
    }

    // -------------------------------------------------------------------------
    // command execution
    // -------------------------------------------------------------------------

    auto session::exec(std::string_view const command, exec_options const &options) -> result<execution_result>
    {
        if (!is_open())
        {
            return std::unexpected(error::connection_closed);
        }

        impl_->prune();

        command_executor executor{*impl_->link_, impl_->config_,
                                  [this](std::shared_ptr<exec_channel> channel)
                                  {
                                      if (channel->accepts_input())
                                      {
                                          impl_->retained_.push_back(std::move(channel));
                                      }
                                  }};
        return executor.execute(command, options);
    }

    auto session::exec(std::span<std::string const> const commands, exec_options const &options)
        -> result<execution_result>
    {
        return exec(join_commands(commands), options);
    }

    auto session::async_exec(std::string_view const command, output_callback on_output, exec_options const &options)
        -> result<async_execution>
    {
        return async_exec(command, std::move(on_output), {}, options);
    }

    auto session::async_exec(std::string_view const command, output_callback on_stdout, output_callback on_stderr,
                             exec_options const &options) -> result<async_execution>
    {
        if (!is_open())
        {
            return std::unexpected(error::connection_closed);
        }

        impl_->prune();

        async_executor executor{*impl_->link_, impl_->config_};
        auto task = executor.start(command, std::move(on_stdout), std::move(on_stderr), options);
        if (!task.has_value())
        {
            return std::unexpected(task.error());
        }

        auto handle = (*task)->handle();
        impl_->tasks_.push_back(std::move(*task));
        return handle;
    }

    // -------------------------------------------------------------------------
    // file transfer (SFTP)
    // -------------------------------------------------------------------------

    auto session::transfer() -> result<file_transfer_channel>
    {
        if (!is_open())
        {
            return std::unexpected(error::connection_closed);
        }
        return file_transfer_channel{*impl_->link_};
    }

    auto session::send_file(std::string_view const remote_path, transfer_payload const &content, int const mode)
        -> void_result
    {
        return transfer().and_then([&](file_transfer_channel channel)
                                   { return channel.send_file(remote_path, content, mode); });
    }

    auto session::send_file(std::string_view const remote_path, std::span<std::uint8_t const> const content,
                            int const mode) -> void_result
    {
        return transfer().and_then([&](file_transfer_channel channel)
                                   { return channel.send_file(remote_path, content, mode); });
    }

    auto session::download_file(std::string_view const remote_path) -> result<bytes>
    {
        return transfer().and_then([&](file_transfer_channel channel) { return channel.download_file(remote_path); });
    }

    auto session::remove_file(std::string_view const remote_path) -> void_result
    {
        return transfer().and_then([&](file_transfer_channel channel) { return channel.remove_file(remote_path); });
    }

    auto session::file_matches(std::string_view const remote_path, std::filesystem::path const &local) -> result<bool>
    {
        return transfer().and_then([&](file_transfer_channel channel)
                                   { return channel.file_matches(remote_path, local); });
    }

    auto session::edit_file(std::string_view const remote_path, file_transfer_channel::edit_fn const &edit)
        -> void_result
    {
        return transfer().and_then([&](file_transfer_channel channel) { return channel.edit_file(remote_path, edit); });
    }

    auto session::edit_file_replace(std::string_view const remote_path, std::string_view const old_text,
                                    std::string_view const new_text, std::size_t const count) -> void_result
    {
        return transfer().and_then([&](file_transfer_channel channel)
                                   { return channel.edit_file_replace(remote_path, old_text, new_text, count); });
    }

    auto session::edit_file_regex_replace(std::string_view const remote_path, std::string const &pattern,
                                          std::string const &replacement, std::size_t const count) -> void_result
    {
        return transfer().and_then(
            [&](file_transfer_channel channel)
            { return channel.edit_file_regex_replace(remote_path, pattern, replacement, count); });
    }

} // namespace fastssh
