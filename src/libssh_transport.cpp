// libssh_transport.cpp - libssh SFTP backend
// RAII guards around every libssh handle, errors classified per call

#include "arkv/libssh_transport.hpp"
#include "arkv/log.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstring>
#include <string>
#include <utility>

// libssh headers - order matters due to internal dependencies
#include <libssh/libssh.h>
#include <libssh/sftp.h>

// some libssh versions have issues with fcntl.h order
#include <fcntl.h>

#include <cerrno>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace arkv
{

    namespace
    {

        // =============================================================================
        // RAII guards
        // =============================================================================

        struct socket_guard
        {
            int fd{-1};

            socket_guard() = default;
            explicit socket_guard(int f) : fd(f) {}
            ~socket_guard()
            {
                if (fd >= 0)
                {
                    ::close(fd);
                }
            }

            socket_guard(socket_guard const &) = delete;
            auto operator=(socket_guard const &) -> socket_guard & = delete;

            socket_guard(socket_guard &&other) noexcept : fd(std::exchange(other.fd, -1)) {}

            auto operator=(socket_guard &&other) noexcept -> socket_guard &
            {
                if (this != &other)
                {
                    if (fd >= 0)
                    {
                        ::close(fd);
                    }
                    fd = std::exchange(other.fd, -1);
                }
                return *this;
            }

            auto release() noexcept -> int { return std::exchange(fd, -1); }
            [[nodiscard]] explicit operator bool() const noexcept { return fd >= 0; }
        };

        struct addrinfo_guard
        {
            struct addrinfo *list{nullptr};

            addrinfo_guard() = default;
            ~addrinfo_guard()
            {
                if (list != nullptr)
                {
                    ::freeaddrinfo(list);
                }
            }

            addrinfo_guard(addrinfo_guard const &) = delete;
            auto operator=(addrinfo_guard const &) -> addrinfo_guard & = delete;
        };

        struct sftp_file_guard
        {
            sftp_file file{nullptr};

            sftp_file_guard() = default;
            explicit sftp_file_guard(sftp_file f) : file(f) {}
            ~sftp_file_guard()
            {
                if (file != nullptr)
                {
                    sftp_close(file);
                }
            }

            sftp_file_guard(sftp_file_guard const &) = delete;
            auto operator=(sftp_file_guard const &) -> sftp_file_guard & = delete;

            sftp_file_guard(sftp_file_guard &&other) noexcept : file(std::exchange(other.file, nullptr)) {}

            auto operator=(sftp_file_guard &&other) noexcept -> sftp_file_guard &
            {
                if (this != &other)
                {
                    if (file != nullptr)
                    {
                        sftp_close(file);
                    }
                    file = std::exchange(other.file, nullptr);
                }
                return *this;
            }

            auto release() noexcept -> sftp_file { return std::exchange(file, nullptr); }
            [[nodiscard]] auto get() const noexcept -> sftp_file { return file; }
            [[nodiscard]] explicit operator bool() const noexcept { return file != nullptr; }
        };

        struct sftp_attributes_guard
        {
            sftp_attributes attrs{nullptr};

            explicit sftp_attributes_guard(sftp_attributes a) : attrs(a) {}
            ~sftp_attributes_guard()
            {
                if (attrs != nullptr)
                {
                    sftp_attributes_free(attrs);
                }
            }

            sftp_attributes_guard(sftp_attributes_guard const &) = delete;
            auto operator=(sftp_attributes_guard const &) -> sftp_attributes_guard & = delete;
        };

        struct ssh_key_guard
        {
            ssh_key key{nullptr};

            ssh_key_guard() = default;
            ~ssh_key_guard()
            {
                if (key != nullptr)
                {
                    ssh_key_free(key);
                }
            }

            ssh_key_guard(ssh_key_guard const &) = delete;
            auto operator=(ssh_key_guard const &) -> ssh_key_guard & = delete;
        };

        // =============================================================================
        // tcp connect with a deadline
        // =============================================================================

        void tune_socket(int const fd) noexcept
        {
            int one = 1;
            (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

            int buffer = constants::socket_buffer_size;
            (void)::setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &buffer, sizeof(buffer));
            (void)::setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &buffer, sizeof(buffer));
        }

        [[nodiscard]] auto connect_one(struct addrinfo const *ai, std::chrono::steady_clock::time_point const deadline)
            -> result<socket_guard>
        {
            socket_guard sock{::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol)};
            if (!sock)
            {
                return std::unexpected{error_code::host_unreachable};
            }

            if (::connect(sock.fd, ai->ai_addr, ai->ai_addrlen) != 0)
            {
                if (errno != EINPROGRESS)
                {
                    return std::unexpected{error_code::host_unreachable};
                }

                auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0)
                {
                    return std::unexpected{error_code::host_unreachable};
                }

                struct pollfd pfd{};
                pfd.fd = sock.fd;
                pfd.events = POLLOUT;
                if (::poll(&pfd, 1, static_cast<int>(remaining.count())) <= 0)
                {
                    return std::unexpected{error_code::host_unreachable};
                }

                int so_error = 0;
                socklen_t len = sizeof(so_error);
                if (::getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0)
                {
                    return std::unexpected{error_code::host_unreachable};
                }
            }

            // libssh expects a blocking socket
            auto const flags = ::fcntl(sock.fd, F_GETFL, 0);
            if (flags < 0 || ::fcntl(sock.fd, F_SETFL, flags & ~O_NONBLOCK) < 0)
            {
                return std::unexpected{error_code::host_unreachable};
            }

            tune_socket(sock.fd);
            return sock;
        }

        [[nodiscard]] auto tcp_connect(std::string const &host, std::uint16_t const port,
                                       std::chrono::seconds const timeout) -> result<socket_guard>
        {
            struct addrinfo hints{};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;

            addrinfo_guard resolved;
            auto const service = fmt::format("{}", port);
            if (::getaddrinfo(host.c_str(), service.c_str(), &hints, &resolved.list) != 0)
            {
                return std::unexpected{error_code::host_unreachable};
            }

            auto const deadline = std::chrono::steady_clock::now() + timeout;
            for (auto const *ai = resolved.list; ai != nullptr; ai = ai->ai_next)
            {
                auto sock = connect_one(ai, deadline);
                if (sock.has_value())
                {
                    return sock;
                }
            }

            return std::unexpected{error_code::host_unreachable};
        }

    } // namespace

    // =============================================================================
    // transport state
    // =============================================================================

    class libssh_transport::impl
    {
    public:
        ssh_session ssh_{nullptr};
        sftp_session sftp_{nullptr};
        std::string host_;
        session_options options_{};

        impl() = default;

        ~impl() { reset(); }

        impl(impl const &) = delete;
        auto operator=(impl const &) -> impl & = delete;
        impl(impl &&) = delete;
        auto operator=(impl &&) -> impl & = delete;

        void reset() noexcept
        {
            if (sftp_ != nullptr)
            {
                sftp_free(sftp_);
                sftp_ = nullptr;
            }
            if (ssh_ != nullptr)
            {
                ssh_disconnect(ssh_);
                ssh_free(ssh_);
                ssh_ = nullptr;
            }
        }

        // map the last failure on this session to an error kind
        [[nodiscard]] auto classify() const noexcept -> error_code
        {
            if (ssh_ == nullptr || ssh_is_connected(ssh_) == 0)
            {
                return error_code::session_lost;
            }
            if (sftp_ == nullptr)
            {
                return error_code::session_lost;
            }

            switch (sftp_get_error(sftp_))
            {
            case SSH_FX_CONNECTION_LOST:
            case SSH_FX_NO_CONNECTION:
                return error_code::session_lost;
            case SSH_FX_OK:
                // no SFTP status: the failure happened below, in the ssh layer
                return ssh_get_error_code(ssh_) == SSH_FATAL ? error_code::session_lost : error_code::timeout;
            default:
                return error_code::remote_io_error;
            }
        }
    };

    namespace
    {

        class libssh_remote_file final : public remote_file
        {
        public:
            libssh_remote_file(libssh_transport::impl const &owner, sftp_file file) : owner_{owner}, file_{file} {}

            [[nodiscard]] auto write(std::span<std::byte const> chunk) -> result<std::size_t> override
            {
                if (!file_)
                {
                    return std::unexpected{error_code::remote_io_error};
                }

                auto const written = sftp_write(file_.get(), chunk.data(), chunk.size());
                if (written < 0)
                {
                    return std::unexpected{owner_.classify()};
                }
                return static_cast<std::size_t>(written);
            }

            [[nodiscard]] auto close() -> void_result override
            {
                if (!file_)
                {
                    return {};
                }
                if (sftp_close(file_.release()) != SSH_NO_ERROR)
                {
                    return std::unexpected{owner_.classify()};
                }
                return {};
            }

        private:
            libssh_transport::impl const &owner_;
            sftp_file_guard file_;
        };

    } // namespace

    // =============================================================================
    // libssh_transport
    // =============================================================================

    libssh_transport::libssh_transport() : impl_(std::make_unique<impl>()) {}

    libssh_transport::~libssh_transport() = default;

    libssh_transport::libssh_transport(libssh_transport &&other) noexcept = default;

    auto libssh_transport::operator=(libssh_transport &&other) noexcept -> libssh_transport & = default;

    auto libssh_transport::connect(destination_context const &ctx, session_options const &options) -> void_result
    {
        impl_->reset();
        impl_->host_ = ctx.host;
        impl_->options_ = options;

        auto sock = tcp_connect(ctx.host, ctx.port, options.connect_timeout);
        if (!sock.has_value())
        {
            log::get()->debug("tcp connect to {}:{} failed", ctx.host, ctx.port);
            return std::unexpected{sock.error()};
        }

        impl_->ssh_ = ssh_new();
        if (impl_->ssh_ == nullptr)
        {
            return std::unexpected{error_code::handshake_error};
        }

        int const port = ctx.port;
        ssh_options_set(impl_->ssh_, SSH_OPTIONS_HOST, ctx.host.c_str());
        ssh_options_set(impl_->ssh_, SSH_OPTIONS_PORT, &port);
        ssh_options_set(impl_->ssh_, SSH_OPTIONS_USER, ctx.username.c_str());

        auto timeout_secs = static_cast<long>(options.connect_timeout.count());
        ssh_options_set(impl_->ssh_, SSH_OPTIONS_TIMEOUT, &timeout_secs);

        if (options.verbosity > 0)
        {
            int verbosity = SSH_LOG_PROTOCOL;
            ssh_options_set(impl_->ssh_, SSH_OPTIONS_LOG_VERBOSITY, &verbosity);
        }

        if (!options.strict_host_key_checking)
        {
            // accept any host key - the operator opted out of known_hosts
            int strict = 0;
            ssh_options_set(impl_->ssh_, SSH_OPTIONS_STRICTHOSTKEYCHECK, &strict);
        }

        // libssh owns the descriptor from here on
        socket_t fd = sock->release();
        ssh_options_set(impl_->ssh_, SSH_OPTIONS_FD, &fd);

        if (ssh_connect(impl_->ssh_) != SSH_OK)
        {
            log::get()->debug("ssh handshake with {} failed: {}", ctx.host, ssh_get_error(impl_->ssh_));
            impl_->reset();
            return std::unexpected{error_code::handshake_error};
        }

        if (options.strict_host_key_checking && ssh_session_is_known_server(impl_->ssh_) != SSH_KNOWN_HOSTS_OK)
        {
            log::get()->warn("host key for {} is not in known_hosts", ctx.host);
            impl_->reset();
            return std::unexpected{error_code::handshake_error};
        }

        return {};
    }

    auto libssh_transport::authenticate(destination_context const &ctx) -> void_result
    {
        if (impl_->ssh_ == nullptr)
        {
            return std::unexpected{error_code::session_lost};
        }

        bool authenticated = false;

        if (auto const *password = std::get_if<password_auth>(&ctx.auth))
        {
            authenticated = ssh_userauth_password(impl_->ssh_, nullptr, password->secret.c_str()) == SSH_AUTH_SUCCESS;
        }
        else if (auto const *key = std::get_if<key_auth>(&ctx.auth))
        {
            if (!key->private_key_path.empty())
            {
                ssh_key_guard imported;
                auto const *passphrase = key->passphrase.empty() ? nullptr : key->passphrase.c_str();
                auto rc = ssh_pki_import_privkey_file(key->private_key_path.c_str(), passphrase, nullptr, nullptr,
                                                      &imported.key);
                if (rc == SSH_OK && imported.key != nullptr)
                {
                    authenticated = ssh_userauth_publickey(impl_->ssh_, nullptr, imported.key) == SSH_AUTH_SUCCESS;
                }
                else
                {
                    log::get()->debug("could not import private key {}", key->private_key_path.string());
                }
            }

            // fall back to the agent and default identities
            if (!authenticated)
            {
                authenticated = ssh_userauth_publickey_auto(impl_->ssh_, nullptr, nullptr) == SSH_AUTH_SUCCESS;
            }
        }

        if (!authenticated)
        {
            return std::unexpected{error_code::auth_failed};
        }
        return {};
    }

    auto libssh_transport::open_channel() -> void_result
    {
        if (impl_->ssh_ == nullptr)
        {
            return std::unexpected{error_code::session_lost};
        }

        impl_->sftp_ = sftp_new(impl_->ssh_);
        if (impl_->sftp_ == nullptr)
        {
            return std::unexpected{error_code::handshake_error};
        }

        if (sftp_init(impl_->sftp_) != SSH_OK)
        {
            sftp_free(impl_->sftp_);
            impl_->sftp_ = nullptr;
            return std::unexpected{error_code::handshake_error};
        }

        // blocking calls from here on are bounded by the per-chunk timeout
        auto io_secs = static_cast<long>(impl_->options_.io_timeout.count());
        ssh_options_set(impl_->ssh_, SSH_OPTIONS_TIMEOUT, &io_secs);

        return {};
    }

    auto libssh_transport::stat(std::string_view const path) -> result<std::optional<remote_kind>>
    {
        if (impl_->sftp_ == nullptr)
        {
            return std::unexpected{error_code::session_lost};
        }

        sftp_attributes_guard attrs{sftp_stat(impl_->sftp_, std::string(path).c_str())};
        if (attrs.attrs == nullptr)
        {
            if (sftp_get_error(impl_->sftp_) == SSH_FX_NO_SUCH_FILE)
            {
                return std::optional<remote_kind>{};
            }
            return std::unexpected{impl_->classify()};
        }

        switch (attrs.attrs->type)
        {
        case SSH_FILEXFER_TYPE_DIRECTORY:
            return std::optional{remote_kind::directory};
        case SSH_FILEXFER_TYPE_REGULAR:
            return std::optional{remote_kind::regular};
        default:
            return std::optional{remote_kind::other};
        }
    }

    auto libssh_transport::mkdir(std::string_view const path, std::uint32_t const mode) -> void_result
    {
        if (impl_->sftp_ == nullptr)
        {
            return std::unexpected{error_code::session_lost};
        }

        if (sftp_mkdir(impl_->sftp_, std::string(path).c_str(), static_cast<mode_t>(mode)) != 0)
        {
            return std::unexpected{impl_->classify()};
        }
        return {};
    }

    auto libssh_transport::open_write(std::string_view const path, std::uint32_t const mode)
        -> result<std::unique_ptr<remote_file>>
    {
        if (impl_->sftp_ == nullptr)
        {
            return std::unexpected{error_code::session_lost};
        }

        auto *file = sftp_open(impl_->sftp_, std::string(path).c_str(), O_WRONLY | O_CREAT | O_TRUNC,
                               static_cast<mode_t>(mode));
        if (file == nullptr)
        {
            return std::unexpected{impl_->classify()};
        }

        return std::make_unique<libssh_remote_file>(*impl_, file);
    }

    void libssh_transport::disconnect()
    {
        if (impl_)
        {
            impl_->reset();
        }
    }

    auto libssh_transport::is_connected() const noexcept -> bool
    {
        return impl_ && impl_->ssh_ != nullptr && impl_->sftp_ != nullptr && ssh_is_connected(impl_->ssh_) != 0;
    }

    auto make_libssh_transport_factory() -> transport_factory
    {
        return []() -> std::unique_ptr<sftp_transport> { return std::make_unique<libssh_transport>(); };
    }

} // namespace arkv
