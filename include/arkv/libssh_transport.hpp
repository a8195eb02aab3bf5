// libssh_transport.hpp - sftp_transport on top of libssh
// we own the tcp socket so unreachable hosts and bad handshakes stay distinguishable

#pragma once

#include "transport.hpp"

#include <memory>

namespace arkv
{

    class libssh_transport final : public sftp_transport
    {
    public:
        libssh_transport();
        ~libssh_transport() override;

        // move-only type
        libssh_transport(libssh_transport const &) = delete;
        auto operator=(libssh_transport const &) -> libssh_transport & = delete;
        libssh_transport(libssh_transport &&) noexcept;
        auto operator=(libssh_transport &&) noexcept -> libssh_transport &;

        [[nodiscard]] auto connect(destination_context const &ctx, session_options const &options)
            -> void_result override;
        [[nodiscard]] auto authenticate(destination_context const &ctx) -> void_result override;
        [[nodiscard]] auto open_channel() -> void_result override;

        [[nodiscard]] auto stat(std::string_view path) -> result<std::optional<remote_kind>> override;
        [[nodiscard]] auto mkdir(std::string_view path, std::uint32_t mode) -> void_result override;
        [[nodiscard]] auto open_write(std::string_view path, std::uint32_t mode)
            -> result<std::unique_ptr<remote_file>> override;

        void disconnect() override;
        [[nodiscard]] auto is_connected() const noexcept -> bool override;

        class impl;

    private:
        std::unique_ptr<impl> impl_;
    };

    [[nodiscard]] auto make_libssh_transport_factory() -> transport_factory;

} // namespace arkv
