// transport.hpp - the SFTP capability boundary
// everything the engine needs from the wire, and nothing more

#pragma once

#include "common.hpp"
#include "destination.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace arkv
{

    enum class remote_kind : std::uint8_t
    {
        directory,
        regular,
        other,
    };

    // an open remote file; closes on destruction if close() was not called
    class remote_file
    {
    public:
        virtual ~remote_file() = default;

        // bytes accepted by the server, or remote_io_error / session_lost / timeout
        [[nodiscard]] virtual auto write(std::span<std::byte const> chunk) -> result<std::size_t> = 0;

        [[nodiscard]] virtual auto close() -> void_result = 0;
    };

    class sftp_transport
    {
    public:
        virtual ~sftp_transport() = default;

        // tcp connect + protocol handshake: host_unreachable, handshake_error
        [[nodiscard]] virtual auto connect(destination_context const &ctx, session_options const &options)
            -> void_result = 0;

        // auth_failed
        [[nodiscard]] virtual auto authenticate(destination_context const &ctx) -> void_result = 0;

        // SFTP sub-channel on the same connection: handshake_error
        [[nodiscard]] virtual auto open_channel() -> void_result = 0;

        // nullopt when the path does not exist
        [[nodiscard]] virtual auto stat(std::string_view path) -> result<std::optional<remote_kind>> = 0;

        [[nodiscard]] virtual auto mkdir(std::string_view path, std::uint32_t mode) -> void_result = 0;

        // create or truncate
        [[nodiscard]] virtual auto open_write(std::string_view path, std::uint32_t mode)
            -> result<std::unique_ptr<remote_file>> = 0;

        virtual void disconnect() = 0;

        [[nodiscard]] virtual auto is_connected() const noexcept -> bool = 0;
    };

    // builds a fresh, unconnected transport; called once per (re)connect
    using transport_factory = std::function<std::unique_ptr<sftp_transport>()>;

} // namespace arkv
