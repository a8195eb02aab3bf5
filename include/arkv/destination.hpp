// destination.hpp - a resolved upload target and the knobs for reaching it
// the credential lives here and nowhere else; formatting never prints it

#pragma once

#include "common.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>

namespace arkv
{

    struct key_auth
    {
        std::filesystem::path private_key_path;
        std::string passphrase; // optional
    };

    struct password_auth
    {
        std::string secret;
    };

    using credential = std::variant<key_auth, password_auth>;

    struct destination_context
    {
        std::string name; // registry label, informational only
        std::string host;
        std::uint16_t port{constants::default_ssh_port};
        std::string username;
        credential auth{key_auth{}};
        std::string remote_base; // absolute

        [[nodiscard]] auto uses_password() const noexcept -> bool
        {
            return std::holds_alternative<password_auth>(auth);
        }
    };

    struct session_options
    {
        std::chrono::seconds connect_timeout{constants::default_connect_timeout};
        std::chrono::seconds io_timeout{constants::default_io_timeout}; // per chunk
        bool strict_host_key_checking{false};
        int verbosity{0}; // 0=quiet, 1+=libssh protocol logging
    };

} // namespace arkv

// "name (user@host:port)" - safe to log, the credential is never printed
template <>
struct fmt::formatter<arkv::destination_context> : fmt::formatter<std::string_view>
{
    auto format(arkv::destination_context const &ctx, format_context &fctx) const
    {
        auto const text = ctx.name.empty()
                              ? fmt::format("{}@{}:{}", ctx.username, ctx.host, ctx.port)
                              : fmt::format("{} ({}@{}:{})", ctx.name, ctx.username, ctx.host, ctx.port);
        return fmt::formatter<std::string_view>::format(text, fctx);
    }
};
