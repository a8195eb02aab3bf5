// session_manager.cpp - connect, authenticate, open channel; reconnect at most once

#include "arkv/session_manager.hpp"
#include "arkv/log.hpp"

#include <utility>

namespace arkv
{

    // =============================================================================
    // session
    // =============================================================================

    session::session(std::unique_ptr<sftp_transport> transport) noexcept : transport_{std::move(transport)} {}

    session::~session()
    {
        close();
    }

    void session::close() noexcept
    {
        if (transport_)
        {
            transport_->disconnect();
        }
    }

    // =============================================================================
    // session_manager
    // =============================================================================

    session_manager::session_manager(transport_factory factory, session_options options)
        : factory_{std::move(factory)}, options_{options}
    {
    }

    session_manager::~session_manager()
    {
        close();
    }

    auto session_manager::open(destination_context const &ctx) -> result<session>
    {
        auto transport = factory_ ? factory_() : nullptr;
        if (!transport)
        {
            return std::unexpected{error_code::handshake_error};
        }

        log::get()->debug("connecting to {}", ctx);
        if (auto connected = transport->connect(ctx, options_); !connected.has_value())
        {
            transport->disconnect();
            return std::unexpected{connected.error()};
        }

        log::get()->debug("authenticating as {} with {}", ctx.username, ctx.uses_password() ? "password" : "key");
        if (auto authed = transport->authenticate(ctx); !authed.has_value())
        {
            transport->disconnect();
            return std::unexpected{authed.error()};
        }

        if (auto channel = transport->open_channel(); !channel.has_value())
        {
            transport->disconnect();
            return std::unexpected{channel.error()};
        }

        return session{std::move(transport)};
    }

    auto session_manager::connect(destination_context const &ctx) -> void_result
    {
        close();
        context_ = ctx;
        reconnects_used_ = 0;

        auto opened = open(ctx);
        if (!opened.has_value())
        {
            log::get()->warn("connection to {} failed: {}", ctx, opened.error());
            return std::unexpected{opened.error()};
        }

        current_.emplace(std::move(*opened));
        log::get()->info("connected to {}", ctx);
        return {};
    }

    auto session_manager::reconnect() -> void_result
    {
        if (!can_reconnect())
        {
            return std::unexpected{error_code::session_lost};
        }
        ++reconnects_used_;

        current_.reset();
        log::get()->warn("session to {} lost, reconnecting", *context_);

        auto opened = open(*context_);
        if (!opened.has_value())
        {
            log::get()->error("reconnect to {} failed: {}", *context_, opened.error());
            return std::unexpected{opened.error()};
        }

        current_.emplace(std::move(*opened));
        return {};
    }

    void session_manager::close() noexcept
    {
        current_.reset();
    }

} // namespace arkv
