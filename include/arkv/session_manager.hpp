// session_manager.hpp - one authenticated connection + SFTP channel per upload
// no globals: whoever runs an upload owns its manager

#pragma once

#include "common.hpp"
#include "destination.hpp"
#include "transport.hpp"

#include <cstddef>
#include <memory>
#include <optional>

namespace arkv
{

    // a live, authenticated transport with its SFTP channel open
    class session
    {
    public:
        explicit session(std::unique_ptr<sftp_transport> transport) noexcept;
        ~session();

        session(session const &) = delete;
        auto operator=(session const &) -> session & = delete;
        session(session &&) noexcept = default;
        auto operator=(session &&) noexcept -> session & = default;

        [[nodiscard]] auto transport() noexcept -> sftp_transport & { return *transport_; }
        [[nodiscard]] auto is_open() const noexcept -> bool { return transport_ && transport_->is_connected(); }

        void close() noexcept;

    private:
        std::unique_ptr<sftp_transport> transport_;
    };

    class session_manager
    {
    public:
        static constexpr std::size_t max_automatic_reconnects = 1;

        explicit session_manager(transport_factory factory, session_options options = {});
        ~session_manager();

        session_manager(session_manager const &) = delete;
        auto operator=(session_manager const &) -> session_manager & = delete;

        // host_unreachable, handshake_error or auth_failed on failure
        [[nodiscard]] auto connect(destination_context const &ctx) -> void_result;

        // drop the current session and connect again with the same destination;
        // session_lost once the reconnect budget is spent
        [[nodiscard]] auto reconnect() -> void_result;

        void close() noexcept;

        [[nodiscard]] auto has_session() const noexcept -> bool { return current_.has_value(); }

        // precondition: has_session()
        [[nodiscard]] auto current() noexcept -> session & { return *current_; }

        [[nodiscard]] auto reconnects_used() const noexcept -> std::size_t { return reconnects_used_; }
        [[nodiscard]] auto can_reconnect() const noexcept -> bool
        {
            return context_.has_value() && reconnects_used_ < max_automatic_reconnects;
        }

        [[nodiscard]] auto options() const noexcept -> session_options const & { return options_; }

    private:
        [[nodiscard]] auto open(destination_context const &ctx) -> result<session>;

        transport_factory factory_;
        session_options options_;
        std::optional<destination_context> context_;
        std::optional<session> current_;
        std::size_t reconnects_used_{0};
    };

} // namespace arkv
