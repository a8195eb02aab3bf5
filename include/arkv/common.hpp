// common.hpp - error codes, result types and shared constants

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <fmt/format.h>
#include <string_view>

namespace arkv
{

    // ============================================================================
    // error handling - errors are values, exceptions stay out of the hot path
    // ============================================================================

    enum class error_code : std::uint8_t
    {
        success = 0,

        // per-entry, never abort a plan
        local_io_error,
        path_conflict,
        remote_io_error,

        // pre-flight, nothing is attempted
        auth_failed,
        handshake_error,
        host_unreachable,

        // transport went away mid-plan
        session_lost,
        timeout,

        // planning
        not_found,
        permission_denied,
        invalid_path,

        // destination registry
        config_unreadable,
        config_invalid,
        destination_unknown,
    };

    struct error_code_formatter
    {
        [[nodiscard]] static constexpr auto to_string(error_code const ec) noexcept
            -> std::string_view
        {
            switch (ec)
            {
            case error_code::success:
                return "success";
            case error_code::local_io_error:
                return "local_io_error";
            case error_code::path_conflict:
                return "path_conflict";
            case error_code::remote_io_error:
                return "remote_io_error";
            case error_code::auth_failed:
                return "auth_failed";
            case error_code::handshake_error:
                return "handshake_error";
            case error_code::host_unreachable:
                return "host_unreachable";
            case error_code::session_lost:
                return "session_lost";
            case error_code::timeout:
                return "timeout";
            case error_code::not_found:
                return "not_found";
            case error_code::permission_denied:
                return "permission_denied";
            case error_code::invalid_path:
                return "invalid_path";
            case error_code::config_unreadable:
                return "config_unreadable";
            case error_code::config_invalid:
                return "config_invalid";
            case error_code::destination_unknown:
                return "destination_unknown";
            }
            return "unknown_error";
        }

        // human readable, for the cli
        [[nodiscard]] static constexpr auto describe(error_code const ec) noexcept
            -> std::string_view
        {
            switch (ec)
            {
            case error_code::success:
                return "success";
            case error_code::local_io_error:
                return "local file could not be read";
            case error_code::path_conflict:
                return "remote path exists with the wrong type";
            case error_code::remote_io_error:
                return "remote write was refused";
            case error_code::auth_failed:
                return "authentication failed";
            case error_code::handshake_error:
                return "SSH handshake failed";
            case error_code::host_unreachable:
                return "host unreachable";
            case error_code::session_lost:
                return "SSH session lost";
            case error_code::timeout:
                return "operation timed out";
            case error_code::not_found:
                return "path does not exist";
            case error_code::permission_denied:
                return "permission denied";
            case error_code::invalid_path:
                return "invalid path";
            case error_code::config_unreadable:
                return "config file could not be read";
            case error_code::config_invalid:
                return "config file is malformed";
            case error_code::destination_unknown:
                return "no such destination";
            }
            return "unknown error";
        }
    };

    // session-level failures are the ones a reconnect can fix
    [[nodiscard]] constexpr auto is_session_level(error_code const ec) noexcept -> bool
    {
        return ec == error_code::session_lost || ec == error_code::timeout;
    }

    template <typename T>
    using result = std::expected<T, error_code>;

    using void_result = std::expected<void, error_code>;

    namespace constants
    {
        inline constexpr std::uint16_t default_ssh_port = 22;

        // 256 KiB keeps the SFTP pipeline full without ballooning memory
        inline constexpr std::size_t default_chunk_size = 256 * 1024;
        inline constexpr std::size_t min_chunk_size = 1024;
        inline constexpr std::size_t max_chunk_size = 16 * 1024 * 1024;

        inline constexpr std::uint32_t remote_file_mode = 0644;
        inline constexpr std::uint32_t remote_dir_mode = 0755;

        inline constexpr std::chrono::seconds default_connect_timeout{30};
        inline constexpr std::chrono::seconds default_io_timeout{60};

        inline constexpr int socket_buffer_size = 2 * 1024 * 1024;

        // consecutive remote write failures that smell like a dead channel
        inline constexpr std::size_t remote_failure_streak_limit = 3;

        inline constexpr std::size_t default_max_link_depth = 8;
    } // namespace constants

} // namespace arkv

template <>
struct fmt::formatter<arkv::error_code> : fmt::formatter<std::string_view>
{
    auto format(arkv::error_code const ec, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(
            arkv::error_code_formatter::to_string(ec), ctx);
    }
};
