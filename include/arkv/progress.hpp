// progress.hpp - engine -> renderer events, per-entry outcomes and the run summary
// the engine pushes, the sink renders; neither knows about the other's internals

#pragma once

#include "common.hpp"
#include "path_planner.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace arkv
{

    // ============================================================================
    // outcomes
    // ============================================================================

    enum class skip_reason : std::uint8_t
    {
        symlink_not_followed,
        cancelled,
    };

    [[nodiscard]] constexpr auto to_string(skip_reason const reason) noexcept -> std::string_view
    {
        switch (reason)
        {
        case skip_reason::symlink_not_followed:
            return "symlink_not_followed";
        case skip_reason::cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    struct entry_outcome
    {
        enum class status : std::uint8_t
        {
            succeeded,
            skipped,
            failed,
        };

        status state{status::succeeded};
        skip_reason skipped_because{skip_reason::cancelled}; // meaningful when skipped
        error_code error{error_code::success};                // meaningful when failed

        [[nodiscard]] static constexpr auto success() noexcept -> entry_outcome
        {
            return entry_outcome{status::succeeded, skip_reason::cancelled, error_code::success};
        }

        [[nodiscard]] static constexpr auto skipped(skip_reason const why) noexcept -> entry_outcome
        {
            return entry_outcome{status::skipped, why, error_code::success};
        }

        [[nodiscard]] static constexpr auto failed(error_code const why) noexcept -> entry_outcome
        {
            return entry_outcome{status::failed, skip_reason::cancelled, why};
        }

        [[nodiscard]] constexpr auto is_success() const noexcept -> bool { return state == status::succeeded; }
        [[nodiscard]] constexpr auto is_skipped() const noexcept -> bool { return state == status::skipped; }
        [[nodiscard]] constexpr auto is_failure() const noexcept -> bool { return state == status::failed; }

        [[nodiscard]] constexpr auto operator==(entry_outcome const &other) const noexcept -> bool
        {
            if (state != other.state)
            {
                return false;
            }
            switch (state)
            {
            case status::skipped:
                return skipped_because == other.skipped_because;
            case status::failed:
                return error == other.error;
            case status::succeeded:
                break;
            }
            return true;
        }
    };

    // ============================================================================
    // events
    // ============================================================================

    namespace events
    {
        struct started
        {
            std::size_t index{0};
            upload_entry const *entry{nullptr};
        };

        struct bytes_written
        {
            std::size_t index{0};
            upload_entry const *entry{nullptr};
            std::uint64_t delta{0};
        };

        struct entry_completed
        {
            std::size_t index{0};
            upload_entry const *entry{nullptr};
            entry_outcome outcome{};
        };

        struct directory_ensured
        {
            std::string remote_path; // absolute
        };
    } // namespace events

    using transfer_event =
        std::variant<events::started, events::bytes_written, events::entry_completed, events::directory_ensured>;

    class progress_sink
    {
    public:
        virtual ~progress_sink() = default;

        virtual void on_event(transfer_event const &event) = 0;
    };

    // discards everything
    class null_sink final : public progress_sink
    {
    public:
        void on_event(transfer_event const & /*event*/) override {}
    };

    // ============================================================================
    // cancellation
    // ============================================================================

    class cancel_token
    {
    public:
        void request() noexcept { requested_.store(true, std::memory_order_release); }
        [[nodiscard]] auto requested() const noexcept -> bool { return requested_.load(std::memory_order_acquire); }

    private:
        std::atomic<bool> requested_{false};
    };

    // ============================================================================
    // summary
    // ============================================================================

    struct upload_summary
    {
        std::size_t directories_ensured{0};
        std::size_t files_transferred{0};
        std::size_t skipped{0};
        std::size_t failed{0};
        std::uint64_t bytes_transferred{0}; // succeeded files only
        std::chrono::steady_clock::duration elapsed{};
        std::vector<entry_outcome> outcomes; // parallel to the plan's entries
        std::optional<error_code> aborted_by;  // set when the run stopped early

        [[nodiscard]] auto succeeded() const noexcept -> std::size_t { return directories_ensured + files_transferred; }
        [[nodiscard]] auto ok() const noexcept -> bool { return failed == 0 && !aborted_by.has_value(); }
        [[nodiscard]] auto seconds() const noexcept -> double
        {
            return std::chrono::duration<double>(elapsed).count();
        }
    };

} // namespace arkv

template <>
struct fmt::formatter<arkv::entry_outcome> : fmt::formatter<std::string_view>
{
    auto format(arkv::entry_outcome const &outcome, format_context &ctx) const
    {
        switch (outcome.state)
        {
        case arkv::entry_outcome::status::succeeded:
            return fmt::formatter<std::string_view>::format("succeeded", ctx);
        case arkv::entry_outcome::status::skipped:
            return fmt::formatter<std::string_view>::format(
                fmt::format("skipped({})", arkv::to_string(outcome.skipped_because)), ctx);
        case arkv::entry_outcome::status::failed:
            break;
        }
        return fmt::formatter<std::string_view>::format(fmt::format("failed({})", outcome.error), ctx);
    }
};
