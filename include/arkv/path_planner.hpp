// path_planner.hpp - local tree -> ordered remote upload plan
// computed once, before any network traffic

#pragma once

#include "common.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace arkv
{

    enum class entry_kind : std::uint8_t
    {
        file,
        directory,
        symlink, // leaf, never uploaded
    };

    [[nodiscard]] constexpr auto to_string(entry_kind const kind) noexcept -> std::string_view
    {
        switch (kind)
        {
        case entry_kind::file:
            return "file";
        case entry_kind::directory:
            return "directory";
        case entry_kind::symlink:
            return "symlink";
        }
        return "unknown";
    }

    struct upload_entry
    {
        std::filesystem::path local_path; // absolute
        std::string remote_path;          // relative to the plan's remote_base, '/' separated
        entry_kind kind{entry_kind::file};
        std::uint64_t size_bytes{0}; // files only

        [[nodiscard]] auto is_file() const noexcept -> bool { return kind == entry_kind::file; }
        [[nodiscard]] auto is_directory() const noexcept -> bool { return kind == entry_kind::directory; }
    };

    enum class warning_kind : std::uint8_t
    {
        symlink_not_followed,
        link_escapes_root,
        link_cycle,
        link_depth_exceeded,
        dangling_link,
        special_file, // fifo, socket, device - never read
    };

    [[nodiscard]] constexpr auto to_string(warning_kind const kind) noexcept -> std::string_view
    {
        switch (kind)
        {
        case warning_kind::symlink_not_followed:
            return "symlink not followed";
        case warning_kind::link_escapes_root:
            return "link target escapes the upload root";
        case warning_kind::link_cycle:
            return "link forms a cycle";
        case warning_kind::link_depth_exceeded:
            return "link depth exceeded";
        case warning_kind::dangling_link:
            return "dangling link";
        case warning_kind::special_file:
            return "not a regular file";
        }
        return "unknown";
    }

    struct plan_warning
    {
        std::filesystem::path local_path;
        warning_kind kind{warning_kind::symlink_not_followed};
    };

    struct upload_plan
    {
        std::string remote_base; // absolute, normalized, no trailing slash (except "/")
        std::vector<upload_entry> entries;
        std::vector<plan_warning> warnings;
        std::uint64_t total_bytes{0};
        std::size_t total_files{0};
        std::size_t total_directories{0};

        // remote_base joined with the entry's relative path
        [[nodiscard]] auto absolute_remote_path(upload_entry const &entry) const -> std::string;

        [[nodiscard]] auto size() const noexcept -> std::size_t { return entries.size(); }
        [[nodiscard]] auto empty() const noexcept -> bool { return entries.empty(); }
    };

    struct planner_options
    {
        bool follow_symlinks{false};
        // link hops allowed along one traversal path when following
        std::size_t max_link_depth{constants::default_max_link_depth};
    };

    // remote path helpers, shared with the materializer
    namespace remote_path
    {
        // "/a//b/./c/" -> "/a/b/c"; fails on relative input or ".."
        [[nodiscard]] auto normalize_absolute(std::string_view path) -> result<std::string>;

        [[nodiscard]] auto join(std::string_view base, std::string_view relative) -> std::string;

        // "/a/b/c" -> "/a/b"; "/a" -> "/"; "/" -> "/"
        [[nodiscard]] auto parent(std::string_view absolute) -> std::string;

        // a relative path with no empty, "." or ".." segments
        [[nodiscard]] auto is_safe_relative(std::string_view path) noexcept -> bool;
    } // namespace remote_path

    // walk local_root and map it under remote_base
    [[nodiscard]] auto plan_upload(std::filesystem::path const &local_root,
                                   std::string_view remote_base,
                                   planner_options const &options = {}) -> result<upload_plan>;

} // namespace arkv
