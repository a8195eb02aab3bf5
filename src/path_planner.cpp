// path_planner.cpp - depth-first planning over an explicit work-list
// directories first, then leaves, so every remote parent exists before a byte is sent

#include "arkv/path_planner.hpp"
#include "arkv/log.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace arkv
{

    namespace fs = std::filesystem;

    // ============================================================================
    // remote path helpers
    // ============================================================================

    namespace remote_path
    {

        auto normalize_absolute(std::string_view const path) -> result<std::string>
        {
            if (path.empty() || path.front() != '/')
            {
                return std::unexpected{error_code::invalid_path};
            }

            std::string out;
            std::size_t pos = 0;
            while (pos < path.size())
            {
                auto const next = path.find('/', pos);
                auto const end = next == std::string_view::npos ? path.size() : next;
                auto const segment = path.substr(pos, end - pos);
                pos = end + 1;

                if (segment.empty() || segment == ".")
                {
                    continue;
                }
                if (segment == "..")
                {
                    return std::unexpected{error_code::invalid_path};
                }
                out.push_back('/');
                out.append(segment);
            }

            if (out.empty())
            {
                out = "/";
            }
            return out;
        }

        auto join(std::string_view const base, std::string_view const relative) -> std::string
        {
            if (relative.empty())
            {
                return std::string{base};
            }
            std::string out{base};
            if (out.empty() || out.back() != '/')
            {
                out.push_back('/');
            }
            out.append(relative);
            return out;
        }

        auto parent(std::string_view const absolute) -> std::string
        {
            auto const pos = absolute.rfind('/');
            if (pos == std::string_view::npos || pos == 0)
            {
                return "/";
            }
            return std::string{absolute.substr(0, pos)};
        }

        auto is_safe_relative(std::string_view const path) noexcept -> bool
        {
            if (path.empty() || path.front() == '/')
            {
                return false;
            }

            std::size_t pos = 0;
            while (pos <= path.size())
            {
                auto const next = path.find('/', pos);
                auto const end = next == std::string_view::npos ? path.size() : next;
                auto const segment = path.substr(pos, end - pos);
                if (segment.empty() || segment == "." || segment == "..")
                {
                    return false;
                }
                pos = end + 1;
            }
            return true;
        }

    } // namespace remote_path

    auto upload_plan::absolute_remote_path(upload_entry const &entry) const -> std::string
    {
        return remote_path::join(remote_base, entry.remote_path);
    }

    // ============================================================================
    // planner
    // ============================================================================

    namespace
    {

        struct pending_dir
        {
            fs::path local;
            std::string remote;
            std::size_t link_depth{0};
            std::vector<fs::path> ancestry; // canonical, only tracked when following links
        };

        [[nodiscard]] auto map_fs_error(std::error_code const &ec) noexcept -> error_code
        {
            if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
            {
                return error_code::permission_denied;
            }
            if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
            {
                return error_code::not_found;
            }
            return error_code::local_io_error;
        }

        // children of a directory, sorted by name for deterministic plans
        [[nodiscard]] auto list_sorted(fs::path const &dir) -> result<std::vector<fs::directory_entry>>
        {
            std::error_code ec;
            fs::directory_iterator it{dir, ec};
            if (ec)
            {
                return std::unexpected{map_fs_error(ec)};
            }

            std::vector<fs::directory_entry> children;
            for (fs::directory_iterator const end; it != end; it.increment(ec))
            {
                if (ec)
                {
                    return std::unexpected{map_fs_error(ec)};
                }
                children.push_back(*it);
            }
            if (ec)
            {
                return std::unexpected{map_fs_error(ec)};
            }

            std::sort(children.begin(), children.end(),
                      [](fs::directory_entry const &a, fs::directory_entry const &b)
                      { return a.path().filename().native() < b.path().filename().native(); });
            return children;
        }

        [[nodiscard]] auto is_within(fs::path const &root, fs::path const &target) -> bool
        {
            auto const diverged = std::mismatch(root.begin(), root.end(), target.begin(), target.end());
            return diverged.first == root.end();
        }

        class planner
        {
        public:
            planner(fs::path root, std::string remote_base, planner_options const &options)
                : root_{std::move(root)}, options_{options}
            {
                plan_.remote_base = std::move(remote_base);
            }

            // a real subdirectory of an already canonical parent
            [[nodiscard]] static auto canonical_child(pending_dir const &parent, fs::path const &child) -> fs::path
            {
                std::error_code ec;
                auto canonical = fs::weakly_canonical(child, ec);
                if (!ec)
                {
                    return canonical;
                }
                log::get()->debug("cannot canonicalize {}: {}", child.string(), ec.message());
                return parent.ancestry.empty() ? child : parent.ancestry.back() / child.filename();
            }

            [[nodiscard]] auto run(std::string const &root_name) -> result<upload_plan>
            {
                std::error_code ec;
                canonical_root_ = fs::canonical(root_, ec);
                if (ec)
                {
                    return std::unexpected{map_fs_error(ec)};
                }

                auto const status = fs::status(root_, ec);
                if (ec)
                {
                    return std::unexpected{map_fs_error(ec)};
                }

                if (fs::is_regular_file(status))
                {
                    add_file(root_, root_name);
                    return std::move(plan_);
                }

                if (!fs::is_directory(status))
                {
                    return std::unexpected{error_code::invalid_path};
                }

                auto walked = walk(root_name);
                if (!walked.has_value())
                {
                    return std::unexpected{walked.error()};
                }

                plan_.entries = std::move(directories_);
                plan_.entries.insert(plan_.entries.end(), std::make_move_iterator(leaves_.begin()),
                                     std::make_move_iterator(leaves_.end()));
                return std::move(plan_);
            }

        private:
            [[nodiscard]] auto walk(std::string const &root_name) -> void_result
            {
                std::vector<pending_dir> work;
                work.push_back(pending_dir{root_, root_name, 0, {}});
                if (options_.follow_symlinks)
                {
                    work.back().ancestry.push_back(canonical_root_);
                }

                while (!work.empty())
                {
                    auto current = std::move(work.back());
                    work.pop_back();

                    directories_.push_back(upload_entry{current.local, current.remote, entry_kind::directory, 0});
                    ++plan_.total_directories;

                    auto children = list_sorted(current.local);
                    if (!children.has_value())
                    {
                        return std::unexpected{children.error()};
                    }

                    std::vector<pending_dir> subdirs;
                    for (auto const &child : *children)
                    {
                        auto remote = current.remote + "/" + child.path().filename().string();

                        std::error_code ec;
                        auto const link_status = child.symlink_status(ec);
                        if (ec)
                        {
                            return std::unexpected{map_fs_error(ec)};
                        }

                        if (fs::is_symlink(link_status))
                        {
                            visit_link(child.path(), std::move(remote), current, subdirs);
                        }
                        else if (fs::is_directory(link_status))
                        {
                            auto next = pending_dir{child.path(), std::move(remote), current.link_depth, {}};
                            if (options_.follow_symlinks)
                            {
                                next.ancestry = current.ancestry;
                                next.ancestry.push_back(canonical_child(current, child.path()));
                            }
                            subdirs.push_back(std::move(next));
                        }
                        else if (fs::is_regular_file(link_status))
                        {
                            add_file(child.path(), std::move(remote));
                        }
                        else
                        {
                            plan_.warnings.push_back(plan_warning{child.path(), warning_kind::special_file});
                        }
                    }

                    // reversed so the smallest name is popped first
                    for (auto it = subdirs.rbegin(); it != subdirs.rend(); ++it)
                    {
                        work.push_back(std::move(*it));
                    }
                }

                return {};
            }

            void visit_link(fs::path const &link, std::string remote, pending_dir const &current,
                            std::vector<pending_dir> &subdirs)
            {
                if (!options_.follow_symlinks)
                {
                    add_symlink(link, std::move(remote), warning_kind::symlink_not_followed);
                    return;
                }

                std::error_code ec;
                auto const target = fs::canonical(link, ec);
                if (ec)
                {
                    add_symlink(link, std::move(remote), warning_kind::dangling_link);
                    return;
                }

                if (!is_within(canonical_root_, target))
                {
                    add_symlink(link, std::move(remote), warning_kind::link_escapes_root);
                    return;
                }

                if (current.link_depth + 1 > options_.max_link_depth)
                {
                    add_symlink(link, std::move(remote), warning_kind::link_depth_exceeded);
                    return;
                }

                auto const status = fs::status(target, ec);
                if (ec)
                {
                    add_symlink(link, std::move(remote), warning_kind::dangling_link);
                    return;
                }

                if (fs::is_directory(status))
                {
                    if (std::find(current.ancestry.begin(), current.ancestry.end(), target) != current.ancestry.end())
                    {
                        add_symlink(link, std::move(remote), warning_kind::link_cycle);
                        return;
                    }
                    auto next = pending_dir{link, std::move(remote), current.link_depth + 1, current.ancestry};
                    next.ancestry.push_back(target);
                    subdirs.push_back(std::move(next));
                }
                else if (fs::is_regular_file(status))
                {
                    add_file(link, std::move(remote));
                }
                else
                {
                    plan_.warnings.push_back(plan_warning{link, warning_kind::special_file});
                }
            }

            void add_file(fs::path const &local, std::string remote)
            {
                std::error_code ec;
                auto size = fs::file_size(local, ec);
                if (ec)
                {
                    // unreadable metadata surfaces again as local_io_error when the engine opens it
                    size = 0;
                }

                auto entry = upload_entry{local, std::move(remote), entry_kind::file, size};
                plan_.total_bytes += size;
                ++plan_.total_files;

                if (directories_.empty())
                {
                    plan_.entries.push_back(std::move(entry));
                }
                else
                {
                    leaves_.push_back(std::move(entry));
                }
            }

            void add_symlink(fs::path const &local, std::string remote, warning_kind const why)
            {
                plan_.warnings.push_back(plan_warning{local, why});
                leaves_.push_back(upload_entry{local, std::move(remote), entry_kind::symlink, 0});
            }

            fs::path root_;
            fs::path canonical_root_;
            planner_options options_;
            upload_plan plan_;
            std::vector<upload_entry> directories_;
            std::vector<upload_entry> leaves_;
        };

    } // namespace

    auto plan_upload(fs::path const &local_root,
                     std::string_view const remote_base,
                     planner_options const &options) -> result<upload_plan>
    {
        auto base = remote_path::normalize_absolute(remote_base);
        if (!base.has_value())
        {
            return std::unexpected{base.error()};
        }

        std::error_code ec;
        auto root = fs::absolute(local_root, ec).lexically_normal();
        if (ec)
        {
            return std::unexpected{map_fs_error(ec)};
        }
        if (!root.has_filename() && root.has_parent_path() && root != root.root_path())
        {
            root = root.parent_path(); // "docs/" -> "docs"
        }

        auto const exists = fs::exists(fs::symlink_status(root, ec));
        if (ec && ec != std::errc::no_such_file_or_directory)
        {
            return std::unexpected{map_fs_error(ec)};
        }
        if (!exists)
        {
            return std::unexpected{error_code::not_found};
        }

        auto const root_name = root.filename().string();
        if (root_name.empty() || !remote_path::is_safe_relative(root_name))
        {
            return std::unexpected{error_code::invalid_path};
        }

        return planner{std::move(root), std::move(*base), options}.run(root_name);
    }

} // namespace arkv
