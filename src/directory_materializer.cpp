// directory_materializer.cpp - ensure remote directories exist

#include "arkv/directory_materializer.hpp"
#include "arkv/log.hpp"
#include "arkv/path_planner.hpp"

namespace arkv
{

    auto directory_materializer::is_known(std::string_view const remote_path) const -> bool
    {
        return known_.contains(std::string{remote_path});
    }

    auto directory_materializer::ensure(sftp_transport &transport, std::string_view const remote_path) -> void_result
    {
        auto normalized = remote_path::normalize_absolute(remote_path);
        if (!normalized.has_value())
        {
            return std::unexpected{normalized.error()};
        }
        auto const &leaf = *normalized;

        if (leaf == "/" || known_.contains(leaf))
        {
            return {};
        }

        // common case: the leaf is already there
        auto existing = check(transport, leaf);
        if (!existing.has_value())
        {
            return std::unexpected{existing.error()};
        }
        if (*existing)
        {
            return {};
        }

        // walk the ancestors root-to-leaf; "/" always exists
        for (auto end = leaf.find('/', 1); end != std::string::npos; end = leaf.find('/', end + 1))
        {
            auto const ancestor = leaf.substr(0, end);
            if (known_.contains(ancestor))
            {
                continue;
            }

            auto present = check(transport, ancestor);
            if (!present.has_value())
            {
                return std::unexpected{present.error()};
            }
            if (!*present)
            {
                if (auto created = create(transport, ancestor); !created.has_value())
                {
                    return created;
                }
            }
        }

        return create(transport, leaf);
    }

    auto directory_materializer::check(sftp_transport &transport, std::string const &path) -> result<bool>
    {
        auto existing = transport.stat(path);
        if (!existing.has_value())
        {
            return std::unexpected{existing.error()};
        }
        if (!existing->has_value())
        {
            return false;
        }
        if (**existing != remote_kind::directory)
        {
            return std::unexpected{error_code::path_conflict};
        }

        known_.insert(path);
        return true;
    }

    auto directory_materializer::create(sftp_transport &transport, std::string const &path) -> void_result
    {
        auto created = transport.mkdir(path, constants::remote_dir_mode);
        if (!created.has_value())
        {
            if (is_session_level(created.error()))
            {
                return created;
            }

            // a concurrent writer may have beaten us to it
            auto again = check(transport, path);
            if (!again.has_value())
            {
                return std::unexpected{again.error()};
            }
            if (!*again)
            {
                return created;
            }
            return {};
        }

        log::get()->debug("created remote directory {}", path);
        known_.insert(path);
        return {};
    }

} // namespace arkv
