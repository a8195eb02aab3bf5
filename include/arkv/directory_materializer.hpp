// directory_materializer.hpp - idempotent "mkdir -p" over SFTP

#pragma once

#include "common.hpp"
#include "transport.hpp"

#include <string>
#include <string_view>
#include <unordered_set>

namespace arkv
{

    class directory_materializer
    {
    public:
        // existing directory: existence check only; existing non-directory: path_conflict;
        // missing: every absent segment is created root-to-leaf
        [[nodiscard]] auto ensure(sftp_transport &transport, std::string_view remote_path) -> void_result;

        // directories confirmed during this run, skipped on later calls
        [[nodiscard]] auto is_known(std::string_view remote_path) const -> bool;

        void forget() noexcept { known_.clear(); }

    private:
        // true if present as a directory, path_conflict if present as anything else
        [[nodiscard]] auto check(sftp_transport &transport, std::string const &path) -> result<bool>;

        [[nodiscard]] auto create(sftp_transport &transport, std::string const &path) -> void_result;

        std::unordered_set<std::string> known_;
    };

} // namespace arkv
