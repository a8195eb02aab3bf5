// scratch_tree.hpp - throwaway local trees for the benchmarks

#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <system_error>

namespace bench
{

    class scratch_tree
    {
        std::filesystem::path root_;

    public:
        // fan_out directories per level, files_per_dir files of file_size bytes in each
        scratch_tree(std::size_t const depth, std::size_t const fan_out, std::size_t const files_per_dir,
                     std::size_t const file_size)
        {
            std::random_device rd;
            root_ = std::filesystem::temp_directory_path() / ("arkv-bench-" + std::to_string(rd())) / "tree";
            std::filesystem::create_directories(root_);
            populate(root_, depth, fan_out, files_per_dir, std::string(file_size, 'b'));
        }

        ~scratch_tree()
        {
            std::error_code ec;
            std::filesystem::remove_all(root_.parent_path(), ec);
        }

        scratch_tree(scratch_tree const &) = delete;
        auto operator=(scratch_tree const &) -> scratch_tree & = delete;

        [[nodiscard]] auto root() const -> std::filesystem::path const & { return root_; }

    private:
        static void populate(std::filesystem::path const &dir, std::size_t const depth, std::size_t const fan_out,
                             std::size_t const files_per_dir, std::string const &content)
        {
            for (std::size_t i = 0; i < files_per_dir; ++i)
            {
                std::ofstream out{dir / ("file" + std::to_string(i) + ".bin"), std::ios::binary};
                out << content;
            }
            if (depth == 0)
            {
                return;
            }
            for (std::size_t i = 0; i < fan_out; ++i)
            {
                auto const child = dir / ("dir" + std::to_string(i));
                std::filesystem::create_directory(child);
                populate(child, depth - 1, fan_out, files_per_dir, content);
            }
        }
    };

} // namespace bench
