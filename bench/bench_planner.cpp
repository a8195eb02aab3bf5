// bench/bench_planner.cpp - local tree walking and remote path helpers

#include "arkv/path_planner.hpp"
#include "scratch_tree.hpp"

#include <fmt/format.h>
#include <nanobench.h>

namespace bench
{

    void run_planner_benchmarks()
    {
        using namespace ankerl::nanobench;

        Bench().run("RemotePath_Normalize",
                    [&]
                    {
                        auto normalized = arkv::remote_path::normalize_absolute("/srv//backup/./2024/photos/");
                        doNotOptimizeAway(normalized);
                    });

        Bench().run("RemotePath_Join",
                    [&]
                    {
                        auto joined = arkv::remote_path::join("/srv/backup", "docs/sub/deeper/file.txt");
                        doNotOptimizeAway(joined);
                    });

        // 1 + 4 + 16 + 64 directories, 4 files each
        scratch_tree const tree{3, 4, 4, 64};
        auto const probe = arkv::plan_upload(tree.root(), "/srv/backup");
        if (!probe.has_value())
        {
            fmt::print(stderr, "Skipping planner benchmarks: {}\n", probe.error());
            return;
        }

        Bench().minEpochIterations(20).batch(probe->size()).unit("entry").run(
            "Plan_Tree_85Dirs",
            [&]
            {
                auto plan = arkv::plan_upload(tree.root(), "/srv/backup");
                doNotOptimizeAway(plan);
            });

        arkv::planner_options follow;
        follow.follow_symlinks = true;
        Bench().minEpochIterations(20).batch(probe->size()).unit("entry").run(
            "Plan_Tree_85Dirs_FollowLinks",
            [&]
            {
                auto plan = arkv::plan_upload(tree.root(), "/srv/backup", follow);
                doNotOptimizeAway(plan);
            });
    }

} // namespace bench
