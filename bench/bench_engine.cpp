// bench/bench_engine.cpp - plan execution against the in-memory server
// measures engine overhead: chunking, progress events, directory bookkeeping

#include "arkv/path_planner.hpp"
#include "arkv/progress.hpp"
#include "arkv/session_manager.hpp"
#include "arkv/transfer_engine.hpp"
#include "memory_transport.hpp"
#include "scratch_tree.hpp"

#include <fmt/format.h>
#include <memory>
#include <string>
#include <nanobench.h>

namespace bench
{

    namespace
    {

        [[nodiscard]] auto bench_destination() -> arkv::destination_context
        {
            arkv::destination_context ctx;
            ctx.name = "bench";
            ctx.host = "localhost";
            ctx.username = "bench";
            ctx.remote_base = "/srv/backup";
            return ctx;
        }

        void run_execute(std::string const &name, arkv::upload_plan const &plan, arkv::engine_options const &options)
        {
            using namespace ankerl::nanobench;

            Bench().minEpochIterations(5).batch(plan.total_bytes).unit("byte").run(
                name,
                [&]
                {
                    auto remote = std::make_shared<arkv::testing::remote_fs>();
                    arkv::session_manager sessions{arkv::testing::make_memory_factory(remote)};
                    if (!sessions.connect(bench_destination()).has_value())
                    {
                        return;
                    }
                    arkv::null_sink sink;
                    auto summary = arkv::transfer_engine{options}.execute(sessions, plan, sink);
                    doNotOptimizeAway(summary);
                });
        }

    } // namespace

    void run_engine_benchmarks()
    {
        // many small files: per-entry overhead dominates
        {
            scratch_tree const tree{2, 8, 8, 512};
            auto const plan = arkv::plan_upload(tree.root(), "/srv/backup");
            if (!plan.has_value())
            {
                fmt::print(stderr, "Skipping engine benchmarks: {}\n", plan.error());
                return;
            }
            run_execute("Execute_SmallFiles", *plan, {});
        }

        // few large files: chunk loop and read-ahead dominate
        {
            scratch_tree const tree{0, 0, 4, 8 * 1024 * 1024};
            auto const plan = arkv::plan_upload(tree.root(), "/srv/backup");
            if (!plan.has_value())
            {
                fmt::print(stderr, "Skipping engine benchmarks: {}\n", plan.error());
                return;
            }

            arkv::engine_options sequential;
            run_execute("Execute_LargeFiles_256K", *plan, sequential);

            arkv::engine_options ahead;
            ahead.read_ahead = true;
            run_execute("Execute_LargeFiles_256K_ReadAhead", *plan, ahead);

            arkv::engine_options big_chunks;
            big_chunks.chunk_size = 4 * 1024 * 1024;
            big_chunks.read_ahead = true;
            run_execute("Execute_LargeFiles_4M_ReadAhead", *plan, big_chunks);
        }
    }

} // namespace bench
