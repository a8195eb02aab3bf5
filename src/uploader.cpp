// uploader.cpp - the upload facade: plan, connect, execute, close

#include "arkv/uploader.hpp"
#include "arkv/log.hpp"
#include "arkv/session_manager.hpp"

namespace arkv
{

    auto execute_upload(upload_plan const &plan,
                        destination_context const &destination,
                        session_options const &session,
                        engine_options const &engine,
                        transport_factory const &factory,
                        progress_sink &sink,
                        cancel_token const *cancel) -> result<upload_summary>
    {
        session_manager sessions{factory, session};
        if (auto connected = sessions.connect(destination); !connected.has_value())
        {
            return std::unexpected{connected.error()};
        }

        auto summary = transfer_engine{engine}.execute(sessions, plan, sink, cancel);
        sessions.close();

        log::get()->info("{}: {} directories, {} files, {} skipped, {} failed, {} bytes in {:.1f}s", destination,
                         summary.directories_ensured, summary.files_transferred, summary.skipped, summary.failed,
                         summary.bytes_transferred, summary.seconds());
        return summary;
    }

    auto upload(upload_request const &request,
                transport_factory const &factory,
                progress_sink &sink,
                cancel_token const *cancel) -> result<upload_summary>
    {
        auto plan = plan_upload(request.local_root, request.destination.remote_base, request.planner);
        if (!plan.has_value())
        {
            log::get()->error("cannot plan {}: {}", request.local_root.string(), plan.error());
            return std::unexpected{plan.error()};
        }

        for (auto const &warning : plan->warnings)
        {
            log::get()->warn("skipping {}: {}", warning.local_path.string(), to_string(warning.kind));
        }

        return execute_upload(*plan, request.destination, request.session, request.engine, factory, sink, cancel);
    }

} // namespace arkv
