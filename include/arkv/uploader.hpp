// uploader.hpp - plan, connect, execute, close
// pre-flight failures come back as errors before a single event is emitted

#pragma once

#include "common.hpp"
#include "destination.hpp"
#include "path_planner.hpp"
#include "progress.hpp"
#include "transfer_engine.hpp"
#include "transport.hpp"

#include <filesystem>

namespace arkv
{

    struct upload_request
    {
        std::filesystem::path local_root;
        destination_context destination;
        session_options session{};
        planner_options planner{};
        engine_options engine{};
    };

    // connect to the destination and run an already computed plan
    [[nodiscard]] auto execute_upload(upload_plan const &plan,
                                      destination_context const &destination,
                                      session_options const &session,
                                      engine_options const &engine,
                                      transport_factory const &factory,
                                      progress_sink &sink,
                                      cancel_token const *cancel = nullptr) -> result<upload_summary>;

    // plan request.local_root, then execute_upload
    [[nodiscard]] auto upload(upload_request const &request,
                              transport_factory const &factory,
                              progress_sink &sink,
                              cancel_token const *cancel = nullptr) -> result<upload_summary>;

} // namespace arkv
