// transfer_engine.hpp - executes an upload plan over one session, in plan order
// one bad file never aborts the plan; a dead channel gets exactly one reconnect

#pragma once

#include "common.hpp"
#include "directory_materializer.hpp"
#include "path_planner.hpp"
#include "progress.hpp"
#include "session_manager.hpp"

#include <cstddef>

namespace arkv
{

    struct engine_options
    {
        std::size_t chunk_size{constants::default_chunk_size};
        // overlap the read of the next local chunk with the remote write of the current one
        bool read_ahead{false};
    };

    class transfer_engine
    {
    public:
        explicit transfer_engine(engine_options options = {});

        // precondition: sessions is connected; the plan must outlive the call and the sink's use of its events
        [[nodiscard]] auto execute(session_manager &sessions,
                                   upload_plan const &plan,
                                   progress_sink &sink,
                                   cancel_token const *cancel = nullptr) -> upload_summary;

        [[nodiscard]] auto options() const noexcept -> engine_options const & { return options_; }

    private:
        engine_options options_;
    };

} // namespace arkv
