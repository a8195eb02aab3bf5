// log.hpp - the library's named logger
// silent by default; the application decides where diagnostics go

#pragma once

#include <memory>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace arkv::log
{

    // never null; a null-sink logger until configured
    [[nodiscard]] auto get() -> std::shared_ptr<spdlog::logger>;

    // route diagnostics to stderr at the given level
    void enable_console(spdlog::level::level_enum level);

    // replace the logger outright (tests, embedding applications)
    void set(std::shared_ptr<spdlog::logger> logger);

} // namespace arkv::log
