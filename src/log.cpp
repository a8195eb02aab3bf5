// log.cpp - the arkv spdlog logger and its sinks

#include "arkv/log.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <utility>

namespace arkv::log
{

    namespace
    {

        std::mutex g_mutex;

        auto make_null_logger() -> std::shared_ptr<spdlog::logger>
        {
            return std::make_shared<spdlog::logger>("arkv", std::make_shared<spdlog::sinks::null_sink_mt>());
        }

        auto instance() -> std::shared_ptr<spdlog::logger> &
        {
            static std::shared_ptr<spdlog::logger> logger = make_null_logger();
            return logger;
        }

    } // namespace

    auto get() -> std::shared_ptr<spdlog::logger>
    {
        std::lock_guard const lock{g_mutex};
        return instance();
    }

    void enable_console(spdlog::level::level_enum const level)
    {
        auto logger = std::make_shared<spdlog::logger>("arkv", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        logger->set_pattern("%H:%M:%S.%e [%^%l%$] [%t] %v");
        logger->set_level(level);
        set(std::move(logger));
    }

    void set(std::shared_ptr<spdlog::logger> logger)
    {
        if (!logger)
        {
            logger = make_null_logger();
        }
        std::lock_guard const lock{g_mutex};
        instance() = std::move(logger);
    }

} // namespace arkv::log
