#include <mutex>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <peimage/logging.hpp>

namespace peimage
{
    static const char *LOGGER_NAME = "peimage";

    std::shared_ptr<spdlog::logger> logger()
    {
        static std::mutex lock;

        auto log = spdlog::get(LOGGER_NAME);
        if (log != nullptr)
            return log;

        std::lock_guard<std::mutex> guard(lock);

        log = spdlog::get(LOGGER_NAME);    // registered while we were waiting?
        if (log == nullptr)
        {
            log = spdlog::stderr_color_mt(LOGGER_NAME);
            log->set_pattern("[%n] [%l] %v");
            log->set_level(spdlog::level::warn);
        }

        return log;
    }

    void set_log_level(spdlog::level::level_enum level)
    {
        logger()->set_level(level);
    }

    void load_log_config()
    {
        logger();   // must be registered before env levels are applied
        spdlog::cfg::load_env_levels();
    }

};  // end of peimage namespace
