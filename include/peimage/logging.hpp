#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace peimage
{
    /** the library logger ("peimage"), created on first use */
    std::shared_ptr<spdlog::logger> logger();

    void set_log_level(spdlog::level::level_enum level);

    /** apply SPDLOG_LEVEL from the environment, e.g. SPDLOG_LEVEL=peimage=debug */
    void load_log_config();
}

#define PEIMAGE_TRACE(...)  ::peimage::logger()->trace(__VA_ARGS__)
#define PEIMAGE_DEBUG(...)  ::peimage::logger()->debug(__VA_ARGS__)
#define PEIMAGE_WARN(...)   ::peimage::logger()->warn(__VA_ARGS__)
