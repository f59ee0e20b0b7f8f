// log.cpp - library logger setup

#include "sshpool/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace sshpool
{

    auto logger() -> spdlog::logger &
    {
        static auto const instance = []
        {
            if (auto existing = spdlog::get("sshpool"))
            {
                return existing;
            }
            return spdlog::stderr_color_mt("sshpool");
        }();
        return *instance;
    }

} // namespace sshpool
