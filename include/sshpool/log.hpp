#pragma once

// log.hpp - the library logger

#include <spdlog/spdlog.h>

namespace sshpool
{

    // logger named "sshpool"; reuses one the host application registered under that name
    [[nodiscard]] auto logger() -> spdlog::logger &;

} // namespace sshpool
