#pragma once

// fwd.hpp - forward declarations and the two registry shapes

#include "registry.hpp"

#include <string>

namespace sshpool
{

    class connection;
    class proc;
    class shell;
    class shell_token;

    // keyed by device name
    using connection_registry = registry<std::string, connection>;
    using shell_registry = registry<shell_token, shell>;

} // namespace sshpool
