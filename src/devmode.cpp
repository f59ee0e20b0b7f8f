// devmode.cpp - developer mode token probe

#include "sshpool/devmode.hpp"
#include "sshpool/log.hpp"
#include "sshpool/session_manager.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace sshpool::devmode
{

    auto is_valid_token(std::string_view const text) noexcept -> bool
    {
        return !text.empty() &&
               std::ranges::all_of(text, [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; });
    }

    auto read_token(session_manager &manager, device const &dev) -> result<std::optional<std::string>>
    {
        auto const output = manager.exec(dev, fmt::format("cat {}", token_path));
        if (!output)
        {
            return std::unexpected(output.error());
        }

        std::string text(output->begin(), output->end());
        if (!is_valid_token(text))
        {
            logger().debug("{}: token '{}' doesn't look like a valid devmode token", dev.name, text);
            return std::nullopt;
        }
        return text;
    }

    auto token(session_manager &manager, device const &dev) -> result<std::string>
    {
        if (dev.username != devmode_user)
        {
            return std::unexpected(error::unsupported);
        }

        auto const found = read_token(manager, dev);
        if (!found)
        {
            return std::unexpected(found.error());
        }
        if (!found->has_value())
        {
            return std::unexpected(error::unsupported);
        }
        return **found;
    }

} // namespace sshpool::devmode
