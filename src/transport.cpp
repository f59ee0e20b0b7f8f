// transport.cpp - name tables for the transport vocabulary

#include "sshpool/transport.hpp"

namespace sshpool::transport
{

    auto to_string(signature_hash const hash) noexcept -> std::string_view
    {
        switch (hash)
        {
        case signature_hash::sha1:
            return "sha1";
        case signature_hash::sha2_256:
            return "sha2-256";
        case signature_hash::sha2_512:
            return "sha2-512";
        }
        return "unknown";
    }

    auto signal_name(signal const sig) noexcept -> std::string_view
    {
        switch (sig)
        {
        case signal::abort:
            return "ABRT";
        case signal::alarm:
            return "ALRM";
        case signal::fpe:
            return "FPE";
        case signal::hangup:
            return "HUP";
        case signal::illegal:
            return "ILL";
        case signal::interrupt:
            return "INT";
        case signal::kill:
            return "KILL";
        case signal::pipe:
            return "PIPE";
        case signal::quit:
            return "QUIT";
        case signal::segv:
            return "SEGV";
        case signal::terminate:
            return "TERM";
        case signal::usr1:
            return "USR1";
        case signal::usr2:
            return "USR2";
        }
        return "TERM";
    }

} // namespace sshpool::transport
