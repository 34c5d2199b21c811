#include "utils/channel_error.hpp"

#include <fmt/format.h>

namespace relayhub::relay
{

const char *to_string(ChannelErrc code) noexcept
{
    switch (code)
    {
    case ChannelErrc::UnknownProcess:       return "UnknownProcess";
    case ChannelErrc::AlreadyJoined:        return "AlreadyJoined";
    case ChannelErrc::IdInUse:              return "IdInUse";
    case ChannelErrc::DestinationNotMember: return "DestinationNotMember";
    case ChannelErrc::UnknownSender:        return "UnknownSender";
    }
    return "Unknown";
}

ChannelError::ChannelError(ChannelErrc code, const std::string &what_arg)
    : std::runtime_error(fmt::format("{}: {}", to_string(code), what_arg)), m_code(code)
{
}

} // namespace relayhub::relay
