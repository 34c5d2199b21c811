#pragma once
/**
 * @file channel_error.hpp
 * @brief Protocol-misuse errors raised by relay::Channel.
 */
#include "relayhub_utils_export.h"

#include <stdexcept>
#include <string>

namespace relayhub::relay
{

enum class ChannelErrc
{
    UnknownProcess,       ///< Caller has not joined (or its membership was removed).
    AlreadyJoined,        ///< Caller's OS identity already holds a channel-level id.
    IdInUse,              ///< Requested channel-level id belongs to another process.
    DestinationNotMember, ///< send_to() named an id that is not a member.
    UnknownSender,        ///< recv_from() named an id that is not a member.
};

[[nodiscard]] RELAYHUB_UTILS_EXPORT const char *to_string(ChannelErrc code) noexcept;

class RELAYHUB_UTILS_EXPORT ChannelError : public std::runtime_error
{
  public:
    ChannelError(ChannelErrc code, const std::string &what_arg);

    [[nodiscard]] ChannelErrc code() const noexcept { return m_code; }

  private:
    ChannelErrc m_code;
};

} // namespace relayhub::relay
