#pragma once
/**
 * @file channel_keys.hpp
 * @brief Store key layout of a relay channel.
 *
 * Every key of channel `c` starts with `C` followed by `c` as four zero-padded digits:
 *
 *   C0001MID          set   channel-level member ids (sentinel "9999" always present)
 *   C0001OID          hash  OS identity -> channel-level id (sentinel "-1" -> "-1")
 *   C000100020003     list  messages from 2 to 3
 *   C0001WOS0003      list  wakeup markers for 3
 *
 * plus the global set `channelSet` listing every channel id ever opened.
 */
#include "relayhub_utils_export.h"

#include <optional>
#include <string>
#include <string_view>

namespace relayhub::relay
{

/// Width of every numeric field in a key.
inline constexpr int kNumDigits = 4;
/// Highest channel id (inclusive).
inline constexpr int kMaxChannelId = 9999;
/// Placeholder member seeded at channel creation; never a real participant.
inline constexpr int kSentinelId = 9999;
/// Highest id a process may join with (inclusive).
inline constexpr int kMaxMemberId = kSentinelId - 1;

inline constexpr const char *kChannelSetKey = "channelSet";
inline constexpr const char *kWakeupMarker = "WAKEUP";
inline constexpr const char *kSentinelOsIdentity = "-1";

struct PairKey
{
    int channel;
    int sender;
    int receiver;

    bool operator==(const PairKey &) const = default;
};

/// "C" + 4-digit channel id. @throws std::out_of_range for ids outside [0, 9999].
RELAYHUB_UTILS_EXPORT std::string channel_prefix(int channel_id);
RELAYHUB_UTILS_EXPORT std::string members_key(int channel_id);
RELAYHUB_UTILS_EXPORT std::string os_members_key(int channel_id);
RELAYHUB_UTILS_EXPORT std::string encode_pair_key(int channel_id, int sender, int receiver);
RELAYHUB_UTILS_EXPORT std::string wakeup_key(int channel_id, int member_id);

/**
 * @brief Inverse of encode_pair_key().
 * @return std::nullopt for anything that is not exactly `C` followed by 12 digits.
 */
RELAYHUB_UTILS_EXPORT std::optional<PairKey> decode_pair_key(std::string_view key) noexcept;

} // namespace relayhub::relay
