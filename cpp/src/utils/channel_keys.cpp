#include "utils/channel_keys.hpp"
#include "utils/format_tools.hpp"

namespace relayhub::relay
{

using format_tools::zero_padded;

namespace
{
constexpr std::size_t kPrefixLen = 1 + kNumDigits;
constexpr std::size_t kPairKeyLen = kPrefixLen + 2 * kNumDigits;
} // namespace

std::string channel_prefix(int channel_id)
{
    return "C" + zero_padded(channel_id, kNumDigits);
}

std::string members_key(int channel_id)
{
    return channel_prefix(channel_id) + "MID";
}

std::string os_members_key(int channel_id)
{
    return channel_prefix(channel_id) + "OID";
}

std::string encode_pair_key(int channel_id, int sender, int receiver)
{
    return channel_prefix(channel_id) + zero_padded(sender, kNumDigits) +
           zero_padded(receiver, kNumDigits);
}

std::string wakeup_key(int channel_id, int member_id)
{
    return channel_prefix(channel_id) + "WOS" + zero_padded(member_id, kNumDigits);
}

std::optional<PairKey> decode_pair_key(std::string_view key) noexcept
{
    if (key.size() != kPairKeyLen || key.front() != 'C')
        return std::nullopt;

    const int channel = format_tools::parse_digits(key.substr(1, kNumDigits));
    const int sender = format_tools::parse_digits(key.substr(kPrefixLen, kNumDigits));
    const int receiver =
        format_tools::parse_digits(key.substr(kPrefixLen + kNumDigits, kNumDigits));
    if (channel < 0 || sender < 0 || receiver < 0)
        return std::nullopt;
    return PairKey{channel, sender, receiver};
}

} // namespace relayhub::relay
