#include "rlh_service.hpp"
#include "utils/channel.hpp"
#include "utils/channel_keys.hpp"

#include <algorithm>
#include <stdexcept>

namespace relayhub::relay
{

namespace
{

/// Parses a member id stored in a set or hash; -1 for anything that is not a plain number.
int parse_id(const std::string &text)
{
    return format_tools::parse_digits(text);
}

std::unique_ptr<store::MessageStore> connect(const store::StoreConnector &connector)
{
    auto store = connector();
    if (!store)
    {
        throw store::StoreError("relay: connector returned no store");
    }
    return store;
}

} // namespace

// ============================================================================
// Registry
// ============================================================================

Channel::Channel(store::StoreConnector connector, int channel_id)
    : m_connector(std::move(connector)), m_channel_id(channel_id)
{
}

Channel Channel::open(store::StoreConnector connector, int channel_id, bool flush)
{
    if (channel_id < 0 || channel_id > kMaxChannelId)
    {
        throw std::invalid_argument(
            fmt::format("relay: channel id {} outside [0, {}]", channel_id, kMaxChannelId));
    }
    if (!connector)
    {
        throw std::invalid_argument("relay: empty store connector");
    }

    auto store = connect(connector);
    if (flush)
    {
        LOGGER_WARN("relay: flushing the whole store before opening channel {}", channel_id);
        store->flushall();
    }
    // Only the caller whose sadd inserted the id seeds the sentinels.
    if (store->sadd(kChannelSetKey, std::to_string(channel_id)))
    {
        store->sadd(members_key(channel_id), std::to_string(kSentinelId));
        store->hset(os_members_key(channel_id), kSentinelOsIdentity, kSentinelOsIdentity);
        LOGGER_INFO("relay: created channel {}", channel_id);
    }
    return Channel(std::move(connector), channel_id);
}

std::vector<int> Channel::known_channels(const store::StoreConnector &connector)
{
    auto store = connect(connector);
    std::vector<int> ids;
    for (const auto &entry : store->smembers(kChannelSetKey))
    {
        const int id = parse_id(entry);
        if (id >= 0)
            ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

Channel Channel::with_process_identity(std::string identity) const
{
    Channel copy(*this);
    copy.m_identity_override = std::move(identity);
    return copy;
}

std::string Channel::process_identity() const
{
    if (m_identity_override)
        return *m_identity_override;
    return std::to_string(platform::get_pid());
}

void Channel::join(int id)
{
    if (id < 0 || id > kMaxMemberId)
    {
        throw std::invalid_argument(
            fmt::format("relay: member id {} outside [0, {}]", id, kMaxMemberId));
    }

    auto store = connect(m_connector);
    const std::string me = process_identity();
    if (store->hexists(os_members_key(m_channel_id), me))
    {
        throw ChannelError(ChannelErrc::AlreadyJoined,
                           fmt::format("process '{}' already joined channel {}", me,
                                       m_channel_id));
    }
    // sadd is the atomic claim on the id; the OS mapping is written only after it succeeds.
    if (!store->sadd(members_key(m_channel_id), std::to_string(id)))
    {
        throw ChannelError(ChannelErrc::IdInUse,
                           fmt::format("id {} is taken in channel {}", id, m_channel_id));
    }
    try
    {
        store->hset(os_members_key(m_channel_id), me, std::to_string(id));
    }
    catch (const store::StoreError &e)
    {
        // Release the claim, or the id stays taken with no process behind it.
        LOGGER_WARN("relay: recording process '{}' as {} failed ({}); releasing the id", me, id,
                    e.what());
        store->srem(members_key(m_channel_id), std::to_string(id));
        throw;
    }
    LOGGER_INFO("relay: process '{}' joined channel {} as {}", me, m_channel_id, id);
}

void Channel::leave()
{
    auto store = connect(m_connector);
    const Caller me = authorize(*store);
    store->hdel(os_members_key(m_channel_id), me.os_identity);
    store->srem(members_key(m_channel_id), std::to_string(me.id));
    LOGGER_INFO("relay: process '{}' (id {}) left channel {}", me.os_identity, me.id,
                m_channel_id);
}

Channel::Caller Channel::authorize(store::MessageStore &store) const
{
    std::string me = process_identity();
    const auto mapped = store.hget(os_members_key(m_channel_id), me);
    if (!mapped)
    {
        throw ChannelError(ChannelErrc::UnknownProcess,
                           fmt::format("process '{}' has not joined channel {}", me,
                                       m_channel_id));
    }
    const int id = parse_id(*mapped);
    if (id < 0 || id == kSentinelId || !store.sismember(members_key(m_channel_id), *mapped))
    {
        throw ChannelError(ChannelErrc::UnknownProcess,
                           fmt::format("process '{}' maps to id '{}', which is not a member of "
                                       "channel {}",
                                       me, *mapped, m_channel_id));
    }
    return Caller{std::move(me), id};
}

std::set<int> Channel::members() const
{
    auto store = connect(m_connector);
    std::set<int> ids;
    for (const auto &entry : store->smembers(members_key(m_channel_id)))
    {
        const int id = parse_id(entry);
        if (id >= 0 && id != kSentinelId)
            ids.insert(id);
    }
    return ids;
}

std::optional<int> Channel::self_id() const
{
    auto store = connect(m_connector);
    try
    {
        return authorize(*store).id;
    }
    catch (const ChannelError &e)
    {
        RLH_DEBUG("relay: self_id: {}", e.what());
        return std::nullopt;
    }
}

// ============================================================================
// Send
// ============================================================================

void Channel::send_to(int destination, const nlohmann::json &message)
{
    send_impl({destination}, message, true);
}

void Channel::send_to(const std::set<int> &destinations, const nlohmann::json &message)
{
    send_impl(destinations, message, true);
}

void Channel::send_to_all(const nlohmann::json &message)
{
    std::set<int> everyone = members();
    send_impl(everyone, message, false);
}

void Channel::send_impl(const std::set<int> &destinations, const nlohmann::json &message,
                        bool validate)
{
    auto store = connect(m_connector);
    const Caller me = authorize(*store);

    if (validate)
    {
        const std::string mkey = members_key(m_channel_id);
        for (int dest : destinations)
        {
            if (dest < 0 || dest == kSentinelId || dest > kMaxMemberId ||
                !store->sismember(mkey, std::to_string(dest)))
            {
                throw ChannelError(ChannelErrc::DestinationNotMember,
                                   fmt::format("id {} is not a member of channel {}", dest,
                                               m_channel_id));
            }
        }
    }

    const std::string payload = message.dump();
    for (int dest : destinations)
    {
        // Payload before wakeup: a woken receiver must find the message on its next pass.
        store->rpush(encode_pair_key(m_channel_id, me.id, dest), payload);
        store->rpush(wakeup_key(m_channel_id, dest), kWakeupMarker);
        LOGGER_DEBUG("relay: channel {} {} -> {} ({} bytes)", m_channel_id, me.id, dest,
                     payload.size());
    }
}

// ============================================================================
// Receive
// ============================================================================

RecvResult Channel::recv_from(int sender, bool block, std::chrono::milliseconds timeout)
{
    return recv_impl(std::set<int>{sender}, block, timeout);
}

RecvResult Channel::recv_from(const std::set<int> &senders, bool block,
                              std::chrono::milliseconds timeout)
{
    return recv_impl(senders, block, timeout);
}

RecvResult Channel::recv_from_any(bool block, std::chrono::milliseconds timeout)
{
    return recv_impl(std::nullopt, block, timeout);
}

RecvResult Channel::recv_impl(const std::optional<std::set<int>> &senders, bool block,
                              std::chrono::milliseconds timeout)
{
    auto store = connect(m_connector);
    const std::string mkey = members_key(m_channel_id);

    for (;;)
    {
        // Membership may change while we wait; recompute everything on each pass.
        const Caller me = authorize(*store);

        std::vector<std::string> keys;
        if (senders)
        {
            for (int s : *senders)
            {
                if (s < 0 || s == kSentinelId || s > kMaxMemberId ||
                    !store->sismember(mkey, std::to_string(s)))
                {
                    throw ChannelError(ChannelErrc::UnknownSender,
                                       fmt::format("id {} is not a member of channel {}", s,
                                                   m_channel_id));
                }
                keys.push_back(encode_pair_key(m_channel_id, s, me.id));
            }
        }
        else
        {
            std::vector<int> others;
            for (const auto &entry : store->smembers(mkey))
            {
                const int id = parse_id(entry);
                if (id >= 0 && id != kSentinelId && id != me.id)
                    others.push_back(id);
            }
            std::sort(others.begin(), others.end());
            for (int id : others)
                keys.push_back(encode_pair_key(m_channel_id, id, me.id));
        }
        const std::string wake = wakeup_key(m_channel_id, me.id);
        keys.push_back(wake);

        if (!block && store->exists(keys) == 0)
        {
            return RecvResult::error(RecvError::NoMessage);
        }

        auto popped = store->blpop(keys, timeout);
        if (!popped)
        {
            LOGGER_TRACE("relay: channel {} id {} receive timed out", m_channel_id, me.id);
            return RecvResult::error(RecvError::Timeout);
        }
        if (popped->key == wake)
        {
            LOGGER_TRACE("relay: channel {} id {} woken; recomputing senders", m_channel_id,
                         me.id);
            continue;
        }

        const auto pair = decode_pair_key(popped->key);
        if (!pair)
        {
            RLH_PANIC("relay: blpop returned key '{}' that was never requested", popped->key);
        }
        LOGGER_DEBUG("relay: channel {} {} <- {} ({} bytes)", m_channel_id, me.id, pair->sender,
                     popped->value.size());
        return RecvResult::ok(ReceivedMessage{pair->sender, nlohmann::json::parse(popped->value)});
    }
}

} // namespace relayhub::relay
