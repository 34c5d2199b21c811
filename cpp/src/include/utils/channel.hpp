#pragma once
/**
 * @file channel.hpp
 * @brief relay::Channel: a named many-to-many message channel between OS processes.
 *
 * Processes rendezvous through a shared MessageStore. Each process joins a channel under a small
 * channel-level id, then exchanges JSON messages with other members:
 *
 * @code
 *   auto connector = relayhub::store::make_zmq_connector("tcp://127.0.0.1:5580");
 *   auto ch = relayhub::relay::Channel::open(connector, 1);
 *   ch.join(2);
 *   auto r = ch.recv_from_any();
 *   if (r.is_ok())
 *       ch.send_to(r.content().sender, "ack");
 *   ch.leave();
 * @endcode
 *
 * ## Delivery
 *
 * Each (sender, receiver) pair has its own FIFO queue, so order is preserved per pair. A sender
 * also drops a marker on the receiver's wakeup queue. A receiver blocked on an outdated set of
 * queues (for example, waiting before a new sender joined) is woken by the marker, recomputes
 * its queue set from the current membership and waits again.
 *
 * ## Connections and identity
 *
 * A Channel holds no live connection. Every call obtains a fresh MessageStore from the
 * connector, so a Channel may be copied and used in a child after fork(). The caller is
 * identified by its process id, read on every call; with_process_identity() substitutes a fixed
 * identity so several logical participants can share one process.
 *
 * Membership is re-validated on every call; nothing is cached.
 */
#include "relayhub_utils_export.h"

#include "utils/channel_error.hpp"
#include "utils/message_store.hpp"
#include "utils/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace relayhub::relay
{

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

struct ReceivedMessage
{
    int sender{-1};
    nlohmann::json message;
};

/// Non-error outcomes of a receive that returned no message.
enum class RecvError
{
    NoMessage, ///< Non-blocking receive found nothing queued.
    Timeout,   ///< A blocking wait elapsed without a message.
};

using RecvResult = Result<ReceivedMessage, RecvError>;

class RELAYHUB_UTILS_EXPORT Channel
{
  public:
    /**
     * @brief Opens (creating on first use) channel `channel_id`.
     *
     * The first caller to reference an id registers it in `channelSet` and seeds the sentinel
     * member and OS mapping; later callers just attach.
     *
     * @param flush Wipe the whole store first. Affects every channel; meant for tests and demos.
     * @throws std::invalid_argument if `channel_id` is outside [0, 9999].
     */
    static Channel open(store::StoreConnector connector, int channel_id, bool flush = false);

    /// Ids of every channel ever opened on the store, ascending.
    static std::vector<int> known_channels(const store::StoreConnector &connector);

    /// Copy of this handle that identifies its caller as `identity` instead of the process id.
    [[nodiscard]] Channel with_process_identity(std::string identity) const;

    [[nodiscard]] int channel_id() const noexcept { return m_channel_id; }

    /// The OS-level identity used for the next call.
    [[nodiscard]] std::string process_identity() const;

    /**
     * @brief Joins the channel as member `id`.
     * @throws std::invalid_argument if `id` is outside [0, 9998].
     * @throws ChannelError AlreadyJoined or IdInUse.
     * @throws store::StoreError if the store fails; a claimed id is released first.
     *
     * The AlreadyJoined check and the id claim are separate store calls, so two threads
     * sharing one process identity can both join. Each identity must join from one thread.
     */
    void join(int id);

    /// @throws ChannelError UnknownProcess if the caller is not a member.
    void leave();

    /**
     * @brief Sends `message` to one or several members.
     *
     * All destinations are checked before anything is queued, so a bad destination leaves the
     * store untouched.
     *
     * @throws ChannelError UnknownProcess or DestinationNotMember.
     */
    void send_to(int destination, const nlohmann::json &message);
    void send_to(const std::set<int> &destinations, const nlohmann::json &message);

    /// Sends to every current member, the caller included.
    void send_to_all(const nlohmann::json &message);

    /**
     * @brief Receives the next message from one of `senders`.
     *
     * @param block   false returns RecvError::NoMessage immediately when nothing is queued.
     * @param timeout Bound on each wait; zero waits forever. A wakeup restarts the wait, so the
     *                total time spent may exceed `timeout`.
     * @throws ChannelError UnknownProcess, or UnknownSender if a sender is not a member.
     * @throws nlohmann::json::parse_error if the queued payload is not valid JSON.
     */
    RecvResult recv_from(int sender, bool block = true,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds{0});
    RecvResult recv_from(const std::set<int> &senders, bool block = true,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

    /// Receives from any member except the caller. Same semantics as recv_from().
    RecvResult recv_from_any(bool block = true,
                             std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

    /// Current member ids, sentinel excluded.
    [[nodiscard]] std::set<int> members() const;

    /// The caller's channel-level id, or nothing if it is not a member.
    [[nodiscard]] std::optional<int> self_id() const;

  private:
    Channel(store::StoreConnector connector, int channel_id);

    struct Caller
    {
        std::string os_identity;
        int id;
    };

    Caller authorize(store::MessageStore &store) const;
    void send_impl(const std::set<int> &destinations, const nlohmann::json &message,
                   bool validate);
    RecvResult recv_impl(const std::optional<std::set<int>> &senders, bool block,
                         std::chrono::milliseconds timeout);

    store::StoreConnector m_connector;
    int m_channel_id;
    std::optional<std::string> m_identity_override;
};

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

} // namespace relayhub::relay
