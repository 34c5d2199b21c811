#pragma once
/**
 * @file store_client.hpp
 * @brief MessageStore that talks to a StoreService over a ZMQ DEALER socket.
 *
 * One socket per instance, created on the shared context (requires the "ZMQContext" lifecycle
 * module). Requests are strictly sequential: each call sends one request and waits for the reply
 * carrying the same correlation id, discarding any stale reply left over from an earlier
 * timed-out request.
 *
 * A reply that does not arrive within `request_timeout` (plus the blpop timeout, for blpop)
 * raises StoreError. A blpop with an infinite timeout waits for the reply indefinitely.
 */
#include "relayhub_utils_export.h"

#include "utils/message_store.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace relayhub::store
{

class ZmqMessageStoreImpl;

class RELAYHUB_UTILS_EXPORT ZmqMessageStore final : public MessageStore
{
  public:
    static constexpr std::chrono::milliseconds kDefaultRequestTimeout{5000};

    /// Connects (lazily, ZMQ-style) to `endpoint`. @throws StoreError on a bad endpoint.
    explicit ZmqMessageStore(const std::string &endpoint,
                             std::chrono::milliseconds request_timeout = kDefaultRequestTimeout);
    ~ZmqMessageStore() override;

    ZmqMessageStore(const ZmqMessageStore &) = delete;
    ZmqMessageStore &operator=(const ZmqMessageStore &) = delete;

    /// Round-trips a PING_REQ. @return false if the service did not answer in time.
    bool ping();

    bool sadd(const std::string &key, const std::string &member) override;
    bool srem(const std::string &key, const std::string &member) override;
    bool sismember(const std::string &key, const std::string &member) override;
    std::vector<std::string> smembers(const std::string &key) override;

    bool hset(const std::string &key, const std::string &field,
              const std::string &value) override;
    std::optional<std::string> hget(const std::string &key, const std::string &field) override;
    bool hdel(const std::string &key, const std::string &field) override;
    bool hexists(const std::string &key, const std::string &field) override;
    std::map<std::string, std::string> hgetall(const std::string &key) override;

    std::size_t rpush(const std::string &key, const std::string &value) override;
    std::optional<PoppedItem> blpop(const std::vector<std::string> &keys,
                                    std::chrono::milliseconds timeout) override;

    std::size_t exists(const std::vector<std::string> &keys) override;
    void flushall() override;

  private:
#if defined(_MSC_VER)
#pragma warning(suppress : 4251)
#endif
    std::unique_ptr<ZmqMessageStoreImpl> pImpl;
};

/// Connector creating a new ZmqMessageStore per call.
RELAYHUB_UTILS_EXPORT StoreConnector make_zmq_connector(
    std::string endpoint,
    std::chrono::milliseconds request_timeout = ZmqMessageStore::kDefaultRequestTimeout);

} // namespace relayhub::store
