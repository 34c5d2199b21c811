#pragma once
/**
 * @file message_store.hpp
 * @brief Abstract key-value / queue store that relay channels meet through.
 *
 * A MessageStore is one connection to a shared store. The operations mirror a small subset of a
 * Redis-like server: string sets, string hashes and string lists (FIFO queues). Every operation
 * is atomic with respect to other connections to the same store.
 *
 * Channels never keep a connection alive between calls; they ask a StoreConnector for a fresh
 * MessageStore per operation and drop it afterwards.
 */
#include "relayhub_utils_export.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace relayhub::store
{

/**
 * @brief Raised when a store connection fails (unreachable service, timeout, protocol error).
 * The relay layer never catches it.
 */
class RELAYHUB_UTILS_EXPORT StoreError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// Result of a successful blpop: the key that fired and the element popped from its head.
struct PoppedItem
{
    std::string key;
    std::string value;
};

class RELAYHUB_UTILS_EXPORT MessageStore
{
  public:
    virtual ~MessageStore() = default;

    // --- sets -------------------------------------------------------------------------------
    /// @return true if `member` was newly inserted.
    virtual bool sadd(const std::string &key, const std::string &member) = 0;
    /// @return true if `member` was present.
    virtual bool srem(const std::string &key, const std::string &member) = 0;
    virtual bool sismember(const std::string &key, const std::string &member) = 0;
    virtual std::vector<std::string> smembers(const std::string &key) = 0;

    // --- hashes -----------------------------------------------------------------------------
    /// @return true if `field` was newly created (false if an existing value was overwritten).
    virtual bool hset(const std::string &key, const std::string &field,
                      const std::string &value) = 0;
    virtual std::optional<std::string> hget(const std::string &key, const std::string &field) = 0;
    virtual bool hdel(const std::string &key, const std::string &field) = 0;
    virtual bool hexists(const std::string &key, const std::string &field) = 0;
    virtual std::map<std::string, std::string> hgetall(const std::string &key) = 0;

    // --- lists ------------------------------------------------------------------------------
    /// Appends `value` to the tail of list `key`. @return the new list length.
    virtual std::size_t rpush(const std::string &key, const std::string &value) = 0;

    /**
     * @brief Blocks until one of `keys` holds data, then pops the head of the first non-empty
     *        key in list order.
     * @param timeout Zero waits forever.
     * @return The popped item, or std::nullopt when the timeout elapsed.
     */
    virtual std::optional<PoppedItem> blpop(const std::vector<std::string> &keys,
                                            std::chrono::milliseconds timeout) = 0;

    // --- keyspace ---------------------------------------------------------------------------
    /// Counts how many of `keys` currently hold data (a key listed twice counts twice).
    virtual std::size_t exists(const std::vector<std::string> &keys) = 0;
    virtual void flushall() = 0;
};

/// Factory producing a fresh connection per call.
using StoreConnector = std::function<std::unique_ptr<MessageStore>()>;

} // namespace relayhub::store
