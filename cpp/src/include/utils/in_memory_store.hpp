#pragma once
/**
 * @file in_memory_store.hpp
 * @brief MessageStore backed by a KeySpace shared between threads of one process.
 *
 * Every InMemoryMessageStore handle created from the same InMemoryStoreState sees the same
 * data. blpop() waits on the state's condition variable, so a push from any handle (on any
 * thread) wakes blocked readers. The state outlives all handles through shared ownership.
 *
 * Also usable across fork(): a child inherits a copy of the state, which is fine for tests that
 * only need isolation, but processes that must talk to each other need the ZMQ store.
 */
#include "relayhub_utils_export.h"

#include "utils/key_space.hpp"
#include "utils/message_store.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>

namespace relayhub::store
{

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

struct InMemoryStoreState
{
    std::mutex mu;
    std::condition_variable data_cv;
    KeySpace keys;
};

class RELAYHUB_UTILS_EXPORT InMemoryMessageStore final : public MessageStore
{
  public:
    explicit InMemoryMessageStore(std::shared_ptr<InMemoryStoreState> state);

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
    std::shared_ptr<InMemoryStoreState> m_state;
};

/// Connector handing out fresh handles onto `state`.
RELAYHUB_UTILS_EXPORT StoreConnector
make_in_memory_connector(std::shared_ptr<InMemoryStoreState> state);

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

} // namespace relayhub::store
