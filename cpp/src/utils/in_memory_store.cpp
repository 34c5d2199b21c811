#include "utils/in_memory_store.hpp"

#include <stdexcept>

namespace relayhub::store
{

InMemoryMessageStore::InMemoryMessageStore(std::shared_ptr<InMemoryStoreState> state)
    : m_state(std::move(state))
{
    if (!m_state)
    {
        throw std::invalid_argument("InMemoryMessageStore: state must not be null");
    }
}

bool InMemoryMessageStore::sadd(const std::string &key, const std::string &member)
{
    std::lock_guard lock(m_state->mu);
    return m_state->keys.sadd(key, member);
}

bool InMemoryMessageStore::srem(const std::string &key, const std::string &member)
{
    std::lock_guard lock(m_state->mu);
    return m_state->keys.srem(key, member);
}

bool InMemoryMessageStore::sismember(const std::string &key, const std::string &member)
{
    std::lock_guard lock(m_state->mu);
    return m_state->keys.sismember(key, member);
}

std::vector<std::string> InMemoryMessageStore::smembers(const std::string &key)
{
    std::lock_guard lock(m_state->mu);
    return m_state->keys.smembers(key);
}

bool InMemoryMessageStore::hset(const std::string &key, const std::string &field,
                                const std::string &value)
{
    std::lock_guard lock(m_state->mu);
    return m_state->keys.hset(key, field, value);
}

std::optional<std::string> InMemoryMessageStore::hget(const std::string &key,
                                                      const std::string &field)
{
    std::lock_guard lock(m_state->mu);
    return m_state->keys.hget(key, field);
}

bool InMemoryMessageStore::hdel(const std::string &key, const std::string &field)
{
    std::lock_guard lock(m_state->mu);
    return m_state->keys.hdel(key, field);
}

bool InMemoryMessageStore::hexists(const std::string &key, const std::string &field)
{
    std::lock_guard lock(m_state->mu);
    return m_state->keys.hexists(key, field);
}

std::map<std::string, std::string> InMemoryMessageStore::hgetall(const std::string &key)
{
    std::lock_guard lock(m_state->mu);
    return m_state->keys.hgetall(key);
}

std::size_t InMemoryMessageStore::rpush(const std::string &key, const std::string &value)
{
    std::size_t len = 0;
    {
        std::lock_guard lock(m_state->mu);
        len = m_state->keys.rpush(key, value);
    }
    // Waiters watch different key sets; wake all and let each re-check its own keys.
    m_state->data_cv.notify_all();
    return len;
}

std::optional<PoppedItem> InMemoryMessageStore::blpop(const std::vector<std::string> &keys,
                                                      std::chrono::milliseconds timeout)
{
    std::unique_lock lock(m_state->mu);
    std::optional<PoppedItem> item;
    auto ready = [&] {
        item = m_state->keys.pop_first(keys);
        return item.has_value();
    };

    if (timeout.count() <= 0)
    {
        m_state->data_cv.wait(lock, ready);
    }
    else
    {
        m_state->data_cv.wait_for(lock, timeout, ready);
    }
    return item;
}

std::size_t InMemoryMessageStore::exists(const std::vector<std::string> &keys)
{
    std::lock_guard lock(m_state->mu);
    return m_state->keys.exists(keys);
}

void InMemoryMessageStore::flushall()
{
    std::lock_guard lock(m_state->mu);
    m_state->keys.clear();
}

StoreConnector make_in_memory_connector(std::shared_ptr<InMemoryStoreState> state)
{
    return [state = std::move(state)]() -> std::unique_ptr<MessageStore>
    { return std::make_unique<InMemoryMessageStore>(state); };
}

} // namespace relayhub::store
