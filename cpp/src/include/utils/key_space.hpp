#pragma once
/**
 * @file key_space.hpp
 * @brief In-process data structure holding sets, hashes and lists by key.
 *
 * KeySpace is NOT thread-safe. InMemoryMessageStore guards it with a mutex and StoreService
 * touches it only from its run() thread.
 *
 * A key names exactly one kind of value. Writing a different kind to an existing key replaces
 * it, and collections that become empty are erased so that exists() reports them absent.
 */
#include "relayhub_utils_export.h"

#include "utils/message_store.hpp"

#include <deque>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace relayhub::store
{

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

class RELAYHUB_UTILS_EXPORT KeySpace
{
  public:
    bool sadd(const std::string &key, const std::string &member);
    bool srem(const std::string &key, const std::string &member);
    [[nodiscard]] bool sismember(const std::string &key, const std::string &member) const;
    [[nodiscard]] std::vector<std::string> smembers(const std::string &key) const;

    bool hset(const std::string &key, const std::string &field, const std::string &value);
    [[nodiscard]] std::optional<std::string> hget(const std::string &key,
                                                  const std::string &field) const;
    bool hdel(const std::string &key, const std::string &field);
    [[nodiscard]] bool hexists(const std::string &key, const std::string &field) const;
    [[nodiscard]] std::map<std::string, std::string> hgetall(const std::string &key) const;

    std::size_t rpush(const std::string &key, const std::string &value);
    /// Re-inserts `value` at the head of list `key` (undo of a pop that could not be delivered).
    void push_front(const std::string &key, const std::string &value);
    /// Non-blocking half of blpop: pops from the first non-empty key in list order.
    std::optional<PoppedItem> pop_first(const std::vector<std::string> &keys);
    [[nodiscard]] std::size_t llen(const std::string &key) const;

    [[nodiscard]] std::size_t exists(const std::vector<std::string> &keys) const;
    void clear() noexcept;
    [[nodiscard]] std::size_t key_count() const noexcept { return m_entries.size(); }

  private:
    using SetValue = std::set<std::string>;
    using HashValue = std::map<std::string, std::string>;
    using ListValue = std::deque<std::string>;
    using Value = std::variant<SetValue, HashValue, ListValue>;

    template <typename T> T *find_as(const std::string &key);
    template <typename T> const T *find_as(const std::string &key) const;
    template <typename T> T &get_or_create(const std::string &key);

    std::map<std::string, Value> m_entries;
};

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

} // namespace relayhub::store
