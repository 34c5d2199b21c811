#include "utils/key_space.hpp"

namespace relayhub::store
{

template <typename T> T *KeySpace::find_as(const std::string &key)
{
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return nullptr;
    return std::get_if<T>(&it->second);
}

template <typename T> const T *KeySpace::find_as(const std::string &key) const
{
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return nullptr;
    return std::get_if<T>(&it->second);
}

template <typename T> T &KeySpace::get_or_create(const std::string &key)
{
    auto it = m_entries.find(key);
    if (it == m_entries.end())
    {
        it = m_entries.emplace(key, T{}).first;
    }
    else if (!std::holds_alternative<T>(it->second))
    {
        it->second = T{};
    }
    return std::get<T>(it->second);
}

// ---- sets ----------------------------------------------------------------------------------

bool KeySpace::sadd(const std::string &key, const std::string &member)
{
    return get_or_create<SetValue>(key).insert(member).second;
}

bool KeySpace::srem(const std::string &key, const std::string &member)
{
    auto *set = find_as<SetValue>(key);
    if (set == nullptr || set->erase(member) == 0)
        return false;
    if (set->empty())
        m_entries.erase(key);
    return true;
}

bool KeySpace::sismember(const std::string &key, const std::string &member) const
{
    const auto *set = find_as<SetValue>(key);
    return set != nullptr && set->count(member) != 0;
}

std::vector<std::string> KeySpace::smembers(const std::string &key) const
{
    const auto *set = find_as<SetValue>(key);
    if (set == nullptr)
        return {};
    return {set->begin(), set->end()};
}

// ---- hashes --------------------------------------------------------------------------------

bool KeySpace::hset(const std::string &key, const std::string &field, const std::string &value)
{
    auto &hash = get_or_create<HashValue>(key);
    auto [it, inserted] = hash.try_emplace(field, value);
    if (!inserted)
        it->second = value;
    return inserted;
}

std::optional<std::string> KeySpace::hget(const std::string &key, const std::string &field) const
{
    const auto *hash = find_as<HashValue>(key);
    if (hash == nullptr)
        return std::nullopt;
    auto it = hash->find(field);
    if (it == hash->end())
        return std::nullopt;
    return it->second;
}

bool KeySpace::hdel(const std::string &key, const std::string &field)
{
    auto *hash = find_as<HashValue>(key);
    if (hash == nullptr || hash->erase(field) == 0)
        return false;
    if (hash->empty())
        m_entries.erase(key);
    return true;
}

bool KeySpace::hexists(const std::string &key, const std::string &field) const
{
    const auto *hash = find_as<HashValue>(key);
    return hash != nullptr && hash->count(field) != 0;
}

std::map<std::string, std::string> KeySpace::hgetall(const std::string &key) const
{
    const auto *hash = find_as<HashValue>(key);
    if (hash == nullptr)
        return {};
    return *hash;
}

// ---- lists ---------------------------------------------------------------------------------

std::size_t KeySpace::rpush(const std::string &key, const std::string &value)
{
    auto &list = get_or_create<ListValue>(key);
    list.push_back(value);
    return list.size();
}

void KeySpace::push_front(const std::string &key, const std::string &value)
{
    get_or_create<ListValue>(key).push_front(value);
}

std::optional<PoppedItem> KeySpace::pop_first(const std::vector<std::string> &keys)
{
    for (const auto &key : keys)
    {
        auto *list = find_as<ListValue>(key);
        if (list == nullptr || list->empty())
            continue;
        PoppedItem item{key, std::move(list->front())};
        list->pop_front();
        if (list->empty())
            m_entries.erase(key);
        return item;
    }
    return std::nullopt;
}

std::size_t KeySpace::llen(const std::string &key) const
{
    const auto *list = find_as<ListValue>(key);
    return list == nullptr ? 0 : list->size();
}

// ---- keyspace ------------------------------------------------------------------------------

std::size_t KeySpace::exists(const std::vector<std::string> &keys) const
{
    std::size_t count = 0;
    for (const auto &key : keys)
    {
        if (m_entries.count(key) != 0)
            ++count;
    }
    return count;
}

void KeySpace::clear() noexcept
{
    m_entries.clear();
}

} // namespace relayhub::store
