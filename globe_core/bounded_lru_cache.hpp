#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <unordered_map>
#include <utility>

namespace globe::core
{

// Fixed-capacity map that evicts the least recently used entry. A lookup
// through find() counts as a use. The eviction callback runs before the
// entry is dropped so owners can release side resources.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class BoundedLruCache
{
public:
    using EvictionCallback = std::function<void(const Key&, Value&)>;

    explicit BoundedLruCache(std::size_t capacity)
        : m_capacity(capacity == 0U ? 1U : capacity)
    {
    }

    BoundedLruCache(const BoundedLruCache&) = delete;
    BoundedLruCache& operator=(const BoundedLruCache&) = delete;

    // Destruction does not run the eviction callback.
    ~BoundedLruCache() = default;

    void setEvictionCallback(EvictionCallback callback)
    {
        m_onEvict = std::move(callback);
    }

    // Returns nullptr on a miss. The pointer stays valid until the entry is
    // evicted or erased.
    Value* find(const Key& key)
    {
        const auto it = m_index.find(key);
        if (it == m_index.end())
        {
            ++m_misses;
            return nullptr;
        }
        ++m_hits;
        m_entries.splice(m_entries.begin(), m_entries, it->second);
        return &it->second->second;
    }

    bool contains(const Key& key) const
    {
        return m_index.find(key) != m_index.end();
    }

    // Inserts or replaces, then evicts down to capacity.
    Value& insert(const Key& key, Value value)
    {
        const auto it = m_index.find(key);
        if (it != m_index.end())
        {
            it->second->second = std::move(value);
            m_entries.splice(m_entries.begin(), m_entries, it->second);
            return it->second->second;
        }

        m_entries.emplace_front(key, std::move(value));
        m_index.emplace(key, m_entries.begin());
        while (m_entries.size() > m_capacity)
        {
            evictBack();
        }
        return m_entries.front().second;
    }

    void setCapacity(std::size_t capacity)
    {
        m_capacity = capacity == 0U ? 1U : capacity;
        while (m_entries.size() > m_capacity)
        {
            evictBack();
        }
    }

    // Evicts every entry, most stale first.
    void clear()
    {
        while (!m_entries.empty())
        {
            evictBack();
        }
    }

    std::size_t size() const noexcept
    {
        return m_entries.size();
    }

    std::size_t capacity() const noexcept
    {
        return m_capacity;
    }

    std::size_t hits() const noexcept
    {
        return m_hits;
    }

    std::size_t misses() const noexcept
    {
        return m_misses;
    }

    std::size_t evictions() const noexcept
    {
        return m_evictions;
    }

private:
    using Entry = std::pair<Key, Value>;
    using EntryList = std::list<Entry>;

    void evictBack()
    {
        Entry& stale = m_entries.back();
        if (m_onEvict)
        {
            m_onEvict(stale.first, stale.second);
        }
        m_index.erase(stale.first);
        m_entries.pop_back();
        ++m_evictions;
    }

    std::size_t m_capacity;
    EntryList m_entries;
    std::unordered_map<Key, typename EntryList::iterator, Hash> m_index;
    EvictionCallback m_onEvict;
    std::size_t m_hits = 0U;
    std::size_t m_misses = 0U;
    std::size_t m_evictions = 0U;
};

} // namespace globe::core
