#include "CounterCache.hpp"

CounterCache::CounterCache(size_t capacity, std::chrono::milliseconds ttl, Clock clock)
    : m_capacity(capacity),
      m_ttl(ttl),
      m_clock(clock ? std::move(clock) : Clock([]
                                                { return std::chrono::steady_clock::now(); }))
{
}

bool CounterCache::isExpired(const Entry &entry, std::chrono::steady_clock::time_point now) const
{
    return now - entry.insertedAt >= m_ttl;
}

void CounterCache::touch(Entry &entry)
{
    m_lruList.splice(m_lruList.begin(), m_lruList, entry.lruIt);
}

void CounterCache::erase(std::unordered_map<std::string, Entry>::iterator it)
{
    m_lruList.erase(it->second.lruIt);
    m_entries.erase(it);
}

void CounterCache::evictLRU()
{
    if (m_lruList.empty())
        return;

    auto it = m_entries.find(m_lruList.back());
    if (it != m_entries.end())
    {
        m_entries.erase(it);
    }
    m_lruList.pop_back();
}

void CounterCache::insert(const std::string &key, int64_t value, std::chrono::steady_clock::time_point now)
{
    if (m_capacity == 0)
        return;

    if (m_entries.size() >= m_capacity)
    {
        evictLRU();
    }

    m_lruList.push_front(key);
    m_entries[key] = Entry{value, now, m_lruList.begin()};
}

std::optional<int64_t> CounterCache::get(const std::string &key)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(key);
    if (it == m_entries.end())
    {
        ++m_misses;
        return std::nullopt;
    }

    if (isExpired(it->second, m_clock()))
    {
        erase(it);
        ++m_misses;
        return std::nullopt;
    }

    touch(it->second);
    ++m_hits;
    return it->second.value;
}

void CounterCache::put(const std::string &key, int64_t value)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto now = m_clock();
    auto it = m_entries.find(key);
    if (it != m_entries.end())
    {
        it->second.value = value;
        it->second.insertedAt = now;
        touch(it->second);
        return;
    }

    insert(key, value, now);
}

std::optional<int64_t> CounterCache::increment(const std::string &key, int64_t delta)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto now = m_clock();
    auto it = m_entries.find(key);
    if (it == m_entries.end())
    {
        return std::nullopt;
    }

    if (isExpired(it->second, now))
    {
        erase(it);
        return std::nullopt;
    }

    it->second.value += delta;
    it->second.insertedAt = now;
    touch(it->second);
    return it->second.value;
}

bool CounterCache::invalidate(const std::string &key)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(key);
    if (it == m_entries.end())
    {
        return false;
    }
    erase(it);
    return true;
}

size_t CounterCache::purgeExpired()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto now = m_clock();
    size_t purged = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();)
    {
        if (isExpired(it->second, now))
        {
            m_lruList.erase(it->second.lruIt);
            it = m_entries.erase(it);
            ++purged;
        }
        else
        {
            ++it;
        }
    }
    return purged;
}

void CounterCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    m_lruList.clear();
}

CounterCache::Stats CounterCache::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return Stats{m_hits, m_misses, m_entries.size()};
}

size_t CounterCache::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}
