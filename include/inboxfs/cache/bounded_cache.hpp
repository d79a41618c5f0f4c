/**********************************************************************
File name: bounded_cache.hpp
This file is part of: InboxFS

LICENSE

This program is free software: you can redistribute it and/or modify it
under the terms of the GNU General Public License as published by the
Free Software Foundation, either version 3 of the License, or (at your
option) any later version.

This program is distributed in the hope that it will be useful, but
WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
General Public License for more details.

You should have received a copy of the GNU General Public License along
with this program.  If not, see <http://www.gnu.org/licenses/>.

FEEDBACK & QUESTIONS

For feedback and questions about InboxFS please e-mail one of the
authors named in the AUTHORS file.
**********************************************************************/
#ifndef INBOXFS_CACHE_BOUNDED_CACHE_H
#define INBOXFS_CACHE_BOUNDED_CACHE_H

#include <cstddef>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

#include "inboxfs/clock.hpp"
#include "inboxfs/error.hpp"

namespace Inboxfs {

/**
 * In-memory cache with an optional time-to-live and an optional bound on
 * the number of resident entries.
 *
 * Entries older than the time-to-live are treated as absent. When the
 * capacity is reached, the least recently used entry is evicted. Failed
 * fetches are never cached.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class BoundedCache {
public:
    using duration = Clock::duration;

public:
    BoundedCache(const Clock &clock,
                 std::optional<duration> ttl,
                 std::optional<std::size_t> capacity):
        m_clock(clock),
        m_ttl(ttl),
        m_capacity(capacity)
    {

    }

    BoundedCache(const BoundedCache &src) = delete;
    BoundedCache(BoundedCache &&src) = delete;
    BoundedCache &operator=(const BoundedCache &src) = delete;
    BoundedCache &operator=(BoundedCache &&src) = delete;
    ~BoundedCache() = default;

private:
    using LruList = std::list<Key>;

    struct Slot {
        Value value;
        Clock::time_point fetched_at;
        typename LruList::iterator lru_pos;
    };

    const Clock &m_clock;
    const std::optional<duration> m_ttl;
    const std::optional<std::size_t> m_capacity;

    std::unordered_map<Key, Slot, Hash> m_slots;
    // most recently used key first
    LruList m_lru;

    [[nodiscard]] bool expired(const Slot &slot) const {
        if (!m_ttl) {
            return false;
        }
        return m_clock.now() - slot.fetched_at > *m_ttl;
    }

    void erase(typename std::unordered_map<Key, Slot, Hash>::iterator iter) {
        m_lru.erase(iter->second.lru_pos);
        m_slots.erase(iter);
    }

    void store(const Key &key, const Value &value) {
        auto iter = m_slots.find(key);
        if (iter != m_slots.end()) {
            erase(iter);
        }

        if (m_capacity) {
            if (*m_capacity == 0) {
                return;
            }
            while (m_slots.size() >= *m_capacity) {
                erase(m_slots.find(m_lru.back()));
            }
        }

        m_lru.push_front(key);
        m_slots.emplace(key, Slot{value, m_clock.now(), m_lru.begin()});
    }

public:
    /**
     * @brief Return the cached value for @a key or fetch and cache it.
     *
     * @a fetch is invoked at most once and only if no fresh value is
     * cached. It must return a Result<Value>; its error is passed through
     * and nothing is stored.
     */
    template <typename Fetch>
    Result<Value> get_or_fetch(const Key &key, Fetch &&fetch) {
        auto iter = m_slots.find(key);
        if (iter != m_slots.end()) {
            if (!expired(iter->second)) {
                m_lru.splice(m_lru.begin(), m_lru, iter->second.lru_pos);
                return make_result(iter->second.value);
            }
            erase(iter);
        }

        Result<Value> fetched = std::invoke(std::forward<Fetch>(fetch));
        if (!fetched) {
            return fetched;
        }
        store(key, *fetched);
        return fetched;
    }

    /**
     * @return true if a value which has not expired is cached for @a key.
     */
    [[nodiscard]] bool contains(const Key &key) const {
        auto iter = m_slots.find(key);
        return iter != m_slots.end() && !expired(iter->second);
    }

    /**
     * @brief Number of resident entries, including expired ones which
     * have not been accessed since they expired.
     */
    [[nodiscard]] std::size_t size() const {
        return m_slots.size();
    }

    void clear() {
        m_slots.clear();
        m_lru.clear();
    }

};

}

#endif
