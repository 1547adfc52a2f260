#include "stanza/path_cache.hpp"

#include <vector>


namespace Stanza {

    path_cache::path_cache(CacheOptions opts, clock_fn clock)
        : m_Opts{ std::move(opts) }, m_Clock{ std::move(clock) } {
        if (!m_Clock) m_Clock = [] { return clock_type::now(); };
        m_Stats.max_size = m_Opts.max_entries;
    }

    node path_cache::resolve(const document& doc, std::string_view path) {
        return resolve(doc, path, m_Opts.default_ttl);
    }

    node path_cache::resolve(const document& doc, std::string_view path, std::chrono::milliseconds ttl) {
        if (!m_Opts.enabled || m_Opts.max_entries == 0 || ttl <= std::chrono::milliseconds::zero() || !doc.valid())
            return doc.get_path(path);

        const key_view k{ doc.id(), path };
        bool expired = false;
        {
            std::lock_guard lock{ m_Mutex };
            auto it = m_Index.find(k);
            if (it != m_Index.end()) {
                auto item_it = it->second;
                if (m_Clock() < item_it->inserted_at + item_it->ttl) {
                    m_Items.splice(m_Items.begin(), m_Items, item_it);
                    m_Stats.hits++;
                    return node{ doc.data(), item_it->index };
                }
                m_Items.erase(item_it);
                m_Index.erase(it);
                m_Stats.expirations++;
                expired = true;
            }
            m_Stats.misses++;
        }
        // The logger is caller code and may call back into this cache.
        if (expired)
            detail::log(m_Opts.logger, log_level::trace, "path cache: expired '{}' of document {}", path, doc.id());

        node resolved = doc.get_path(path);
        store(doc.id(), path, resolved.exists() ? resolved.index_in_document() : detail::invalid_index, ttl);
        return resolved;
    }

    void path_cache::store(std::uint64_t doc, std::string_view path, std::uint32_t index, std::chrono::milliseconds ttl) {
        std::vector<key> evicted;
        {
            std::lock_guard lock{ m_Mutex };
            auto now = m_Clock();

            // Another reader may have stored the same path while we resolved it.
            if (auto it = m_Index.find(key_view{ doc, path }); it != m_Index.end()) {
                auto item_it = it->second;
                item_it->index = index;
                item_it->inserted_at = now;
                item_it->ttl = ttl;
                m_Items.splice(m_Items.begin(), m_Items, item_it);
                m_Stats.sets++;
                return;
            }

            while (m_Index.size() >= m_Opts.max_entries && !m_Items.empty()) {
                m_Index.erase(m_Items.back().k);
                evicted.push_back(std::move(m_Items.back().k));
                m_Items.pop_back();
                m_Stats.evictions++;
            }

            m_Items.push_front(item{ key{ doc, std::string{ path } }, index, now, ttl });
            m_Index.emplace(m_Items.front().k, m_Items.begin());
            m_Stats.sets++;
        }

        for (const auto& victim : evicted)
            detail::log(m_Opts.logger, log_level::trace, "path cache: evicted '{}' of document {}", victim.path, victim.doc);
    }

    void path_cache::erase(const document& doc) {
        std::lock_guard lock{ m_Mutex };
        for (auto it = m_Items.begin(); it != m_Items.end();) {
            if (it->k.doc == doc.id()) {
                m_Index.erase(it->k);
                it = m_Items.erase(it);
            } else ++it;
        }
    }

    void path_cache::clear() {
        std::lock_guard lock{ m_Mutex };
        m_Index.clear();
        m_Items.clear();
    }

    cache_stats path_cache::stats() const {
        std::lock_guard lock{ m_Mutex };
        cache_stats s = m_Stats;
        s.size = m_Index.size();
        return s;
    }

} // namespace Stanza
