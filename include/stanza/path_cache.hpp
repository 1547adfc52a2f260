#pragma once


/*
    ------------------------------------------------
    Stanza::path_cache - Memoized path resolution
    ------------------------------------------------
    A `path_cache` remembers which structural index entry a path resolved
    to, per document, so hot paths skip the segment-by-segment walk.

    - Entries are keyed by (document id, path string) and store only the
      resolved index; the caller always passes the document back in, so a
      cache never keeps a document alive or dangles into a freed one
    - Capacity is bounded by `CacheOptions::max_entries`; past it the least
      recently used entry is evicted
    - Every entry carries its own TTL and is never returned after
      `inserted_at + ttl`
    - Absent results are cached as well: resolving through the cache
      always agrees with `node::get_path` on the same document
    - All mutation happens under one mutex; `resolve` may be called from
      any number of threads. The path walk itself runs outside the lock

    There is no process-wide cache. Create one where it is needed and pass
    it around, or attach one per document in the caller's own context.

        Stanza::path_cache cache{ { .max_entries = 256 } };
        auto doc = Stanza::parse(text).value();
        auto name = cache.resolve(doc, "user.name", std::chrono::seconds{ 30 });
*/

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "stanza/config.hpp"
#include "stanza/document.hpp"
#include "stanza/node.hpp"
#include "stanza/options.hpp"

namespace Stanza {

    /// @brief Counters describing a cache's activity
    struct cache_stats {
        std::uint64_t hits = 0;
        std::uint64_t misses = 0;
        std::uint64_t sets = 0;
        std::uint64_t evictions = 0;    ///< LRU evictions
        std::uint64_t expirations = 0;  ///< Entries dropped because their TTL elapsed
        std::size_t size = 0;
        std::size_t max_size = 0;

        [[nodiscard]] double hit_rate() const noexcept {
            auto total = hits + misses;
            return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
        }
    };

    /// @brief Bounded, TTL-aware cache of path resolutions
    class path_cache {
    public:
        using clock_type = std::chrono::steady_clock;
        using time_point = clock_type::time_point;
        using clock_fn = std::function<time_point()>;

        /// @brief Creates a cache; @p clock defaults to `steady_clock::now`
        STANZA_API explicit path_cache(CacheOptions opts = {}, clock_fn clock = {});

        path_cache(const path_cache&) = delete;
        path_cache& operator=(const path_cache&) = delete;

        /// @brief Resolves @p path against @p doc using `CacheOptions::default_ttl`
        [[nodiscard]] STANZA_API node resolve(const document& doc, std::string_view path);

        /// @brief Resolves @p path against @p doc, caching the result for @p ttl
        ///
        /// @details
        /// A hit within its TTL returns the stored resolution and refreshes
        /// its LRU position. A miss walks the path like `node::get_path`,
        /// stores the outcome and evicts the least recently used entry when
        /// the cache is full. A non-positive @p ttl, a disabled cache or an
        /// absent document resolve without touching the cache.
        [[nodiscard]] STANZA_API node resolve(const document& doc, std::string_view path, std::chrono::milliseconds ttl);

        /// @brief Drops every entry that belongs to @p doc
        STANZA_API void erase(const document& doc);

        /// @brief Drops every entry
        STANZA_API void clear();

        /// @brief Snapshot of the activity counters
        [[nodiscard]] STANZA_API cache_stats stats() const;

        [[nodiscard]] const CacheOptions& options() const noexcept { return m_Opts; }

    private:
        struct key {
            std::uint64_t doc = 0;
            std::string path;
        };

        struct key_view {
            std::uint64_t doc = 0;
            std::string_view path;
        };

        struct key_hash {
            using is_transparent = void;
            std::size_t operator()(const key_view& k) const noexcept {
                std::size_t h = std::hash<std::string_view>{}(k.path);
                return h ^ (std::hash<std::uint64_t>{}(k.doc) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2));
            }
            std::size_t operator()(const key& k) const noexcept { return (*this)(key_view{ k.doc, k.path }); }
        };

        struct key_equal {
            using is_transparent = void;
            static key_view view(const key& k) noexcept { return { k.doc, k.path }; }
            static key_view view(const key_view& k) noexcept { return k; }
            template<typename A, typename B>
            bool operator()(const A& a, const B& b) const noexcept {
                auto va = view(a);
                auto vb = view(b);
                return va.doc == vb.doc && va.path == vb.path;
            }
        };

        struct item {
            key k;
            std::uint32_t index = detail::invalid_index;
            time_point inserted_at{};
            std::chrono::milliseconds ttl{};
        };

        using lru_list = std::list<item>;

        CacheOptions m_Opts;
        clock_fn m_Clock;
        mutable std::mutex m_Mutex;
        lru_list m_Items;  // most recently used first
        std::unordered_map<key, lru_list::iterator, key_hash, key_equal> m_Index;
        cache_stats m_Stats{};

        void store(std::uint64_t doc, std::string_view path, std::uint32_t index, std::chrono::milliseconds ttl);
    };

} // namespace Stanza
