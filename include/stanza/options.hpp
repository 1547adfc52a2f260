#pragma once


/*
    ----------------------------------
    Stanza parsing and caching options
    ----------------------------------
    This header defines the configuration structures that control how a
    document is indexed and how resolved paths are cached.

    --------------------------------------
    Parsing Options - Stanza::ParseOptions
    --------------------------------------
    - `size_t max_depth`:
        * Maximum nesting depth of arrays/objects (default 512)
        * Exceeding it fails the parse with `Error::code::depth_limit`
        * 0 means "no explicit limit"; an internal ceiling still guards the
          stack against adversarial input
    - `size_t max_string_len`, `max_object_keys`, `max_array_items`:
        * Per-value ceilings; exceeding one fails with
          `Error::code::memory_limit`. 0 disables the check
    - `bool strict_mode`:
        * Rejects every lenient extension: comments are refused regardless
          of `allow_comments` and string contents must be valid UTF-8
    - `bool allow_comments`:
        * Accepts `// ...` and block comments as whitespace when strict
          mode is off
    - `Logger logger`:
        * Receives a record for each rejected document

    Trailing commas, unquoted keys and bare `NaN`/`Infinity` are always
    rejected.

    ------------------------------------
    Cache Options - Stanza::CacheOptions
    ------------------------------------
    - `size_t max_entries`: capacity of a `path_cache`; the least recently
      used entry is evicted past it
    - `milliseconds default_ttl`: lifetime used by `path_cache::resolve`
      when no explicit TTL is passed
    - `bool enabled`: when false every resolution bypasses the cache
    - `Logger logger`: receives eviction and expiry records

    Both structures are plain aggregates suitable for brace-initialization.
*/


#include <chrono>
#include <cstddef>

#include "stanza/log.hpp"

/// @defgroup StanzaOptions Parsing and Caching Options
/// @ingroup Stanza
/// @brief Configuration objects controlling parsing and path caching

namespace Stanza {

    /// @ingroup StanzaOptions
    /// @brief Configuration controlling how a document is indexed
    ///
    /// Example:
    /// @code
    /// ParseOptions opts;
    /// opts.max_depth = 32;
    /// opts.max_string_len = 1 << 20;
    /// auto doc = Stanza::parse(text, opts);
    /// @endcode
    struct ParseOptions {
        std::size_t max_depth = 512;      ///< Maximum nesting depth (0 = no explicit limit)
        std::size_t max_string_len = 0;   ///< Maximum raw bytes of one string (0 = unlimited)
        std::size_t max_object_keys = 0;  ///< Maximum members of one object (0 = unlimited)
        std::size_t max_array_items = 0;  ///< Maximum elements of one array (0 = unlimited)
        bool strict_mode = false;         ///< Reject every lenient extension
        bool allow_comments = false;      ///< Accept `//` and `/* */` comments if true
        Logger logger{};                  ///< Receives parse failure records
    };

    /// @ingroup StanzaOptions
    /// @brief Configuration of a `Stanza::path_cache`
    struct CacheOptions {
        std::size_t max_entries = 1024;                      ///< Capacity before LRU eviction
        std::chrono::milliseconds default_ttl{ 60'000 };     ///< TTL used when none is given
        bool enabled = true;                                 ///< Bypass the cache if false
        Logger logger{};                                     ///< Receives eviction records
    };

} // namespace Stanza
