#pragma once


/*
    -------------------------------------------------------------
    Stanza - Zero-copy JSON access library (index + query + cache)
    -------------------------------------------------------------

    This is the main public header for Stanza

    It brings together:
        - Parsing into an immutable document:   `Stanza::parse(...)`
        - Zero-copy value handles:              `Stanza::node`
        - Error reporting types:                `Stanza::Error`
        - Configuration options:                `Stanza::ParseOptions`,
                                                `Stanza::CacheOptions`
        - Path resolution with caching:         `Stanza::path_cache`
        - Filtering, sorting and pagination:    `Stanza::query_builder`
        - Grouping and reduction:               `Stanza::aggregator`
        - Data-driven validation rules:         `Stanza::validate(...)`

    -------------------
    High-Level Overview
    -------------------
    - Parsing:
        * `std::expected<document, Error> parse(std::string_view, const ParseOptions& = {})`
        * `std::expected<document, Error> parse(std::string&&, const ParseOptions& = {})`
        * `std::expected<document, Error> parse(std::istream&, const ParseOptions& = {})`
        * One forward scan builds the structural index: every value's kind
          and byte extent plus, for containers, the table of immediate
          children. Scalars are validated but decoded lazily on access
    - Access:
        * `node` handles are two words wide and never allocate. Navigation
          by key is linear in sibling count, by array index O(1)
        * Strict getters report `Error`; `..._or` getters substitute a default
    - Caching:
        * `path_cache` memoizes path resolutions per document with LRU
          capacity and TTL expiry. It is an explicit object, not global state
    - Query and aggregation:
        * Operate over the children of an array (or the member values of an
          object) without copying any JSON text

    ------------
    Design Goals
    ------------
    - No copy of the input beyond the single owning buffer in `document`
    - No heap allocation on the common access paths
    - Documents and nodes are safe for concurrent readers
    - Malformed, truncated or adversarially deep input fails cleanly with
      a typed error; nothing aborts

    -----
    Usage
    -----
        #include <stanza/stanza.hpp>

        int main() {
            auto doc = Stanza::parse(R"({"user":{"name":"ada","langs":["c++","ml"]}})");
            if (!doc) {
                std::println("Parse Error: {}", doc.error().what());
                return 1;
            }

            Stanza::node root = doc->root();
            std::println("{}", root.get_path("user.langs.0").string_or("?"));
        }

    Include this header for the full Stanza API, or individual headers such as
    `node.hpp`, `error.hpp`, `options.hpp` and `query.hpp` for finer control.
*/

/// @defgroup Stanza Stanza JSON Library
/// @brief Core types and functions for Stanza

/// @defgroup StanzaAPI Top-level Parsing API
/// @ingroup Stanza
/// @brief Free functions for building documents

#include <expected>
#include <iosfwd>
#include <string>
#include <string_view>

#include "stanza/aggregate.hpp"
#include "stanza/document.hpp"
#include "stanza/error.hpp"
#include "stanza/log.hpp"
#include "stanza/node.hpp"
#include "stanza/options.hpp"
#include "stanza/path_cache.hpp"
#include "stanza/query.hpp"
#include "stanza/validate.hpp"

namespace Stanza {

    /// @ingroup StanzaAPI
    /// @brief Result type of every `parse(...)` overload
    ///
    /// @details
    /// On success the `document` owns the text and its structural index.
    /// On failure the `Error` carries the category (`parse`, `depth_limit`
    /// or `memory_limit`), the byte offset, line/column and a short source
    /// excerpt. No partially indexed document is ever returned.
    using ParseResult = std::expected<document, Error>;

    /// @ingroup StanzaAPI
    /// @brief Parses a JSON document from a string view
    ///
    /// @details
    /// The bytes of @p input are copied once into the document, which owns
    /// them from then on. Use the `std::string&&` overload to hand over an
    /// existing buffer without that copy.
    ///
    /// Example:
    /// @code
    /// auto res = Stanza::parse(R"({"x":42})");
    /// if (!res) {
    ///     std::cerr << res.error().what() << '\n';
    /// } else {
    ///     std::cout << res->root()["x"].int_or(0);
    /// }
    /// @endcode
    ///
    /// @param input UTF-8 encoded JSON text containing one value
    /// @param opts Resource limits and strictness
    /// @return A `ParseResult` containing either a document or an error
    [[nodiscard]] STANZA_API ParseResult parse(std::string_view input, const ParseOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Parses a JSON document, taking ownership of @p input
    [[nodiscard]] STANZA_API ParseResult parse(std::string&& input, const ParseOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Parses a JSON document from a null-terminated string
    [[nodiscard]] inline ParseResult parse(const char* input, const ParseOptions& opts = {}) {
        return parse(std::string_view{ input }, opts);
    }

    /// @ingroup StanzaAPI
    /// @brief Parses a JSON document read entirely from an input stream
    [[nodiscard]] STANZA_API ParseResult parse(std::istream& is, const ParseOptions& opts = {});

} // namespace Stanza
