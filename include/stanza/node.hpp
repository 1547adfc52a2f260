#pragma once


/*
    -------------------------------------------
    Stanza::node - Zero-copy JSON value handle
    -------------------------------------------
    A `node` is a (document, index) pair pointing at one entry of a
    document's structural index. It never owns or copies the source text;
    every accessor reads the original bytes in place.

    -------------------
    The Structural Index
    -------------------
    Parsing scans the text once and records, for every JSON value, an
    `entry` holding its kind and byte extent. Containers additionally point
    at a contiguous run of `slot`s, one per immediate child, in document
    order. Object slots carry the raw key span of their member. Scalars are
    validated while indexing but decoded only when an accessor asks.

    ---------
    Absent Nodes
    ---------
    A default-constructed node, or any node produced by a failed lookup,
    is *absent*: `exists()` is false, `type()` is `kind::invalid`, every
    navigation returns another absent node and every safe accessor
    returns its default. Nothing on a node throws or aborts.

    -----------
    Access Families
    -----------
    - Navigation: `get(key)`, `index(i)`, `get_path("a.b[2].c")`, `operator[]`
    - Strict getters: `get_string()`, `get_int()`, `get_uint()`,
      `get_float()`, `get_bool()` return `std::expected<T, Error>` with
      `not_found` for absent nodes and `type_mismatch` otherwise
    - Safe getters: `string_or(d)`, `int_or(d)`, ... return @p d on any
      failure. Only the literal JSON type is accepted: the string `"28"`
      is never read as the number 28
    - Traversal: `for_each`, `array_for_each`, `walk`, and the lazy
      `members()` / `elements()` ranges

    -------------
    Thread-Safety
    -------------
    - The index and text are immutable after parsing, so nodes from the
      same document may be read from any number of threads concurrently
    - A node is valid only while a `document` handle for its data lives
*/

/// @defgroup StanzaNode Node Access
/// @ingroup Stanza

#include <cstddef>
#include <cstdint>
#include <expected>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"

namespace Stanza {

    /// @brief Enumerates the JSON value kinds recorded in the structural index
    enum class kind : uint8_t {
        invalid, ///< Absent value; never stored for real input
        object,  ///< JSON object
        array,   ///< JSON array
        string,  ///< JSON string
        number,  ///< JSON number
        boolean, ///< `true` or `false`
        null,    ///< `null`
    };

    /// @brief Name of a kind, e.g. `"object"`
    [[nodiscard]] STANZA_API std::string_view to_string(kind k) noexcept;

    class query_builder;
    class aggregator;
    class node;

    /// @brief Object members keyed by decoded key, as produced by `pick`, `omit` and `merge`
    using node_map = std::map<std::string, node, std::less<>>;

    namespace detail {

        inline constexpr uint32_t invalid_index = std::numeric_limits<uint32_t>::max();

        /// One structural index entry. `start`/`end` delimit the value's
        /// bytes; containers own `child_count` slots from `children_start`.
        struct entry {
            kind type = kind::invalid;
            uint32_t start = 0;
            uint32_t end = 0;
            uint32_t children_start = 0;
            uint32_t child_count = 0;
        };

        /// One immediate child of a container. Key fields are unused for
        /// array elements.
        struct slot {
            uint32_t key_start = 0;
            uint32_t key_len = 0;
            uint32_t value = invalid_index;
            bool key_escaped = false;
        };

        /// Immutable result of one parse. Shared by every `document`
        /// handle and referenced by every node.
        struct document_data {
            std::string text;
            std::vector<entry> entries;
            std::vector<slot> slots;
            uint64_t id = 0;
        };

        /// Decodes a raw string span (no surrounding quotes) into UTF-8.
        STANZA_API void decode_string(std::string_view raw, std::string& out);

    } // namespace detail

    /// @ingroup StanzaNode
    /// @brief One object member as seen by `node::members()`
    struct member;

    /// @ingroup StanzaNode
    /// @brief Lightweight, immutable handle to a JSON value inside a document
    class node {
    public:
        /// @brief Constructs an absent node
        node() noexcept = default;

        /// @brief Internal constructor used by the parser and the path cache
        node(const detail::document_data* doc, uint32_t index) noexcept
            : m_Doc{ doc }, m_Index{ index } {}

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        /// @brief True if the node refers to a real value
        [[nodiscard]] bool exists() const noexcept { return m_Doc != nullptr && m_Index < m_Doc->entries.size(); }

        /// @brief Kind of the referenced value, `kind::invalid` if absent
        [[nodiscard]] kind type() const noexcept { return exists() ? m_Doc->entries[m_Index].type : kind::invalid; }

        /// @brief Name of the referenced kind
        [[nodiscard]] std::string_view type_name() const noexcept { return to_string(type()); }

        [[nodiscard]] bool is_object()  const noexcept { return type() == kind::object;  }
        [[nodiscard]] bool is_array()   const noexcept { return type() == kind::array;   }
        [[nodiscard]] bool is_string()  const noexcept { return type() == kind::string;  }
        [[nodiscard]] bool is_number()  const noexcept { return type() == kind::number;  }
        [[nodiscard]] bool is_bool()    const noexcept { return type() == kind::boolean; }
        [[nodiscard]] bool is_null()    const noexcept { return type() == kind::null;    }

        /// @brief Number of immediate children (duplicate keys counted), 0 for scalars
        [[nodiscard]] std::size_t size() const noexcept { return exists() ? entry().child_count : 0; }

        /// @brief True for `""`, `[]`, `{}`, `null` and absent nodes
        [[nodiscard]] STANZA_API bool is_empty() const noexcept;

        /// @brief Exact source bytes of the value, empty if absent
        [[nodiscard]] STANZA_API std::string_view raw() const noexcept;

        /// @brief Source lexeme of a number, empty for other kinds
        [[nodiscard]] STANZA_API std::string_view number_text() const noexcept;

        /// @brief Undecoded content of a string (escapes left in place), empty for other kinds
        [[nodiscard]] STANZA_API std::string_view raw_string() const noexcept;

        /// @brief Index of this node in the document's structural index
        [[nodiscard]] uint32_t index_in_document() const noexcept { return m_Index; }

        /// @brief The document data this node reads from, or nullptr
        [[nodiscard]] const detail::document_data* data() const noexcept { return m_Doc; }

        // ------------------------------------------------------------
        // Navigation
        // ------------------------------------------------------------

        /// @ingroup StanzaNode
        /// @brief Looks up an object member by key
        ///
        /// @details
        /// Scans the member slots in document order and returns the value of
        /// the *last* member named @p key, so duplicate keys resolve
        /// last-wins. Escaped keys are compared in decoded form. Returns an
        /// absent node if this is not an object or no member matches.
        [[nodiscard]] STANZA_API node get(std::string_view key) const;

        /// @ingroup StanzaNode
        /// @brief Returns the @p i-th array element in O(1)
        ///
        /// @details
        /// Returns an absent node if this is not an array or @p i is out of range.
        [[nodiscard]] STANZA_API node index(std::size_t i) const noexcept;

        /// @ingroup StanzaNode
        /// @brief Resolves a dotted/indexed path such as `a.b.2.c` or `a.b[2].c`
        ///
        /// @details
        /// Segments are separated by `.`. Against an array, a digits-only
        /// segment is an element index; against an object, every segment is
        /// a member key, digits included. A `[n]` suffix always indexes an
        /// array. Resolution stops at the first segment that cannot be
        /// resolved and returns an absent node; applying a segment to a
        /// scalar is not an error, it simply yields an absent node. The
        /// empty path names nothing and is absent as well.
        [[nodiscard]] STANZA_API node get_path(std::string_view path) const;

        /// @brief Shorthand for `get(key)`
        [[nodiscard]] node operator[](std::string_view key) const { return get(key); }

        /// @brief Shorthand for `get(key)`
        [[nodiscard]] node operator[](const char* key) const { return get(key); }

        /// @brief Shorthand for `index(i)`
        [[nodiscard]] node operator[](std::size_t i) const noexcept { return index(i); }

        /// @brief First array element, absent if empty or not an array
        [[nodiscard]] node first() const noexcept { return index(0); }

        /// @brief Last array element, absent if empty or not an array
        [[nodiscard]] node last() const noexcept { return is_array() && size() > 0 ? index(size() - 1) : node{}; }

        /// @brief Elements in `[begin, end)` of an array, clamped to its bounds
        [[nodiscard]] STANZA_API std::vector<node> slice(std::size_t begin, std::size_t end) const;

        /// @brief Array elements in reverse order, empty for non-arrays
        [[nodiscard]] STANZA_API std::vector<node> reverse() const;

        /// @brief Resolves several paths at once, in order
        [[nodiscard]] STANZA_API std::vector<node> get_multiple(std::span<const std::string_view> paths) const;

        /// @brief True if at least one of @p paths resolves
        [[nodiscard]] STANZA_API bool has_any_path(std::span<const std::string_view> paths) const;

        /// @brief True if every one of @p paths resolves
        [[nodiscard]] STANZA_API bool has_all_paths(std::span<const std::string_view> paths) const;

        [[nodiscard]] std::vector<node> get_multiple(std::initializer_list<std::string_view> paths) const {
            return get_multiple(std::span<const std::string_view>{ paths.begin(), paths.size() });
        }
        [[nodiscard]] bool has_any_path(std::initializer_list<std::string_view> paths) const {
            return has_any_path(std::span<const std::string_view>{ paths.begin(), paths.size() });
        }
        [[nodiscard]] bool has_all_paths(std::initializer_list<std::string_view> paths) const {
            return has_all_paths(std::span<const std::string_view>{ paths.begin(), paths.size() });
        }

        // ------------------------------------------------------------
        // Object projections
        // ------------------------------------------------------------

        /// @brief Members whose decoded key is one of @p keys; empty for non-objects
        [[nodiscard]] STANZA_API node_map pick(std::span<const std::string_view> keys) const;

        /// @brief Members whose decoded key is not one of @p keys; empty for non-objects
        [[nodiscard]] STANZA_API node_map omit(std::span<const std::string_view> keys) const;

        /// @brief Shallow merge of this object's members with @p other's
        ///
        /// @details
        /// Members of @p other replace same-named members of this object.
        /// A side that is not an object contributes nothing. The values
        /// remain nodes of their own documents.
        [[nodiscard]] STANZA_API node_map merge(const node& other) const;

        [[nodiscard]] node_map pick(std::initializer_list<std::string_view> keys) const {
            return pick(std::span<const std::string_view>{ keys.begin(), keys.size() });
        }
        [[nodiscard]] node_map omit(std::initializer_list<std::string_view> keys) const {
            return omit(std::span<const std::string_view>{ keys.begin(), keys.size() });
        }

        // ------------------------------------------------------------
        // Strict accessors
        // ------------------------------------------------------------

        /// @ingroup StanzaNode
        /// @brief Decoded value of a JSON string
        /// @return The string, `not_found` if absent, `type_mismatch` if not a string
        [[nodiscard]] STANZA_API std::expected<std::string, Error> get_string() const;

        /// @ingroup StanzaNode
        /// @brief Value of a JSON number as a signed 64-bit integer
        ///
        /// @details
        /// Integral lexemes are read exactly. Any other number is decoded as
        /// a double and truncated toward zero. Values outside the `int64_t`
        /// range fail with `type_mismatch`.
        [[nodiscard]] STANZA_API std::expected<std::int64_t, Error> get_int() const;

        /// @brief Value of a non-negative JSON number as an unsigned 64-bit integer
        [[nodiscard]] STANZA_API std::expected<std::uint64_t, Error> get_uint() const;

        /// @brief Value of a JSON number as a double
        [[nodiscard]] STANZA_API std::expected<double, Error> get_float() const;

        /// @brief Value of a JSON boolean
        [[nodiscard]] STANZA_API std::expected<bool, Error> get_bool() const;

        // ------------------------------------------------------------
        // Safe accessors
        // ------------------------------------------------------------

        [[nodiscard]] STANZA_API std::string string_or(std::string_view def) const;
        [[nodiscard]] STANZA_API std::int64_t int_or(std::int64_t def) const noexcept;
        [[nodiscard]] STANZA_API std::uint64_t uint_or(std::uint64_t def) const noexcept;
        [[nodiscard]] STANZA_API double float_or(double def) const noexcept;
        [[nodiscard]] STANZA_API bool bool_or(bool def) const noexcept;

        /// @brief True for a number without fractional part
        [[nodiscard]] STANZA_API bool is_integer() const noexcept;

        /// @brief True for a number in `[min, max]`
        [[nodiscard]] STANZA_API bool in_range(double min, double max) const noexcept;

        [[nodiscard]] STANZA_API bool is_positive() const noexcept;
        [[nodiscard]] STANZA_API bool is_negative() const noexcept;
        [[nodiscard]] STANZA_API bool is_zero() const noexcept;

        // ------------------------------------------------------------
        // String checks
        // ------------------------------------------------------------
        // All of these are false for anything but a JSON string, and
        // operate on the decoded text.

        [[nodiscard]] STANZA_API bool contains(std::string_view needle) const;
        [[nodiscard]] STANZA_API bool starts_with(std::string_view prefix) const;
        [[nodiscard]] STANZA_API bool ends_with(std::string_view suffix) const;

        /// @brief `local@domain.tld` with a top-level domain of two or more letters
        [[nodiscard]] STANZA_API bool is_valid_email() const;

        /// @brief Absolute URL with a scheme and a non-empty host
        [[nodiscard]] STANZA_API bool is_valid_url() const;

        /// @brief Canonical 8-4-4-4-12 hexadecimal UUID
        [[nodiscard]] STANZA_API bool is_valid_uuid() const;

        /// @brief Dotted quad, each part 0-255 with at most three digits
        [[nodiscard]] STANZA_API bool is_valid_ipv4() const;

        /// @brief Colon-separated IPv6 address, `::` compression, optional
        ///        trailing dotted quad and `%zone` suffix
        [[nodiscard]] STANZA_API bool is_valid_ipv6() const;

        [[nodiscard]] bool is_valid_ip() const { return is_valid_ipv4() || is_valid_ipv6(); }

        // ------------------------------------------------------------
        // Array conversions
        // ------------------------------------------------------------

        [[nodiscard]] STANZA_API std::expected<std::vector<std::string>, Error> to_string_vector() const;
        [[nodiscard]] STANZA_API std::expected<std::vector<std::int64_t>, Error> to_int_vector() const;
        [[nodiscard]] STANZA_API std::expected<std::vector<double>, Error> to_float_vector() const;
        [[nodiscard]] STANZA_API std::expected<std::vector<bool>, Error> to_bool_vector() const;

        /// @brief Raw key spans of an object's members in document order
        [[nodiscard]] STANZA_API std::vector<std::string_view> keys() const;

        // ------------------------------------------------------------
        // Iteration
        // ------------------------------------------------------------

        class element_range;
        class member_range;

        /// @brief Lazy range of array elements; empty for non-arrays
        [[nodiscard]] element_range elements() const noexcept;

        /// @brief Lazy range of object members; empty for non-objects
        [[nodiscard]] member_range members() const noexcept;

        /// @ingroup StanzaNode
        /// @brief Calls `fn(index, node)` for each array element until it returns false
        template<typename Fn>
        void array_for_each(Fn&& fn) const {
            if (!is_array()) return;
            const auto& e = entry();
            for (uint32_t i = 0; i < e.child_count; i++) {
                const auto& s = m_Doc->slots[e.children_start + i];
                if (!fn(static_cast<std::size_t>(i), node{ m_Doc, s.value })) return;
            }
        }

        /// @ingroup StanzaNode
        /// @brief Calls `fn(key, node)` for each object member until it returns false
        ///
        /// @details
        /// Duplicate keys are all visited, in document order. @p key is the
        /// raw (undecoded) key span and stays valid as long as the document.
        template<typename Fn>
        void for_each(Fn&& fn) const {
            if (!is_object()) return;
            const auto& e = entry();
            for (uint32_t i = 0; i < e.child_count; i++) {
                const auto& s = m_Doc->slots[e.children_start + i];
                std::string_view key{ m_Doc->text.data() + s.key_start, s.key_len };
                if (!fn(key, node{ m_Doc, s.value })) return;
            }
        }

        /// @ingroup StanzaNode
        /// @brief Depth-first traversal calling `fn(path, node)` for every descendant
        ///
        /// @details
        /// Paths use the `get_path` syntax (`a.b.0.c`) with decoded keys.
        /// Returning false from @p fn stops the whole traversal. Paths through
        /// a key that is empty or contains `.` or `[` do not resolve back
        /// through `get_path`. Allocates path strings; prefer
        /// `for_each`/`array_for_each` when a full walk is not needed.
        template<typename Fn>
        void walk(Fn&& fn) const {
            std::string path;
            walk_impl(fn, path, true);
        }

        /// @brief Calls `fn(node, index)` for each array element until it returns false
        /// @return `type_mismatch` if this is not an array
        template<typename Fn>
        std::expected<void, Error> stream(Fn&& fn) const {
            if (!is_array()) return std::unexpected(mismatch("array"));
            array_for_each([&](std::size_t i, node n) { return fn(n, i); });
            return {};
        }

        // ------------------------------------------------------------
        // Query / aggregation
        // ------------------------------------------------------------

        /// @brief Starts a filter/sort/paginate pipeline over this node's children
        [[nodiscard]] STANZA_API query_builder query() const;

        /// @brief Starts a grouping/reduction pipeline over this node's children
        [[nodiscard]] STANZA_API aggregator aggregate() const;

        // ------------------------------------------------------------
        // Comparison
        // ------------------------------------------------------------

        /// @brief Identity: same document data and same index
        friend bool operator==(const node& lhs, const node& rhs) noexcept {
            return lhs.m_Doc == rhs.m_Doc && lhs.m_Index == rhs.m_Index;
        }

        /// @brief Structural JSON equality; object member order is ignored
        [[nodiscard]] STANZA_API bool equals(const node& other) const;

        /// @brief Builds the `type_mismatch`/`not_found` error for this node
        [[nodiscard]] STANZA_API Error mismatch(std::string_view expected) const;

    private:
        const detail::document_data* m_Doc = nullptr;
        uint32_t m_Index = detail::invalid_index;

        [[nodiscard]] const detail::entry& entry() const noexcept { return m_Doc->entries[m_Index]; }

        template<typename Fn>
        bool walk_impl(Fn& fn, std::string& path, bool top) const {
            const std::size_t base = path.size();
            bool keep_going = true;
            auto visit = [&](std::string_view segment, node child) {
                if (!top) path.push_back('.');
                path.append(segment);
                keep_going = fn(static_cast<const std::string&>(path), child) && child.walk_impl(fn, path, false);
                path.resize(base);
                return keep_going;
            };
            if (is_object()) {
                std::string decoded;
                for_each([&](std::string_view key, node child) {
                    if (key.find('\\') == std::string_view::npos) return visit(key, child);
                    detail::decode_string(key, decoded);
                    return visit(decoded, child);
                });
            } else if (is_array()) {
                array_for_each([&](std::size_t i, node child) { return visit(std::to_string(i), child); });
            }
            return keep_going;
        }
    };

    struct member {
        std::string_view key; ///< Raw key span, escapes left in place
        node value;
    };

    /// @brief Forward range over the elements of one array
    class node::element_range {
    public:
        class iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = node;
            using difference_type = std::ptrdiff_t;
            using reference = node;

            iterator() noexcept = default;
            iterator(const detail::document_data* doc, const detail::slot* s) noexcept : m_Doc{ doc }, m_Slot{ s } {}

            node operator*() const noexcept { return node{ m_Doc, m_Slot->value }; }
            iterator& operator++() noexcept { ++m_Slot; return *this; }
            iterator operator++(int) noexcept { auto tmp = *this; ++m_Slot; return tmp; }
            friend bool operator==(const iterator& a, const iterator& b) noexcept { return a.m_Slot == b.m_Slot; }

        private:
            const detail::document_data* m_Doc = nullptr;
            const detail::slot* m_Slot = nullptr;
        };

        element_range() noexcept = default;
        element_range(const detail::document_data* doc, const detail::slot* first, const detail::slot* last) noexcept
            : m_Begin{ doc, first }, m_End{ doc, last } {}

        [[nodiscard]] iterator begin() const noexcept { return m_Begin; }
        [[nodiscard]] iterator end() const noexcept { return m_End; }

    private:
        iterator m_Begin{};
        iterator m_End{};
    };

    /// @brief Forward range over the members of one object
    class node::member_range {
    public:
        class iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = member;
            using difference_type = std::ptrdiff_t;
            using reference = member;

            iterator() noexcept = default;
            iterator(const detail::document_data* doc, const detail::slot* s) noexcept : m_Doc{ doc }, m_Slot{ s } {}

            member operator*() const noexcept {
                return member{ std::string_view{ m_Doc->text.data() + m_Slot->key_start, m_Slot->key_len },
                               node{ m_Doc, m_Slot->value } };
            }
            iterator& operator++() noexcept { ++m_Slot; return *this; }
            iterator operator++(int) noexcept { auto tmp = *this; ++m_Slot; return tmp; }
            friend bool operator==(const iterator& a, const iterator& b) noexcept { return a.m_Slot == b.m_Slot; }

        private:
            const detail::document_data* m_Doc = nullptr;
            const detail::slot* m_Slot = nullptr;
        };

        member_range() noexcept = default;
        member_range(const detail::document_data* doc, const detail::slot* first, const detail::slot* last) noexcept
            : m_Begin{ doc, first }, m_End{ doc, last } {}

        [[nodiscard]] iterator begin() const noexcept { return m_Begin; }
        [[nodiscard]] iterator end() const noexcept { return m_End; }

    private:
        iterator m_Begin{};
        iterator m_End{};
    };

    inline node::element_range node::elements() const noexcept {
        if (!is_array() || entry().child_count == 0) return {};
        const auto* first = m_Doc->slots.data() + entry().children_start;
        return { m_Doc, first, first + entry().child_count };
    }

    inline node::member_range node::members() const noexcept {
        if (!is_object() || entry().child_count == 0) return {};
        const auto* first = m_Doc->slots.data() + entry().children_start;
        return { m_Doc, first, first + entry().child_count };
    }

    namespace detail {
        /// Field lookup used by queries and aggregations: the empty field
        /// names the element itself.
        inline node field_of(const node& element, std::string_view field) {
            return field.empty() ? element : element.get_path(field);
        }
    } // namespace detail

} // namespace Stanza
