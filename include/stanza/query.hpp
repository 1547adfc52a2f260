#pragma once


/*
    -------------------------------------------------
    Stanza::query_builder - Filter, sort and paginate
    -------------------------------------------------
    A `query_builder` runs a small pipeline over the children of one node
    (the elements of an array, or the member values of an object):

        1. every `where*` clause is applied in order; an element must pass
           all of them (AND), and evaluation stops at the first failure
        2. the survivors are stably sorted by the `sort_by` keys, in order
        3. `offset` and then `limit` cut the page out of the sorted list

    Fields are paths relative to each element (`"user.age"`); the empty
    field names the element itself, for arrays of scalars. An element
    that lacks a field referenced by a clause fails that clause, whatever
    the operator; the field is never replaced by a default.

    ----------
    Comparison
    ----------
    Values are compared numerically when both sides are numbers, where a
    string that spells a complete number counts as one. Otherwise two
    strings compare lexically and two booleans compare `false < true`.
    A number against a non-numeric string compares their text forms.
    Other pairings (arrays, objects, `null` against a non-null) are not
    ordered: every operator fails except `!=` and `not_in`.

    Sorting needs a total order, so `sort_by` ranks kinds first:
    `null` < booleans < numbers (and numeric strings) < other strings <
    arrays and objects. Within a rank numbers compare by value, strings
    lexically and containers are all equivalent.

    -----
    Usage
    -----
        auto adults = doc.root()["people"].query()
                          .where("age", ">=", 18)
                          .sort_by("name", "asc")
                          .limit(10)
                          .to_vector();

    Builders are cheap value types holding a node and the clause list;
    they never touch the document text until a terminal call.
*/

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/node.hpp"

namespace Stanza {

    /// @brief Comparison operators understood by `query_builder::where`
    enum class op : uint8_t {
        eq,       ///< `=`
        ne,       ///< `!=`
        gt,       ///< `>`
        ge,       ///< `>=`
        lt,       ///< `<`
        le,       ///< `<=`
        in,       ///< `in`
        not_in,   ///< `not_in`
        contains, ///< `contains`
    };

    /// @brief Parses an operator spelling such as `">="` or `"not_in"`
    [[nodiscard]] STANZA_API std::optional<op> parse_op(std::string_view text) noexcept;

    /// @brief Canonical spelling of an operator
    [[nodiscard]] STANZA_API std::string_view to_string(op o) noexcept;

    /// @brief A literal operand of a query clause
    class scalar {
    public:
        using storage_t = std::variant<std::nullptr_t, bool, double, std::string>;

        scalar() noexcept : m_Storage{ nullptr } {}
        scalar(std::nullptr_t) noexcept : m_Storage{ nullptr } {}
        scalar(bool b) noexcept : m_Storage{ b } {}

        template<typename T>
            requires (std::is_arithmetic_v<T> && !std::same_as<T, bool>)
        scalar(T n) noexcept : m_Storage{ static_cast<double>(n) } {}

        scalar(const char* s) : m_Storage{ std::string{ s } } {}
        scalar(std::string_view s) : m_Storage{ std::string{ s } } {}
        scalar(std::string s) noexcept : m_Storage{ std::move(s) } {}

        [[nodiscard]] bool is_null()   const noexcept { return std::holds_alternative<std::nullptr_t>(m_Storage); }
        [[nodiscard]] bool is_bool()   const noexcept { return std::holds_alternative<bool>(m_Storage); }
        [[nodiscard]] bool is_number() const noexcept { return std::holds_alternative<double>(m_Storage); }
        [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(m_Storage); }

        [[nodiscard]] bool as_bool() const { return std::get<bool>(m_Storage); }
        [[nodiscard]] double as_number() const { return std::get<double>(m_Storage); }
        [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(m_Storage); }

        [[nodiscard]] const storage_t& storage() const noexcept { return m_Storage; }

    private:
        storage_t m_Storage;
    };

    /// @brief Filter/sort/paginate pipeline over a node's children
    class query_builder {
    public:
        /// @brief Builds a query over the children of @p source
        explicit query_builder(node source) noexcept : m_Source{ source } {}

        /// @brief Keeps elements whose @p field compares to @p value under @p o
        ///
        /// @details
        /// With `op::in` / `op::not_in` the single @p value acts as a
        /// one-element list. `op::contains` requires both the field and
        /// @p value to be strings.
        STANZA_API query_builder& where(std::string_view field, op o, scalar value);

        /// @brief Same as above with the operator spelled as text
        ///
        /// @details
        /// An unknown spelling is remembered and reported as a
        /// `validation` error by the terminal call.
        STANZA_API query_builder& where(std::string_view field, std::string_view o, scalar value);

        /// @brief Keeps elements whose @p field equals one of @p values
        STANZA_API query_builder& where_in(std::string_view field, std::vector<scalar> values);

        /// @brief Keeps elements that have @p field and whose value equals none of @p values
        STANZA_API query_builder& where_not_in(std::string_view field, std::vector<scalar> values);

        /// @brief Keeps elements whose string @p field contains @p needle
        STANZA_API query_builder& where_contains(std::string_view field, std::string_view needle);

        /// @brief Adds a sort key; @p order is `"asc"` or `"desc"`
        STANZA_API query_builder& sort_by(std::string_view field, std::string_view order = "asc");

        /// @brief Keeps at most @p n results; `limit(0)` keeps none
        query_builder& limit(std::size_t n) noexcept { m_Limit = n; return *this; }

        /// @brief Skips the first @p n results
        query_builder& offset(std::size_t n) noexcept { m_Offset = n; return *this; }

        // ------------------------------------------------------------
        // Terminal operations
        // ------------------------------------------------------------

        /// @brief Runs the pipeline
        /// @return The selected nodes in result order, or an error if the
        ///         source is absent (`not_found`), not a container
        ///         (`type_mismatch`) or a clause was malformed (`validation`)
        [[nodiscard]] STANZA_API std::expected<std::vector<node>, Error> to_vector() const;

        /// @brief Number of nodes `to_vector()` would return
        [[nodiscard]] STANZA_API std::expected<std::size_t, Error> count() const;

        /// @brief First node `to_vector()` would return, `not_found` if there is none
        [[nodiscard]] STANZA_API std::expected<node, Error> first() const;

    private:
        struct condition {
            std::string field;
            op oper = op::eq;
            std::vector<scalar> values;
        };

        struct sort_key {
            std::string field;
            bool descending = false;
        };

        node m_Source;
        std::vector<condition> m_Conditions;
        std::vector<sort_key> m_Sort;
        std::size_t m_Offset = 0;
        std::optional<std::size_t> m_Limit;
        std::optional<Error> m_Invalid;

        [[nodiscard]] bool matches(node element) const;
        [[nodiscard]] std::expected<std::vector<node>, Error> filtered() const;
    };

} // namespace Stanza
