#pragma once


/*
    ----------------------------------------------
    Stanza::aggregator - Grouping and reduction
    ----------------------------------------------
    An `aggregator` reduces the children of a node (array elements, or the
    member values of an object) to named metrics:

        - `count(alias)`            number of elements, valid fields or not
        - `sum(field, alias)`       sum of the numeric values of @p field
        - `avg(field, alias)`       their mean, `0.0` when there are none
        - `max/min(field, alias)`   extreme value, `null` when there are none

    Elements whose field is missing or not a number are skipped by the
    numeric metrics; they never fail the computation.

    -------
    Results
    -------
    Results are `agg_value`s, a tagged union of null, integer, float,
    string and group (an ordered map of name to `agg_value`).

    - Without `group_by` the result is one group: alias -> metric
    - With `group_by(f1, ..., fn)` elements are bucketed by the values of
      those fields joined with `|`, and the result maps each bucket key to
      its own alias -> metric group. A missing field contributes an empty
      component; strings contribute their decoded text, numbers their
      source lexeme and containers their raw JSON

        auto totals = root["orders"].aggregate()
                          .group_by("region")
                          .sum("amount", "total")
                          .count("orders")
                          .execute();
        double emea = (*totals)["emea"]["total"].as_float();
*/

#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/node.hpp"

namespace Stanza {

    class agg_value;

    /// @brief Named members of a grouped aggregation result
    using agg_group = std::map<std::string, agg_value, std::less<>>;

    /// @brief One value of an aggregation result
    class agg_value {
    public:
        using storage_t = std::variant<
            std::monostate,
            std::int64_t,
            double,
            std::string,
            agg_group
        >;

        agg_value() noexcept = default;
        agg_value(std::int64_t i) noexcept : m_Storage{ i } {}
        agg_value(double d) noexcept : m_Storage{ d } {}
        agg_value(std::string s) noexcept : m_Storage{ std::move(s) } {}
        agg_value(agg_group g) noexcept : m_Storage{ std::move(g) } {}

        [[nodiscard]] bool is_null()   const noexcept { return std::holds_alternative<std::monostate>(m_Storage); }
        [[nodiscard]] bool is_int()    const noexcept { return std::holds_alternative<std::int64_t>(m_Storage); }
        [[nodiscard]] bool is_float()  const noexcept { return std::holds_alternative<double>(m_Storage); }
        [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(m_Storage); }
        [[nodiscard]] bool is_group()  const noexcept { return std::holds_alternative<agg_group>(m_Storage); }

        /// @brief The stored integer; throws `std::bad_variant_access` on the wrong kind
        [[nodiscard]] std::int64_t as_int() const { return std::get<std::int64_t>(m_Storage); }
        [[nodiscard]] double as_float() const { return std::get<double>(m_Storage); }
        [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(m_Storage); }
        [[nodiscard]] const agg_group& as_group() const { return std::get<agg_group>(m_Storage); }

        /// @brief Integer or float value as a double, @p def for other kinds
        [[nodiscard]] STANZA_API double number_or(double def) const noexcept;

        /// @brief Member @p key of a group, or nullptr
        [[nodiscard]] STANZA_API const agg_value* find(std::string_view key) const;

        /// @brief Member @p key of a group, or a null value
        [[nodiscard]] STANZA_API const agg_value& operator[](std::string_view key) const;

        /// @brief Number of members of a group, 0 otherwise
        [[nodiscard]] STANZA_API std::size_t size() const noexcept;

        [[nodiscard]] const storage_t& storage() const noexcept { return m_Storage; }

    private:
        storage_t m_Storage{};
    };

    /// @brief Grouping/reduction pipeline over a node's children
    class aggregator {
    public:
        aggregator() noexcept = default;

        /// @brief Aggregator bound to @p source for `execute()`
        explicit aggregator(node source) noexcept : m_Source{ source } {}

        STANZA_API aggregator& count(std::string_view alias);
        STANZA_API aggregator& sum(std::string_view field, std::string_view alias);
        STANZA_API aggregator& avg(std::string_view field, std::string_view alias);
        STANZA_API aggregator& max(std::string_view field, std::string_view alias);
        STANZA_API aggregator& min(std::string_view field, std::string_view alias);

        /// @brief Buckets elements by the values of @p fields before reducing
        template<typename... Fields>
        aggregator& group_by(Fields&&... fields) {
            (m_GroupBy.emplace_back(std::forward<Fields>(fields)), ...);
            return *this;
        }

        /// @brief Runs the pipeline over the node this aggregator was created from
        [[nodiscard]] STANZA_API std::expected<agg_value, Error> execute() const;

        /// @brief Runs the pipeline over the children of @p source
        /// @return A group, or `not_found` / `type_mismatch` if @p source is
        ///         absent or not a container
        [[nodiscard]] STANZA_API std::expected<agg_value, Error> execute(node source) const;

    private:
        enum class metric_kind : uint8_t { count, sum, avg, max, min };

        struct metric {
            metric_kind fn = metric_kind::count;
            std::string field;
            std::string alias;
        };

        node m_Source;
        std::vector<metric> m_Metrics;
        std::vector<std::string> m_GroupBy;

        aggregator& add(metric_kind fn, std::string_view field, std::string_view alias);
        [[nodiscard]] agg_group reduce(const std::vector<node>& items) const;
        [[nodiscard]] std::string group_key(node item) const;
    };

} // namespace Stanza
