#include "stanza/query.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <numeric>


namespace Stanza {

    std::optional<op> parse_op(std::string_view text) noexcept {
        if (text == "=" || text == "==") return op::eq;
        if (text == "!=") return op::ne;
        if (text == ">")  return op::gt;
        if (text == ">=") return op::ge;
        if (text == "<")  return op::lt;
        if (text == "<=") return op::le;
        if (text == "in") return op::in;
        if (text == "not_in") return op::not_in;
        if (text == "contains") return op::contains;
        return std::nullopt;
    }

    std::string_view to_string(op o) noexcept {
        switch (o) {
        case op::eq: return "=";
        case op::ne: return "!=";
        case op::gt: return ">";
        case op::ge: return ">=";
        case op::lt: return "<";
        case op::le: return "<=";
        case op::in: return "in";
        case op::not_in: return "not_in";
        case op::contains: return "contains";
        }
        return "?";
    }

#pragma region Comparison
    namespace {

        // Decoded form of one side of a comparison.
        struct operand {
            enum class tag : uint8_t { other, null, boolean, number, string };

            tag type = tag::other;
            bool boolean = false;
            bool numeric = false; // number, or a string spelling one
            double num = 0.0;
            std::string text;     // string contents or the number's lexeme
        };

        bool spells_number(std::string_view s, double& out) noexcept {
            if (s.empty()) return false;
            if (!std::all_of(s.begin(), s.end(), [](char c) {
                    return (c >= '0' && c <= '9') || c == '-' || c == '.' || c == 'e' || c == 'E' || c == '+';
                }))
                return false;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            return ec == std::errc{} && ptr == s.data() + s.size();
        }

        operand make_operand(node n) {
            operand o;
            switch (n.type()) {
            case kind::null:
                o.type = operand::tag::null;
                break;
            case kind::boolean:
                o.type = operand::tag::boolean;
                o.boolean = n.bool_or(false);
                break;
            case kind::number:
                o.type = operand::tag::number;
                o.numeric = true;
                o.num = n.float_or(0.0);
                o.text = n.number_text();
                break;
            case kind::string:
                o.type = operand::tag::string;
                o.text = n.string_or("");
                o.numeric = spells_number(o.text, o.num);
                break;
            default:
                break;
            }
            return o;
        }

        operand make_operand(const scalar& s) {
            operand o;
            if (s.is_null()) {
                o.type = operand::tag::null;
            } else if (s.is_bool()) {
                o.type = operand::tag::boolean;
                o.boolean = s.as_bool();
            } else if (s.is_number()) {
                o.type = operand::tag::number;
                o.numeric = true;
                o.num = s.as_number();
                o.text = std::format("{}", o.num);
            } else {
                o.type = operand::tag::string;
                o.text = s.as_string();
                o.numeric = spells_number(o.text, o.num);
            }
            return o;
        }

        template<typename T>
        int three_way(const T& a, const T& b) {
            return a < b ? -1 : (b < a ? 1 : 0);
        }

        // Returns nullopt when the two operands have no ordering.
        std::optional<int> compare(const operand& a, const operand& b) {
            using tag = operand::tag;
            if (a.type == tag::other || b.type == tag::other) return std::nullopt;
            if (a.type == tag::null || b.type == tag::null) {
                if (a.type == b.type) return 0;
                return std::nullopt;
            }
            if (a.type == tag::boolean || b.type == tag::boolean) {
                if (a.type == b.type) return three_way(a.boolean, b.boolean);
                return std::nullopt;
            }
            if (a.numeric && b.numeric) return three_way(a.num, b.num);
            return three_way(a.text, b.text);
        }

        // Sort position of an operand's kind; containers rank last.
        int sort_rank(const operand& o) noexcept {
            using tag = operand::tag;
            switch (o.type) {
            case tag::null: return 0;
            case tag::boolean: return 1;
            case tag::number: return 2;
            case tag::string: return o.numeric ? 2 : 3;
            case tag::other: return 4;
            }
            return 4;
        }

        // Total order used for sorting, unlike `compare` which leaves
        // mismatched kinds unordered.
        int sort_compare(const operand& a, const operand& b) {
            int ra = sort_rank(a);
            int rb = sort_rank(b);
            if (ra != rb) return ra < rb ? -1 : 1;
            switch (ra) {
            case 1: return three_way(a.boolean, b.boolean);
            case 2: return three_way(a.num, b.num);
            case 3: return three_way(a.text, b.text);
            default: return 0;
            }
        }

        bool equal_to_any(const operand& field, const std::vector<operand>& values) {
            return std::any_of(values.begin(), values.end(), [&](const operand& v) {
                auto c = compare(field, v);
                return c && *c == 0;
            });
        }

    } // namespace
#pragma endregion

#pragma region Builder
    query_builder& query_builder::where(std::string_view field, op o, scalar value) {
        condition c{ std::string{ field }, o, {} };
        c.values.push_back(std::move(value));
        m_Conditions.push_back(std::move(c));
        return *this;
    }

    query_builder& query_builder::where(std::string_view field, std::string_view o, scalar value) {
        if (auto parsed = parse_op(o)) return where(field, *parsed, std::move(value));
        if (!m_Invalid)
            m_Invalid = Error::make(Error::code::validation, std::format("unknown query operator '{}'", o), field);
        return *this;
    }

    query_builder& query_builder::where_in(std::string_view field, std::vector<scalar> values) {
        m_Conditions.push_back(condition{ std::string{ field }, op::in, std::move(values) });
        return *this;
    }

    query_builder& query_builder::where_not_in(std::string_view field, std::vector<scalar> values) {
        m_Conditions.push_back(condition{ std::string{ field }, op::not_in, std::move(values) });
        return *this;
    }

    query_builder& query_builder::where_contains(std::string_view field, std::string_view needle) {
        return where(field, op::contains, scalar{ needle });
    }

    query_builder& query_builder::sort_by(std::string_view field, std::string_view order) {
        if (order == "asc" || order == "desc") {
            m_Sort.push_back(sort_key{ std::string{ field }, order == "desc" });
        } else if (!m_Invalid) {
            m_Invalid = Error::make(Error::code::validation, std::format("unknown sort order '{}'", order), field);
        }
        return *this;
    }
#pragma endregion

#pragma region Evaluation
    bool query_builder::matches(node element) const {
        for (const auto& c : m_Conditions) {
            node field = detail::field_of(element, c.field);
            if (!field.exists()) return false;

            if (c.oper == op::contains) {
                if (!field.is_string() || c.values.empty() || !c.values.front().is_string()) return false;
                if (field.string_or("").find(c.values.front().as_string()) == std::string::npos) return false;
                continue;
            }

            operand lhs = make_operand(field);
            std::vector<operand> rhs;
            rhs.reserve(c.values.size());
            for (const auto& v : c.values) rhs.push_back(make_operand(v));

            bool ok = false;
            switch (c.oper) {
            case op::in:
                ok = equal_to_any(lhs, rhs);
                break;
            case op::not_in:
                ok = !equal_to_any(lhs, rhs);
                break;
            default: {
                auto cmp = rhs.empty() ? std::nullopt : compare(lhs, rhs.front());
                switch (c.oper) {
                case op::eq: ok = cmp && *cmp == 0; break;
                case op::ne: ok = !cmp || *cmp != 0; break;
                case op::gt: ok = cmp && *cmp > 0; break;
                case op::ge: ok = cmp && *cmp >= 0; break;
                case op::lt: ok = cmp && *cmp < 0; break;
                case op::le: ok = cmp && *cmp <= 0; break;
                default: break;
                }
                break;
            }
            }
            if (!ok) return false;
        }
        return true;
    }

    std::expected<std::vector<node>, Error> query_builder::filtered() const {
        if (m_Invalid) return std::unexpected(*m_Invalid);
        if (!m_Source.is_array() && !m_Source.is_object())
            return std::unexpected(m_Source.mismatch("array or object"));

        std::vector<node> out;
        auto keep = [&](node element) {
            if (matches(element)) out.push_back(element);
        };
        if (m_Source.is_array()) {
            for (node element : m_Source.elements()) keep(element);
        } else {
            for (const member& m : m_Source.members()) keep(m.value);
        }

        if (m_Sort.empty() || out.size() < 2) return out;

        // Sort keys are decoded once per element, not once per comparison.
        const std::size_t nkeys = m_Sort.size();
        std::vector<std::optional<operand>> keys(out.size() * nkeys);
        for (std::size_t i = 0; i < out.size(); i++) {
            for (std::size_t k = 0; k < nkeys; k++) {
                node field = detail::field_of(out[i], m_Sort[k].field);
                if (field.exists()) keys[i * nkeys + k] = make_operand(field);
            }
        }

        std::vector<std::size_t> order(out.size());
        std::iota(order.begin(), order.end(), std::size_t{ 0 });
        std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
            for (std::size_t k = 0; k < nkeys; k++) {
                const auto& ka = keys[a * nkeys + k];
                const auto& kb = keys[b * nkeys + k];
                if (!ka || !kb) {
                    if (ka.has_value() == kb.has_value()) continue;
                    return ka.has_value(); // missing fields last
                }
                int cmp = sort_compare(*ka, *kb);
                if (cmp != 0) return m_Sort[k].descending ? cmp > 0 : cmp < 0;
            }
            return false;
        });

        std::vector<node> sorted;
        sorted.reserve(out.size());
        for (auto i : order) sorted.push_back(out[i]);
        return sorted;
    }

    std::expected<std::vector<node>, Error> query_builder::to_vector() const {
        auto all = filtered();
        if (!all) return std::unexpected(std::move(all.error()));

        auto& items = *all;
        if (m_Offset >= items.size()) return std::vector<node>{};

        std::size_t available = items.size() - m_Offset;
        std::size_t take = m_Limit ? std::min(*m_Limit, available) : available;
        auto first = items.begin() + static_cast<std::ptrdiff_t>(m_Offset);
        return std::vector<node>(first, first + static_cast<std::ptrdiff_t>(take));
    }

    std::expected<std::size_t, Error> query_builder::count() const {
        return to_vector().transform([](const std::vector<node>& v) { return v.size(); });
    }

    std::expected<node, Error> query_builder::first() const {
        auto all = to_vector();
        if (!all) return std::unexpected(std::move(all.error()));
        if (all->empty()) return std::unexpected(Error::make(Error::code::not_found, "no matching elements"));
        return all->front();
    }
#pragma endregion

    query_builder node::query() const {
        return query_builder{ *this };
    }

} // namespace Stanza
