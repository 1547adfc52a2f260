#include "stanza/aggregate.hpp"

#include <optional>


namespace Stanza {

    double agg_value::number_or(double def) const noexcept {
        if (is_int()) return static_cast<double>(std::get<std::int64_t>(m_Storage));
        if (is_float()) return std::get<double>(m_Storage);
        return def;
    }

    const agg_value* agg_value::find(std::string_view key) const {
        if (!is_group()) return nullptr;
        const auto& g = std::get<agg_group>(m_Storage);
        auto it = g.find(key);
        return it == g.end() ? nullptr : &it->second;
    }

    const agg_value& agg_value::operator[](std::string_view key) const {
        static const agg_value null_value{};
        const agg_value* v = find(key);
        return v ? *v : null_value;
    }

    std::size_t agg_value::size() const noexcept {
        return is_group() ? std::get<agg_group>(m_Storage).size() : 0;
    }

    aggregator& aggregator::add(metric_kind fn, std::string_view field, std::string_view alias) {
        m_Metrics.push_back(metric{ fn, std::string{ field }, std::string{ alias } });
        return *this;
    }

    aggregator& aggregator::count(std::string_view alias) { return add(metric_kind::count, {}, alias); }
    aggregator& aggregator::sum(std::string_view field, std::string_view alias) { return add(metric_kind::sum, field, alias); }
    aggregator& aggregator::avg(std::string_view field, std::string_view alias) { return add(metric_kind::avg, field, alias); }
    aggregator& aggregator::max(std::string_view field, std::string_view alias) { return add(metric_kind::max, field, alias); }
    aggregator& aggregator::min(std::string_view field, std::string_view alias) { return add(metric_kind::min, field, alias); }

    agg_group aggregator::reduce(const std::vector<node>& items) const {
        agg_group out;
        for (const auto& m : m_Metrics) {
            if (m.fn == metric_kind::count) {
                out.insert_or_assign(m.alias, agg_value{ static_cast<std::int64_t>(items.size()) });
                continue;
            }

            double total = 0.0;
            std::size_t seen = 0;
            std::optional<double> best;
            for (node item : items) {
                node field = detail::field_of(item, m.field);
                if (!field.is_number()) continue;
                double v = field.float_or(0.0);
                total += v;
                seen++;
                if (!best
                    || (m.fn == metric_kind::max && v > *best)
                    || (m.fn == metric_kind::min && v < *best))
                    best = v;
            }

            agg_value result;
            switch (m.fn) {
            case metric_kind::sum:
                result = agg_value{ total };
                break;
            case metric_kind::avg:
                result = agg_value{ seen == 0 ? 0.0 : total / static_cast<double>(seen) };
                break;
            case metric_kind::max:
            case metric_kind::min:
                if (best) result = agg_value{ *best };
                break;
            case metric_kind::count:
                break;
            }
            out.insert_or_assign(m.alias, std::move(result));
        }
        return out;
    }

    std::string aggregator::group_key(node item) const {
        std::string key;
        for (std::size_t i = 0; i < m_GroupBy.size(); i++) {
            if (i != 0) key.push_back('|');
            node field = detail::field_of(item, m_GroupBy[i]);
            switch (field.type()) {
            case kind::string:  key += field.string_or(""); break;
            case kind::number:  key += field.number_text(); break;
            case kind::invalid: break;
            default:            key += field.raw(); break;
            }
        }
        return key;
    }

    std::expected<agg_value, Error> aggregator::execute() const {
        return execute(m_Source);
    }

    std::expected<agg_value, Error> aggregator::execute(node source) const {
        if (!source.is_array() && !source.is_object())
            return std::unexpected(source.mismatch("array or object"));

        std::vector<node> items;
        items.reserve(source.size());
        if (source.is_array()) {
            for (node element : source.elements()) items.push_back(element);
        } else {
            for (const member& m : source.members()) items.push_back(m.value);
        }

        if (m_GroupBy.empty()) return agg_value{ reduce(items) };

        std::map<std::string, std::vector<node>, std::less<>> buckets;
        for (node item : items) buckets[group_key(item)].push_back(item);

        agg_group out;
        for (const auto& [key, members] : buckets)
            out.emplace(key, agg_value{ reduce(members) });
        return agg_value{ std::move(out) };
    }

    aggregator node::aggregate() const {
        return aggregator{ *this };
    }

} // namespace Stanza
