#include "stanza/node.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <optional>
#include <unordered_map>
#include <utility>


namespace Stanza {

    std::string_view to_string(kind k) noexcept {
        switch (k) {
        case kind::invalid: return "invalid";
        case kind::object: return "object";
        case kind::array: return "array";
        case kind::string: return "string";
        case kind::number: return "number";
        case kind::boolean: return "boolean";
        case kind::null: return "null";
        }
        return "invalid";
    }

    namespace detail {

        void append_utf8(uint32_t cp, std::string& out) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0x10FFFF) {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                // Invalid codepoint; replace with replacement character
                append_utf8(0xFFFDu, out);
            }
        }

        uint16_t read_hex4(std::string_view raw, size_t at) {
            uint16_t val = 0;
            for (size_t i = at; i < at + 4 && i < raw.size(); i++) {
                char h = raw[i];
                unsigned digit = 0;
                if (h >= '0' && h <= '9') digit = h - '0';
                else if (h >= 'A' && h <= 'F') digit = 10 + (h - 'A');
                else if (h >= 'a' && h <= 'f') digit = 10 + (h - 'a');
                val = static_cast<uint16_t>((val << 4) | digit);
            }
            return val;
        }

        // The span was validated by the indexer, so escapes are well-formed.
        void decode_string(std::string_view raw, std::string& out) {
            out.clear();
            out.reserve(raw.size());
            for (size_t i = 0; i < raw.size(); i++) {
                char c = raw[i];
                if (c != '\\' || i + 1 >= raw.size()) {
                    out.push_back(c);
                    continue;
                }
                char esc = raw[++i];
                switch (esc) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': {
                        uint32_t first = read_hex4(raw, i + 1);
                        i += 4;
                        uint32_t codepoint = first;
                        if (first >= 0xD800 && first <= 0xDBFF && i + 6 < raw.size()) {
                            uint32_t second = read_hex4(raw, i + 3);
                            codepoint = 0x10000u + (((first - 0xD800) << 10) | (second - 0xDC00));
                            i += 6;
                        }
                        append_utf8(codepoint, out);
                        break;
                    }
                    default: out.push_back(esc); break;
                }
            }
        }

        bool is_integral_lexeme(std::string_view text) noexcept {
            return text.find_first_of(".eE") == std::string_view::npos;
        }

        // Decimal exponent of the leading significant digit: 1.5e3 -> 3, 0.02 -> -2.
        // Only the sign matters, so a huge explicit exponent is clamped.
        long long magnitude(std::string_view text) noexcept {
            std::size_t i = text.front() == '-' ? 1 : 0;
            long long int_digits = 0;
            long long lead_zeros = 0;
            bool nonzero_int = false;
            bool seen_significant = false;
            bool fraction = false;
            for (; i < text.size() && text[i] != 'e' && text[i] != 'E'; i++) {
                char c = text[i];
                if (c == '.') { fraction = true; continue; }
                if (!fraction) {
                    if (c != '0') nonzero_int = true;
                    if (nonzero_int) int_digits++;
                } else if (!nonzero_int && !seen_significant) {
                    if (c == '0') lead_zeros++;
                    else seen_significant = true;
                }
            }
            long long mag = nonzero_int ? int_digits - 1 : -(lead_zeros + 1);
            if (i < text.size()) {
                std::string_view exp = text.substr(i + 1);
                bool negative = !exp.empty() && exp.front() == '-';
                if (!exp.empty() && (exp.front() == '-' || exp.front() == '+')) exp.remove_prefix(1);
                long long e = 0;
                auto [ptr, ec] = std::from_chars(exp.data(), exp.data() + exp.size(), e);
                if (ec == std::errc::result_out_of_range) e = std::numeric_limits<int>::max();
                mag += negative ? -e : e;
            }
            return mag;
        }

        std::optional<double> parse_double(std::string_view text) noexcept {
            if (text.empty()) return std::nullopt;
            double res = 0.0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), res);
            if (ec == std::errc::result_out_of_range) {
                // from_chars leaves res untouched on overflow and on underflow alike
                bool negative = text.front() == '-';
                if (magnitude(text) < 0) return negative ? -0.0 : 0.0;
                return negative ? -std::numeric_limits<double>::infinity()
                                : std::numeric_limits<double>::infinity();
            }
            if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
            return res;
        }

        std::optional<std::int64_t> parse_int64(std::string_view text) noexcept {
            if (is_integral_lexeme(text)) {
                std::int64_t v = 0;
                auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
                if (ec == std::errc{} && ptr == text.data() + text.size()) return v;
            }
            auto d = parse_double(text);
            if (!d) return std::nullopt;
            double t = std::trunc(*d);
            // 2^63 is exactly representable; anything at or beyond it overflows
            if (!(t >= -9223372036854775808.0 && t < 9223372036854775808.0)) return std::nullopt;
            return static_cast<std::int64_t>(t);
        }

        std::optional<std::uint64_t> parse_uint64(std::string_view text) noexcept {
            if (text.front() != '-' && is_integral_lexeme(text)) {
                std::uint64_t v = 0;
                auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
                if (ec == std::errc{} && ptr == text.data() + text.size()) return v;
            }
            auto d = parse_double(text);
            if (!d) return std::nullopt;
            double t = std::trunc(*d);
            if (!(t >= 0.0 && t < 18446744073709551616.0)) return std::nullopt;
            return static_cast<std::uint64_t>(t);
        }

        // Compares a raw (possibly escaped) key span with a plain key.
        bool key_equals(const slot& s, std::string_view text, std::string_view key) {
            std::string_view raw{ text.data() + s.key_start, s.key_len };
            if (!s.key_escaped) return raw == key;
            std::string decoded;
            decode_string(raw, decoded);
            return decoded == key;
        }

    } // namespace detail

    bool node::is_empty() const noexcept {
        switch (type()) {
        case kind::invalid:
        case kind::null:
            return true;
        case kind::object:
        case kind::array:
            return size() == 0;
        case kind::string:
            return raw_string().empty();
        default:
            return false;
        }
    }

    std::string_view node::raw() const noexcept {
        if (!exists()) return {};
        const auto& e = entry();
        return std::string_view{ m_Doc->text }.substr(e.start, e.end - e.start);
    }

    std::string_view node::number_text() const noexcept {
        return is_number() ? raw() : std::string_view{};
    }

    std::string_view node::raw_string() const noexcept {
        if (!is_string()) return {};
        auto r = raw();
        return r.substr(1, r.size() - 2);
    }

    Error node::mismatch(std::string_view expected) const {
        if (!exists()) return Error::make(Error::code::not_found, "value does not exist");
        std::string msg{ "expected " };
        msg.append(expected);
        msg.append(", got ");
        msg.append(type_name());
        return Error::make(Error::code::type_mismatch, msg, raw());
    }

    node node::get(std::string_view key) const {
        if (!is_object()) return {};
        const auto& e = entry();
        uint32_t found = detail::invalid_index;
        for (uint32_t i = 0; i < e.child_count; i++) {
            const auto& s = m_Doc->slots[e.children_start + i];
            if (detail::key_equals(s, m_Doc->text, key)) found = s.value;
        }
        if (found == detail::invalid_index) return {};
        return node{ m_Doc, found };
    }

    node node::index(std::size_t i) const noexcept {
        if (!is_array()) return {};
        const auto& e = entry();
        if (i >= e.child_count) return {};
        return node{ m_Doc, m_Doc->slots[e.children_start + i].value };
    }

    namespace {
        // Accepts digits-only tokens that fit in size_t.
        bool parse_index(std::string_view token, std::size_t& out) noexcept {
            if (token.empty()) return false;
            for (char c : token)
                if (c < '0' || c > '9') return false;
            auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), out);
            return ec == std::errc{} && ptr == token.data() + token.size();
        }
    } // namespace

    node node::get_path(std::string_view path) const {
        if (!exists() || path.empty()) return {};

        node cur = *this;
        size_t pos = 0;
        while (pos <= path.size()) {
            size_t stop = path.find_first_of(".[", pos);
            if (stop == std::string_view::npos) stop = path.size();
            std::string_view segment = path.substr(pos, stop - pos);

            // A bare segment may only be empty directly before a '[' suffix.
            if (!segment.empty()) {
                std::size_t idx = 0;
                if (cur.is_array()) {
                    if (!parse_index(segment, idx)) return {};
                    cur = cur.index(idx);
                } else {
                    cur = cur.get(segment);
                }
                if (!cur.exists()) return {};
            } else if (stop >= path.size() || path[stop] != '[') {
                return {};
            }

            pos = stop;
            while (pos < path.size() && path[pos] == '[') {
                size_t close = path.find(']', pos);
                if (close == std::string_view::npos) return {};
                std::size_t idx = 0;
                if (!parse_index(path.substr(pos + 1, close - pos - 1), idx)) return {};
                cur = cur.index(idx);
                if (!cur.exists()) return {};
                pos = close + 1;
            }

            if (pos >= path.size()) return cur;
            if (path[pos] != '.') return {};
            pos++;
            if (pos == path.size()) return {};
        }
        return cur;
    }

    std::vector<node> node::slice(std::size_t begin, std::size_t end) const {
        std::vector<node> out;
        if (!is_array()) return out;
        end = std::min(end, size());
        for (std::size_t i = begin; i < end; i++) out.push_back(index(i));
        return out;
    }

    std::vector<node> node::reverse() const {
        std::vector<node> out;
        if (!is_array()) return out;
        out.reserve(size());
        for (std::size_t i = size(); i > 0; i--) out.push_back(index(i - 1));
        return out;
    }

    namespace {
        // Decoded member map of an object, last occurrence of a key wins.
        template<typename Keep>
        void collect_members(const node& n, node_map& out, Keep keep) {
            for (auto [key, value] : n.members()) {
                std::string k;
                detail::decode_string(key, k);
                if (keep(k)) out.insert_or_assign(std::move(k), value);
            }
        }

        bool listed(std::span<const std::string_view> keys, std::string_view key) noexcept {
            return std::find(keys.begin(), keys.end(), key) != keys.end();
        }
    } // namespace

    node_map node::pick(std::span<const std::string_view> keys) const {
        node_map out;
        collect_members(*this, out, [&](std::string_view k) { return listed(keys, k); });
        return out;
    }

    node_map node::omit(std::span<const std::string_view> keys) const {
        node_map out;
        collect_members(*this, out, [&](std::string_view k) { return !listed(keys, k); });
        return out;
    }

    node_map node::merge(const node& other) const {
        node_map out;
        auto all = [](std::string_view) { return true; };
        collect_members(*this, out, all);
        collect_members(other, out, all);
        return out;
    }

    std::vector<node> node::get_multiple(std::span<const std::string_view> paths) const {
        std::vector<node> out;
        out.reserve(paths.size());
        for (auto p : paths) out.push_back(get_path(p));
        return out;
    }

    bool node::has_any_path(std::span<const std::string_view> paths) const {
        for (auto p : paths)
            if (get_path(p).exists()) return true;
        return false;
    }

    bool node::has_all_paths(std::span<const std::string_view> paths) const {
        for (auto p : paths)
            if (!get_path(p).exists()) return false;
        return true;
    }

    std::expected<std::string, Error> node::get_string() const {
        if (!is_string()) return std::unexpected(mismatch("string"));
        std::string out;
        detail::decode_string(raw_string(), out);
        return out;
    }

    std::expected<std::int64_t, Error> node::get_int() const {
        if (!is_number()) return std::unexpected(mismatch("number"));
        if (auto v = detail::parse_int64(number_text())) return *v;
        if (!detail::parse_double(number_text()))
            return std::unexpected(Error::make(Error::code::type_mismatch, "number could not be decoded", raw()));
        return std::unexpected(Error::make(Error::code::type_mismatch, "number out of int64 range", raw()));
    }

    std::expected<std::uint64_t, Error> node::get_uint() const {
        if (!is_number()) return std::unexpected(mismatch("number"));
        if (auto v = detail::parse_uint64(number_text())) return *v;
        if (!detail::parse_double(number_text()))
            return std::unexpected(Error::make(Error::code::type_mismatch, "number could not be decoded", raw()));
        return std::unexpected(Error::make(Error::code::type_mismatch, "number out of uint64 range", raw()));
    }

    std::expected<double, Error> node::get_float() const {
        if (!is_number()) return std::unexpected(mismatch("number"));
        if (auto v = detail::parse_double(number_text())) return *v;
        return std::unexpected(Error::make(Error::code::type_mismatch, "number could not be decoded", raw()));
    }

    std::expected<bool, Error> node::get_bool() const {
        if (!is_bool()) return std::unexpected(mismatch("boolean"));
        return raw().front() == 't';
    }

    std::string node::string_or(std::string_view def) const {
        if (auto v = get_string()) return std::move(*v);
        return std::string{ def };
    }

    std::int64_t node::int_or(std::int64_t def) const noexcept {
        if (!is_number()) return def;
        return detail::parse_int64(number_text()).value_or(def);
    }

    std::uint64_t node::uint_or(std::uint64_t def) const noexcept {
        if (!is_number()) return def;
        return detail::parse_uint64(number_text()).value_or(def);
    }

    double node::float_or(double def) const noexcept {
        if (!is_number()) return def;
        return detail::parse_double(number_text()).value_or(def);
    }

    bool node::bool_or(bool def) const noexcept {
        if (!is_bool()) return def;
        return raw().front() == 't';
    }

    bool node::is_integer() const noexcept {
        auto d = is_number() ? detail::parse_double(number_text()) : std::nullopt;
        return d && std::isfinite(*d) && std::trunc(*d) == *d;
    }

    bool node::in_range(double min, double max) const noexcept {
        auto d = is_number() ? detail::parse_double(number_text()) : std::nullopt;
        return d && *d >= min && *d <= max;
    }

    bool node::is_positive() const noexcept { return float_or(0.0) > 0.0; }
    bool node::is_negative() const noexcept { return float_or(0.0) < 0.0; }
    bool node::is_zero() const noexcept { return is_number() && float_or(1.0) == 0.0; }

    bool node::contains(std::string_view needle) const {
        auto str = get_string();
        return str && str->find(needle) != std::string::npos;
    }

    bool node::starts_with(std::string_view prefix) const {
        auto str = get_string();
        return str && str->starts_with(prefix);
    }

    bool node::ends_with(std::string_view suffix) const {
        auto str = get_string();
        return str && str->ends_with(suffix);
    }

    namespace {
        template<typename T, typename Get>
        std::expected<std::vector<T>, Error> collect(const node& n, Get get) {
            if (!n.is_array()) return std::unexpected(n.mismatch("array"));
            std::vector<T> out;
            out.reserve(n.size());
            std::optional<Error> failure;
            n.array_for_each([&](std::size_t, node elem) {
                auto v = get(elem);
                if (!v) {
                    failure = std::move(v.error());
                    return false;
                }
                out.push_back(std::move(*v));
                return true;
            });
            if (failure) return std::unexpected(std::move(*failure));
            return out;
        }
    } // namespace

    std::expected<std::vector<std::string>, Error> node::to_string_vector() const {
        return collect<std::string>(*this, [](const node& e) { return e.get_string(); });
    }

    std::expected<std::vector<std::int64_t>, Error> node::to_int_vector() const {
        return collect<std::int64_t>(*this, [](const node& e) { return e.get_int(); });
    }

    std::expected<std::vector<double>, Error> node::to_float_vector() const {
        return collect<double>(*this, [](const node& e) { return e.get_float(); });
    }

    std::expected<std::vector<bool>, Error> node::to_bool_vector() const {
        return collect<bool>(*this, [](const node& e) { return e.get_bool(); });
    }

    std::vector<std::string_view> node::keys() const {
        std::vector<std::string_view> out;
        out.reserve(size());
        for_each([&](std::string_view key, node) {
            out.push_back(key);
            return true;
        });
        return out;
    }

    bool node::equals(const node& other) const {
        if (type() != other.type()) return false;
        switch (type()) {
        case kind::invalid:
        case kind::null:
            return true;
        case kind::boolean:
            return raw() == other.raw();
        case kind::number: {
            auto a = get_float();
            auto b = other.get_float();
            return a && b && *a == *b;
        }
        case kind::string: {
            if (raw_string() == other.raw_string()) return true;
            auto a = get_string();
            auto b = other.get_string();
            return a && b && *a == *b;
        }
        case kind::array: {
            if (size() != other.size()) return false;
            for (std::size_t i = 0; i < size(); i++)
                if (!index(i).equals(other.index(i))) return false;
            return true;
        }
        case kind::object: {
            // Compare the effective (last-wins) member sets.
            std::unordered_map<std::string, node> lhs;
            std::unordered_map<std::string, node> rhs;
            auto fill = [](const node& n, std::unordered_map<std::string, node>& m) {
                for (auto [key, value] : n.members()) {
                    std::string k;
                    detail::decode_string(key, k);
                    m.insert_or_assign(std::move(k), value);
                }
            };
            fill(*this, lhs);
            fill(other, rhs);
            if (lhs.size() != rhs.size()) return false;
            for (const auto& [k, v] : lhs) {
                auto it = rhs.find(k);
                if (it == rhs.end() || !v.equals(it->second)) return false;
            }
            return true;
        }
        }
        return false;
    }

} // namespace Stanza
