#include "stanza/stanza.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <limits>
#include <memory>
#include <sstream>


namespace Stanza {

    namespace detail {
        ParseResult parse_impl(std::string text, const ParseOptions& opts);
    } // namespace detail

    ParseResult parse(std::string_view input, const ParseOptions& opts) {
        return detail::parse_impl(std::string{ input }, opts);
    }

    ParseResult parse(std::string&& input, const ParseOptions& opts) {
        return detail::parse_impl(std::move(input), opts);
    }

    ParseResult parse(std::istream& is, const ParseOptions& opts) {
        std::ostringstream oss;
        oss << is.rdbuf();
        return detail::parse_impl(std::move(oss).str(), opts);
    }


#pragma region Indexer
    // ================================
    // Structural index builder
    // ================================

    namespace detail {
        using expected_void = std::expected<void, Error>;
        template<typename T>
        using expected_t = std::expected<T, Error>;

        // Recursion ceiling applied when max_depth is 0.
        constexpr std::size_t hard_depth_limit = 1024;

        std::atomic<uint64_t> next_document_id{ 1 };

        struct Scanner {
            std::string_view text;
            const ParseOptions& opts;
            document_data& out;
            size_t idx = 0;
            size_t depth = 0;
            size_t max_depth = 0;
            bool comments = false;

            // Children of the container open at each depth, flushed into
            // out.slots when the container closes so siblings stay contiguous.
            std::vector<std::vector<slot>> pending;

            Scanner(std::string_view t, const ParseOptions& o, document_data& d)
                : text{ t }, opts{ o }, out{ d },
                  max_depth{ o.max_depth == 0 ? hard_depth_limit : std::min(o.max_depth, hard_depth_limit) },
                  comments{ o.allow_comments && !o.strict_mode } {}

            [[nodiscard]] bool eof() const noexcept { return idx >= text.size(); }
            [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : text[idx]; }
            [[nodiscard]] char peek_next() const noexcept { return (idx + 1 < text.size()) ? text[idx + 1] : '\0'; }

            char get() {
                if (eof()) return '\0';
                return text[idx++];
            }

            bool consume(char c) {
                if (peek() == c) {
                    idx++;
                    return true;
                }
                return false;
            }

            Error make_error(Error::syntax code, std::string_view msg) const {
                return Error::at(Error::code::parse, code, text, idx, msg);
            }

            Error make_limit_error(Error::code code, std::string_view msg) const {
                return Error::at(code, Error::syntax::none, text, idx, msg);
            }
        };

        struct DepthGuard {
            Scanner& s;
            bool active = false;

            DepthGuard(Scanner& sc) : s(sc) {
                if (s.depth + 1 > s.max_depth) active = false;
                else {
                    s.depth++;
                    active = true;
                }
            }

            ~DepthGuard() {
                if (active) s.depth--;
            }

            bool ok() const {
                return active;
            }
        };

        expected_t<uint32_t> parse_value(Scanner& s);
        expected_t<uint32_t> parse_object(Scanner& s);
        expected_t<uint32_t> parse_array(Scanner& s);
        expected_void scan_number(Scanner& s);
        expected_t<std::string_view> scan_string(Scanner& s);
        expected_void scan_literal(Scanner& s, std::string_view literal, std::string_view fail_msg);
        expected_void skip_ws_and_comments(Scanner& s);

        inline bool is_valid_utf8(std::string_view s, size_t& error_idx) {
            const unsigned char* data = reinterpret_cast<const unsigned char*>(s.data());
            size_t i = 0;
            size_t n = s.size();

            auto fail = [&](size_t idx) { error_idx = idx; return false; };
            auto cont = [&](size_t at) { return (data[at] & 0xC0) == 0x80; };

            while (i < n) {
                unsigned char c = data[i];

                if (c <= 0x7F) {
                    i++;
                    continue;
                }

                if (c >= 0xC2 && c <= 0xDF) {
                    if (i + 1 >= n || !cont(i + 1)) return fail(i);
                    i += 2;
                    continue;
                }

                if (c >= 0xE0 && c <= 0xEF) {
                    if (i + 2 >= n) return fail(i);
                    unsigned char c1 = data[i + 1];
                    if (c == 0xE0 && (c1 < 0xA0 || c1 > 0xBF)) return fail(i);
                    if (c == 0xED && (c1 < 0x80 || c1 > 0x9F)) return fail(i);
                    if (!cont(i + 1) || !cont(i + 2)) return fail(i);
                    i += 3;
                    continue;
                }

                if (c >= 0xF0 && c <= 0xF4) {
                    if (i + 3 >= n) return fail(i);
                    unsigned char c1 = data[i + 1];
                    if (c == 0xF0 && (c1 < 0x90 || c1 > 0xBF)) return fail(i);
                    if (c == 0xF4 && (c1 < 0x80 || c1 > 0x8F)) return fail(i);
                    if (!cont(i + 1) || !cont(i + 2) || !cont(i + 3)) return fail(i);
                    i += 4;
                    continue;
                }

                return fail(i);
            }
            return true;
        }

        expected_void skip_ws_and_comments(Scanner& s) {
            while (!s.eof()) {
                char c = s.peek();

                if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                    s.idx++;
                    continue;
                }

                if (c != '/') break;

                char next = s.peek_next();
                if (next != '/' && next != '*') break;
                if (!s.comments) return std::unexpected(s.make_error(Error::syntax::comment_not_allowed, "Comments are not allowed"));

                s.idx += 2;
                if (next == '/') {
                    // Line comment
                    while (!s.eof() && s.peek() != '\n') s.idx++;
                    continue;
                }

                bool closed = false;
                while (!s.eof()) {
                    char ch = s.get();
                    if (ch == '*' && s.peek() == '/') {
                        s.idx++;
                        closed = true;
                        break;
                    }
                }
                if (!closed) return std::unexpected(s.make_error(Error::syntax::unexpected_end_of_input, "Nonterminated block comment"));
            }
            return {};
        }

        expected_void scan_literal(Scanner& s, std::string_view literal, std::string_view fail_msg) {
            for (char expected : literal) {
                if (s.eof()) return std::unexpected(s.make_error(Error::syntax::unexpected_end_of_input, fail_msg));
                if (s.peek() != expected) return std::unexpected(s.make_error(Error::syntax::unexpected_character, fail_msg));
                s.idx++;
            }
            return {};
        }

        // Validates a string and returns its raw content (between the quotes).
        // Decoding is deferred to the accessors.
        expected_t<std::string_view> scan_string(Scanner& s) {
            if (!s.consume('"')) return std::unexpected(s.make_error(Error::syntax::invalid_string, "Expected '\"' to start a string"));

            size_t start = s.idx;

            auto parse_hex4 = [&](uint16_t& out_code) -> expected_void {
                uint16_t val = 0;
                for (int i = 0; i < 4; i++) {
                    if (s.eof()) return std::unexpected(s.make_error(Error::syntax::invalid_unicode_escape, "Unexpected end in unicode escape"));
                    char h = s.get();
                    unsigned digit = 0;
                    if (h >= '0' && h <= '9') digit = h - '0';
                    else if (h >= 'A' && h <= 'F') digit = 10 + (h - 'A');
                    else if (h >= 'a' && h <= 'f') digit = 10 + (h - 'a');
                    else return std::unexpected(s.make_error(Error::syntax::invalid_unicode_escape, "Invalid hex digit in unicode escape"));
                    val = static_cast<uint16_t>((val << 4) | digit);
                }
                out_code = val;
                return {};
            };

            while (!s.eof()) {
                char c = s.get();
                if (c == '"') {
                    std::string_view raw = s.text.substr(start, s.idx - 1 - start);
                    if (s.opts.max_string_len != 0 && raw.size() > s.opts.max_string_len)
                        return std::unexpected(s.make_limit_error(Error::code::memory_limit, "String exceeds maximum length"));
                    size_t bad_idx = 0;
                    if (s.opts.strict_mode && !is_valid_utf8(raw, bad_idx))
                        return std::unexpected(Error::at(Error::code::parse, Error::syntax::invalid_string, s.text, start + bad_idx, "Invalid UTF-8 sequence in string"));
                    return raw;
                }
                if (static_cast<unsigned char>(c) < 0x20) return std::unexpected(s.make_error(Error::syntax::invalid_string, "Control character in string"));
                if (c != '\\') continue;

                if (s.eof()) return std::unexpected(s.make_error(Error::syntax::invalid_escape, "Unfinished escape sequence"));
                char esc = s.get();
                switch (esc) {
                    case '"': case '\\': case '/': case 'b':
                    case 'f': case 'n': case 'r': case 't':
                        break;
                    case 'u': {
                        uint16_t first = 0;
                        if (auto r = parse_hex4(first); !r) return std::unexpected(r.error());

                        if (first >= 0xD800 && first <= 0xDBFF) {
                            if (!(s.consume('\\') && s.consume('u'))) return std::unexpected(s.make_error(Error::syntax::invalid_unicode_escape, "Expected low surrogate after high surrogate"));
                            uint16_t second = 0;
                            if (auto r = parse_hex4(second); !r) return std::unexpected(r.error());
                            if (!(second >= 0xDC00 && second <= 0xDFFF)) return std::unexpected(s.make_error(Error::syntax::invalid_unicode_escape, "Invalid low surrogate"));
                        } else if (first >= 0xDC00 && first <= 0xDFFF) return std::unexpected(s.make_error(Error::syntax::invalid_unicode_escape, "Unpaired low surrogate"));
                        break;
                    }
                    default: return std::unexpected(s.make_error(Error::syntax::invalid_escape, "Invalid escape sequence"));
                }
            }

            return std::unexpected(s.make_error(Error::syntax::unexpected_end_of_input, "Nonterminated string"));
        }

        expected_void scan_number(Scanner& s) {
            auto is_digit = [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; };

            if (s.peek() == '-') {
                s.idx++;
                if (!is_digit(s.peek())) return std::unexpected(s.make_error(Error::syntax::unexpected_character, "Expected digit after '-'"));
            }

            char first_digit = s.get();
            if (!is_digit(first_digit)) return std::unexpected(s.make_error(Error::syntax::invalid_number, "Expected digit"));
            if (first_digit == '0' && is_digit(s.peek())) return std::unexpected(s.make_error(Error::syntax::invalid_number, "Leading zeros disallowed"));
            while (is_digit(s.peek())) s.idx++;

            if (s.peek() == '.') {
                s.idx++;
                if (!is_digit(s.peek())) return std::unexpected(s.make_error(Error::syntax::invalid_number, "Expected digit after '.'"));
                while (is_digit(s.peek())) s.idx++;
            }

            char p = s.peek();
            if (p == 'e' || p == 'E') {
                s.idx++;
                char sign = s.peek();
                if (sign == '+' || sign == '-') s.idx++;
                if (!is_digit(s.peek())) return std::unexpected(s.make_error(Error::syntax::invalid_number, "Expected digit in exponent"));
                while (is_digit(s.peek())) s.idx++;

                char c = s.peek();
                auto is_ws = [](char ch) { return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r'; };
                if (!(c == '\0' || c == ',' || c == ']' || c == '}' || c == '/' || is_ws(c))) return std::unexpected(s.make_error(Error::syntax::invalid_number, "Invalid character in exponent"));
            }
            return {};
        }

        // Appends a provisional entry and returns its index. Callers finish
        // `end` (and children) once the value has been scanned.
        uint32_t open_entry(Scanner& s, kind k) {
            auto index = static_cast<uint32_t>(s.out.entries.size());
            s.out.entries.push_back(entry{ k, static_cast<uint32_t>(s.idx), 0, 0, 0 });
            return index;
        }

        // Moves the pending children of the container at the current depth
        // into the shared slot table.
        void close_container(Scanner& s, uint32_t index) {
            auto& children = s.pending[s.depth];
            auto& e = s.out.entries[index];
            e.end = static_cast<uint32_t>(s.idx);
            e.children_start = static_cast<uint32_t>(s.out.slots.size());
            e.child_count = static_cast<uint32_t>(children.size());
            s.out.slots.insert(s.out.slots.end(), children.begin(), children.end());
            children.clear();
        }

        std::vector<slot>& begin_children(Scanner& s) {
            if (s.pending.size() <= s.depth) s.pending.resize(s.depth + 1);
            auto& children = s.pending[s.depth];
            children.clear();
            return children;
        }

        expected_t<uint32_t> parse_array(Scanner& s) {
            DepthGuard guard{ s };
            if (!guard.ok()) return std::unexpected(s.make_limit_error(Error::code::depth_limit, "Maximum nesting depth exceeded"));

            uint32_t index = open_entry(s, kind::array);
            if (!s.consume('[')) return std::unexpected(s.make_error(Error::syntax::unexpected_character, "Expected '[' to start array"));
            begin_children(s);

            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (s.consume(']')) {
                close_container(s, index);
                return index;
            }

            while (true) {
                auto elem = parse_value(s);
                if (!elem) return std::unexpected(std::move(elem.error()));

                auto& children = s.pending[s.depth];
                children.push_back(slot{ 0, 0, *elem, false });
                if (s.opts.max_array_items != 0 && children.size() > s.opts.max_array_items)
                    return std::unexpected(s.make_limit_error(Error::code::memory_limit, "Array exceeds maximum item count"));

                if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());

                char c = s.peek();
                if (c == ',') {
                    s.idx++;
                    if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
                    if (s.peek() == ']') return std::unexpected(s.make_error(Error::syntax::trailing_comma, "Trailing commas not allowed"));
                    continue;
                }
                if (c == ']') { s.idx++; break; }
                if (s.eof()) return std::unexpected(s.make_error(Error::syntax::unexpected_end_of_input, "Unterminated array, expected ',' or ']'"));
                return std::unexpected(s.make_error(Error::syntax::unexpected_character, "Expected ',' or ']' in array"));
            }
            close_container(s, index);
            return index;
        }

        expected_t<uint32_t> parse_object(Scanner& s) {
            DepthGuard guard{ s };
            if (!guard.ok()) return std::unexpected(s.make_limit_error(Error::code::depth_limit, "Maximum nesting depth exceeded"));

            uint32_t index = open_entry(s, kind::object);
            if (!s.consume('{')) return std::unexpected(s.make_error(Error::syntax::unexpected_character, "Expected '{' to start object"));
            begin_children(s);

            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (s.consume('}')) {
                close_container(s, index);
                return index;
            }

            while (true) {
                char c = s.peek();
                if (s.eof()) return std::unexpected(s.make_error(Error::syntax::unexpected_end_of_input, "Unterminated object, expected '}' or string key"));
                if (c != '"') return std::unexpected(s.make_error(Error::syntax::unexpected_character, "Expected '\"' to start object key"));
                auto key = scan_string(s);
                if (!key) return std::unexpected(key.error());

                if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
                if (s.eof()) return std::unexpected(s.make_error(Error::syntax::unexpected_end_of_input, "Unterminated object, expected ':' after key"));
                if (!s.consume(':')) return std::unexpected(s.make_error(Error::syntax::unexpected_character, "Expected ':' after object key"));
                if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());

                auto val = parse_value(s);
                if (!val) return std::unexpected(val.error());

                // Every occurrence is kept; lookups resolve duplicates last-wins.
                auto& children = s.pending[s.depth];
                children.push_back(slot{
                    static_cast<uint32_t>(key->data() - s.text.data()),
                    static_cast<uint32_t>(key->size()),
                    *val,
                    key->find('\\') != std::string_view::npos });
                if (s.opts.max_object_keys != 0 && children.size() > s.opts.max_object_keys)
                    return std::unexpected(s.make_limit_error(Error::code::memory_limit, "Object exceeds maximum key count"));

                if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
                c = s.peek();
                if (c == ',') {
                    s.idx++;
                    if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
                    if (s.peek() == '}') return std::unexpected(s.make_error(Error::syntax::trailing_comma, "Trailing commas not allowed"));
                    continue;
                }
                if (c == '}') { s.idx++; break; }
                if (s.eof()) return std::unexpected(s.make_error(Error::syntax::unexpected_end_of_input, "Unterminated object, expected ',' or '}'"));
                return std::unexpected(s.make_error(Error::syntax::unexpected_character, "Expected ',' or '}' in object"));
            }
            close_container(s, index);
            return index;
        }

        expected_t<uint32_t> parse_value(Scanner& s) {
            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (s.eof()) return std::unexpected(s.make_error(Error::syntax::unexpected_end_of_input, "Expected JSON value"));

            auto scalar = [&](kind k, auto&& scan) -> expected_t<uint32_t> {
                uint32_t index = open_entry(s, k);
                if (auto r = scan(); !r) return std::unexpected(r.error());
                s.out.entries[index].end = static_cast<uint32_t>(s.idx);
                return index;
            };

            char c = s.peek();
            switch (c) {
            case 'n': return scalar(kind::null, [&] { return scan_literal(s, "null", "Invalid 'null' literal"); });
            case 't': return scalar(kind::boolean, [&] { return scan_literal(s, "true", "Invalid 'true' literal"); });
            case 'f': return scalar(kind::boolean, [&] { return scan_literal(s, "false", "Invalid 'false' literal"); });
            case '"':
                return scalar(kind::string, [&]() -> expected_void {
                    if (auto str = scan_string(s); !str) return std::unexpected(str.error());
                    return {};
                });
            case '[': return parse_array(s);
            case '{': return parse_object(s);
            default:
                if (c == '-' || (c >= '0' && c <= '9')) return scalar(kind::number, [&] { return scan_number(s); });
                else if (c == '.') return std::unexpected(s.make_error(Error::syntax::invalid_number, "Fractional values must start with a 0"));
                return std::unexpected(s.make_error(Error::syntax::unexpected_character, "Unexpected character while parsing value"));
            }
        }

        ParseResult reject(const ParseOptions& opts, Error err) {
            detail::log(opts.logger, err.errc == Error::code::parse ? log_level::debug : log_level::warn,
                "rejected document: {}", err.what());
            return std::unexpected(std::move(err));
        }

        ParseResult parse_impl(std::string text, const ParseOptions& opts) {
            if (text.size() >= std::numeric_limits<uint32_t>::max())
                return reject(opts, Error::make(Error::code::memory_limit, "Input exceeds the 4 GiB offset range"));

            auto data = std::make_shared<document_data>();
            data->text = std::move(text);
            // A rough guess: most documents hold one value per 8 bytes or so.
            data->entries.reserve(data->text.size() / 8 + 1);

            Scanner s{ data->text, opts, *data };

            auto v = parse_value(s);
            if (!v) return reject(opts, std::move(v.error()));
            if (auto ws = skip_ws_and_comments(s); !ws) return reject(opts, std::move(ws.error()));
            if (!s.eof()) return reject(opts, s.make_error(Error::syntax::trailing_characters, "Trailing characters after top-level JSON value"));

            data->entries.shrink_to_fit();
            data->slots.shrink_to_fit();
            data->id = next_document_id.fetch_add(1, std::memory_order_relaxed);
            return document{ std::shared_ptr<const document_data>{ std::move(data) } };
        }
#pragma endregion

    } // namespace detail

} // namespace Stanza
