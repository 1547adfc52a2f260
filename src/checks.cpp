#include "stanza/node.hpp"

#include <regex>


namespace Stanza {

    namespace {

        bool matches(const node& n, const std::regex& re) {
            auto str = n.get_string();
            return str && std::regex_match(*str, re);
        }

        bool is_hex(char c) noexcept {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        }

        bool dotted_quad(std::string_view s) noexcept {
            int parts = 0;
            std::size_t pos = 0;
            while (true) {
                std::size_t dot = s.find('.', pos);
                std::string_view part = s.substr(pos, dot == std::string_view::npos ? std::string_view::npos : dot - pos);
                if (part.empty() || part.size() > 3) return false;
                int value = 0;
                for (char c : part) {
                    if (c < '0' || c > '9') return false;
                    value = value * 10 + (c - '0');
                }
                if (value > 255) return false;
                parts++;
                if (dot == std::string_view::npos) break;
                pos = dot + 1;
            }
            return parts == 4;
        }

        bool ipv6(std::string_view s) noexcept {
            if (auto zone = s.find('%'); zone != std::string_view::npos) {
                if (zone + 1 == s.size()) return false;
                s = s.substr(0, zone);
            }
            if (s.find(':') == std::string_view::npos) return false;

            auto gap = s.find("::");
            if (gap != std::string_view::npos && s.find("::", gap + 1) != std::string_view::npos) return false;

            // Counts the 16-bit groups of one side of the `::` gap.
            auto groups = [](std::string_view side, bool last, int& count) {
                if (side.empty()) return true;
                std::size_t pos = 0;
                while (true) {
                    std::size_t colon = side.find(':', pos);
                    std::string_view part = side.substr(pos, colon == std::string_view::npos ? std::string_view::npos : colon - pos);
                    if (colon == std::string_view::npos && last && part.find('.') != std::string_view::npos) {
                        if (!dotted_quad(part)) return false;
                        count += 2;
                        return true;
                    }
                    if (part.empty() || part.size() > 4) return false;
                    for (char c : part)
                        if (!is_hex(c)) return false;
                    count++;
                    if (colon == std::string_view::npos) return true;
                    pos = colon + 1;
                }
            };

            int count = 0;
            if (gap == std::string_view::npos) return groups(s, true, count) && count == 8;
            return groups(s.substr(0, gap), false, count)
                && groups(s.substr(gap + 2), true, count)
                && count < 8;
        }

    } // namespace

    bool node::is_valid_email() const {
        static const std::regex re{ R"(^[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}$)" };
        return matches(*this, re);
    }

    bool node::is_valid_url() const {
        static const std::regex re{ R"(^[A-Za-z][A-Za-z0-9+.-]*://([^/?#@]*@)?(\[[0-9A-Fa-f:.]+\]|[^/?#@:\[\]]+)(:[0-9]*)?([/?#].*)?$)" };
        return matches(*this, re);
    }

    bool node::is_valid_uuid() const {
        static const std::regex re{ R"(^[0-9A-Fa-f]{8}-[0-9A-Fa-f]{4}-[0-9A-Fa-f]{4}-[0-9A-Fa-f]{4}-[0-9A-Fa-f]{12}$)" };
        return matches(*this, re);
    }

    bool node::is_valid_ipv4() const {
        auto str = get_string();
        return str && dotted_quad(*str);
    }

    bool node::is_valid_ipv6() const {
        auto str = get_string();
        return str && ipv6(*str);
    }

} // namespace Stanza
