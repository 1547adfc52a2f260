#include "stanza/error.hpp"

#include <algorithm>
#include <format>


namespace Stanza {

    Position compute_position(std::string_view text, std::size_t offset) noexcept {
        if (offset > text.size()) return { offset, 0, 0 };

        std::size_t line = 1;
        std::size_t column = 1;
        for (std::size_t i = 0; i < offset; i++) {
            if (text[i] == '\n') {
                line++;
                column = 1;
            } else column++;
        }
        return { offset, line, column };
    }

    Error Error::at(code c, syntax s, std::string_view text, std::size_t o, std::string_view m) {
        Error e;
        e.errc = c;
        e.detail = s;
        Position p = compute_position(text, o);
        e.offset = p.offset;
        e.line = p.line;
        e.column = p.column;
        e.msg.assign(m.begin(), m.end());

        std::size_t from = o > 20 ? o - 20 : 0;
        std::size_t to = std::min(text.size(), o + 20);
        if (from < to) e.context.assign(text.substr(from, to - from));
        return e;
    }

    Error Error::make(code c, std::string_view m, std::string_view ctx) {
        Error e;
        e.errc = c;
        e.msg.assign(m.begin(), m.end());
        e.context.assign(ctx.begin(), ctx.end());
        return e;
    }

    std::string Error::what() const {
        if (line > 0 && column > 0)
            return std::format("[{}] {} at line {}, column {}", to_string(errc), msg, line, column);
        if (offset > 0)
            return std::format("[{}] {} at position {}", to_string(errc), msg, offset);
        return std::format("[{}] {}", to_string(errc), msg);
    }

    std::string_view to_string(Error::code c) noexcept {
        switch (c) {
        case Error::code::parse: return "Parse";
        case Error::code::type_mismatch: return "TypeMismatch";
        case Error::code::not_found: return "NotFound";
        case Error::code::validation: return "Validation";
        case Error::code::depth_limit: return "DepthLimit";
        case Error::code::memory_limit: return "MemoryLimit";
        }
        return "Unknown";
    }

} // namespace Stanza
