#include "stanza/log.hpp"

#include <cstdio>
#include <print>


namespace Stanza {

    std::string_view to_string(log_level lvl) noexcept {
        switch (lvl) {
        case log_level::trace: return "trace";
        case log_level::debug: return "debug";
        case log_level::info: return "info";
        case log_level::warn: return "warn";
        case log_level::error: return "error";
        }
        return "unknown";
    }

    Logger stderr_logger(log_level min_level) {
        return [min_level](log_level lvl, std::string_view msg) {
            if (lvl < min_level) return;
            std::println(stderr, "[stanza] {}: {}", to_string(lvl), msg);
        };
    }

} // namespace Stanza
