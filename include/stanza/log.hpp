#pragma once


/*
    -------------------------------
    Stanza logging hook
    -------------------------------
    Stanza does not own a global logger. Components that have something
    worth reporting (the parser on rejected input, the path cache on
    eviction) receive a `Logger` through their options struct and call it
    when it is set. An empty `Logger` disables logging at the cost of one
    branch.

        Stanza::ParseOptions opts;
        opts.logger = Stanza::stderr_logger(Stanza::log_level::debug);
        auto doc = Stanza::parse(text, opts);
*/

#include <cstdint>
#include <format>
#include <functional>
#include <string_view>
#include <utility>

#include "stanza/config.hpp"

namespace Stanza {

    /// @brief Severity of a log record
    enum class log_level : uint8_t {
        trace,
        debug,
        info,
        warn,
        error,
    };

    /// @brief Receives log records; may be called from several threads at once
    using Logger = std::function<void(log_level, std::string_view)>;

    /// @brief Name of a level, e.g. `"warn"`
    [[nodiscard]] STANZA_API std::string_view to_string(log_level lvl) noexcept;

    /// @brief Returns a logger printing records at or above @p min_level to stderr
    [[nodiscard]] STANZA_API Logger stderr_logger(log_level min_level = log_level::info);

    namespace detail {
        template<typename... Args>
        void log(const Logger& logger, log_level lvl, std::format_string<Args...> fmt, Args&&... args) {
            if (!logger) return;
            logger(lvl, std::format(fmt, std::forward<Args>(args)...));
        }
    } // namespace detail

} // namespace Stanza
