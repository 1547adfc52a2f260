#pragma once


/*
    --------------------------------------------------
    Stanza::Error - Structured error reporting
    --------------------------------------------------
    `Stanza::Error` describes every failure the library can report:
    a document that could not be indexed, a value that has the wrong
    type, a path that does not resolve, or a rule that did not hold.

    ------
    Fields
    ------
    - `code errc`:
        * Category of the failure:
            - `parse`           malformed JSON text
            - `type_mismatch`   the value exists but has another type
            - `not_found`       key, index or path is absent
            - `validation`      a caller-supplied rule failed
            - `depth_limit`     nesting exceeded `ParseOptions::max_depth`
            - `memory_limit`    a size ceiling in `ParseOptions` was exceeded
    - `syntax detail`:
        * Finer classification of `parse` failures (unexpected character,
          malformed number, ...). `syntax::none` for every other category
    - `size_t offset`, `size_t line`, `size_t column`:
        * Byte offset into the input and its 1-based line/column. Line and
          column are 0 when the error is not tied to a position
    - `std::string msg`:
        * Human-readable description. Not stable for programmatic use
    - `std::string context`:
        * Up to 20 bytes on each side of `offset` for parse errors, or the
          raw JSON of the offending value for access errors
    - `std::shared_ptr<const Error> cause`:
        * The error that triggered this one, if any

    -----
    Usage
    -----
    - `Stanza::parse(...)` returns `std::expected<document, Error>`
    - Strict accessors such as `node::get_int()` return
      `std::expected<T, Error>`
    - Safe accessors (`int_or`, `string_or`, ...) never produce an `Error`
*/

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "stanza/config.hpp"


/// @defgroup StanzaError Errors
/// @ingroup Stanza
/// @brief Error codes and structures produced by parsing and access
namespace Stanza {

    /// @ingroup StanzaError
    /// @brief A location inside the JSON text
    struct Position {
        std::size_t offset{}; ///< Byte offset from the start of input
        std::size_t line{};   ///< 1-based line, 0 if @c offset is out of range
        std::size_t column{}; ///< 1-based column, 0 if @c offset is out of range
    };

    /// @ingroup StanzaError
    /// @brief Computes the line and column of a byte offset
    ///
    /// @details
    /// Scans @p text up to @p offset counting `\n` characters. An offset past
    /// the end of @p text yields a position with line and column set to 0.
    [[nodiscard]] STANZA_API Position compute_position(std::string_view text, std::size_t offset) noexcept;

    /// @ingroup StanzaError
    /// @brief Structured error information produced by Stanza
    struct Error {
        /// @brief Category of the failure
        enum class code : uint8_t {
            parse,          ///< Malformed JSON text.
            type_mismatch,  ///< Value exists but is not of the requested type.
            not_found,      ///< Key, index or path is absent.
            validation,     ///< Caller-supplied rule failed.
            depth_limit,    ///< Nesting deeper than the configured maximum.
            memory_limit,   ///< String, object or array larger than the configured maximum.
        };

        /// @brief Finer classification of `code::parse` failures
        ///
        /// @details
        /// - `unexpected_character`
        ///     A character that is not valid in the current parsing state,
        ///     e.g. an unquoted key or a bare `NaN`.
        /// - `invalid_number`
        ///     Leading zeros, a missing fraction or exponent digit.
        /// - `invalid_string`
        ///     Unescaped control character or invalid UTF-8 in strict mode.
        /// - `invalid_escape`, `invalid_unicode_escape`
        ///     Bad `\` sequence, malformed `\uXXXX` or unpaired surrogate.
        /// - `unexpected_end_of_input`
        ///     Empty input or input that stops inside a value.
        /// - `trailing_characters`
        ///     Non-whitespace after the top-level value.
        /// - `trailing_comma`
        ///     `[1,]` or `{"a":1,}`.
        /// - `comment_not_allowed`
        ///     A comment while comments are disabled or strict mode is on.
        enum class syntax : uint8_t {
            none,
            unexpected_character,
            invalid_number,
            invalid_string,
            invalid_escape,
            invalid_unicode_escape,
            unexpected_end_of_input,
            trailing_characters,
            trailing_comma,
            comment_not_allowed,
        };

        code errc{};               ///< The category of the failure.
        syntax detail{};           ///< Parse failure detail, `none` otherwise.
        std::size_t offset{};      ///< Byte offset where the error was detected.
        std::size_t line{};        ///< Line number (1-based, 0 if unknown).
        std::size_t column{};      ///< Column number (1-based, 0 if unknown).
        std::string msg{};         ///< Human-readable diagnostic message.
        std::string context{};     ///< Source excerpt around the failure.
        std::shared_ptr<const Error> cause{}; ///< Underlying error, if any.

        /// @brief Builds a positioned error against the text it refers to
        ///
        /// @details
        /// Line and column are computed from @p text and @p o, and the
        /// `context` excerpt is taken from up to 20 bytes on each side.
        STANZA_API static Error at(code c, syntax s, std::string_view text, std::size_t o, std::string_view m);

        /// @brief Builds an error that carries no source position
        STANZA_API static Error make(code c, std::string_view m, std::string_view ctx = {});

        /// @brief Returns the position recorded in this error
        [[nodiscard]] Position position() const noexcept { return { offset, line, column }; }

        /// @brief Renders `[Kind] message at line L, column C`
        [[nodiscard]] STANZA_API std::string what() const;
    };

    /// @ingroup StanzaError
    /// @brief Name of an error category, e.g. `"TypeMismatch"`
    [[nodiscard]] STANZA_API std::string_view to_string(Error::code c) noexcept;

} // namespace Stanza
