#pragma once


/*
    ------------------------------------------
    Stanza::validate - Data-driven field rules
    ------------------------------------------
    A schema is a list of `field_rules`, each naming a path (relative to
    the validated node) and the rules its value must satisfy:

        - `required{}`         the path must resolve
        - `type_is{ kind }`    the value has the given kind
        - `pattern{ regex }`   the value is a string matching the
                               ECMAScript regex somewhere (`regex_search`)
        - `range{ min, max }`  the value is a number in `[min, max]`
        - `length{ min, max }` string byte length, or element/member count
                               of a container, lies in `[min, max]`
        - `fallback{ value }`  value reported for the field when it is
                               missing

    A missing field fails `required` and is skipped by every other rule,
    so optional fields are expressed by leaving `required` out.

    `validate_values` runs the same checks and also collects each valid
    field's value converted to a `scalar`: strings decoded, numbers as
    doubles, booleans and `null` as themselves, arrays and objects as
    their raw JSON text. Missing fields take their `fallback`, if any.
    A field with a violation gets no value.

    `validate` never stops early: it returns one `Error` (code
    `validation`) per failed rule, in schema order. Where an accessor
    failure caused the violation, it is attached as `cause`.

        const Stanza::field_rules schema[] = {
            { "name", { Stanza::required{}, Stanza::length{ 1, 64 } } },
            { "age",  { Stanza::range{ 0, 150 } } },
        };
        auto errors = Stanza::validate(doc.root(), schema);

        auto res = Stanza::validate_values(doc.root(), schema);
        double age = res.values["age"].as_number();
*/

#include <cstddef>
#include <functional>
#include <limits>
#include <map>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/node.hpp"
#include "stanza/query.hpp"

namespace Stanza {

    struct required {};

    struct pattern {
        std::string regex;
    };

    struct range {
        double min = std::numeric_limits<double>::lowest();
        double max = std::numeric_limits<double>::max();
    };

    struct length {
        std::size_t min = 0;
        std::size_t max = std::numeric_limits<std::size_t>::max();
    };

    struct type_is {
        kind expected = kind::invalid;
    };

    struct fallback {
        scalar value;
    };

    using rule = std::variant<required, pattern, range, length, type_is, fallback>;

    /// @brief The rules applying to one path
    struct field_rules {
        std::string field;
        std::vector<rule> rules;
    };

    /// @brief Checks @p target against @p schema
    /// @return Every violation found; empty when @p target is valid
    [[nodiscard]] STANZA_API std::vector<Error> validate(node target, std::span<const field_rules> schema);

    /// @brief Outcome of `validate_values`
    struct validation_result {
        std::map<std::string, scalar, std::less<>> values;
        std::vector<Error> errors;

        [[nodiscard]] bool ok() const noexcept { return errors.empty(); }
    };

    /// @brief Checks @p target against @p schema and collects the converted field values
    [[nodiscard]] STANZA_API validation_result validate_values(node target, std::span<const field_rules> schema);

} // namespace Stanza
