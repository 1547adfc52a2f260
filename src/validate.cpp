#include "stanza/validate.hpp"

#include <format>
#include <memory>
#include <regex>


namespace Stanza {

    namespace {

        Error violation(std::string_view field, std::string_view what, std::string_view ctx = {}) {
            return Error::make(Error::code::validation, std::format("field '{}' {}", field, what), ctx);
        }

        Error violation(std::string_view field, std::string_view what, const Error& cause) {
            Error err = violation(field, what);
            err.cause = std::make_shared<const Error>(cause);
            return err;
        }

        scalar converted(const node& value) {
            switch (value.type()) {
            case kind::string:  return scalar{ value.string_or("") };
            case kind::number:  return scalar{ value.float_or(0.0) };
            case kind::boolean: return scalar{ value.bool_or(false) };
            case kind::null:    return scalar{ nullptr };
            default:            return scalar{ value.raw() };
            }
        }

        struct rule_checker {
            std::string_view field;
            node value;
            std::vector<Error>& out;

            void operator()(const required&) const {}
            void operator()(const fallback&) const {}

            void operator()(const type_is& r) const {
                if (value.type() != r.expected)
                    out.push_back(violation(field, std::format("must be of type {}", to_string(r.expected)),
                                            value.mismatch(to_string(r.expected))));
            }

            void operator()(const pattern& r) const {
                auto str = value.get_string();
                if (!str) {
                    out.push_back(violation(field, "must be a string to match a pattern", str.error()));
                    return;
                }
                try {
                    if (!std::regex_search(*str, std::regex{ r.regex, std::regex::ECMAScript }))
                        out.push_back(violation(field, std::format("does not match pattern '{}'", r.regex), *str));
                } catch (const std::regex_error& e) {
                    out.push_back(violation(field, std::format("has an invalid pattern '{}': {}", r.regex, e.what())));
                }
            }

            void operator()(const range& r) const {
                auto num = value.get_float();
                if (!num) {
                    out.push_back(violation(field, "must be a number", num.error()));
                    return;
                }
                if (*num < r.min || *num > r.max)
                    out.push_back(violation(field, std::format("must be within [{}, {}]", r.min, r.max), value.raw()));
            }

            void operator()(const length& r) const {
                std::size_t n = 0;
                if (value.is_string()) {
                    n = value.string_or("").size();
                } else if (value.is_array() || value.is_object()) {
                    n = value.size();
                } else {
                    out.push_back(violation(field, "has no length", value.mismatch("string, array or object")));
                    return;
                }
                if (n < r.min || n > r.max)
                    out.push_back(violation(field, std::format("length {} is outside [{}, {}]", n, r.min, r.max)));
            }
        };

    } // namespace

    validation_result validate_values(node target, std::span<const field_rules> schema) {
        validation_result res;
        for (const auto& fr : schema) {
            node value = target.get_path(fr.field);
            if (!value.exists()) {
                const fallback* substitute = nullptr;
                bool missing_required = false;
                for (const auto& r : fr.rules) {
                    if (std::holds_alternative<required>(r)) missing_required = true;
                    else if (auto* f = std::get_if<fallback>(&r); f && !substitute) substitute = f;
                }
                if (missing_required)
                    res.errors.push_back(violation(fr.field, "is required", value.mismatch("value")));
                else if (substitute)
                    res.values.insert_or_assign(fr.field, substitute->value);
                continue;
            }

            const std::size_t before = res.errors.size();
            rule_checker check{ fr.field, value, res.errors };
            for (const auto& r : fr.rules) std::visit(check, r);
            if (res.errors.size() == before)
                res.values.insert_or_assign(fr.field, converted(value));
        }
        return res;
    }

    std::vector<Error> validate(node target, std::span<const field_rules> schema) {
        return validate_values(target, schema).errors;
    }

} // namespace Stanza
