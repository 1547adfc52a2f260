#include <catch2/catch_all.hpp>

#include "stanza/stanza.hpp"

#include <string>
#include <vector>

using namespace Catch;

namespace {

    Stanza::document must_parse(std::string_view s) {
        auto r = Stanza::parse(s);
        REQUIRE(r);
        return *r;
    }

    std::vector<std::string> names(const std::vector<Stanza::node>& nodes) {
        std::vector<std::string> out;
        for (auto n : nodes) out.push_back(n["name"].string_or("?"));
        return out;
    }

    constexpr std::string_view people = R"({"people":[
        { "name": "ada",   "age": 36, "team": "core", "tags": "lead,c++" },
        { "name": "bob",   "age": 25, "team": "web",  "tags": "js" },
        { "name": "cyd",   "age": 41, "team": "core", "tags": "c++,ml" },
        { "name": "dee",   "age": 25, "team": "ops" },
        { "name": "eve",   "team": "web", "tags": "sec" },
        { "name": "fay",   "age": "30", "team": "ops", "active": false }
    ]})";
}


TEST_CASE("Scenario: Filter Then Sort Ascending") {
    auto doc = must_parse(R"({"items":[{"v":5},{"v":15},{"v":10}]})");

    auto res = doc.root()["items"].query().where("v", ">", 7).sort_by("v", "asc").to_vector();
    REQUIRE(res);
    REQUIRE(res->size() == 2);
    REQUIRE((*res)[0]["v"].int_or(0) == 10);
    REQUIRE((*res)[1]["v"].int_or(0) == 15);
}

TEST_CASE("Comparison Operators") {
    auto doc = must_parse(people);
    auto list = doc.root()["people"];

    REQUIRE(names(list.query().where("age", "=", 25).to_vector().value()) == std::vector<std::string>{ "bob", "dee" });
    REQUIRE(names(list.query().where("age", Stanza::op::ge, 36).to_vector().value()) == std::vector<std::string>{ "ada", "cyd" });
    REQUIRE(names(list.query().where("age", "<", 30).to_vector().value()) == std::vector<std::string>{ "bob", "dee" });
    REQUIRE(names(list.query().where("age", "<=", 30).to_vector().value()) == std::vector<std::string>{ "bob", "dee", "fay" });
    REQUIRE(names(list.query().where("team", "!=", "core").to_vector().value()) == std::vector<std::string>{ "bob", "dee", "eve", "fay" });
    REQUIRE(names(list.query().where("name", ">", "cyd").to_vector().value()) == std::vector<std::string>{ "dee", "eve", "fay" });
    REQUIRE(names(list.query().where("active", "=", false).to_vector().value()) == std::vector<std::string>{ "fay" });
}

TEST_CASE("Numeric Strings Compare as Numbers") {
    auto doc = must_parse(people);
    auto list = doc.root()["people"];

    REQUIRE(names(list.query().where("age", "=", "30").to_vector().value()) == std::vector<std::string>{ "fay" });
    REQUIRE(names(list.query().where("age", ">", "29.5").to_vector().value()) == std::vector<std::string>{ "ada", "cyd", "fay" });
}

TEST_CASE("Missing Fields Fail Every Predicate") {
    auto doc = must_parse(people);
    auto list = doc.root()["people"];

    // "eve" has no age: excluded even by != and not_in
    REQUIRE(list.query().where("age", "!=", 99).count().value() == 5);
    REQUIRE(list.query().where_not_in("age", { 25 }).count().value() == 3);
    REQUIRE(list.query().where_contains("tags", "c++").count().value() == 2);
}

TEST_CASE("Set Membership and Substring Clauses") {
    auto doc = must_parse(people);
    auto list = doc.root()["people"];

    REQUIRE(names(list.query().where_in("team", { "ops", "web" }).to_vector().value())
            == std::vector<std::string>{ "bob", "dee", "eve", "fay" });
    REQUIRE(names(list.query().where_not_in("team", { "ops", "web" }).to_vector().value())
            == std::vector<std::string>{ "ada", "cyd" });
    REQUIRE(names(list.query().where_contains("tags", "ml").to_vector().value()) == std::vector<std::string>{ "cyd" });
    REQUIRE(list.query().where("team", "in", "core").count().value() == 2);
    REQUIRE(list.query().where_contains("age", "2").count().value() == 0);
}

TEST_CASE("Clauses Are Combined With AND") {
    auto doc = must_parse(people);
    auto res = doc.root()["people"].query()
                   .where("team", "=", "core")
                   .where("age", ">", 40)
                   .to_vector();
    REQUIRE(res);
    REQUIRE(names(*res) == std::vector<std::string>{ "cyd" });
}

TEST_CASE("Sorting is Stable and Puts Missing Keys Last") {
    auto doc = must_parse(people);
    auto list = doc.root()["people"];

    auto asc = list.query().sort_by("age").to_vector();
    REQUIRE(asc);
    REQUIRE(names(*asc) == std::vector<std::string>{ "bob", "dee", "fay", "ada", "cyd", "eve" });

    auto desc = list.query().sort_by("age", "desc").to_vector();
    REQUIRE(desc);
    REQUIRE(names(*desc) == std::vector<std::string>{ "cyd", "ada", "fay", "bob", "dee", "eve" });

    auto multi = list.query().sort_by("team").sort_by("name", "desc").to_vector();
    REQUIRE(multi);
    REQUIRE(names(*multi) == std::vector<std::string>{ "cyd", "ada", "fay", "dee", "eve", "bob" });
}

TEST_CASE("Mixed Kinds Sort in a Fixed Rank Order") {
    auto doc = must_parse(R"([
        {"k":"1a"}, {"k":10}, {"k":true}, {"k":"9"}, {"k":null},
        {"k":[1]}, {"k":"10"}, {"k":3}, {"k":false}, {"k":"b"}, {"k":{}}, {}, {"k":5}
    ])");
    auto rendered = [](const std::vector<Stanza::node>& nodes) {
        std::vector<std::string> out;
        for (auto n : nodes) {
            auto k = n["k"];
            out.emplace_back(k.exists() ? k.raw() : "-");
        }
        return out;
    };

    auto asc = doc.root().query().sort_by("k").to_vector();
    REQUIRE(asc);
    REQUIRE(rendered(*asc) == std::vector<std::string>{
        "null", "false", "true", "3", "5", "\"9\"", "10", "\"10\"", "\"1a\"", "\"b\"", "[1]", "{}", "-" });

    auto desc = doc.root().query().sort_by("k", "desc").to_vector();
    REQUIRE(desc);
    REQUIRE(rendered(*desc) == std::vector<std::string>{
        "[1]", "{}", "\"b\"", "\"1a\"", "10", "\"10\"", "\"9\"", "5", "3", "true", "false", "null", "-" });

    // Predicates keep their own rules: mismatched kinds stay unordered there.
    REQUIRE(doc.root().query().where("k", "<", 100).count().value() == 5);
}

TEST_CASE("Query Results Are Deterministic") {
    auto doc = must_parse(people);
    auto q = doc.root()["people"].query().where("age", ">=", 25).sort_by("age");

    auto first = q.to_vector();
    auto second = q.to_vector();
    REQUIRE(first);
    REQUIRE(second);
    REQUIRE(*first == *second);
}

TEST_CASE("Pagination Boundaries") {
    auto doc = must_parse(R"([0,1,2,3,4,5,6,7,8,9])");
    auto arr = doc.root();

    auto page = arr.query().offset(3).limit(4).to_vector();
    REQUIRE(page);
    REQUIRE(page->size() == 4);
    REQUIRE(page->front().int_or(-1) == 3);

    REQUIRE(arr.query().offset(8).limit(4).count().value() == 2);
    REQUIRE(arr.query().offset(10).count().value() == 0);
    REQUIRE(arr.query().offset(50).limit(2).count().value() == 0);
    REQUIRE(arr.query().limit(0).count().value() == 0);
    REQUIRE(arr.query().count().value() == 10);
}

TEST_CASE("Bare Elements Are Addressed by the Empty Path") {
    auto doc = must_parse(R"([3, 1, 2])");
    auto res = doc.root().query().where("", ">", 1).sort_by("").to_vector();
    REQUIRE(res);
    REQUIRE(res->size() == 2);
    REQUIRE((*res)[0].int_or(0) == 2);
    REQUIRE((*res)[1].int_or(0) == 3);
}

TEST_CASE("Objects Are Queried by Member Value") {
    auto doc = must_parse(R"({"a":{"p":3},"b":{"p":1},"c":{"p":2}})");
    auto res = doc.root().query().sort_by("p").to_vector();
    REQUIRE(res);
    REQUIRE(res->size() == 3);
    REQUIRE((*res)[0]["p"].int_or(0) == 1);
}

TEST_CASE("First Reports NotFound on Empty Results") {
    auto doc = must_parse(people);
    auto list = doc.root()["people"];

    auto hit = list.query().where("team", "=", "ops").first();
    REQUIRE(hit);
    REQUIRE((*hit)["name"].string_or("") == "dee");

    auto miss = list.query().where("team", "=", "hr").first();
    REQUIRE_FALSE(miss);
    REQUIRE(miss.error().errc == Stanza::Error::code::not_found);
}

TEST_CASE("Malformed Queries Report Errors") {
    auto doc = must_parse(people);

    auto bad_op = doc.root()["people"].query().where("age", "~", 3).to_vector();
    REQUIRE_FALSE(bad_op);
    REQUIRE(bad_op.error().errc == Stanza::Error::code::validation);

    auto bad_order = doc.root()["people"].query().sort_by("age", "sideways").count();
    REQUIRE_FALSE(bad_order);
    REQUIRE(bad_order.error().errc == Stanza::Error::code::validation);

    auto scalar_source = doc.root()["people"].index(0)["name"].query().to_vector();
    REQUIRE_FALSE(scalar_source);
    REQUIRE(scalar_source.error().errc == Stanza::Error::code::type_mismatch);

    auto absent_source = doc.root()["nobody"].query().count();
    REQUIRE_FALSE(absent_source);
    REQUIRE(absent_source.error().errc == Stanza::Error::code::not_found);
}

TEST_CASE("Operator Spellings Round-Trip") {
    for (auto o : { Stanza::op::eq, Stanza::op::ne, Stanza::op::gt, Stanza::op::ge, Stanza::op::lt,
                    Stanza::op::le, Stanza::op::in, Stanza::op::not_in, Stanza::op::contains }) {
        auto parsed = Stanza::parse_op(Stanza::to_string(o));
        REQUIRE(parsed);
        REQUIRE(*parsed == o);
    }
    REQUIRE_FALSE(Stanza::parse_op("=>"));
}

TEST_CASE("Scenario: Grouped Sum") {
    auto doc = must_parse(R"({"items":[{"g":"a","v":1},{"g":"a","v":3},{"g":"b","v":5}]})");

    auto res = doc.root()["items"].aggregate().group_by("g").sum("v", "total").execute();
    REQUIRE(res);
    REQUIRE(res->is_group());
    REQUIRE(res->size() == 2);
    REQUIRE((*res)["a"]["total"].as_float() == Approx(4.0));
    REQUIRE((*res)["b"]["total"].as_float() == Approx(5.0));
}

TEST_CASE("Flat Aggregation Over All Elements") {
    auto doc = must_parse(people);
    auto res = Stanza::aggregator{}
                   .count("n")
                   .sum("age", "sum")
                   .avg("age", "avg")
                   .max("age", "oldest")
                   .min("age", "youngest")
                   .execute(doc.root()["people"]);
    REQUIRE(res);

    const auto& r = *res;
    REQUIRE(r["n"].is_int());
    REQUIRE(r["n"].as_int() == 6);
    REQUIRE(r["sum"].as_float() == Approx(127.0)); // "30" is a string and "eve" has no age
    REQUIRE(r["avg"].as_float() == Approx(31.75));
    REQUIRE(r["oldest"].as_float() == Approx(41.0));
    REQUIRE(r["youngest"].as_float() == Approx(25.0));
    REQUIRE(r["unknown"].is_null());
}

TEST_CASE("Aggregates Over No Numeric Input") {
    auto doc = must_parse(R"([{"v":"x"},{}])");
    auto res = doc.root().aggregate().count("n").sum("v", "s").avg("v", "a").max("v", "hi").min("v", "lo").execute();
    REQUIRE(res);
    REQUIRE((*res)["n"].as_int() == 2);
    REQUIRE((*res)["s"].as_float() == 0.0);
    REQUIRE((*res)["a"].as_float() == 0.0);
    REQUIRE((*res)["hi"].is_null());
    REQUIRE((*res)["lo"].is_null());
}

TEST_CASE("Multi-Field Groups Use Composite Keys") {
    auto doc = must_parse(people);
    auto res = doc.root()["people"].aggregate().group_by("team", "age").count("n").execute();
    REQUIRE(res);

    REQUIRE((*res)["core|36"]["n"].as_int() == 1);
    REQUIRE((*res)["web|25"]["n"].as_int() == 1);
    REQUIRE((*res)["web|"]["n"].as_int() == 1);     // missing age
    REQUIRE((*res)["ops|\"30\""].is_null());          // strings contribute decoded text
    REQUIRE((*res)["ops|30"]["n"].as_int() == 1);
    REQUIRE(res->size() == 6);
}

TEST_CASE("Aggregation Requires a Container") {
    auto doc = must_parse(R"({"n":1})");

    auto scalar = doc.root()["n"].aggregate().count("c").execute();
    REQUIRE_FALSE(scalar);
    REQUIRE(scalar.error().errc == Stanza::Error::code::type_mismatch);

    auto unbound = Stanza::aggregator{}.count("c").execute();
    REQUIRE_FALSE(unbound);
    REQUIRE(unbound.error().errc == Stanza::Error::code::not_found);
}

TEST_CASE("Validation Rules") {
    auto doc = must_parse(R"({"name":"ada","email":"ada@example.org","age":36,"tags":["a","b","c"],"nick":5})");

    const Stanza::field_rules ok_schema[] = {
        { "name",  { Stanza::required{}, Stanza::length{ 1, 16 }, Stanza::type_is{ Stanza::kind::string } } },
        { "email", { Stanza::pattern{ R"(^[^@]+@[^@]+\.[a-z]+$)" } } },
        { "age",   { Stanza::range{ 0, 150 } } },
        { "tags",  { Stanza::length{ 1, 5 } } },
        { "phone", { Stanza::pattern{ "^[0-9]+$" } } }, // optional and absent
    };
    REQUIRE(Stanza::validate(doc.root(), ok_schema).empty());

    const Stanza::field_rules bad_schema[] = {
        { "phone", { Stanza::required{} } },
        { "age",   { Stanza::range{ 0, 18 } } },
        { "nick",  { Stanza::pattern{ "^[a-z]+$" } } },
        { "tags",  { Stanza::length{ 4, 10 } } },
        { "name",  { Stanza::type_is{ Stanza::kind::number } } },
    };
    auto errors = Stanza::validate(doc.root(), bad_schema);
    REQUIRE(errors.size() == 5);
    for (const auto& e : errors) REQUIRE(e.errc == Stanza::Error::code::validation);

    REQUIRE(errors[0].msg == "field 'phone' is required");
    REQUIRE(errors[0].cause);
    REQUIRE(errors[0].cause->errc == Stanza::Error::code::not_found);

    REQUIRE(errors[1].msg.starts_with("field 'age' must be within"));
    REQUIRE_FALSE(errors[1].cause);

    REQUIRE(errors[2].cause);
    REQUIRE(errors[2].cause->errc == Stanza::Error::code::type_mismatch);

    REQUIRE(errors[3].msg.find("length 3") != std::string::npos);

    REQUIRE(errors[4].cause->msg == "expected number, got string");
}

TEST_CASE("Validated Values Are Converted and Defaults Fill Gaps") {
    auto doc = must_parse(R"({"name":"caf\u00e9","age":36,"admin":false,"note":null,"tags":["a"],"bad":"x"})");

    const Stanza::field_rules schema[] = {
        { "name",   { Stanza::required{}, Stanza::type_is{ Stanza::kind::string } } },
        { "age",    { Stanza::range{ 0, 150 }, Stanza::fallback{ 18 } } },
        { "admin",  { Stanza::type_is{ Stanza::kind::boolean } } },
        { "note",   {} },
        { "tags",   { Stanza::length{ 1, 3 } } },
        { "level",  { Stanza::fallback{ "basic" } } },
        { "limit",  { Stanza::fallback{ 10 } } },
        { "extra",  {} },
        { "bad",    { Stanza::range{ 0, 1 } } },
        { "id",     { Stanza::required{}, Stanza::fallback{ 1 } } },
    };
    auto res = Stanza::validate_values(doc.root(), schema);

    REQUIRE_FALSE(res.ok());
    REQUIRE(res.errors.size() == 2);
    REQUIRE(res.errors[0].msg == "field 'bad' must be a number");
    REQUIRE(res.errors[1].msg == "field 'id' is required");

    REQUIRE(res.values.size() == 7);
    REQUIRE(res.values.at("name").as_string() == "caf\xC3\xA9");
    REQUIRE(res.values.at("age").as_number() == 36.0);
    REQUIRE(res.values.at("admin").as_bool() == false);
    REQUIRE(res.values.at("note").is_null());
    REQUIRE(res.values.at("tags").as_string() == R"(["a"])");
    REQUIRE(res.values.at("level").as_string() == "basic");
    REQUIRE(res.values.at("limit").as_number() == 10.0);
    REQUIRE_FALSE(res.values.contains("extra"));
    REQUIRE_FALSE(res.values.contains("bad"));
    REQUIRE_FALSE(res.values.contains("id"));

    REQUIRE(Stanza::validate(doc.root(), schema).size() == 2);
}

TEST_CASE("Invalid Patterns Are Reported, Not Thrown") {
    auto doc = must_parse(R"({"s":"abc"})");
    const Stanza::field_rules schema[] = { { "s", { Stanza::pattern{ "([a-z" } } } };

    auto errors = Stanza::validate(doc.root(), schema);
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].msg.find("invalid pattern") != std::string::npos);
}
