#include <print>
#include <fstream>

#include "stanza/stanza.hpp"

using namespace std::chrono_literals;

int main(int argc, char** argv) {

    Stanza::ParseOptions opts;
    opts.logger = Stanza::stderr_logger(Stanza::log_level::debug);

    auto r = Stanza::parse(R"({
        "team": "core",
        "users": [
            {"name": "ada",   "age": 36, "dept": "core", "active": true},
            {"name": "linus", "age": 54, "dept": "os",   "active": false},
            {"name": "grace", "age": 85, "dept": "core", "active": true},
            {"name": "ken",   "age": 81, "dept": "os",   "active": true}
        ]
    })", opts);
    if (!r) {
        std::println("Parse error! -> {}", r.error().what());
        return 1;
    }

    Stanza::document doc = std::move(*r);
    std::println("team: {}", doc.get_path("team").string_or("?"));
    std::println("second user: {}", doc.get_path("users[1].name").string_or("?"));
    std::println("missing: {}", doc.get_path("users.9.name").string_or("<none>"));

    Stanza::node users = doc.get_path("users");
    auto active = users.query()
        .where("active", "=", true)
        .sort_by("age", "desc")
        .limit(2)
        .to_vector();
    if (!active) {
        std::println("Query error! -> {}", active.error().what());
        return 1;
    }
    for (auto u : *active)
        std::println("  {} ({})", u["name"].string_or(""), u["age"].int_or(0));

    auto stats = users.aggregate()
        .group_by("dept")
        .count("n")
        .avg("age", "mean_age")
        .execute();
    if (!stats) {
        std::println("Aggregation error! -> {}", stats.error().what());
        return 1;
    }
    for (const auto& [dept, row] : stats->as_group())
        std::println("  {}: n={} mean_age={}", dept, row["n"].as_int(), row["mean_age"].number_or(0));

    Stanza::path_cache cache;
    for (int i = 0; i < 3; i++)
        (void)cache.resolve(doc, "users.0.name", 5s);
    std::println("cache hit rate: {}", cache.stats().hit_rate());

    if (argc < 2) return 0;

    std::ifstream ifs(argv[1]);
    if (!ifs) {
        std::println("Failed to open file");
        return -1;
    }

    auto file_r = Stanza::parse(ifs, opts);
    if (!file_r) {
        std::println("Parse error! -> {}", file_r.error().what());
        return 1;
    }

    Stanza::node root = file_r->root();
    std::println("{} with {} children", root.type_name(), root.size());
    for (auto k : root.keys())
        std::println("  {}: {}", k, root[k].type_name());

    return 0;
}
