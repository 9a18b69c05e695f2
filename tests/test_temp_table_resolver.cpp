#include <catch2/catch_test_macros.hpp>
#include "lineage/temp_table_resolver.hpp"

#include <regex>
#include <unordered_set>

using namespace bqlineage;

namespace {

std::string key(const std::string& dataset, const std::string& table) {
    return BigQueryTableRef(TableIdentifier("p", dataset, table)).to_string();
}

std::vector<std::string> names(const std::set<BigQueryTableRef>& refs) {
    std::vector<std::string> out;
    for (const auto& r : refs) out.push_back(r.table_identifier().raw_table_name());
    return out;
}

} // anonymous namespace

// ============================================================================
// Classification
// ============================================================================

TEST_CASE("Temporary tables by dataset prefix", "[temp_tables]") {
    TempTableClassifier classifier;
    CHECK(classifier.is_temporary(TableIdentifier("p", "_script123", "t")));
    CHECK_FALSE(classifier.is_temporary(TableIdentifier("p", "sales", "_t")));
}

TEST_CASE("Temporary tables by name pattern", "[temp_tables]") {
    TempTableClassifier classifier({}, {"tmp_", ".*_staging$"});
    CHECK(classifier.is_temporary(TableIdentifier("p", "d", "tmp_orders")));
    CHECK(classifier.is_temporary(TableIdentifier("p", "d", "TMP_orders")));
    CHECK(classifier.is_temporary(TableIdentifier("p", "d", "orders_staging")));
    CHECK_FALSE(classifier.is_temporary(TableIdentifier("p", "d", "orders_tmp_x")));
    CHECK_FALSE(classifier.is_temporary(TableIdentifier("p", "_d", "orders")));
}

TEST_CASE("Invalid temp table pattern throws", "[temp_tables]") {
    CHECK_THROWS_AS(TempTableClassifier({}, {"tmp_("}), std::regex_error);
}

// ============================================================================
// Resolution
// ============================================================================

TEST_CASE("Non-temporary upstreams pass through", "[temp_tables]") {
    TempTableResolver resolver(TempTableClassifier{});
    LineageMap map{{key("d", "t"), {key("d", "a"), key("d", "b")}}};

    std::unordered_set<std::string> seen;
    CHECK(names(resolver.resolve_upstreams(map, key("d", "t"), seen))
          == std::vector<std::string>{"p.d.a", "p.d.b"});
    CHECK(seen.empty());
}

TEST_CASE("Temporary chains resolve transitively", "[temp_tables]") {
    TempTableResolver resolver(TempTableClassifier{});
    LineageMap map{
        {key("d", "final"), {key("_s", "t2"), key("d", "dim")}},
        {key("_s", "t2"), {key("_s", "t1")}},
        {key("_s", "t1"), {key("d", "raw")}},
    };

    std::unordered_set<std::string> seen;
    CHECK(names(resolver.resolve_upstreams(map, key("d", "final"), seen))
          == std::vector<std::string>{"p.d.dim", "p.d.raw"});
    CHECK(seen.size() == 2);
}

TEST_CASE("Temporary dead end contributes nothing", "[temp_tables]") {
    TempTableResolver resolver(TempTableClassifier{});
    LineageMap map{{key("d", "t"), {key("_s", "orphan")}}};

    std::unordered_set<std::string> seen;
    CHECK(resolver.resolve_upstreams(map, key("d", "t"), seen).empty());
}

TEST_CASE("Cyclic temporary tables terminate", "[temp_tables]") {
    TempTableResolver resolver(TempTableClassifier{});

    SECTION("Three-cycle") {
        LineageMap map{
            {key("d", "t"), {key("_s", "a")}},
            {key("_s", "a"), {key("_s", "b")}},
            {key("_s", "b"), {key("_s", "c")}},
            {key("_s", "c"), {key("_s", "a")}},
        };
        std::unordered_set<std::string> seen;
        CHECK(resolver.resolve_upstreams(map, key("d", "t"), seen).empty());
        CHECK(seen.size() == 3);
    }

    SECTION("Self-cycle with a real upstream") {
        LineageMap map{
            {key("d", "t"), {key("_s", "a")}},
            {key("_s", "a"), {key("_s", "a"), key("d", "raw")}},
        };
        std::unordered_set<std::string> seen;
        CHECK(names(resolver.resolve_upstreams(map, key("d", "t"), seen))
              == std::vector<std::string>{"p.d.raw"});
    }
}

TEST_CASE("Diamond through temporary tables expands once", "[temp_tables]") {
    TempTableResolver resolver(TempTableClassifier{});
    LineageMap map{
        {key("d", "t"), {key("_s", "left"), key("_s", "right")}},
        {key("_s", "left"), {key("_s", "base")}},
        {key("_s", "right"), {key("_s", "base")}},
        {key("_s", "base"), {key("d", "raw")}},
    };

    std::unordered_set<std::string> seen;
    CHECK(names(resolver.resolve_upstreams(map, key("d", "t"), seen))
          == std::vector<std::string>{"p.d.raw"});
    CHECK(seen.size() == 3);
}

TEST_CASE("Seen set is the caller's", "[temp_tables]") {
    TempTableResolver resolver(TempTableClassifier{});
    LineageMap map{
        {key("d", "t"), {key("_s", "a")}},
        {key("_s", "a"), {key("d", "raw")}},
    };

    std::unordered_set<std::string> seen{key("_s", "a")};
    CHECK(resolver.resolve_upstreams(map, key("d", "t"), seen).empty());

    std::unordered_set<std::string> fresh;
    CHECK(resolver.resolve_upstreams(map, key("d", "t"), fresh).size() == 1);
}
