#include <catch2/catch_test_macros.hpp>
#include "core/utils.hpp"

using namespace bqlineage;
using namespace std::chrono;

TEST_CASE("parse_utc reads audit timestamps", "[utils]") {
    const auto expected = sys_days{2024y / 3 / 5} + hours{7} + minutes{8} + seconds{9};

    SECTION("Z suffix") {
        auto tp = utils::parse_utc("2024-03-05T07:08:09Z");
        REQUIRE(tp.has_value());
        CHECK(*tp == expected);
    }

    SECTION("Fractional seconds are dropped") {
        auto tp = utils::parse_utc("2024-03-05T07:08:09.123456Z");
        REQUIRE(tp.has_value());
        CHECK(*tp == expected);
    }

    SECTION("Space separator") {
        auto tp = utils::parse_utc("2024-03-05 07:08:09");
        REQUIRE(tp.has_value());
        CHECK(*tp == expected);
    }
}

TEST_CASE("parse_utc rejects malformed input", "[utils]") {
    CHECK_FALSE(utils::parse_utc("").has_value());
    CHECK_FALSE(utils::parse_utc("2024-03-05").has_value());
    CHECK_FALSE(utils::parse_utc("2024/03/05T07:08:09Z").has_value());
    CHECK_FALSE(utils::parse_utc("2024-13-05T07:08:09Z").has_value());
    CHECK_FALSE(utils::parse_utc("2024-02-30T07:08:09Z").has_value());
    CHECK_FALSE(utils::parse_utc("2024-03-05T25:08:09Z").has_value());
}

TEST_CASE("format_utc renders filter and shard bounds", "[utils]") {
    const auto tp = sys_days{2024y / 3 / 5} + hours{7} + minutes{8} + seconds{9};
    CHECK(utils::format_utc(tp) == "2024-03-05T07:08:09Z");
    CHECK(utils::format_utc(tp, utils::kDateShardFormat) == "20240305");
}

TEST_CASE("escape_json", "[utils]") {
    CHECK(utils::escape_json("plain") == "plain");
    CHECK(utils::escape_json("a\"b") == "a\\\"b");
    CHECK(utils::escape_json("a\\b") == "a\\\\b");
    CHECK(utils::escape_json("line\nnext\t") == "line\\nnext\\t");

    SECTION("Other control characters use \\u escapes") {
        CHECK(utils::escape_json(std::string("a\x01" "b")) == "a\\u0001b");
        CHECK(utils::escape_json(std::string("\x1f\b\f")) == "\\u001f\\u0008\\u000c");
        CHECK(utils::escape_json(std::string("nul\0", 4)) == "nul\\u0000");
    }
}

TEST_CASE("last_segment", "[utils]") {
    CHECK(utils::last_segment("projects/p/datasets/d/tables/t", '/') == "t");
    CHECK(utils::last_segment("p.d.t", '.') == "t");
    CHECK(utils::last_segment("t", '.') == "t");
}
