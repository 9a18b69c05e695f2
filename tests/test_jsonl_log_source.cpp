#include <catch2/catch_test_macros.hpp>
#include "source/jsonl_log_source.hpp"
#include "mocks/audit_fixtures.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace bqlineage;
using namespace bqlineage::testing;

namespace {

// RAII temporary file
struct TmpFile {
    std::filesystem::path path;
    explicit TmpFile(const std::string& content)
        : path(std::filesystem::temp_directory_path() / "bqlineage_test_events.jsonl") {
        std::ofstream f(path);
        f << content;
    }
    ~TmpFile() { std::filesystem::remove(path); }
};

size_t drain(IAuditRecordCursor& cursor) {
    size_t n = 0;
    while (cursor.next()) ++n;
    return n;
}

} // anonymous namespace

TEST_CASE("JSONL source yields one record per line", "[jsonl]") {
    TmpFile file(job_change_entry("1", "p.d.t", {"p.d.a"}) + "\n\n   \n"
                 + job_change_entry("2", "p.d.t", {"p.d.b"}) + "\n");
    JsonlLogSource source(file.path.string());

    auto cursor = source.fetch("ignored filter", 100, std::nullopt);
    auto first = cursor->next();
    REQUIRE(first.has_value());
    CHECK(first->insert_id() == "1");
    CHECK(drain(*cursor) == 1);
}

TEST_CASE("JSONL source honors max_results and LIMIT", "[jsonl]") {
    TmpFile file(job_change_entry("1", "p.d.t", {"p.d.a"}) + "\n"
                 + job_change_entry("2", "p.d.t", {"p.d.b"}) + "\n"
                 + job_change_entry("3", "p.d.t", {"p.d.c"}) + "\n");
    JsonlLogSource source(file.path.string());

    CHECK(drain(*source.fetch("", 100, 2)) == 2);
    CHECK(drain(*source.query("SELECT * FROM t WHERE x LIMIT 1;")) == 1);
    CHECK(drain(*source.query("SELECT * FROM t;")) == 3);
}

TEST_CASE("JSONL source errors are thrown from the cursor", "[jsonl]") {
    SECTION("Missing file") {
        JsonlLogSource source("/nonexistent/bqlineage/events.jsonl");
        auto cursor = source.fetch("", 100, std::nullopt);
        CHECK_THROWS_AS(cursor->next(), std::runtime_error);
    }

    SECTION("Malformed line") {
        TmpFile file(job_change_entry("1", "p.d.t", {"p.d.a"}) + "\n{broken\n");
        JsonlLogSource source(file.path.string());
        auto cursor = source.fetch("", 100, std::nullopt);
        REQUIRE(cursor->next().has_value());
        CHECK_THROWS_AS(cursor->next(), std::runtime_error);
    }

    SECTION("Line is not an object") {
        TmpFile file("[1, 2, 3]\n");
        JsonlLogSource source(file.path.string());
        CHECK_THROWS_AS(source.fetch("", 100, std::nullopt)->next(), std::runtime_error);
    }
}
