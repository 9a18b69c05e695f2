#include <catch2/catch_test_macros.hpp>
#include "audit/query_event_parser.hpp"
#include "mocks/audit_fixtures.hpp"

#include <algorithm>
#include <format>
#include <variant>

using namespace bqlineage;
using namespace bqlineage::testing;

static RawAuditRecord record(const std::string& json) {
    return RawAuditRecord(JsonValue::parse(json));
}

static bool mentions(const ParseFailure& f, const std::string& path) {
    return std::any_of(f.missing_paths.begin(), f.missing_paths.end(),
                       [&](const std::string& p) { return p.find(path) != std::string::npos; });
}

// ============================================================================
// Structured audit log (jobChange)
// ============================================================================

TEST_CASE("Parse structured jobChange record", "[parser]") {
    const auto rec = record(job_change_entry("abc", "p.d.dest", {"p.d.a", "p.d.b"}, {"p.d.v"},
                                             "SELECT * FROM a"));
    CHECK(QueryEventParser::detect_schema(rec) == AuditSchema::JOB_CHANGE_V2);

    QueryEventParser parser;
    auto outcome = parser.parse(rec);
    REQUIRE(std::holds_alternative<QueryEvent>(outcome));
    const auto& e = std::get<QueryEvent>(outcome);

    REQUIRE(e.destination_table.has_value());
    CHECK(e.destination_table->to_string() == "projects/p/datasets/d/tables/dest");
    REQUIRE(e.referenced_tables.size() == 2);
    CHECK(e.referenced_tables[0].to_string() == "projects/p/datasets/d/tables/a");
    REQUIRE(e.referenced_views.size() == 1);
    CHECK(e.referenced_views[0].to_string() == "projects/p/datasets/d/tables/v");

    CHECK(e.timestamp == "2024-01-01T10:00:00Z");
    CHECK(e.source_id == "projects/p/logs/cloudaudit.googleapis.com%2Fdata_access-abc");
    CHECK(e.job_name == "projects/p/jobs/abc");
    CHECK(e.actor_email == "etl@p.iam.gserviceaccount.com");
    CHECK(e.statement_type == "CREATE_TABLE_AS_SELECT");
    CHECK(e.billed_bytes == 1024);

    // Query text is dropped unless full payloads are requested
    CHECK_FALSE(e.query.has_value());
    CHECK_FALSE(e.payload.has_value());
}

TEST_CASE("Full payload flag keeps query text", "[parser]") {
    QueryEventParser parser(QueryEventParser::Config{true});
    auto outcome = parser.parse(record(job_change_entry("abc", "p.d.dest", {"p.d.a"}, {},
                                                        "SELECT * FROM `p.d.a`")));
    REQUIRE(std::holds_alternative<QueryEvent>(outcome));
    const auto& e = std::get<QueryEvent>(outcome);
    CHECK(e.query == "SELECT * FROM `p.d.a`");
    CHECK(e.payload.has_value());
}

TEST_CASE("Read-only query has no destination", "[parser]") {
    QueryEventParser parser;
    auto outcome = parser.parse(record(job_change_entry("ro", std::nullopt, {"p.d.a"})));
    REQUIRE(std::holds_alternative<QueryEvent>(outcome));
    CHECK_FALSE(std::get<QueryEvent>(outcome).destination_table.has_value());
}

TEST_CASE("Non-DONE and errored jobs are unparsable", "[parser]") {
    QueryEventParser parser;

    SECTION("Running job") {
        auto outcome = parser.parse(record(job_change_entry("r", "p.d.t", {"p.d.a"}, {}, "", "RUNNING")));
        REQUIRE(std::holds_alternative<ParseFailure>(outcome));
        CHECK(std::get<ParseFailure>(outcome).reason.find("RUNNING") != std::string::npos);
    }

    SECTION("Errored job") {
        auto outcome = parser.parse(record(R"({
            "logName":"l","insertId":"e","timestamp":"2024-01-01T00:00:00Z",
            "protoPayload":{"metadata":{"jobChange":{"job":{
                "jobConfig":{"queryConfig":{"query":"x"}},
                "jobStats":{"queryStats":{}},
                "jobStatus":{"jobState":"DONE","errorResult":{"code":3,"message":"bad"}}}}}}})"));
        REQUIRE(std::holds_alternative<ParseFailure>(outcome));
        CHECK(std::get<ParseFailure>(outcome).schema == AuditSchema::JOB_CHANGE_V2);
    }
}

TEST_CASE("Missing required paths are named", "[parser]") {
    QueryEventParser parser;

    SECTION("jobChange without queryStats") {
        auto outcome = parser.parse(record(R"({
            "logName":"l","insertId":"m",
            "protoPayload":{"metadata":{"jobChange":{"job":{
                "jobConfig":{"queryConfig":{}}}}}}})"));
        REQUIRE(std::holds_alternative<ParseFailure>(outcome));
        const auto& f = std::get<ParseFailure>(outcome);
        CHECK(f.missing_paths.size() == 1);
        CHECK(mentions(f, "jobStats"));
        CHECK(f.describe().find("job_change_v2") != std::string::npos);
    }

    SECTION("Unknown shape lists every variant") {
        auto outcome = parser.parse(record(R"({"logName":"l","insertId":"u","protoPayload":{}})"));
        REQUIRE(std::holds_alternative<ParseFailure>(outcome));
        const auto& f = std::get<ParseFailure>(outcome);
        CHECK(f.schema == AuditSchema::UNKNOWN);
        CHECK(f.missing_paths.size() == 3);
        CHECK(mentions(f, "protoPayload.serviceData"));
        CHECK(mentions(f, "protoPayload.metadata"));
    }
}

TEST_CASE("Malformed table reference is unparsable", "[parser]") {
    QueryEventParser parser;
    auto outcome = parser.parse(record(R"({
        "logName":"l","insertId":"b",
        "protoPayload":{"metadata":{"jobChange":{"job":{
            "jobConfig":{"queryConfig":{"destinationTable":"projects/p/datasets/d/tables/t"}},
            "jobStats":{"queryStats":{"referencedTables":["not-a-table"]}},
            "jobStatus":{"jobState":"DONE"}}}}}})"));
    REQUIRE(std::holds_alternative<ParseFailure>(outcome));
    CHECK(std::get<ParseFailure>(outcome).reason.find("bad table reference") != std::string::npos);
}

// ============================================================================
// Older flat schema (jobCompletedEvent)
// ============================================================================

TEST_CASE("Parse flat jobCompletedEvent record", "[parser]") {
    const auto rec = record(R"({
        "logName":"projects/p/logs/data_access","insertId":"v1","timestamp":"2024-01-01T00:00:00Z",
        "protoPayload":{
            "authenticationInfo":{"principalEmail":"analyst@example.com"},
            "serviceData":{"jobCompletedEvent":{"job":{
                "jobName":{"projectId":"p","jobId":"job_1"},
                "jobConfiguration":{"query":{
                    "query":"INSERT INTO d.t SELECT * FROM d.s",
                    "destinationTable":{"projectId":"p","datasetId":"d","tableId":"t"},
                    "statementType":"INSERT"}},
                "jobStatistics":{
                    "totalBilledBytes":"2048",
                    "referencedTables":[{"projectId":"p","datasetId":"d","tableId":"s"}]},
                "jobStatus":{"state":"DONE"}}}}}})");
    CHECK(QueryEventParser::detect_schema(rec) == AuditSchema::JOB_COMPLETED_V1);

    QueryEventParser parser(QueryEventParser::Config{true});
    auto outcome = parser.parse(rec);
    REQUIRE(std::holds_alternative<QueryEvent>(outcome));
    const auto& e = std::get<QueryEvent>(outcome);
    CHECK(e.destination_table->to_string() == "projects/p/datasets/d/tables/t");
    REQUIRE(e.referenced_tables.size() == 1);
    CHECK(e.referenced_tables[0].to_string() == "projects/p/datasets/d/tables/s");
    CHECK(e.referenced_views.empty());
    CHECK(e.job_name == "job_1");
    CHECK(e.billed_bytes == 2048);
    CHECK(e.query == "INSERT INTO d.t SELECT * FROM d.s");
}

static std::string flat_record(const std::string& billed_bytes,
                               const std::string& destination = R"({"projectId":"p","datasetId":"d","tableId":"t"})") {
    return std::format(R"({{
        "logName":"l","insertId":"bb",
        "protoPayload":{{"serviceData":{{"jobCompletedEvent":{{"job":{{
            "jobConfiguration":{{"query":{{"query":"SELECT 1","destinationTable":{}}}}},
            "jobStatistics":{{
                "totalBilledBytes":{},
                "referencedTables":[{{"projectId":"p","datasetId":"d","tableId":"s"}}]}},
            "jobStatus":{{"state":"DONE"}}}}}}}}}}}})", destination, billed_bytes);
}

TEST_CASE("Numeric billed bytes outside int64 are dropped", "[parser]") {
    QueryEventParser parser;

    SECTION("In range") {
        auto outcome = parser.parse(record(flat_record("4096")));
        REQUIRE(std::holds_alternative<QueryEvent>(outcome));
        CHECK(std::get<QueryEvent>(outcome).billed_bytes == 4096);
    }

    SECTION("Too large") {
        auto outcome = parser.parse(record(flat_record("1e20")));
        REQUIRE(std::holds_alternative<QueryEvent>(outcome));
        CHECK_FALSE(std::get<QueryEvent>(outcome).billed_bytes.has_value());
    }

    SECTION("Too small") {
        auto outcome = parser.parse(record(flat_record("-1e19")));
        REQUIRE(std::holds_alternative<QueryEvent>(outcome));
        CHECK_FALSE(std::get<QueryEvent>(outcome).billed_bytes.has_value());
    }

    SECTION("Fractional") {
        auto outcome = parser.parse(record(flat_record("12.5")));
        REQUIRE(std::holds_alternative<QueryEvent>(outcome));
        CHECK_FALSE(std::get<QueryEvent>(outcome).billed_bytes.has_value());
    }
}

TEST_CASE("Destination spec with an empty part is unparsable", "[parser]") {
    QueryEventParser parser;
    auto outcome = parser.parse(record(
        flat_record("\"0\"", R"({"projectId":"p","datasetId":"d","tableId":""})")));
    REQUIRE(std::holds_alternative<ParseFailure>(outcome));
    CHECK(std::get<ParseFailure>(outcome).reason.find("tableId") != std::string::npos);
}

TEST_CASE("Flat schema missing jobStatistics", "[parser]") {
    QueryEventParser parser;
    auto outcome = parser.parse(record(R"({
        "logName":"l","insertId":"x",
        "protoPayload":{"serviceData":{"jobCompletedEvent":{"job":{
            "jobConfiguration":{"query":{"query":"SELECT 1"}}}}}}})"));
    REQUIRE(std::holds_alternative<ParseFailure>(outcome));
    const auto& f = std::get<ParseFailure>(outcome);
    CHECK(f.schema == AuditSchema::JOB_COMPLETED_V1);
    CHECK(mentions(f, "jobStatistics"));
}

// ============================================================================
// Exported audit table rows
// ============================================================================

TEST_CASE("Parse exported audit table row", "[parser]") {
    const auto rec = record(R"({
        "timestamp":"2024-01-01T00:00:00Z","logName":"l","insertId":"row1",
        "protoPayload":{"serviceName":"bigquery.googleapis.com"},
        "metadata":"{\"jobChange\":{\"job\":{\"jobConfig\":{\"queryConfig\":{\"destinationTable\":\"projects/p/datasets/d/tables/t\"}},\"jobStats\":{\"queryStats\":{\"referencedTables\":[\"projects/p/datasets/d/tables/s\"]}},\"jobStatus\":{\"jobState\":\"DONE\"}}}}"})");
    CHECK(QueryEventParser::detect_schema(rec) == AuditSchema::EXPORTED_METADATA);

    QueryEventParser parser;
    auto outcome = parser.parse(rec);
    REQUIRE(std::holds_alternative<QueryEvent>(outcome));
    const auto& e = std::get<QueryEvent>(outcome);
    CHECK(e.destination_table->to_string() == "projects/p/datasets/d/tables/t");
    REQUIRE(e.referenced_tables.size() == 1);
}

TEST_CASE("Exported row with invalid metadata JSON", "[parser]") {
    QueryEventParser parser;
    auto outcome = parser.parse(record(R"({
        "timestamp":"2024-01-01T00:00:00Z","logName":"l","insertId":"row2",
        "protoPayload":{},"metadata":"{not json"})"));
    REQUIRE(std::holds_alternative<ParseFailure>(outcome));
    CHECK(std::get<ParseFailure>(outcome).schema == AuditSchema::EXPORTED_METADATA);
}
