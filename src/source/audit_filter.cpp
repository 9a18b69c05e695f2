#include "source/audit_filter.hpp"
#include "core/utils.hpp"

#include <format>

namespace bqlineage {

namespace {

constexpr const char* kAuditTable = "cloudaudit_googleapis_com_data_access";

} // anonymous namespace

std::string AuditFilterBuilder::format_bound(
    std::chrono::system_clock::time_point tp, bool date_shard) {
    return utils::format_utc(tp, date_shard ? utils::kDateShardFormat : utils::kDateTimeFormat);
}

std::string AuditFilterBuilder::logging_filter(const TimeWindow& window) {
    const std::string start = format_bound(window.padded_start(), false);
    const std::string end = format_bound(window.padded_end(), false);

    return std::format(
        "resource.type=(\"bigquery_project\")\n"
        "AND\n"
        "(\n"
        "    protoPayload.methodName=\n"
        "        (\n"
        "            \"google.cloud.bigquery.v2.JobService.Query\"\n"
        "            OR\n"
        "            \"google.cloud.bigquery.v2.JobService.InsertJob\"\n"
        "        )\n"
        "    AND\n"
        "    protoPayload.metadata.jobChange.job.jobStatus.jobState=\"DONE\"\n"
        "    AND NOT protoPayload.metadata.jobChange.job.jobStatus.errorResult:*\n"
        "    AND (\n"
        "        protoPayload.metadata.jobChange.job.jobStats.queryStats.referencedTables:*\n"
        "        OR\n"
        "        protoPayload.metadata.jobChange.job.jobStats.queryStats.referencedViews:*\n"
        "    )\n"
        "    AND (\n"
        "        protoPayload.metadata.jobChange.job.jobStats.queryStats.referencedTables !~ \"projects/.*/datasets/_.*/tables/anon.*\"\n"
        "        AND\n"
        "        protoPayload.metadata.jobChange.job.jobStats.queryStats.referencedTables !~ \"projects/.*/datasets/.*/tables/INFORMATION_SCHEMA.*\"\n"
        "        AND\n"
        "        protoPayload.metadata.jobChange.job.jobStats.queryStats.referencedTables !~ \"projects/.*/datasets/.*/tables/__TABLES__\"\n"
        "        AND\n"
        "        protoPayload.metadata.jobChange.job.jobConfig.queryConfig.destinationTable !~ \"projects/.*/datasets/_.*/tables/anon.*\"\n"
        "    )\n"
        ")\n"
        "AND\n"
        "timestamp >= \"{}\"\n"
        "AND\n"
        "timestamp < \"{}\"",
        start, end);
}

std::string AuditFilterBuilder::audit_table_query(
    const std::string& dataset,
    const TimeWindow& window,
    bool date_sharded,
    std::optional<uint64_t> limit) {

    std::string sql =
        "SELECT\n"
        "    timestamp,\n"
        "    logName,\n"
        "    insertId,\n"
        "    protopayload_auditlog AS protoPayload,\n"
        "    protopayload_auditlog.metadataJson AS metadata\n"
        "FROM\n";

    if (date_sharded) {
        sql += std::format("    `{}.{}_*`\nWHERE\n", dataset, kAuditTable);
        sql += std::format("    _TABLE_SUFFIX BETWEEN \"{}\" AND \"{}\" AND\n",
                           format_bound(window.padded_start(), true),
                           format_bound(window.padded_end(), true));
    } else {
        sql += std::format("    `{}.{}`\nWHERE\n", dataset, kAuditTable);
    }

    // Row timestamps are always compared at full precision, shards only
    // narrow the tables scanned
    sql += std::format(
        "    timestamp >= \"{}\"\n"
        "    AND timestamp < \"{}\"\n"
        "    AND protopayload_auditlog.serviceName=\"bigquery.googleapis.com\"\n"
        "    AND JSON_EXTRACT_SCALAR(protopayload_auditlog.metadataJson, \"$.jobChange.job.jobStatus.jobState\") = \"DONE\"\n"
        "    AND JSON_EXTRACT(protopayload_auditlog.metadataJson, \"$.jobChange.job.jobStatus.errorResults\") IS NULL\n"
        "    AND JSON_EXTRACT(protopayload_auditlog.metadataJson, \"$.jobChange.job.jobConfig.queryConfig\") IS NOT NULL",
        format_bound(window.padded_start(), false),
        format_bound(window.padded_end(), false));

    if (limit) {
        sql += std::format("\nLIMIT {}", *limit);
    }
    sql += ";";
    return sql;
}

} // namespace bqlineage
