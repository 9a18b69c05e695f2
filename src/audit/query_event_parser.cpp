#include "audit/query_event_parser.hpp"
#include "core/utils.hpp"

#include <format>
#include <initializer_list>
#include <optional>
#include <stdexcept>

namespace bqlineage {

// Constexpr payload keys (used 2+ times across record shapes)
static constexpr std::string_view kProtoPayload   = "protoPayload";
static constexpr std::string_view kServiceData    = "serviceData";
static constexpr std::string_view kJobCompleted   = "jobCompletedEvent";
static constexpr std::string_view kMetadata       = "metadata";
static constexpr std::string_view kJobChange      = "jobChange";
static constexpr std::string_view kJob            = "job";
static constexpr std::string_view kJobStatus      = "jobStatus";
static constexpr std::string_view kTimestamp      = "timestamp";
static constexpr std::string_view kQuery          = "query";
static constexpr std::string_view kDestination    = "destinationTable";
static constexpr std::string_view kStatementType  = "statementType";
static constexpr std::string_view kRefTables      = "referencedTables";
static constexpr std::string_view kRefViews       = "referencedViews";
static constexpr std::string_view kDone           = "DONE";

namespace {

/**
 * @brief Dotted path up to and including the first absent key, if any.
 */
std::optional<std::string> missing_path(const JsonValue& node,
                                        std::initializer_list<std::string_view> keys) {
    const auto missing = node.first_missing_key(keys);
    if (!missing) return std::nullopt;

    std::string path;
    for (const auto key : keys) {
        if (!path.empty()) path += '.';
        path += key;
        if (key == *missing) break;
    }
    return path;
}

void require(std::vector<std::string>& missing, AuditSchema schema, const JsonValue& node,
             std::initializer_list<std::string_view> keys) {
    if (auto path = missing_path(node, keys)) {
        missing.push_back(std::format("{}: {}", audit_schema_name(schema), *path));
    }
}

ParseFailure make_failure(AuditSchema schema, std::vector<std::string> missing, std::string reason = {}) {
    ParseFailure failure;
    failure.schema = schema;
    failure.missing_paths = std::move(missing);
    failure.reason = std::move(reason);
    return failure;
}

// BigQuery encodes int64 as JSON strings; accept numbers as well
std::optional<int64_t> int64_field(const JsonValue& node) {
    if (node.is_number()) return node.as_int64();
    if (node.is_string()) return utils::try_parse_int<int64_t>(node.get<std::string>());
    return std::nullopt;
}

std::optional<std::string> string_field(const JsonValue& node) {
    if (!node.is_string()) return std::nullopt;
    return node.get<std::string>();
}

bool has_error_result(const JsonValue& status, std::string_view key) {
    const auto err = status[key];
    return !err.is_null() && !(err.is_object() && err.empty());
}

// Append table refs from a JSON array (spec objects or "projects/..." strings)
void append_refs(const JsonValue& arr, std::vector<BigQueryTableRef>& out) {
    if (!arr.is_array()) return;
    out.reserve(out.size() + arr.size());
    for (const auto& item : arr) {
        if (item.is_object()) {
            out.push_back(BigQueryTableRef::from_spec_obj(item));
        } else if (item.is_string()) {
            out.push_back(BigQueryTableRef::from_string_name(item.get<std::string>()));
        } else {
            throw std::invalid_argument("table reference is neither an object nor a string");
        }
    }
}

std::optional<BigQueryTableRef> destination_ref(const JsonValue& node) {
    if (node.is_object()) return BigQueryTableRef::from_spec_obj(node);
    if (node.is_string() && !node.get<std::string>().empty()) {
        return BigQueryTableRef::from_string_name(node.get<std::string>());
    }
    return std::nullopt;
}

} // anonymous namespace

std::string ParseFailure::describe() const {
    std::string out = std::format("schema={}", audit_schema_name(schema));
    if (!missing_paths.empty()) {
        out += " missing=[";
        for (size_t i = 0; i < missing_paths.size(); ++i) {
            if (i > 0) out += ", ";
            out += missing_paths[i];
        }
        out += ']';
    }
    if (!reason.empty()) {
        out += " reason=";
        out += reason;
    }
    return out;
}

QueryEventParser::QueryEventParser(const Config& config)
    : config_(config) {}

AuditSchema QueryEventParser::detect_schema(const RawAuditRecord& record) {
    const auto payload = record.payload();
    if (payload.contains(kServiceData)) return AuditSchema::JOB_COMPLETED_V1;
    if (record.entry[kMetadata].is_string()) return AuditSchema::EXPORTED_METADATA;
    if (payload[kMetadata].is_object()) return AuditSchema::JOB_CHANGE_V2;
    return AuditSchema::UNKNOWN;
}

ParseOutcome QueryEventParser::parse(const RawAuditRecord& record) const {
    switch (detect_schema(record)) {
        case AuditSchema::JOB_COMPLETED_V1:
            return parse_job_completed_v1(record);

        case AuditSchema::JOB_CHANGE_V2:
            return parse_job_change(record, record.payload()[kMetadata], AuditSchema::JOB_CHANGE_V2);

        case AuditSchema::EXPORTED_METADATA: {
            std::vector<std::string> missing;
            require(missing, AuditSchema::EXPORTED_METADATA, record.entry, {kTimestamp});
            require(missing, AuditSchema::EXPORTED_METADATA, record.entry, {kProtoPayload});
            if (!missing.empty()) {
                return make_failure(AuditSchema::EXPORTED_METADATA, std::move(missing));
            }
            JsonValue metadata;
            try {
                metadata = JsonValue::parse(record.entry[kMetadata].get<std::string>());
            } catch (const JsonValue::parse_error& e) {
                return make_failure(AuditSchema::EXPORTED_METADATA, {},
                                    std::format("metadata is not valid JSON: {}", e.what()));
            }
            return parse_job_change(record, metadata, AuditSchema::EXPORTED_METADATA);
        }

        case AuditSchema::UNKNOWN:
            break;
    }

    // No shape matched: name the first missing path of every shape
    std::vector<std::string> missing;
    require(missing, AuditSchema::JOB_COMPLETED_V1, record.entry,
            {kProtoPayload, kServiceData, kJobCompleted, kJob});
    require(missing, AuditSchema::JOB_CHANGE_V2, record.entry,
            {kProtoPayload, kMetadata, kJobChange, kJob});
    require(missing, AuditSchema::EXPORTED_METADATA, record.entry, {kMetadata});
    return make_failure(AuditSchema::UNKNOWN, std::move(missing));
}

ParseOutcome QueryEventParser::parse_job_completed_v1(const RawAuditRecord& record) const {
    constexpr auto schema = AuditSchema::JOB_COMPLETED_V1;
    const auto payload = record.payload();

    std::vector<std::string> missing;
    require(missing, schema, payload, {kServiceData, kJobCompleted, kJob});
    if (!missing.empty()) return make_failure(schema, std::move(missing));

    const auto job = payload.at_path({kServiceData, kJobCompleted, kJob});
    require(missing, schema, job, {"jobConfiguration", kQuery});
    require(missing, schema, job, {"jobStatistics"});
    if (!missing.empty()) return make_failure(schema, std::move(missing));

    const auto status = job[kJobStatus];
    if (const auto state = string_field(status["state"]); state && *state != kDone) {
        return make_failure(schema, {}, std::format("job state is {}", *state));
    }
    if (has_error_result(status, "error")) {
        return make_failure(schema, {}, "job finished with an error");
    }

    const auto query_conf = job.at_path({"jobConfiguration", kQuery});
    const auto stats = job["jobStatistics"];

    QueryEvent event;
    event.timestamp = record.timestamp();
    event.source_id = record.source_id();
    event.job_name = string_field(job.at_path({"jobName", "jobId"})).value_or("");
    event.actor_email = string_field(payload.at_path({"authenticationInfo", "principalEmail"}));
    event.statement_type = string_field(query_conf[kStatementType]);
    event.billed_bytes = int64_field(stats["totalBilledBytes"]);

    try {
        event.destination_table = destination_ref(query_conf[kDestination]);
        append_refs(stats[kRefTables], event.referenced_tables);
        append_refs(stats[kRefViews], event.referenced_views);
    } catch (const std::invalid_argument& e) {
        return make_failure(schema, {}, std::format("bad table reference: {}", e.what()));
    }

    if (config_.include_full_payloads) {
        event.query = string_field(query_conf[kQuery]);
        event.payload = payload;
    }

    if (event.job_name.empty()) {
        utils::log::debug(std::format("jobName absent in query event {}", event.source_id));
    }
    return event;
}

ParseOutcome QueryEventParser::parse_job_change(const RawAuditRecord& record,
                                                const JsonValue& metadata,
                                                AuditSchema schema) const {
    std::vector<std::string> missing;
    require(missing, schema, metadata, {kJobChange, kJob});
    if (!missing.empty()) return make_failure(schema, std::move(missing));

    const auto job = metadata.at_path({kJobChange, kJob});
    require(missing, schema, job, {"jobConfig", "queryConfig"});
    require(missing, schema, job, {"jobStats", "queryStats"});
    if (!missing.empty()) return make_failure(schema, std::move(missing));

    const auto status = job[kJobStatus];
    if (const auto state = string_field(status["jobState"]); state && *state != kDone) {
        return make_failure(schema, {}, std::format("job state is {}", *state));
    }
    if (has_error_result(status, "errorResult")) {
        return make_failure(schema, {}, "job finished with an error");
    }

    const auto query_config = job.at_path({"jobConfig", "queryConfig"});
    const auto query_stats = job.at_path({"jobStats", "queryStats"});
    const auto payload = record.payload();

    QueryEvent event;
    event.timestamp = record.timestamp();
    event.source_id = record.source_id();
    event.job_name = string_field(job["jobName"]).value_or("");
    event.actor_email = string_field(payload.at_path({"authenticationInfo", "principalEmail"}));
    event.statement_type = string_field(query_config[kStatementType]);
    event.billed_bytes = int64_field(query_stats["totalBilledBytes"]);

    try {
        event.destination_table = destination_ref(query_config[kDestination]);
        append_refs(query_stats[kRefTables], event.referenced_tables);
        append_refs(query_stats[kRefViews], event.referenced_views);
    } catch (const std::invalid_argument& e) {
        return make_failure(schema, {}, std::format("bad table reference: {}", e.what()));
    }

    if (config_.include_full_payloads) {
        event.query = string_field(query_config[kQuery]);
        event.payload = schema == AuditSchema::EXPORTED_METADATA ? record.entry : payload;
    }
    return event;
}

} // namespace bqlineage
