#pragma once

#include "audit/audit_record.hpp"
#include "audit/query_event.hpp"
#include "core/types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace bqlineage {

/**
 * @brief Why a raw record could not become a QueryEvent
 */
struct ParseFailure {
    AuditSchema schema = AuditSchema::UNKNOWN;  // Shape that was attempted (UNKNOWN = none matched)
    std::vector<std::string> missing_paths;     // e.g. "job_change_v2: metadata.jobChange"
    std::string reason;                         // Non-path failures (job not DONE, bad table name)

    [[nodiscard]] std::string describe() const;
};

using ParseOutcome = std::variant<QueryEvent, ParseFailure>;

/**
 * @brief Turns raw audit records into QueryEvents
 *
 * Three record shapes are supported, selected by a presence check on the
 * distinguishing key before full parsing:
 * - JOB_COMPLETED_V1:  protoPayload.serviceData.jobCompletedEvent.job
 * - JOB_CHANGE_V2:     protoPayload.metadata.jobChange.job
 * - EXPORTED_METADATA: top-level metadata JSON string holding jobChange
 *
 * Never throws on malformed input. Jobs whose status is present and not
 * DONE, or that carry an error result, are reported as failures.
 *
 * Thread-safety: stateless after construction
 */
class QueryEventParser {
public:
    struct Config {
        bool include_full_payloads = false;
    };

    QueryEventParser() : QueryEventParser(Config{}) {}
    explicit QueryEventParser(const Config& config);

    [[nodiscard]] static AuditSchema detect_schema(const RawAuditRecord& record);

    [[nodiscard]] ParseOutcome parse(const RawAuditRecord& record) const;

private:
    ParseOutcome parse_job_completed_v1(const RawAuditRecord& record) const;
    ParseOutcome parse_job_change(const RawAuditRecord& record,
                                  const JsonValue& metadata,
                                  AuditSchema schema) const;

    Config config_;
};

} // namespace bqlineage
