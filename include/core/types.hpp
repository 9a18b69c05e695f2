#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace bqlineage {

// ============================================================================
// Basic Enums
// ============================================================================

/**
 * @brief Shape of a raw audit record
 *
 * JOB_COMPLETED_V1   - older flat schema (serviceData.jobCompletedEvent.job)
 * JOB_CHANGE_V2      - structured audit log (metadata.jobChange.job)
 * EXPORTED_METADATA  - row of an exported audit table (metadata as JSON string)
 */
enum class AuditSchema {
    UNKNOWN,
    JOB_COMPLETED_V1,
    JOB_CHANGE_V2,
    EXPORTED_METADATA
};

inline constexpr const char* audit_schema_name(AuditSchema schema) {
    switch (schema) {
        case AuditSchema::UNKNOWN:           return "unknown";
        case AuditSchema::JOB_COMPLETED_V1:  return "job_completed_v1";
        case AuditSchema::JOB_CHANGE_V2:     return "job_change_v2";
        case AuditSchema::EXPORTED_METADATA: return "exported_metadata";
    }
    return "unknown";
}

enum class DatasetLineageType {
    COPY,
    TRANSFORMED,
    VIEW
};

inline constexpr const char* lineage_type_name(DatasetLineageType type) {
    switch (type) {
        case DatasetLineageType::COPY:        return "COPY";
        case DatasetLineageType::TRANSFORMED: return "TRANSFORMED";
        case DatasetLineageType::VIEW:        return "VIEW";
    }
    return "TRANSFORMED";
}

// ============================================================================
// Lineage Map
// ============================================================================

// Destination table key -> upstream table keys. Keys are canonical
// "projects/<p>/datasets/<d>/tables/<t>" strings.
using UpstreamKeySet = std::unordered_set<std::string>;
using LineageMap = std::unordered_map<std::string, UpstreamKeySet>;

} // namespace bqlineage
