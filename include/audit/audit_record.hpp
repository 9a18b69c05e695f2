#pragma once

#include "core/json.hpp"

#include <format>
#include <string>

namespace bqlineage {

// ============================================================================
// Raw Audit Record
// ============================================================================

/**
 * @brief One audit log entry exactly as a log source returned it
 *
 * The entry is a LogEntry-shaped JSON object: logName, insertId, timestamp,
 * protoPayload, and (for rows of an exported audit table) a top-level
 * metadata string.
 */
struct RawAuditRecord {
    JsonValue entry;

    RawAuditRecord() = default;
    explicit RawAuditRecord(JsonValue e) : entry(std::move(e)) {}

    [[nodiscard]] std::string log_name() const {
        return entry.string_at("logName").value_or("");
    }

    [[nodiscard]] std::string insert_id() const {
        return entry.string_at("insertId").value_or("");
    }

    [[nodiscard]] std::string timestamp() const {
        return entry.string_at("timestamp").value_or("");
    }

    [[nodiscard]] JsonValue payload() const {
        return entry["protoPayload"];
    }

    // "<logName>-<insertId>", used as the failure key
    [[nodiscard]] std::string source_id() const {
        return std::format("{}-{}", log_name(), insert_id());
    }
};

} // namespace bqlineage
