#pragma once

#include "core/json.hpp"
#include "lineage/table_ref.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bqlineage {

/**
 * @brief One completed, non-errored query job extracted from an audit record
 */
struct QueryEvent {
    std::string timestamp;                          // As reported by the source
    std::string source_id;                          // "<logName>-<insertId>"
    std::string job_name;
    std::optional<std::string> actor_email;
    std::optional<std::string> statement_type;
    std::optional<int64_t> billed_bytes;

    std::optional<BigQueryTableRef> destination_table;  // Absent for read-only queries
    std::vector<BigQueryTableRef> referenced_tables;
    std::vector<BigQueryTableRef> referenced_views;

    // Only populated with debug_include_full_payloads
    std::optional<std::string> query;
    std::optional<JsonValue> payload;
};

} // namespace bqlineage
