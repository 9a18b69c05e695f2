#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace bqlineage {

/**
 * @brief Configured extraction window plus the buffer applied on each side
 *
 * Jobs that started before start_time may only be logged after it, so the
 * fetch window is [start_time - buffer, end_time + buffer).
 */
struct TimeWindow {
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::chrono::minutes buffer{15};

    [[nodiscard]] std::chrono::system_clock::time_point padded_start() const {
        return start_time - buffer;
    }
    [[nodiscard]] std::chrono::system_clock::time_point padded_end() const {
        return end_time + buffer;
    }
};

/**
 * @brief Renders the vendor-side queries for both fetch modes
 *
 * Logging API mode uses a filter expression over protoPayload fields;
 * exported audit table mode uses a SQL query over the exported
 * cloudaudit_googleapis_com_data_access table(s).
 */
class AuditFilterBuilder {
public:
    // Logging service filter for completed, successful query jobs in the window
    [[nodiscard]] static std::string logging_filter(const TimeWindow& window);

    /**
     * @brief SQL for one audit dataset
     * @param dataset "project.dataset" holding the exported audit tables
     * @param date_sharded Read cloudaudit_googleapis_com_data_access_YYYYMMDD
     *        shards instead of the time-partitioned table
     * @param limit Optional LIMIT clause (used by capability checks)
     */
    [[nodiscard]] static std::string audit_table_query(
        const std::string& dataset,
        const TimeWindow& window,
        bool date_sharded,
        std::optional<uint64_t> limit = std::nullopt);

    // Window bounds as recorded on the report for the given mode
    [[nodiscard]] static std::string format_bound(
        std::chrono::system_clock::time_point tp, bool date_shard);
};

} // namespace bqlineage
