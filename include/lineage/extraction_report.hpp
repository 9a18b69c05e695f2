#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace bqlineage {

/**
 * @brief Diagnostic counters and failures for one extraction run
 *
 * Owned by the caller. The extraction pipeline writes into it but never
 * reads it back to make decisions.
 */
struct ExtractionReport {
    // Event source / parser
    uint64_t num_total_log_entries = 0;
    uint64_t num_parsed_log_entries = 0;

    // Lineage map builder
    uint64_t num_total_lineage_entries = 0;
    uint64_t num_skipped_lineage_entries_missing_data = 0;
    uint64_t num_skipped_lineage_entries_not_allowed = 0;
    uint64_t num_skipped_lineage_entries_sql_parser_failure = 0;
    uint64_t num_skipped_lineage_entries_other = 0;

    size_t lineage_metadata_entries = 0;

    // Effective fetch windows (buffer applied)
    std::string log_entry_start_time;
    std::string log_entry_end_time;
    std::string audit_start_time;
    std::string audit_end_time;
    bool audit_metadata_datasets_missing = false;

    // key -> reasons, ordered for stable output
    std::map<std::string, std::vector<std::string>> failures;

    // destination -> upstreams, filled when upstream_lineage_in_report is on
    std::map<std::string, std::set<std::string>> upstream_lineage;

    /**
     * @brief Record a failure and log it at ERROR as "key => reason"
     */
    void report_failure(const std::string& key, const std::string& reason);

    [[nodiscard]] size_t failure_count() const;
};

} // namespace bqlineage
