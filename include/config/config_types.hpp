#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bqlineage {

// ============================================================================
// Configuration Types
// ============================================================================

struct PatternConfig {
    std::vector<std::string> allow{".*"};
    std::vector<std::string> deny;
    bool ignore_case = true;
};

struct LineageConfig {
    std::optional<std::string> project_id;

    // Extraction window (UTC); buffer is applied on both sides when fetching
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::chrono::minutes max_query_duration{15};

    // Fetch mode
    bool use_exported_audit_metadata = false;
    std::optional<std::vector<std::string>> audit_metadata_datasets;  // "project.dataset"
    bool use_date_sharded_audit_log_tables = false;
    uint32_t log_page_size = 1000;

    // Outbound request rate
    bool rate_limit = false;
    uint32_t requests_per_min = 60;

    PatternConfig dataset_pattern;
    PatternConfig table_pattern;

    // Temporary (intermediate) tables
    std::vector<std::string> temp_table_dataset_prefixes{"_"};
    std::vector<std::string> temp_table_name_patterns;

    bool debug_include_full_payloads = false;
    bool upstream_lineage_in_report = false;

    LineageConfig()
        : start_time(std::chrono::system_clock::now() - std::chrono::hours(24)),
          end_time(std::chrono::system_clock::now()) {}
};

struct OutputConfig {
    std::string platform = "bigquery";
    std::optional<std::string> platform_instance;
    std::string env = "PROD";
};

struct LoggingConfig {
    std::string level = "info";
};

struct AppConfig {
    LineageConfig lineage;
    OutputConfig output;
    LoggingConfig logging;
};

} // namespace bqlineage
