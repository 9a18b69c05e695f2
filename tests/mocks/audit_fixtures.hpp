#pragma once

#include "audit/query_event.hpp"
#include "audit/query_event_reader.hpp"
#include "core/utils.hpp"
#include "lineage/table_ref.hpp"

#include <format>
#include <optional>
#include <string>
#include <vector>

namespace bqlineage::testing {

// "p.d.t" -> "projects/p/datasets/d/tables/t"
inline std::string table_path(const std::string& dotted) {
    return BigQueryTableRef(TableIdentifier::from_string_name(dotted)).to_string();
}

inline std::string json_string_list(const std::vector<std::string>& tables) {
    std::string out = "[";
    for (size_t i = 0; i < tables.size(); ++i) {
        if (i > 0) out += ",";
        out += std::format("\"{}\"", table_path(tables[i]));
    }
    return out + "]";
}

/**
 * @brief Structured (jobChange) audit log entry
 */
inline std::string job_change_entry(const std::string& insert_id,
                                    const std::optional<std::string>& destination,
                                    const std::vector<std::string>& tables,
                                    const std::vector<std::string>& views = {},
                                    const std::string& query = "SELECT 1",
                                    const std::string& state = "DONE") {
    const std::string dest = destination
        ? std::format(",\"destinationTable\":\"{}\"", table_path(*destination))
        : std::string();
    return std::format(
        R"({{"logName":"projects/p/logs/cloudaudit.googleapis.com%2Fdata_access",)"
        R"("insertId":"{}","timestamp":"2024-01-01T10:00:00Z",)"
        R"("protoPayload":{{"authenticationInfo":{{"principalEmail":"etl@p.iam.gserviceaccount.com"}},)"
        R"("metadata":{{"jobChange":{{"job":{{"jobName":"projects/p/jobs/{}",)"
        R"("jobConfig":{{"queryConfig":{{"query":"{}","statementType":"CREATE_TABLE_AS_SELECT"{}}}}},)"
        R"("jobStats":{{"queryStats":{{"referencedTables":{},"referencedViews":{},"totalBilledBytes":"1024"}}}},)"
        R"("jobStatus":{{"jobState":"{}"}}}}}}}}}}}})",
        insert_id, insert_id, utils::escape_json(query), dest,
        json_string_list(tables), json_string_list(views), state);
}

/**
 * @brief QueryEvent built directly, bypassing the record parser
 */
inline QueryEvent make_event(const std::optional<std::string>& destination,
                             const std::vector<std::string>& tables,
                             const std::vector<std::string>& views = {},
                             std::optional<std::string> query = std::nullopt) {
    QueryEvent e;
    e.timestamp = "2024-01-01T10:00:00Z";
    e.source_id = "test-log-1";
    if (destination) {
        e.destination_table = BigQueryTableRef(TableIdentifier::from_string_name(*destination));
    }
    for (const auto& t : tables) {
        e.referenced_tables.emplace_back(TableIdentifier::from_string_name(t));
    }
    for (const auto& v : views) {
        e.referenced_views.emplace_back(TableIdentifier::from_string_name(v));
    }
    e.query = std::move(query);
    return e;
}

/**
 * @brief Event stream over a fixed vector
 */
class VectorEventStream : public IQueryEventStream {
public:
    explicit VectorEventStream(std::vector<QueryEvent> events) : events_(std::move(events)) {}

    std::optional<QueryEvent> next() override {
        if (pos_ >= events_.size()) return std::nullopt;
        return events_[pos_++];
    }

private:
    std::vector<QueryEvent> events_;
    size_t pos_ = 0;
};

} // namespace bqlineage::testing
