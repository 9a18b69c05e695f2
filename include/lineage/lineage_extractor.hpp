#pragma once

#include "audit/query_event_parser.hpp"
#include "config/config_types.hpp"
#include "core/types.hpp"
#include "lineage/extraction_report.hpp"
#include "lineage/table_ref.hpp"
#include "lineage/temp_table_resolver.hpp"
#include "parser/itable_name_parser.hpp"
#include "source/audit_event_source.hpp"
#include "source/log_source.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bqlineage {

struct Upstream {
    std::string table_urn;
    DatasetLineageType type = DatasetLineageType::TRANSFORMED;
};

struct UpstreamLineage {
    std::vector<Upstream> upstreams;  // sorted by table_urn
    std::map<std::string, std::string> extra_properties;
};

/**
 * @brief Table-level lineage from the warehouse query audit trail
 *
 * The lineage map is built lazily on the first query and cached until
 * invalidate(). Building pulls every audit record in the configured window
 * through parser and map builder in one streaming pass. A failing source
 * yields an empty map and a reported failure; it never throws to callers.
 *
 * Thread-safety: queries and capability checks are serialized on an internal
 * mutex, so concurrent first callers observe a single build and the report is
 * never written from two threads.
 */
class LineageExtractor {
public:
    LineageExtractor(const LineageConfig& lineage_config,
                     const OutputConfig& output_config,
                     std::shared_ptr<ILogSource> log_source,
                     std::shared_ptr<IAuditTableClient> table_client,
                     std::shared_ptr<ITableNameParser> sql_parser,
                     ExtractionReport& report);

    /**
     * @brief Upstream tables of target, temporary tables resolved away
     * @return nullopt if the map has no entry for target; otherwise the
     *         upstreams ordered by URN (possibly empty)
     */
    [[nodiscard]] std::optional<UpstreamLineage> get_upstream_lineage(const TableIdentifier& target);

    /**
     * @brief Build a lineage map from the configured source, uncached
     */
    [[nodiscard]] LineageMap compute_lineage();

    // Drop the cached map; the next query rebuilds it
    void invalidate();

    /**
     * @brief Pull at most one record from the configured source
     * @return true if the source answered without error
     */
    [[nodiscard]] bool test_capability();

    [[nodiscard]] size_t build_count() const;

private:
    LineageConfig lineage_config_;
    OutputConfig output_config_;
    std::shared_ptr<ITableNameParser> sql_parser_;
    ExtractionReport& report_;

    QueryEventParser event_parser_;
    AuditEventSource event_source_;
    TempTableResolver resolver_;

    mutable std::mutex mutex_;
    std::optional<LineageMap> lineage_map_;
    size_t build_count_ = 0;
};

} // namespace bqlineage
