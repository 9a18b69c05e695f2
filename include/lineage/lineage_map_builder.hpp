#pragma once

#include "audit/query_event.hpp"
#include "audit/query_event_reader.hpp"
#include "config/allow_deny_pattern.hpp"
#include "core/types.hpp"
#include "lineage/extraction_report.hpp"
#include "parser/itable_name_parser.hpp"

#include <memory>
#include <string>

namespace bqlineage {

/**
 * @brief Builds destination -> upstream lineage from a stream of QueryEvents
 *
 * Single pass; each event is folded into the map as it arrives, so memory
 * is bounded by the map rather than by the event volume. Per event:
 * 1. Skip (missing data) without a destination or without any reference.
 * 2. Skip (not allowed) when the destination dataset or table is filtered out.
 * 3. Add every referenced table and view except the destination itself.
 * 4. When both tables and views were referenced, the audit trail has listed a
 *    view together with its base tables. Parse the query text and keep only
 *    upstreams whose bare table name the query mentions. If that parse fails,
 *    the event contributes nothing (sql parser failure).
 * 5. Skip (other) when no reference survived.
 *
 * Keys are canonical (sanitized) table strings, so the map does not depend
 * on the order events arrive in.
 */
class LineageMapBuilder {
public:
    struct Config {
        AllowDenyPattern dataset_pattern;
        AllowDenyPattern table_pattern;
    };

    LineageMapBuilder(Config config,
                      std::shared_ptr<ITableNameParser> sql_parser,
                      ExtractionReport& report);

    /**
     * @brief Fold one event into the map
     */
    void add(const QueryEvent& event);

    /**
     * @brief Drain the stream into the map and hand the map over
     */
    [[nodiscard]] LineageMap build(IQueryEventStream& events);

    [[nodiscard]] const LineageMap& map() const { return map_; }

private:
    /**
     * @brief Keep only upstreams of destination_key named by the query
     * @return false if the query could not be parsed
     */
    bool disambiguate(const std::string& destination_key,
                      const QueryEvent& event,
                      UpstreamKeySet& candidates);

    Config config_;
    std::shared_ptr<ITableNameParser> sql_parser_;
    ExtractionReport& report_;
    LineageMap map_;
};

} // namespace bqlineage
