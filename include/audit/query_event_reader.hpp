#pragma once

#include "audit/query_event.hpp"
#include "audit/query_event_parser.hpp"
#include "lineage/extraction_report.hpp"
#include "source/log_source.hpp"

#include <memory>
#include <optional>

namespace bqlineage {

/**
 * @brief Pull-based stream of QueryEvents
 */
class IQueryEventStream {
public:
    virtual ~IQueryEventStream() = default;

    // Next event, nullopt when the stream is exhausted
    [[nodiscard]] virtual std::optional<QueryEvent> next() = 0;
};

/**
 * @brief Parses raw records from a cursor into QueryEvents, lazily
 *
 * Unparsable records are reported on the ExtractionReport (keyed by
 * "<logName>-<insertId>") and skipped; iteration continues. Exceptions thrown
 * by the cursor itself are source failures and propagate to the caller.
 */
class QueryEventReader : public IQueryEventStream {
public:
    QueryEventReader(std::unique_ptr<IAuditRecordCursor> cursor,
                     const QueryEventParser& parser,
                     ExtractionReport& report);

    [[nodiscard]] std::optional<QueryEvent> next() override;

private:
    std::unique_ptr<IAuditRecordCursor> cursor_;
    const QueryEventParser& parser_;
    ExtractionReport& report_;
};

} // namespace bqlineage
