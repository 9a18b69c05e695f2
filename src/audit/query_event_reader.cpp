#include "audit/query_event_reader.hpp"
#include "core/utils.hpp"

#include <format>
#include <variant>

namespace bqlineage {

QueryEventReader::QueryEventReader(std::unique_ptr<IAuditRecordCursor> cursor,
                                   const QueryEventParser& parser,
                                   ExtractionReport& report)
    : cursor_(std::move(cursor)), parser_(parser), report_(report) {}

std::optional<QueryEvent> QueryEventReader::next() {
    if (!cursor_) return std::nullopt;

    while (auto record = cursor_->next()) {
        ++report_.num_total_log_entries;

        auto outcome = parser_.parse(*record);
        if (auto* event = std::get_if<QueryEvent>(&outcome)) {
            ++report_.num_parsed_log_entries;
            return std::move(*event);
        }

        const auto& failure = std::get<ParseFailure>(outcome);
        report_.report_failure(record->source_id(),
                               std::format("Unable to parse audit record: {}", failure.describe()));
    }

    utils::log::info(std::format(
        "Parsing audit records: {} of {} records parsed successfully",
        report_.num_parsed_log_entries, report_.num_total_log_entries));
    cursor_.reset();
    return std::nullopt;
}

} // namespace bqlineage
