#pragma once

#include "config/config_types.hpp"
#include "lineage/extraction_report.hpp"
#include "source/audit_filter.hpp"
#include "source/log_source.hpp"
#include "source/rate_limiter.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace bqlineage {

/**
 * @brief Turns the configured fetch mode into a lazy sequence of audit records
 *
 * Logging API mode: one ILogSource::fetch() over the buffered window.
 * Exported audit table mode: one IAuditTableClient::query() per configured
 * audit dataset, issued lazily as the previous dataset is exhausted.
 *
 * The effective window bounds are recorded on the report. When rate limiting
 * is on, every outbound call first passes a requests_per_min gate.
 * Client exceptions propagate; the caller decides how to report them.
 */
class AuditEventSource {
public:
    AuditEventSource(const LineageConfig& config,
                     std::shared_ptr<ILogSource> log_source,
                     std::shared_ptr<IAuditTableClient> table_client,
                     ExtractionReport& report);

    /**
     * @brief Open a cursor over the configured mode
     * @param limit Cap on records per outbound call (capability checks use 1)
     * @throws std::runtime_error if the client for the configured mode is missing
     */
    [[nodiscard]] std::unique_ptr<IAuditRecordCursor> open(
        std::optional<uint64_t> limit = std::nullopt);

    [[nodiscard]] bool uses_exported_audit_metadata() const {
        return config_.use_exported_audit_metadata;
    }

    [[nodiscard]] const TimeWindow& window() const { return window_; }

private:
    std::unique_ptr<IAuditRecordCursor> open_logging(std::optional<uint64_t> limit);
    std::unique_ptr<IAuditRecordCursor> open_exported(std::optional<uint64_t> limit);

    LineageConfig config_;
    TimeWindow window_;
    std::shared_ptr<ILogSource> log_source_;
    std::shared_ptr<IAuditTableClient> table_client_;
    ExtractionReport& report_;
    std::shared_ptr<RequestGate> gate_;  // null when rate limiting is off
};

} // namespace bqlineage
