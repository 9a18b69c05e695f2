#pragma once

#include "audit/audit_record.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace bqlineage {

/**
 * @brief Lazy, forward-only sequence of raw audit records
 *
 * Implementations fetch further pages on demand. next() may throw on
 * transport, auth or quota errors; the extraction treats that as a failure
 * of the whole run.
 */
class IAuditRecordCursor {
public:
    virtual ~IAuditRecordCursor() = default;

    // Next record, nullopt when exhausted
    [[nodiscard]] virtual std::optional<RawAuditRecord> next() = 0;
};

/**
 * @brief Logging service client (the "Log Source")
 *
 * Returns entries matching a vendor filter expression, page_size entries per
 * round trip, at most max_results entries in total when set.
 */
class ILogSource {
public:
    virtual ~ILogSource() = default;

    [[nodiscard]] virtual std::unique_ptr<IAuditRecordCursor> fetch(
        const std::string& filter,
        uint32_t page_size,
        std::optional<uint64_t> max_results) = 0;
};

/**
 * @brief Query engine client for exported audit tables
 *
 * Runs a SQL query against an audit dataset and yields the result rows as
 * records (timestamp, logName, insertId, protoPayload, metadata).
 */
class IAuditTableClient {
public:
    virtual ~IAuditTableClient() = default;

    [[nodiscard]] virtual std::unique_ptr<IAuditRecordCursor> query(const std::string& sql) = 0;
};

} // namespace bqlineage
