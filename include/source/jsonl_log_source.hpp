#pragma once

#include "source/log_source.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace bqlineage {

/**
 * @brief Audit records from a newline-delimited JSON file
 *
 * Serves both fetch modes for offline runs: every non-blank line is one
 * record (a LogEntry, or an exported audit table row). Filters and queries
 * are not evaluated; the file is assumed to hold the records the vendor
 * would have returned. The file is opened and read lazily, once per fetch.
 *
 * Cursors throw std::runtime_error when the file cannot be opened or a line
 * is not a JSON object.
 */
class JsonlLogSource : public ILogSource, public IAuditTableClient {
public:
    explicit JsonlLogSource(std::string path);

    [[nodiscard]] std::unique_ptr<IAuditRecordCursor> fetch(
        const std::string& filter,
        uint32_t page_size,
        std::optional<uint64_t> max_results) override;

    [[nodiscard]] std::unique_ptr<IAuditRecordCursor> query(const std::string& sql) override;

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace bqlineage
