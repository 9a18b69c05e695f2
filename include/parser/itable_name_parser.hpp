#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace bqlineage {

/**
 * @brief Extracts the table names a SQL statement reads or writes
 *
 * Injected into the lineage map builder; used only to tell a referenced
 * view apart from the base tables the audit trail reports beneath it.
 * Names are dot-joined ("project.dataset.table"), missing parts omitted.
 * Failure is an error result (SQL_PARSE_ERROR); implementations should not
 * throw, but callers still guard against it.
 */
class ITableNameParser {
public:
    virtual ~ITableNameParser() = default;

    [[nodiscard]] virtual Result<std::vector<std::string>> parse_tables(std::string_view sql) = 0;
};

} // namespace bqlineage
