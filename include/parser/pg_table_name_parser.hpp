#pragma once

#include "parser/itable_name_parser.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace bqlineage {

/**
 * @brief Table-name parser backed by libpg_query (PostgreSQL's parser)
 *
 * BigQuery standard SQL is close enough to PostgreSQL for table extraction
 * once identifiers are normalized:
 * - `project.dataset.table` (one backtick token) -> "project"."dataset"."table"
 * - `project`.`dataset`.`table`                 -> "project"."dataset"."table"
 * - CREATE OR REPLACE TABLE                      -> CREATE TABLE
 *
 * Every RangeVar in the tree is reported (FROM, JOIN, sub-queries, CTE
 * bodies, DML targets). References to CTE names defined in the same
 * statement are not tables and are skipped.
 *
 * Thread-safety: stateless, safe for concurrent use
 */
class PgTableNameParser : public ITableNameParser {
public:
    PgTableNameParser() = default;
    ~PgTableNameParser() override = default;

    [[nodiscard]] Result<std::vector<std::string>> parse_tables(std::string_view sql) override;

    /**
     * @brief Rewrite BigQuery identifier quoting into PostgreSQL quoting
     */
    [[nodiscard]] static std::string normalize_bigquery_sql(std::string_view sql);
};

} // namespace bqlineage
