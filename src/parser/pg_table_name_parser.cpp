#include "parser/pg_table_name_parser.hpp"
#include "parser/ast_keys.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

// libpg_query C API
extern "C" {
#include "pg_query.h"
}

#include <format>
#include <regex>
#include <unordered_set>

namespace bqlineage {

static constexpr char kDot = '.';

namespace {

void append_quoted_path(std::string& out, std::string_view path) {
    bool first = true;
    size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find(kDot, start);
        if (end == std::string_view::npos) end = path.size();
        if (!first) out += kDot;
        first = false;

        out += '"';
        for (const char c : path.substr(start, end - start)) {
            if (c == '"') out += '"';  // "" escapes a quote inside a PG identifier
            out += c;
        }
        out += '"';
        start = end + 1;
    }
}

/**
 * @brief Collect CTE names so references to them are not reported as tables.
 */
void find_cte_names(const JsonValue& node, std::unordered_set<std::string>& ctes) {
    if (node.is_object()) {
        if (node.contains(ast::kCommonTableExpr)) {
            const auto cte = node[ast::kCommonTableExpr];
            if (const auto name = cte.string_at(ast::kCtename)) {
                ctes.insert(utils::to_lower(*name));
            }
        }
        for (const auto& child : node) {
            find_cte_names(child, ctes);
        }
    } else if (node.is_array()) {
        for (const auto& elem : node) {
            find_cte_names(elem, ctes);
        }
    }
}

/**
 * @brief Recursively walk the JSON AST to find all RangeVar nodes.
 *
 * RangeVar nodes are table references in PostgreSQL's AST. They appear in
 * FROM clauses, JOINs, INSERT INTO, UPDATE, DELETE FROM, CREATE TABLE AS,
 * sub-queries and CTE bodies.
 */
void find_range_vars(const JsonValue& node,
                     const std::unordered_set<std::string>& ctes,
                     std::vector<std::string>& tables,
                     std::unordered_set<std::string>& seen_tables) {
    if (node.is_object()) {
        if (node.contains(ast::kRangeVar)) {
            const auto range_var = node[ast::kRangeVar];

            if (const auto relname = range_var.string_at(ast::kRelname)) {
                const auto schema = range_var.string_at(ast::kSchemaname);
                const auto catalog = range_var.string_at(ast::kCatalogname);

                const bool is_cte_ref = !schema && ctes.contains(utils::to_lower(*relname));
                if (!is_cte_ref) {
                    std::string key;
                    if (catalog) {
                        key += *catalog;
                        key += kDot;
                    }
                    if (schema) {
                        key += *schema;
                        key += kDot;
                    }
                    key += *relname;

                    if (seen_tables.insert(key).second) {
                        tables.push_back(std::move(key));
                    }
                }
            }
        }

        // Continue walking all child nodes (handles subqueries, CTEs, JOINs, etc.)
        for (const auto& child : node) {
            find_range_vars(child, ctes, tables, seen_tables);
        }
    } else if (node.is_array()) {
        for (const auto& elem : node) {
            find_range_vars(elem, ctes, tables, seen_tables);
        }
    }
}

} // anonymous namespace

std::string PgTableNameParser::normalize_bigquery_sql(std::string_view sql) {
    std::string out;
    out.reserve(sql.size() + 16);

    size_t i = 0;
    while (i < sql.size()) {
        const char c = sql[i];

        // Copy string literals verbatim (backslash escapes, as BigQuery allows)
        if (c == '\'') {
            const size_t start = i++;
            while (i < sql.size() && sql[i] != '\'') {
                if (sql[i] == '\\' && i + 1 < sql.size()) ++i;
                ++i;
            }
            if (i < sql.size()) ++i;
            out.append(sql.substr(start, i - start));
            continue;
        }

        if (c == '`') {
            const auto close = sql.find('`', i + 1);
            if (close == std::string_view::npos) {
                // Unterminated: leave it for the parser to reject
                out.append(sql.substr(i));
                break;
            }
            append_quoted_path(out, sql.substr(i + 1, close - i - 1));
            i = close + 1;
            continue;
        }

        out += c;
        ++i;
    }

    static const std::regex CREATE_OR_REPLACE_RE(
        R"(\bCREATE\s+OR\s+REPLACE\s+((?:TEMP|TEMPORARY)\s+)?TABLE\b)",
        std::regex::icase);
    return std::regex_replace(out, CREATE_OR_REPLACE_RE, "CREATE $1TABLE");
}

Result<std::vector<std::string>> PgTableNameParser::parse_tables(std::string_view sql) {
    const std::string trimmed = utils::trim(std::string(sql));
    if (trimmed.empty()) {
        return Result<std::vector<std::string>>::error(
            ErrorCategory::SQL_PARSE_ERROR, "Empty SQL query");
    }

    const std::string normalized = normalize_bigquery_sql(trimmed);
    PgQueryParseResult parse_result = pg_query_parse(normalized.c_str());

    // Early return: parse error
    if (parse_result.error) {
        std::string error_msg = parse_result.error->message
            ? parse_result.error->message
            : std::string(ast::kUnknownParseError);
        pg_query_free_parse_result(parse_result);
        return Result<std::vector<std::string>>::error(
            ErrorCategory::SQL_PARSE_ERROR, std::move(error_msg));
    }

    // Early return: no parse tree
    if (!parse_result.parse_tree) {
        pg_query_free_parse_result(parse_result);
        return Result<std::vector<std::string>>::error(
            ErrorCategory::SQL_PARSE_ERROR, "Parser returned no tree");
    }

    JsonValue ast;
    try {
        ast = JsonValue::parse(parse_result.parse_tree);
    } catch (const JsonValue::parse_error& e) {
        pg_query_free_parse_result(parse_result);
        return Result<std::vector<std::string>>::error(
            ErrorCategory::SQL_PARSE_ERROR, std::format("Malformed parse tree: {}", e.what()));
    }
    pg_query_free_parse_result(parse_result);

    std::unordered_set<std::string> ctes;
    find_cte_names(ast, ctes);

    std::vector<std::string> tables;
    std::unordered_set<std::string> seen_tables;
    find_range_vars(ast, ctes, tables, seen_tables);

    return Result<std::vector<std::string>>::ok(std::move(tables));
}

} // namespace bqlineage
