#pragma once

#include <string_view>

namespace bqlineage::ast {

// libpg_query JSON node types and fields
inline constexpr std::string_view kRangeVar        = "RangeVar";
inline constexpr std::string_view kRelname         = "relname";
inline constexpr std::string_view kSchemaname      = "schemaname";
inline constexpr std::string_view kCatalogname     = "catalogname";
inline constexpr std::string_view kCommonTableExpr = "CommonTableExpr";
inline constexpr std::string_view kCtename         = "ctename";

// Common error messages
inline constexpr std::string_view kUnknownParseError = "Unknown parse error";

} // namespace bqlineage::ast
