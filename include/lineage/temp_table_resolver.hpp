#pragma once

#include "core/types.hpp"
#include "lineage/table_ref.hpp"

#include <regex>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace bqlineage {

/**
 * @brief Decides whether a table is an intermediate (temporary) table
 *
 * A table is temporary when its dataset starts with one of the configured
 * prefixes, or when its table name matches one of the configured patterns
 * (prefix-anchored, case-insensitive).
 *
 * @throws std::regex_error from the constructor on an invalid pattern
 */
class TempTableClassifier {
public:
    TempTableClassifier() : TempTableClassifier({"_"}, {}) {}
    TempTableClassifier(std::vector<std::string> dataset_prefixes,
                        std::vector<std::string> table_name_patterns);

    [[nodiscard]] bool is_temporary(const TableIdentifier& id) const;

private:
    std::vector<std::string> dataset_prefixes_;
    std::vector<std::regex> table_name_res_;
};

/**
 * @brief Expands temporary tables in a lineage map into their upstreams
 *
 * Temporary tables are transparent: each one reached from the target is
 * replaced by whatever it was built from, transitively. Traversal uses an
 * explicit worklist; the caller-owned seen-set makes every temporary table
 * expand at most once, so cyclic maps terminate.
 */
class TempTableResolver {
public:
    explicit TempTableResolver(TempTableClassifier classifier);

    /**
     * @brief Non-temporary upstreams of target
     * @param map Lineage map to walk
     * @param target Destination key ("projects/<p>/datasets/<d>/tables/<t>")
     * @param seen Temporary-table keys already expanded; shared across the whole
     *        walk for one top-level query and updated in place
     * @return Ordered set of upstream table references (empty if target has none)
     */
    [[nodiscard]] std::set<BigQueryTableRef> resolve_upstreams(
        const LineageMap& map,
        const std::string& target,
        std::unordered_set<std::string>& seen) const;

private:
    TempTableClassifier classifier_;
};

} // namespace bqlineage
