#include "lineage/temp_table_resolver.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>
#include <vector>

namespace bqlineage {

// ============================================================================
// TempTableClassifier
// ============================================================================

TempTableClassifier::TempTableClassifier(std::vector<std::string> dataset_prefixes,
                                         std::vector<std::string> table_name_patterns)
    : dataset_prefixes_(std::move(dataset_prefixes)) {
    table_name_res_.reserve(table_name_patterns.size());
    for (const auto& pattern : table_name_patterns) {
        table_name_res_.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
    }
}

bool TempTableClassifier::is_temporary(const TableIdentifier& id) const {
    for (const auto& prefix : dataset_prefixes_) {
        if (!prefix.empty() && id.dataset.starts_with(prefix)) return true;
    }
    for (const auto& re : table_name_res_) {
        if (std::regex_search(id.table, re, std::regex_constants::match_continuous)) return true;
    }
    return false;
}

// ============================================================================
// TempTableResolver
// ============================================================================

TempTableResolver::TempTableResolver(TempTableClassifier classifier)
    : classifier_(std::move(classifier)) {}

std::set<BigQueryTableRef> TempTableResolver::resolve_upstreams(
    const LineageMap& map,
    const std::string& target,
    std::unordered_set<std::string>& seen) const {

    std::set<BigQueryTableRef> upstreams;
    std::vector<const std::string*> worklist{&target};

    while (!worklist.empty()) {
        const std::string* current = worklist.back();
        worklist.pop_back();

        const auto it = map.find(*current);
        if (it == map.end()) continue;  // Dead end: contributes nothing

        for (const auto& ref_key : it->second) {
            BigQueryTableRef ref;
            try {
                ref = BigQueryTableRef::from_string_name(ref_key);
            } catch (const std::invalid_argument& e) {
                utils::log::warn(std::format("Skipping malformed upstream key {}: {}", ref_key, e.what()));
                continue;
            }

            if (!classifier_.is_temporary(ref.table_identifier())) {
                upstreams.insert(std::move(ref));
                continue;
            }

            if (!seen.insert(ref_key).second) {
                utils::log::debug(std::format("Skipping table {} because it was seen already", ref_key));
                continue;
            }
            if (map.contains(ref_key)) {
                worklist.push_back(&ref_key);
            }
        }
    }

    return upstreams;
}

} // namespace bqlineage
