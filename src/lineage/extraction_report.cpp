#include "lineage/extraction_report.hpp"
#include "core/utils.hpp"

#include <format>

namespace bqlineage {

void ExtractionReport::report_failure(const std::string& key, const std::string& reason) {
    failures[key].push_back(reason);
    utils::log::error(std::format("{} => {}", key, reason));
}

size_t ExtractionReport::failure_count() const {
    size_t total = 0;
    for (const auto& [key, reasons] : failures) {
        total += reasons.size();
    }
    return total;
}

} // namespace bqlineage
