#pragma once

#include "config/config_types.hpp"
#include "lineage/table_ref.hpp"

#include <format>
#include <string>

namespace bqlineage {

/**
 * @brief Dataset URN for a table
 *
 * urn:li:dataset:(urn:li:dataPlatform:<platform>,[<instance>.]<project>.<dataset>.<table>,<ENV>)
 */
[[nodiscard]] inline std::string make_dataset_urn(const OutputConfig& output,
                                                  const TableIdentifier& id) {
    std::string name = id.raw_table_name();
    if (output.platform_instance && !output.platform_instance->empty()) {
        name = std::format("{}.{}", *output.platform_instance, name);
    }
    return std::format("urn:li:dataset:(urn:li:dataPlatform:{},{},{})",
                       output.platform, name, output.env);
}

} // namespace bqlineage
