#include "lineage/table_ref.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>
#include <stdexcept>

namespace bqlineage {

static constexpr std::string_view kProjects  = "projects";
static constexpr std::string_view kDatasets  = "datasets";
static constexpr std::string_view kTables    = "tables";
static constexpr std::string_view kProjectId = "projectId";
static constexpr std::string_view kDatasetId = "datasetId";
static constexpr std::string_view kTableId   = "tableId";
static constexpr size_t kDateShardLength = 8;

namespace {

// "t@1650000000000" / "t@-3600000" -> "t"
std::string strip_snapshot_decorator(std::string table) {
    const auto at = table.find('@');
    if (at == std::string::npos || at == 0) return table;

    std::string_view decorator(table);
    decorator.remove_prefix(at + 1);
    if (!decorator.empty() && decorator.front() == '-') decorator.remove_prefix(1);
    // Range decorators: t@1000-2000
    for (const char c : decorator) {
        if (!std::isdigit(static_cast<unsigned char>(c)) && c != '-') return table;
    }
    table.resize(at);
    return table;
}

// "t$20220101" -> "t"
std::string strip_partition_decorator(std::string table) {
    const auto dollar = table.find('$');
    if (dollar != std::string::npos && dollar > 0) {
        table.resize(dollar);
    }
    return table;
}

// "events_*" / "events_2022*" -> "events"
std::string strip_wildcard(std::string table) {
    if (table.empty() || table.back() != '*') return table;
    table.pop_back();
    while (!table.empty() && std::isdigit(static_cast<unsigned char>(table.back()))) {
        table.pop_back();
    }
    while (!table.empty() && table.back() == '_') {
        table.pop_back();
    }
    return table;
}

// "events_20220101" -> "events", "20220101" -> ""
std::string strip_date_shard(std::string table) {
    if (table.size() < kDateShardLength) return table;

    const std::string_view tail = std::string_view(table).substr(table.size() - kDateShardLength);
    if (!utils::all_digits(tail)) return table;

    if (table.size() == kDateShardLength) return {};
    if (table[table.size() - kDateShardLength - 1] != '_') return table;

    table.resize(table.size() - kDateShardLength - 1);
    return table;
}

} // anonymous namespace

// ============================================================================
// TableIdentifier
// ============================================================================

TableIdentifier TableIdentifier::from_string_name(std::string_view name) {
    const auto first = name.find('.');
    const auto second = first == std::string_view::npos
        ? std::string_view::npos
        : name.find('.', first + 1);

    if (second == std::string_view::npos
        || first == 0 || second == first + 1 || second + 1 >= name.size()
        || name.find('.', second + 1) != std::string_view::npos) {
        throw std::invalid_argument(
            std::format("Expected project.dataset.table, got '{}'", name));
    }

    return TableIdentifier(std::string(name.substr(0, first)),
                           std::string(name.substr(first + 1, second - first - 1)),
                           std::string(name.substr(second + 1)));
}

std::string TableIdentifier::raw_table_name() const {
    return std::format("{}.{}.{}", project_id, dataset, table);
}

TableIdentifier TableIdentifier::sanitized() const {
    std::string name = utils::to_lower(table);
    name = strip_snapshot_decorator(std::move(name));
    name = strip_partition_decorator(std::move(name));
    name = strip_wildcard(std::move(name));
    name = strip_date_shard(std::move(name));

    std::string lowered_dataset = utils::to_lower(dataset);
    if (name.empty()) {
        name = lowered_dataset;
    }
    return TableIdentifier(utils::to_lower(project_id), std::move(lowered_dataset), std::move(name));
}

// ============================================================================
// BigQueryTableRef
// ============================================================================

BigQueryTableRef BigQueryTableRef::from_string_name(std::string_view ref) {
    const auto parts = utils::split(std::string(ref), '/');
    if (parts.size() != 6
        || parts[0] != kProjects || parts[2] != kDatasets || parts[4] != kTables
        || parts[1].empty() || parts[3].empty() || parts[5].empty()) {
        throw std::invalid_argument(
            std::format("Expected projects/<p>/datasets/<d>/tables/<t>, got '{}'", ref));
    }
    return BigQueryTableRef(TableIdentifier(parts[1], parts[3], parts[5]));
}

BigQueryTableRef BigQueryTableRef::from_spec_obj(const JsonValue& spec) {
    const auto project = spec.string_at(kProjectId);
    const auto dataset = spec.string_at(kDatasetId);
    const auto table = spec.string_at(kTableId);
    // Empty parts would produce keys like projects//datasets/d/tables/t
    const auto missing = [](const std::optional<std::string>& part) {
        return !part || part->empty();
    };
    if (missing(project) || missing(dataset) || missing(table)) {
        throw std::invalid_argument(std::format(
            "Table spec is missing {}",
            missing(project) ? kProjectId : (missing(dataset) ? kDatasetId : kTableId)));
    }
    return BigQueryTableRef(TableIdentifier(*project, *dataset, *table));
}

std::string BigQueryTableRef::to_string() const {
    return std::format("projects/{}/datasets/{}/tables/{}",
                       id_.project_id, id_.dataset, id_.table);
}

} // namespace bqlineage
