#pragma once

#include "core/json.hpp"

#include <compare>
#include <functional>
#include <string>
#include <string_view>

namespace bqlineage {

/**
 * @brief (project, dataset, table) triple as reported by the warehouse
 */
struct TableIdentifier {
    std::string project_id;
    std::string dataset;
    std::string table;

    TableIdentifier() = default;
    TableIdentifier(std::string p, std::string d, std::string t)
        : project_id(std::move(p)), dataset(std::move(d)), table(std::move(t)) {}

    /**
     * @brief Parse a dotted "project.dataset.table" name
     * @throws std::invalid_argument when the name does not have three parts
     */
    [[nodiscard]] static TableIdentifier from_string_name(std::string_view name);

    // "project.dataset.table"
    [[nodiscard]] std::string raw_table_name() const;

    /**
     * @brief Canonical form: lower-cased, decorators and shard suffixes removed
     *
     * Strips snapshot (@1650000000000) and partition ($20220101) decorators,
     * wildcard suffixes (events_*), and a trailing date shard (events_20220101).
     * A table name that is only a date shard falls back to the dataset name.
     */
    [[nodiscard]] TableIdentifier sanitized() const;

    auto operator<=>(const TableIdentifier&) const = default;
    bool operator==(const TableIdentifier&) const = default;
};

/**
 * @brief Table reference in "projects/<p>/datasets/<d>/tables/<t>" form
 *
 * The string form is the lineage map key. Immutable value type; ordered by
 * (project, dataset, table).
 */
class BigQueryTableRef {
public:
    BigQueryTableRef() = default;
    explicit BigQueryTableRef(TableIdentifier id) : id_(std::move(id)) {}

    /**
     * @brief Parse "projects/<p>/datasets/<d>/tables/<t>"
     * @throws std::invalid_argument on any other shape
     */
    [[nodiscard]] static BigQueryTableRef from_string_name(std::string_view ref);

    /**
     * @brief Build from an older-schema spec object {projectId, datasetId, tableId}
     * @throws std::invalid_argument when a field is absent
     */
    [[nodiscard]] static BigQueryTableRef from_spec_obj(const JsonValue& spec);

    [[nodiscard]] const TableIdentifier& table_identifier() const { return id_; }

    [[nodiscard]] BigQueryTableRef sanitized() const {
        return BigQueryTableRef(id_.sanitized());
    }

    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const BigQueryTableRef&) const = default;
    bool operator==(const BigQueryTableRef&) const = default;

private:
    TableIdentifier id_;
};

} // namespace bqlineage

template <>
struct std::hash<bqlineage::TableIdentifier> {
    size_t operator()(const bqlineage::TableIdentifier& id) const noexcept {
        size_t h = std::hash<std::string>{}(id.project_id);
        h ^= std::hash<std::string>{}(id.dataset) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>{}(id.table) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

template <>
struct std::hash<bqlineage::BigQueryTableRef> {
    size_t operator()(const bqlineage::BigQueryTableRef& ref) const noexcept {
        return std::hash<bqlineage::TableIdentifier>{}(ref.table_identifier());
    }
};
