#include "lineage/lineage_map_builder.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>
#include <unordered_set>

namespace bqlineage {

LineageMapBuilder::LineageMapBuilder(Config config,
                                     std::shared_ptr<ITableNameParser> sql_parser,
                                     ExtractionReport& report)
    : config_(std::move(config)),
      sql_parser_(std::move(sql_parser)),
      report_(report) {}

void LineageMapBuilder::add(const QueryEvent& event) {
    ++report_.num_total_lineage_entries;

    if (!event.destination_table
        || (event.referenced_tables.empty() && event.referenced_views.empty())) {
        ++report_.num_skipped_lineage_entries_missing_data;
        return;
    }

    const BigQueryTableRef destination = event.destination_table->sanitized();
    const auto& dest_id = destination.table_identifier();
    if (!config_.dataset_pattern.allowed(dest_id.dataset)
        || !config_.table_pattern.allowed(dest_id.table)) {
        ++report_.num_skipped_lineage_entries_not_allowed;
        return;
    }

    const std::string destination_key = destination.to_string();

    // Collect this event's references first so a failed disambiguation
    // leaves nothing behind
    UpstreamKeySet candidates;
    bool has_table = false;
    for (const auto& ref : event.referenced_tables) {
        std::string key = ref.sanitized().to_string();
        if (key != destination_key) {
            candidates.insert(std::move(key));
            has_table = true;
        }
    }

    bool has_view = false;
    for (const auto& ref : event.referenced_views) {
        std::string key = ref.sanitized().to_string();
        if (key != destination_key) {
            candidates.insert(std::move(key));
            has_view = true;
        }
    }

    if (has_table && has_view) {
        if (!disambiguate(destination_key, event, candidates)) {
            ++report_.num_skipped_lineage_entries_sql_parser_failure;
            map_.try_emplace(destination_key);
            return;
        }
        map_[destination_key] = std::move(candidates);
        return;
    }

    if (!has_table && !has_view) {
        ++report_.num_skipped_lineage_entries_other;
        return;
    }

    map_[destination_key].merge(candidates);
}

bool LineageMapBuilder::disambiguate(const std::string& destination_key,
                                     const QueryEvent& event,
                                     UpstreamKeySet& candidates) {
    const std::string query = event.query.value_or("");
    if (utils::trim(query).empty()) {
        utils::log::warn(std::format(
            "No query text for {} (event {}); it will be skipped from lineage",
            destination_key, event.source_id));
        return false;
    }

    std::vector<std::string> parsed;
    try {
        auto result = sql_parser_->parse_tables(query);
        if (result.is_error()) {
            utils::log::warn(std::format(
                "Sql Parser failed on query: {}. It will be skipped from lineage. The error was {}",
                query, result.error_message()));
            return false;
        }
        parsed = std::move(result.value());
    } catch (const std::exception& e) {
        utils::log::warn(std::format(
            "Sql Parser failed on query: {}. It will be skipped from lineage. The error was {}",
            query, e.what()));
        return false;
    }

    if (parsed.empty()) {
        utils::log::warn(std::format(
            "Sql Parser found no tables in query: {}. It will be skipped from lineage", query));
        return false;
    }

    std::unordered_set<std::string> referenced_names;
    for (const auto& name : parsed) {
        referenced_names.insert(utils::to_lower(utils::last_segment(name, '.')));
    }

    // The whole upstream set of the destination is filtered, including
    // members added by earlier events
    if (const auto it = map_.find(destination_key); it != map_.end()) {
        candidates.insert(it->second.begin(), it->second.end());
    }

    UpstreamKeySet filtered;
    for (const auto& key : candidates) {
        if (referenced_names.contains(std::string(utils::last_segment(key, '/')))) {
            filtered.insert(key);
        }
    }
    candidates = std::move(filtered);
    return true;
}

LineageMap LineageMapBuilder::build(IQueryEventStream& events) {
    while (auto event = events.next()) {
        add(*event);
    }
    return std::move(map_);
}

} // namespace bqlineage
