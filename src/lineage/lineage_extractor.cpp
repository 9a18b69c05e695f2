#include "lineage/lineage_extractor.hpp"
#include "audit/query_event_reader.hpp"
#include "core/utils.hpp"
#include "lineage/dataset_urn.hpp"
#include "lineage/lineage_map_builder.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <map>
#include <set>
#include <unordered_set>

namespace bqlineage {

namespace {

std::string dump_map(const LineageMap& map) {
    // Sorted so debug output is stable
    std::map<std::string, std::set<std::string>> ordered;
    for (const auto& [destination, upstreams] : map) {
        ordered[destination].insert(upstreams.begin(), upstreams.end());
    }

    std::string out;
    for (const auto& [destination, upstreams] : ordered) {
        out += std::format("\n  {} <- [", destination);
        bool first = true;
        for (const auto& upstream : upstreams) {
            if (!first) out += ", ";
            out += upstream;
            first = false;
        }
        out += "]";
    }
    return out;
}

} // anonymous namespace

LineageExtractor::LineageExtractor(const LineageConfig& lineage_config,
                                   const OutputConfig& output_config,
                                   std::shared_ptr<ILogSource> log_source,
                                   std::shared_ptr<IAuditTableClient> table_client,
                                   std::shared_ptr<ITableNameParser> sql_parser,
                                   ExtractionReport& report)
    : lineage_config_(lineage_config),
      output_config_(output_config),
      sql_parser_(std::move(sql_parser)),
      report_(report),
      event_parser_(QueryEventParser::Config{lineage_config.debug_include_full_payloads}),
      event_source_(lineage_config, std::move(log_source), std::move(table_client), report),
      resolver_(TempTableClassifier(lineage_config.temp_table_dataset_prefixes,
                                    lineage_config.temp_table_name_patterns)) {}

LineageMap LineageExtractor::compute_lineage() {
    const bool exported = event_source_.uses_exported_audit_metadata();
    utils::log::info(exported
        ? "Populating lineage info via exported GCP audit logs"
        : "Populating lineage info via GCP audit logs");

    LineageMap map;
    try {
        QueryEventReader events(event_source_.open(), event_parser_, report_);
        LineageMapBuilder builder(
            LineageMapBuilder::Config{
                AllowDenyPattern(lineage_config_.dataset_pattern.allow,
                                 lineage_config_.dataset_pattern.deny,
                                 lineage_config_.dataset_pattern.ignore_case),
                AllowDenyPattern(lineage_config_.table_pattern.allow,
                                 lineage_config_.table_pattern.deny,
                                 lineage_config_.table_pattern.ignore_case)},
            sql_parser_, report_);
        map = builder.build(events);
    } catch (const std::exception& e) {
        // A partial map would under-report lineage silently
        if (exported) {
            report_.report_failure("lineage-exported-gcp-audit-logs",
                                   std::format("Error: {}", e.what()));
        } else {
            report_.report_failure("lineage-gcp-logs",
                                   std::format("Failed to get lineage gcp logging. The error message was {}",
                                               e.what()));
        }
        map.clear();
    }

    report_.lineage_metadata_entries = map.size();
    utils::log::info(std::format("Built lineage map containing {} entries.", map.size()));
    if (utils::log::level() <= utils::log::Level::DEBUG) {
        utils::log::debug(std::format("lineage metadata is {}", dump_map(map)));
    }
    return map;
}

std::optional<UpstreamLineage> LineageExtractor::get_upstream_lineage(const TableIdentifier& target) {
    std::lock_guard lock(mutex_);

    if (!lineage_map_) {
        lineage_map_ = compute_lineage();
        ++build_count_;
    }

    const std::string key = BigQueryTableRef(target).sanitized().to_string();
    if (!lineage_map_->contains(key)) {
        return std::nullopt;
    }

    std::unordered_set<std::string> seen;
    const auto refs = resolver_.resolve_upstreams(*lineage_map_, key, seen);

    UpstreamLineage lineage;
    lineage.upstreams.reserve(refs.size());
    for (const auto& ref : refs) {
        lineage.upstreams.push_back(Upstream{
            make_dataset_urn(output_config_, ref.table_identifier()),
            DatasetLineageType::TRANSFORMED});
    }
    std::sort(lineage.upstreams.begin(), lineage.upstreams.end(),
              [](const Upstream& a, const Upstream& b) { return a.table_urn < b.table_urn; });

    if (lineage_config_.upstream_lineage_in_report) {
        auto& reported = report_.upstream_lineage[key];
        for (const auto& ref : refs) {
            reported.insert(ref.to_string());
        }
    }

    return lineage;
}

void LineageExtractor::invalidate() {
    std::lock_guard lock(mutex_);
    lineage_map_.reset();
}

bool LineageExtractor::test_capability() {
    std::lock_guard lock(mutex_);
    try {
        auto cursor = event_source_.open(1);
        (void)cursor->next();
        return true;
    } catch (const std::exception& e) {
        report_.report_failure("lineage-capability",
                               std::format("Unable to read audit records: {}", e.what()));
        return false;
    }
}

size_t LineageExtractor::build_count() const {
    std::lock_guard lock(mutex_);
    return build_count_;
}

} // namespace bqlineage
