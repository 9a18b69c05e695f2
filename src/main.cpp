#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "lineage/extraction_report.hpp"
#include "lineage/lineage_extractor.hpp"
#include "lineage/table_ref.hpp"
#include "parser/pg_table_name_parser.hpp"
#include "source/jsonl_log_source.hpp"

#include <cstdlib>
#include <exception>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bqlineage;

namespace {

void print_usage(const char* prog) {
    std::cerr << std::format("Usage: {} <config.toml> <events.jsonl> <project.dataset.table>...\n", prog);
}

std::string lineage_json(const std::string& table, const std::optional<UpstreamLineage>& lineage) {
    if (!lineage) {
        return std::format("{{\"table\":\"{}\",\"upstreams\":null}}", utils::escape_json(table));
    }

    std::string upstreams;
    for (const auto& upstream : lineage->upstreams) {
        if (!upstreams.empty()) upstreams += ",";
        upstreams += std::format("{{\"urn\":\"{}\",\"type\":\"{}\"}}",
                                 utils::escape_json(upstream.table_urn),
                                 lineage_type_name(upstream.type));
    }
    return std::format("{{\"table\":\"{}\",\"upstreams\":[{}]}}",
                       utils::escape_json(table), upstreams);
}

std::string report_json(const ExtractionReport& report) {
    std::string failures;
    for (const auto& [key, reasons] : report.failures) {
        if (!failures.empty()) failures += ",";
        std::string list;
        for (const auto& reason : reasons) {
            if (!list.empty()) list += ",";
            list += std::format("\"{}\"", utils::escape_json(reason));
        }
        failures += std::format("\"{}\":[{}]", utils::escape_json(key), list);
    }

    return std::format(
        "{{\"report\":{{"
        "\"num_total_log_entries\":{},"
        "\"num_parsed_log_entries\":{},"
        "\"num_total_lineage_entries\":{},"
        "\"num_skipped_lineage_entries_missing_data\":{},"
        "\"num_skipped_lineage_entries_not_allowed\":{},"
        "\"num_skipped_lineage_entries_sql_parser_failure\":{},"
        "\"num_skipped_lineage_entries_other\":{},"
        "\"lineage_metadata_entries\":{},"
        "\"failures\":{{{}}}}}}}",
        report.num_total_log_entries,
        report.num_parsed_log_entries,
        report.num_total_lineage_entries,
        report.num_skipped_lineage_entries_missing_data,
        report.num_skipped_lineage_entries_not_allowed,
        report.num_skipped_lineage_entries_sql_parser_failure,
        report.num_skipped_lineage_entries_other,
        report.lineage_metadata_entries,
        failures);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    const std::string config_file = argv[1];
    const std::string events_file = argv[2];

    auto config_result = ConfigLoader::load_from_file(config_file);
    if (!config_result.success) {
        utils::log::error(config_result.error_message);
        return EXIT_FAILURE;
    }
    const auto& cfg = config_result.config;
    if (const auto level = utils::log::parse_level(cfg.logging.level)) {
        utils::log::set_level(*level);
    }

    std::vector<TableIdentifier> targets;
    for (int i = 3; i < argc; ++i) {
        try {
            targets.push_back(TableIdentifier::from_string_name(argv[i]));
        } catch (const std::invalid_argument& e) {
            utils::log::error(std::format("Bad table name '{}': {}", argv[i], e.what()));
            return EXIT_FAILURE;
        }
    }

    try {
        ExtractionReport report;
        auto source = std::make_shared<JsonlLogSource>(events_file);
        LineageExtractor extractor(cfg.lineage, cfg.output,
                                   source, source,
                                   std::make_shared<PgTableNameParser>(),
                                   report);

        utils::Timer timer;
        for (size_t i = 0; i < targets.size(); ++i) {
            std::cout << lineage_json(argv[i + 3], extractor.get_upstream_lineage(targets[i])) << "\n";
        }
        std::cout << report_json(report) << "\n";

        utils::log::info(std::format("Answered {} lineage queries in {}ms",
                                     targets.size(), timer.elapsed_ms().count()));
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
