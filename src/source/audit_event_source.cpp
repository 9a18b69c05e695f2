#include "source/audit_event_source.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>
#include <vector>

namespace bqlineage {

namespace {

class EmptyCursor : public IAuditRecordCursor {
public:
    std::optional<RawAuditRecord> next() override { return std::nullopt; }
};

/**
 * Runs one audit-table query per dataset, each only once the previous
 * dataset's rows are exhausted.
 */
class DatasetChainCursor : public IAuditRecordCursor {
public:
    DatasetChainCursor(std::vector<std::pair<std::string, std::string>> queries,
                       std::shared_ptr<IAuditTableClient> client,
                       std::shared_ptr<RequestGate> gate)
        : queries_(std::move(queries)),
          client_(std::move(client)),
          gate_(std::move(gate)) {}

    std::optional<RawAuditRecord> next() override {
        while (true) {
            if (current_) {
                if (auto record = current_->next()) {
                    return record;
                }
                utils::log::info(std::format(
                    "Finished loading log entries from BigQueryAuditMetadata in {}",
                    queries_[index_ - 1].first));
                current_.reset();
            }
            if (index_ >= queries_.size()) {
                return std::nullopt;
            }

            const auto& [dataset, sql] = queries_[index_++];
            utils::log::info(std::format(
                "Start loading log entries from BigQueryAuditMetadata in {}", dataset));
            utils::log::debug(std::format("Audit metadata query: {}", sql));
            if (gate_) gate_->acquire();
            current_ = client_->query(sql);
            if (!current_) {
                throw std::runtime_error(std::format(
                    "audit table client returned no cursor for {}", dataset));
            }
        }
    }

private:
    std::vector<std::pair<std::string, std::string>> queries_;  // (dataset, sql)
    std::shared_ptr<IAuditTableClient> client_;
    std::shared_ptr<RequestGate> gate_;
    std::unique_ptr<IAuditRecordCursor> current_;
    size_t index_ = 0;
};

} // anonymous namespace

AuditEventSource::AuditEventSource(const LineageConfig& config,
                                   std::shared_ptr<ILogSource> log_source,
                                   std::shared_ptr<IAuditTableClient> table_client,
                                   ExtractionReport& report)
    : config_(config),
      window_{config.start_time, config.end_time, config.max_query_duration},
      log_source_(std::move(log_source)),
      table_client_(std::move(table_client)),
      report_(report) {
    if (config_.rate_limit) {
        gate_ = std::make_shared<RequestGate>(config_.requests_per_min, std::chrono::seconds(60));
    }
}

std::unique_ptr<IAuditRecordCursor> AuditEventSource::open(std::optional<uint64_t> limit) {
    return config_.use_exported_audit_metadata ? open_exported(limit) : open_logging(limit);
}

std::unique_ptr<IAuditRecordCursor> AuditEventSource::open_logging(std::optional<uint64_t> limit) {
    if (!log_source_) {
        throw std::runtime_error("no log source configured for logging API mode");
    }

    report_.log_entry_start_time = AuditFilterBuilder::format_bound(window_.padded_start(), false);
    report_.log_entry_end_time = AuditFilterBuilder::format_bound(window_.padded_end(), false);

    const std::string filter = AuditFilterBuilder::logging_filter(window_);
    utils::log::info(std::format(
        "Start loading log entries from BigQuery start_time={} and end_time={}",
        report_.log_entry_start_time, report_.log_entry_end_time));
    utils::log::debug(std::format("Log filter: {}", filter));

    if (gate_) gate_->acquire();
    auto cursor = log_source_->fetch(filter, config_.log_page_size, limit);
    if (!cursor) {
        throw std::runtime_error("log source returned no cursor");
    }
    return cursor;
}

std::unique_ptr<IAuditRecordCursor> AuditEventSource::open_exported(std::optional<uint64_t> limit) {
    if (!config_.audit_metadata_datasets) {
        report_.report_failure("audit-metadata", "bigquery_audit_metadata_datasets not set");
        report_.audit_metadata_datasets_missing = true;
        return std::make_unique<EmptyCursor>();
    }
    if (!table_client_) {
        throw std::runtime_error("no audit table client configured for exported audit metadata mode");
    }

    const bool sharded = config_.use_date_sharded_audit_log_tables;
    report_.audit_start_time = AuditFilterBuilder::format_bound(window_.padded_start(), sharded);
    report_.audit_end_time = AuditFilterBuilder::format_bound(window_.padded_end(), sharded);

    std::vector<std::pair<std::string, std::string>> queries;
    queries.reserve(config_.audit_metadata_datasets->size());
    for (const auto& dataset : *config_.audit_metadata_datasets) {
        queries.emplace_back(dataset,
            AuditFilterBuilder::audit_table_query(dataset, window_, sharded, limit));
    }

    return std::make_unique<DatasetChainCursor>(std::move(queries), table_client_, gate_);
}

} // namespace bqlineage
