#include "source/jsonl_log_source.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <stdexcept>

namespace bqlineage {

namespace {

class JsonlCursor : public IAuditRecordCursor {
public:
    JsonlCursor(std::string path, std::optional<uint64_t> max_results)
        : path_(std::move(path)), max_results_(max_results) {}

    std::optional<RawAuditRecord> next() override {
        if (max_results_ && returned_ >= *max_results_) {
            return std::nullopt;
        }

        if (!opened_) {
            in_.open(path_);
            if (!in_.is_open()) {
                throw std::runtime_error(std::format("Cannot open audit log file: {}", path_));
            }
            opened_ = true;
        }

        std::string line;
        while (std::getline(in_, line)) {
            ++line_no_;
            if (utils::trim(line).empty()) continue;

            JsonValue entry;
            try {
                entry = JsonValue::parse(line);
            } catch (const JsonValue::parse_error& e) {
                throw std::runtime_error(std::format(
                    "{}:{}: malformed audit record: {}", path_, line_no_, e.what()));
            }
            if (!entry.is_object()) {
                throw std::runtime_error(std::format(
                    "{}:{}: audit record is not a JSON object", path_, line_no_));
            }

            ++returned_;
            return RawAuditRecord(std::move(entry));
        }

        if (in_.bad()) {
            throw std::runtime_error(std::format("Read error on audit log file: {}", path_));
        }
        return std::nullopt;
    }

private:
    std::string path_;
    std::optional<uint64_t> max_results_;
    std::ifstream in_;
    bool opened_ = false;
    uint64_t line_no_ = 0;
    uint64_t returned_ = 0;
};

// Trailing "LIMIT n" of an audit-table query, if any
std::optional<uint64_t> trailing_limit(const std::string& sql) {
    const auto pos = sql.rfind("LIMIT ");
    if (pos == std::string::npos) return std::nullopt;

    std::string tail = utils::trim(sql.substr(pos + 6));
    if (!tail.empty() && tail.back() == ';') tail.pop_back();
    return utils::try_parse_int<uint64_t>(utils::trim(tail));
}

} // anonymous namespace

JsonlLogSource::JsonlLogSource(std::string path) : path_(std::move(path)) {}

std::unique_ptr<IAuditRecordCursor> JsonlLogSource::fetch(
    const std::string& /*filter*/,
    uint32_t page_size,
    std::optional<uint64_t> max_results) {
    utils::log::debug(std::format("Reading audit log entries from {} (page_size={})",
                                  path_, page_size));
    return std::make_unique<JsonlCursor>(path_, max_results);
}

std::unique_ptr<IAuditRecordCursor> JsonlLogSource::query(const std::string& sql) {
    utils::log::debug(std::format("Reading exported audit rows from {}", path_));
    return std::make_unique<JsonlCursor>(path_, trailing_limit(sql));
}

} // namespace bqlineage
