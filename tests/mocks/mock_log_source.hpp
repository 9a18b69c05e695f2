#pragma once

#include "core/json.hpp"
#include "source/log_source.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace bqlineage::testing {

/**
 * @brief In-memory log source serving both fetch modes, with call counting
 */
class MockLogSource : public ILogSource, public IAuditTableClient {
public:
    MockLogSource() = default;
    explicit MockLogSource(std::vector<std::string> json_lines) {
        for (const auto& line : json_lines) add(line);
    }

    void add(const std::string& json) {
        records_.emplace_back(JsonValue::parse(json));
    }

    [[nodiscard]] std::unique_ptr<IAuditRecordCursor> fetch(
        const std::string& filter,
        uint32_t page_size,
        std::optional<uint64_t> max_results) override {
        fetch_count_.fetch_add(1, std::memory_order_relaxed);
        last_filter_ = filter;
        last_page_size_ = page_size;
        last_max_results_ = max_results;
        if (fail_on_open_) throw std::runtime_error("permission denied");
        return std::make_unique<Cursor>(records_, max_results, fail_after_);
    }

    [[nodiscard]] std::unique_ptr<IAuditRecordCursor> query(const std::string& sql) override {
        query_count_.fetch_add(1, std::memory_order_relaxed);
        queries_.push_back(sql);
        if (fail_on_open_) throw std::runtime_error("quota exceeded");
        return std::make_unique<Cursor>(records_, std::nullopt, fail_after_);
    }

    // Throw from fetch()/query() themselves
    void set_fail_on_open(bool v) { fail_on_open_ = v; }

    // Throw from the cursor after n records were returned
    void set_fail_after(size_t n) { fail_after_ = n; }

    [[nodiscard]] uint64_t fetch_count() const { return fetch_count_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t query_count() const { return query_count_.load(std::memory_order_relaxed); }
    [[nodiscard]] const std::string& last_filter() const { return last_filter_; }
    [[nodiscard]] uint32_t last_page_size() const { return last_page_size_; }
    [[nodiscard]] std::optional<uint64_t> last_max_results() const { return last_max_results_; }
    [[nodiscard]] const std::vector<std::string>& queries() const { return queries_; }

private:
    class Cursor : public IAuditRecordCursor {
    public:
        Cursor(const std::vector<RawAuditRecord>& records,
               std::optional<uint64_t> max_results,
               std::optional<size_t> fail_after)
            : records_(records), max_results_(max_results), fail_after_(fail_after) {}

        std::optional<RawAuditRecord> next() override {
            if (fail_after_ && pos_ >= *fail_after_) {
                throw std::runtime_error("connection reset by peer");
            }
            if (pos_ >= records_.size()) return std::nullopt;
            if (max_results_ && pos_ >= *max_results_) return std::nullopt;
            return records_[pos_++];
        }

    private:
        const std::vector<RawAuditRecord>& records_;
        std::optional<uint64_t> max_results_;
        std::optional<size_t> fail_after_;
        size_t pos_ = 0;
    };

    std::vector<RawAuditRecord> records_;
    bool fail_on_open_ = false;
    std::optional<size_t> fail_after_;

    std::atomic<uint64_t> fetch_count_{0};
    std::atomic<uint64_t> query_count_{0};
    std::string last_filter_;
    uint32_t last_page_size_ = 0;
    std::optional<uint64_t> last_max_results_;
    std::vector<std::string> queries_;
};

} // namespace bqlineage::testing
