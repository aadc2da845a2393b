#pragma once

#include "source/isource_adapter.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

namespace errorengine::testing {

/**
 * @brief Scriptable source: returns the configured rows or failure.
 *
 * With block() set, fetch() parks until release() so tests can hold a
 * cycle in flight.
 */
class MockSourceAdapter : public ISourceAdapter {
public:
    explicit MockSourceAdapter(std::string name = "mock",
                               SourceType type = SourceType::SQLITE)
        : name_(std::move(name)), type_(type) {}

    void set_rows(std::vector<Row> rows) {
        std::lock_guard lock(mutex_);
        rows_ = std::move(rows);
        fail_ = false;
    }

    void set_failure(SourceErrorKind kind, std::string message) {
        std::lock_guard lock(mutex_);
        fail_ = true;
        fail_kind_ = kind;
        fail_message_ = std::move(message);
    }

    void block() {
        std::lock_guard lock(mutex_);
        blocked_ = true;
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            blocked_ = false;
        }
        cv_.notify_all();
    }

    /// Wait until some fetch() is parked on the gate
    bool wait_until_entered(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return waiting_ > 0; });
    }

    [[nodiscard]] FetchResult fetch(const std::string& query_text,
                                    std::chrono::milliseconds /*timeout*/) override {
        fetch_count_.fetch_add(1, std::memory_order_relaxed);

        std::unique_lock lock(mutex_);
        last_query_ = query_text;
        ++waiting_;
        cv_.notify_all();
        cv_.wait(lock, [this] { return !blocked_; });
        --waiting_;

        if (fail_) {
            return FetchResult::failure(fail_kind_, fail_message_);
        }
        std::vector<std::string> columns;
        if (!rows_.empty()) columns = rows_.front().columns();
        return FetchResult::ok(std::move(columns), rows_);
    }

    [[nodiscard]] SourceType type() const override { return type_; }
    [[nodiscard]] std::string name() const override { return name_; }

    [[nodiscard]] uint64_t fetch_count() const {
        return fetch_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::string last_query() const {
        std::lock_guard lock(mutex_);
        return last_query_;
    }

private:
    std::string name_;
    SourceType type_;

    std::vector<Row> rows_;
    bool fail_ = false;
    SourceErrorKind fail_kind_ = SourceErrorKind::QUERY;
    std::string fail_message_;
    std::string last_query_;

    bool blocked_ = false;
    int waiting_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::atomic<uint64_t> fetch_count_{0};
};

} // namespace errorengine::testing
