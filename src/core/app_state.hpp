#pragma once

#include <atomic>
#include <mutex>
#include <vector>
#include "types.hpp"

namespace arbx {

// Process-level run flag plus the reports of every trigger issued by the CLI
class AppState {
public:
    AppState() : running_(true) {}

    void shutdown() { running_ = false; }
    bool is_running() const { return running_; }

    void add_report(const ExecutionReport& report);
    std::vector<ExecutionReport> get_reports() const;
    size_t settled_count() const;
    size_t failed_count() const;

private:
    std::atomic<bool> running_;
    mutable std::mutex mutex_;
    std::vector<ExecutionReport> reports_;
};

} // namespace arbx
