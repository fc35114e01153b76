#include "app_state.hpp"
#include <algorithm>

namespace arbx {

void AppState::add_report(const ExecutionReport& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    reports_.push_back(report);
}

std::vector<ExecutionReport> AppState::get_reports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reports_;
}

size_t AppState::settled_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(reports_.begin(), reports_.end(),
                                             [](const ExecutionReport& r) { return r.success; }));
}

size_t AppState::failed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(reports_.begin(), reports_.end(),
                                             [](const ExecutionReport& r) { return !r.success; }));
}

} // namespace arbx
