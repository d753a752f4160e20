#include "report_history.hpp"
#include <algorithm>
#include <stdexcept>

namespace serverscore::history {

ReportHistory::ReportHistory(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("ReportHistory capacity must be positive");
    }
}

ReportHistory ReportHistory::from_recent(const std::vector<report::Report>& most_recent_first,
                                         size_t capacity) {
    ReportHistory history(capacity);
    size_t keep = std::min(most_recent_first.size(), capacity);
    for (size_t i = keep; i-- > 0;) {
        history.push(most_recent_first[i]);
    }
    return history;
}

void ReportHistory::push(report::Report report) {
    reports_.push_front(std::move(report));
    while (reports_.size() > capacity_) {
        reports_.pop_back();
    }
}

const report::Report* ReportHistory::latest() const {
    if (reports_.empty()) {
        return nullptr;
    }
    return &reports_.front();
}

std::vector<report::Report> ReportHistory::recent(size_t n) const {
    size_t count = std::min(n, reports_.size());
    return std::vector<report::Report>(reports_.begin(), reports_.begin() + count);
}

std::vector<report::Report> ReportHistory::chronological(size_t n) const {
    std::vector<report::Report> out = recent(n);
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace serverscore::history
