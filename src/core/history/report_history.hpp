#pragma once

#include "core/report/report.hpp"
#include <deque>
#include <vector>

namespace serverscore::history {

/**
 * ReportHistory - Bounded per-entity report window.
 *
 * Front is the most recent report. Capacity is enforced on insertion:
 * pushing onto a full window evicts the oldest report.
 */
class ReportHistory {
public:
    explicit ReportHistory(size_t capacity = 60);

    /**
     * Build from a most-recent-first sequence (the Collector's order).
     * Reports beyond capacity are the oldest ones and are dropped.
     */
    static ReportHistory from_recent(const std::vector<report::Report>& most_recent_first,
                                     size_t capacity);

    // Insert a report newer than everything already held
    void push(report::Report report);

    const report::Report* latest() const;

    // Up to n reports, most recent first
    std::vector<report::Report> recent(size_t n) const;

    // The newest n reports, oldest first
    std::vector<report::Report> chronological(size_t n) const;
    std::vector<report::Report> chronological() const { return chronological(reports_.size()); }

    size_t size() const { return reports_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return reports_.empty(); }

    const std::deque<report::Report>& reports() const { return reports_; }

private:
    size_t capacity_;
    std::deque<report::Report> reports_;
};

} // namespace serverscore::history
