#include "smoother.hpp"
#include <algorithm>
#include <cmath>

namespace serverscore::scoring {

uint32_t smooth(uint32_t raw_score, std::optional<uint32_t> previous, const ScoringConfig& config) {
    if (!previous) {
        return std::min(raw_score, config.max_score);
    }

    const double prev = static_cast<double>(*previous);
    const double diff = static_cast<double>(raw_score) - prev;
    if (std::fabs(diff) < static_cast<double>(config.min_score_change)) {
        return *previous;
    }

    const double limit = static_cast<double>(config.max_score_change);
    const double step = std::clamp(config.ema_alpha * diff, -limit, limit);

    double next = std::round(prev + step);
    next = std::clamp(next, 0.0, static_cast<double>(config.max_score));
    return static_cast<uint32_t>(next);
}

} // namespace serverscore::scoring
