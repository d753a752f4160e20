#pragma once

#include "core/scoring/scoring_config.hpp"
#include <optional>

namespace serverscore::scoring {

/**
 * EMA step from the previous published score towards the new raw score.
 *
 * - No previous score: the raw score is returned as is.
 * - |raw - previous| < min_score_change: previous is returned unchanged.
 * - Otherwise the step alpha * (raw - previous) is clamped to
 *   +/- max_score_change and the result to [0, max_score].
 */
uint32_t smooth(uint32_t raw_score, std::optional<uint32_t> previous, const ScoringConfig& config);

} // namespace serverscore::scoring
