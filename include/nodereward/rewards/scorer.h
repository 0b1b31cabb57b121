// NODEREWARD - Performance Scorer
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#ifndef NODEREWARD_REWARDS_SCORER_H
#define NODEREWARD_REWARDS_SCORER_H

#include "nodereward/core/types.h"

#include <cstdint>

namespace nodereward {
namespace rewards {

/// Score weights (must sum to 100)
namespace ScoreWeight {
    constexpr uint32_t UPTIME = 40;
    constexpr uint32_t PERFORMANCE = 35;
    constexpr uint32_t QUALITY = 25;
}

static_assert(ScoreWeight::UPTIME + ScoreWeight::PERFORMANCE + ScoreWeight::QUALITY == 100,
              "score weights must sum to 100");

constexpr uint32_t MAX_SCORE = 100;

/**
 * Weighted 0-100 score shared by reward adjustment and slashing.
 * Division truncates toward zero at both call sites.
 */
class PerformanceScorer {
public:
    static bool IsValidScore(uint32_t score) { return score <= MAX_SCORE; }

    static bool AreValidScores(uint32_t uptime, uint32_t performance, uint32_t quality) {
        return IsValidScore(uptime) && IsValidScore(performance) && IsValidScore(quality);
    }

    /// (uptime*40 + performance*35 + quality*25) / 100
    static uint32_t Score(uint32_t uptime, uint32_t performance, uint32_t quality);

    /// baseAmount * score / 100
    static Amount Adjust(Amount baseAmount, uint32_t score);
};

} // namespace rewards
} // namespace nodereward

#endif // NODEREWARD_REWARDS_SCORER_H
