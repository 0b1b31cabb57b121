// NODEREWARD - Performance Scorer Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/rewards/scorer.h"
#include "nodereward/rewards/types.h"

namespace nodereward {
namespace rewards {

uint32_t PerformanceScorer::Score(uint32_t uptime, uint32_t performance, uint32_t quality) {
    uint64_t weighted = static_cast<uint64_t>(uptime) * ScoreWeight::UPTIME +
                        static_cast<uint64_t>(performance) * ScoreWeight::PERFORMANCE +
                        static_cast<uint64_t>(quality) * ScoreWeight::QUALITY;
    return static_cast<uint32_t>(weighted / 100);
}

Amount PerformanceScorer::Adjust(Amount baseAmount, uint32_t score) {
    return PercentOf(baseAmount, score);
}

} // namespace rewards
} // namespace nodereward
