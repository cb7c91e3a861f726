#include "statistics/Streak.hh"

#include <algorithm>
#include <ostream>

namespace Landlord {
namespace Statistics {

void StreakCounter::addScore(const int score)
{
    if (score > 0) {
        ++summary.currentWinStreak;
        summary.currentLossStreak = 0;
        summary.maxWinStreak =
            std::max(summary.maxWinStreak, summary.currentWinStreak);
    } else if (score < 0) {
        ++summary.currentLossStreak;
        summary.currentWinStreak = 0;
        summary.maxLossStreak =
            std::max(summary.maxLossStreak, summary.currentLossStreak);
    } else {
        summary.currentWinStreak = 0;
        summary.currentLossStreak = 0;
    }
}

const StreakSummary& StreakCounter::getSummary() const
{
    return summary;
}

bool operator==(const StreakSummary& lhs, const StreakSummary& rhs)
{
    return lhs.currentWinStreak == rhs.currentWinStreak &&
        lhs.currentLossStreak == rhs.currentLossStreak &&
        lhs.maxWinStreak == rhs.maxWinStreak &&
        lhs.maxLossStreak == rhs.maxLossStreak;
}

std::ostream& operator<<(std::ostream& os, const StreakSummary& summary)
{
    return os << "current: +" << summary.currentWinStreak << "/-" <<
        summary.currentLossStreak << ", max: +" << summary.maxWinStreak <<
        "/-" << summary.maxLossStreak;
}

}
}
