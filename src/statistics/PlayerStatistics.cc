#include "statistics/PlayerStatistics.hh"

#include "IoUtility.hh"
#include "Utility.hh"

#include <ostream>

namespace Landlord {
namespace Statistics {

int firstBidCount(const PlayerStatistics& stats, const BidLevel level)
{
    return stats.firstBidCounts.at(bidValue(level));
}

double winRate(const PlayerStatistics& stats)
{
    return ratio(stats.roundsWon, stats.totalRounds);
}

double landlordWinRate(const PlayerStatistics& stats)
{
    return ratio(stats.landlordWins, stats.roundsAsLandlord);
}

double farmerWinRate(const PlayerStatistics& stats)
{
    return ratio(stats.farmerWins, stats.roundsAsFarmer);
}

double doubledWinRate(const PlayerStatistics& stats)
{
    return ratio(stats.doubledWins, stats.doubledRounds);
}

double matchWinRate(const PlayerStatistics& stats)
{
    return ratio(stats.matchesWon, stats.totalMatches);
}

double averageScorePerRound(const PlayerStatistics& stats)
{
    return ratio(stats.totalScore, stats.totalRounds);
}

std::ostream& operator<<(std::ostream& os, const RunningMilestone& milestone)
{
    using Landlord::operator<<;
    return os << milestone.value << " @ " << milestone.roundIndex;
}

std::ostream& operator<<(std::ostream& os, const PlayerStatistics& stats)
{
    os << "player: " << stats.playerId << "\n" <<
        "rounds: " << stats.totalRounds << " (+" << stats.roundsWon <<
        "/-" << stats.roundsLost << ")\n" <<
        "landlord: " << stats.roundsAsLandlord << " (+" <<
        stats.landlordWins << "/-" << stats.landlordLosses << ")\n" <<
        "farmer: " << stats.roundsAsFarmer << " (+" << stats.farmerWins <<
        "/-" << stats.farmerLosses << ")\n" <<
        "first bids:";
    for (const auto level : BID_LEVELS) {
        os << " " << level << "=" << firstBidCount(stats, level);
    }
    return os << " of " << stats.firstBidderRounds << "\n" <<
        "springs: " << stats.springCount << "/" <<
        stats.springAgainstCount << "\n" <<
        "doubled: " << stats.doubledRounds << " (+" << stats.doubledWins <<
        "/-" << stats.doubledLosses << ")\n" <<
        "round streaks: " << stats.roundStreaks << "\n" <<
        "matches: " << stats.totalMatches << " (+" << stats.matchesWon <<
        "/-" << stats.matchesLost << "/=" << stats.matchesTied << ")\n" <<
        "match streaks: " << stats.matchStreaks << "\n" <<
        "score: " << stats.totalScore << "\n" <<
        "round score: " << stats.worstRoundScore << ".." <<
        stats.bestRoundScore << "\n" <<
        "match score: " << stats.worstMatchScore << ".." <<
        stats.bestMatchScore << "\n" <<
        "snapshot: " << stats.worstSnapshot << ".." << stats.bestSnapshot <<
        "\n" <<
        "running: " << stats.runningTrough << ".." << stats.runningPeak;
}

}
}
