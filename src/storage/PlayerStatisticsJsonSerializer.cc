#include "storage/PlayerStatisticsJsonSerializer.hh"

#include "statistics/PlayerStatistics.hh"
#include "storage/JsonSerializerUtility.hh"

using nlohmann::json;

namespace Landlord {
namespace Statistics {

void to_json(json& j, const StreakSummary& streaks)
{
    j = json {
        { "currentWinStreak", streaks.currentWinStreak },
        { "currentLossStreak", streaks.currentLossStreak },
        { "maxWinStreak", streaks.maxWinStreak },
        { "maxLossStreak", streaks.maxLossStreak },
    };
}

void to_json(json& j, const RunningMilestone& milestone)
{
    j = json {
        { "value", milestone.value },
        { "roundIndex", milestone.roundIndex },
    };
}

void to_json(json& j, const PlayerStatistics& stats)
{
    j = json {
        { "playerId", stats.playerId },
        { "totalRounds", stats.totalRounds },
        { "roundsWon", stats.roundsWon },
        { "roundsLost", stats.roundsLost },
        { "roundsAsLandlord", stats.roundsAsLandlord },
        { "landlordWins", stats.landlordWins },
        { "landlordLosses", stats.landlordLosses },
        { "roundsAsFarmer", stats.roundsAsFarmer },
        { "farmerWins", stats.farmerWins },
        { "farmerLosses", stats.farmerLosses },
        { "firstBidderRounds", stats.firstBidderRounds },
        { "firstBidCounts", stats.firstBidCounts },
        { "springCount", stats.springCount },
        { "springAgainstCount", stats.springAgainstCount },
        { "doubledRounds", stats.doubledRounds },
        { "doubledWins", stats.doubledWins },
        { "doubledLosses", stats.doubledLosses },
        { "roundStreaks", stats.roundStreaks },
        { "matchStreaks", stats.matchStreaks },
        { "totalMatches", stats.totalMatches },
        { "matchesWon", stats.matchesWon },
        { "matchesLost", stats.matchesLost },
        { "matchesTied", stats.matchesTied },
        { "totalScore", stats.totalScore },
        { "bestRoundScore", stats.bestRoundScore },
        { "worstRoundScore", stats.worstRoundScore },
        { "bestMatchScore", stats.bestMatchScore },
        { "worstMatchScore", stats.worstMatchScore },
        { "bestSnapshot", stats.bestSnapshot },
        { "worstSnapshot", stats.worstSnapshot },
        { "runningPeak", stats.runningPeak },
        { "runningTrough", stats.runningTrough },
        { "winRate", winRate(stats) },
        { "landlordWinRate", landlordWinRate(stats) },
        { "farmerWinRate", farmerWinRate(stats) },
        { "doubledWinRate", doubledWinRate(stats) },
        { "matchWinRate", matchWinRate(stats) },
        { "averageScorePerRound", averageScorePerRound(stats) },
    };
}

}
}
