#include "statistics/StatisticsEngine.hh"

#include "landlord/MatchSummary.hh"
#include "landlord/RoundRecord.hh"
#include "Enumerate.hh"
#include "Logging.hh"

#include <algorithm>
#include <iterator>
#include <optional>

namespace Landlord {
namespace Statistics {

namespace {

// Round from the point of view of one player
struct PlayerRound {
    const RoundRecord* record;
    Seat seat;
    int score;
};

// Match from the point of view of one player
struct PlayerMatch {
    const MatchSummary* match;
    Seat seat;
    int score;
};

std::vector<PlayerRound> playerRoundsFor(
    const PlayerId& playerId, const std::vector<RoundRecord>& rounds)
{
    auto ret = std::vector<PlayerRound> {};
    ret.reserve(rounds.size());
    for (const auto& record : rounds) {
        const auto seat = seatOf(record.playerIds, playerId);
        if (!seat) {
            log(LogLevel::WARNING,
                "Skipping round %d of match %s: player %s did not play",
                record.roundIndex, record.matchId, playerId);
            continue;
        }
        ret.push_back(PlayerRound {&record, *seat, record.deltas[*seat]});
    }
    return ret;
}

std::vector<PlayerMatch> playerMatchesFor(
    const PlayerId& playerId, const std::vector<MatchSummary>& matches)
{
    auto ret = std::vector<PlayerMatch> {};
    ret.reserve(matches.size());
    for (const auto& match : matches) {
        const auto seat = seatOf(match.playerIds, playerId);
        if (!seat) {
            log(LogLevel::WARNING,
                "Skipping match %s: player %s did not play",
                match.id, playerId);
            continue;
        }
        ret.push_back(PlayerMatch {&match, *seat, match.finalScore[*seat]});
    }
    return ret;
}

void countTotals(PlayerStatistics& stats, const std::vector<PlayerRound>& rounds)
{
    stats.totalRounds = static_cast<int>(rounds.size());
    for (const auto& round : rounds) {
        stats.totalScore += round.score;
        if (round.score > 0) {
            ++stats.roundsWon;
        } else if (round.score < 0) {
            ++stats.roundsLost;
        }
    }
}

void countRoles(PlayerStatistics& stats, const std::vector<PlayerRound>& rounds)
{
    for (const auto& round : rounds) {
        if (isLandlord(*round.record, round.seat)) {
            ++stats.roundsAsLandlord;
            stats.landlordWins += (round.score > 0);
            stats.landlordLosses += (round.score < 0);
        } else {
            ++stats.roundsAsFarmer;
            stats.farmerWins += (round.score > 0);
            stats.farmerLosses += (round.score < 0);
        }
    }
}

void countFirstBids(
    PlayerStatistics& stats, const std::vector<PlayerRound>& rounds)
{
    for (const auto& round : rounds) {
        const auto& record = *round.record;
        if (!record.firstBidder) {
            log(LogLevel::DEBUG,
                "Round %d of match %s has no first bidder, assuming %s",
                record.roundIndex, record.matchId, Seat::A);
        }
        if (recordedFirstBidder(record) == round.seat) {
            ++stats.firstBidderRounds;
            ++stats.firstBidCounts.at(bidValue(record.bids[round.seat]));
        }
    }
}

void countSprings(PlayerStatistics& stats, const std::vector<PlayerRound>& rounds)
{
    for (const auto& round : rounds) {
        const auto& record = *round.record;
        if (!record.spring) {
            log(LogLevel::DEBUG,
                "Round %d of match %s has no spring flag, assuming no spring",
                record.roundIndex, record.matchId);
        }
        if (isSpring(record) && record.landlordWon) {
            if (isLandlord(record, round.seat)) {
                ++stats.springCount;
            } else {
                ++stats.springAgainstCount;
            }
        }
    }
}

void countDoubled(PlayerStatistics& stats, const std::vector<PlayerRound>& rounds)
{
    for (const auto& round : rounds) {
        if (round.record->doubled[round.seat]) {
            ++stats.doubledRounds;
            stats.doubledWins += (round.score > 0);
            stats.doubledLosses += (round.score < 0);
        }
    }
}

void countRoundStreaks(
    PlayerStatistics& stats, const std::vector<PlayerRound>& rounds)
{
    auto counter = StreakCounter {};
    for (const auto& round : rounds) {
        counter.addScore(round.score);
    }
    stats.roundStreaks = counter.getSummary();
}

void countRoundExtremes(
    PlayerStatistics& stats, const std::vector<PlayerRound>& rounds)
{
    if (rounds.empty()) {
        return;
    }
    const auto [min, max] = std::ranges::minmax(
        rounds, {}, &PlayerRound::score);
    stats.bestRoundScore = max.score;
    stats.worstRoundScore = min.score;
}

void countRunningMilestones(
    PlayerStatistics& stats, const std::vector<PlayerRound>& rounds)
{
    auto total = 0;
    for (const auto [n, round] : enumerate(rounds)) {
        total += round.score;
        if (!stats.runningPeak.roundIndex || total > stats.runningPeak.value) {
            stats.runningPeak = RunningMilestone {total, n};
        }
        if (!stats.runningTrough.roundIndex ||
            total < stats.runningTrough.value) {
            stats.runningTrough = RunningMilestone {total, n};
        }
    }
}

void countMatches(
    PlayerStatistics& stats, const std::vector<PlayerMatch>& matches)
{
    stats.totalMatches = static_cast<int>(matches.size());
    auto counter = StreakCounter {};
    for (const auto& match : matches) {
        if (match.score > 0) {
            ++stats.matchesWon;
        } else if (match.score < 0) {
            ++stats.matchesLost;
        } else {
            ++stats.matchesTied;
        }
        counter.addScore(match.score);
    }
    stats.matchStreaks = counter.getSummary();
}

void countMatchExtremes(
    PlayerStatistics& stats, const std::vector<PlayerMatch>& matches)
{
    if (matches.empty()) {
        return;
    }
    const auto [min, max] = std::ranges::minmax(
        matches, {}, &PlayerMatch::score);
    stats.bestMatchScore = max.score;
    stats.worstMatchScore = min.score;
    auto best = std::optional<int> {};
    auto worst = std::optional<int> {};
    for (const auto& match : matches) {
        const auto high = match.match->maxSnapshot[match.seat];
        const auto low = match.match->minSnapshot[match.seat];
        best = best ? std::max(*best, high) : high;
        worst = worst ? std::min(*worst, low) : low;
    }
    stats.bestSnapshot = *best;
    stats.worstSnapshot = *worst;
}

PlayerStatistics computeFromViews(
    const PlayerId& playerId,
    const std::vector<PlayerRound>& rounds,
    const std::vector<PlayerMatch>& matches)
{
    auto stats = PlayerStatistics {};
    stats.playerId = playerId;
    countTotals(stats, rounds);
    countRoles(stats, rounds);
    countFirstBids(stats, rounds);
    countSprings(stats, rounds);
    countDoubled(stats, rounds);
    countRoundStreaks(stats, rounds);
    countRoundExtremes(stats, rounds);
    countRunningMilestones(stats, rounds);
    countMatches(stats, matches);
    countMatchExtremes(stats, matches);
    return stats;
}

}

PlayerStatistics computeStatistics(
    const PlayerId& playerId,
    const std::vector<RoundRecord>& rounds,
    const std::vector<MatchSummary>& matches)
{
    log(LogLevel::DEBUG,
        "Computing statistics of %s from %d rounds and %d matches",
        playerId, rounds.size(), matches.size());
    return computeFromViews(
        playerId, playerRoundsFor(playerId, rounds),
        playerMatchesFor(playerId, matches));
}

PlayerStatistics computeMatchStatistics(
    const PlayerId& playerId,
    const MatchSummary& match,
    const std::vector<RoundRecord>& rounds)
{
    auto matchRounds = std::vector<RoundRecord> {};
    std::ranges::copy_if(
        rounds, std::back_inserter(matchRounds),
        [&match](const auto& record) { return record.matchId == match.id; });
    // The views point into matchRounds, which outlives them
    const auto playerRounds = playerRoundsFor(playerId, matchRounds);
    const auto matches = std::vector<MatchSummary> {match};
    return computeFromViews(
        playerId, playerRounds, playerMatchesFor(playerId, matches));
}

}
}
