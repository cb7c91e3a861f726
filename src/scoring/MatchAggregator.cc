#include "scoring/MatchAggregator.hh"

#include "landlord/MatchSummary.hh"
#include "landlord/RoundRecord.hh"

#include <algorithm>
#include <iterator>
#include <ostream>

namespace Landlord {
namespace Scoring {

MatchFold foldMatch(const std::vector<RoundRecord>& rounds)
{
    auto fold = MatchFold {};
    fold.scores.reserve(rounds.size());
    auto totals = ScoreTriple {};
    for (const auto& round : rounds) {
        totals = totals + round.deltas;
        fold.maxSnapshot = elementwiseMax(fold.maxSnapshot, totals);
        fold.minSnapshot = elementwiseMin(fold.minSnapshot, totals);
        fold.scores.emplace_back(totals);
    }
    return fold;
}

ScoreTriple finalScore(const MatchFold& fold)
{
    if (fold.scores.empty()) {
        return {};
    }
    return fold.scores.back();
}

MatchSummary summarizeMatch(MatchSummary summary, const MatchFold& fold)
{
    summary.finalScore = finalScore(fold);
    summary.totalRounds = static_cast<int>(fold.scores.size());
    summary.maxSnapshot = fold.maxSnapshot;
    summary.minSnapshot = fold.minSnapshot;
    return summary;
}

bool operator==(const MatchFold& lhs, const MatchFold& rhs)
{
    return lhs.scores == rhs.scores && lhs.maxSnapshot == rhs.maxSnapshot &&
        lhs.minSnapshot == rhs.minSnapshot;
}

std::ostream& operator<<(std::ostream& os, const MatchFold& fold)
{
    std::copy(
        fold.scores.begin(), fold.scores.end(),
        std::ostream_iterator<ScoreTriple>(os, "\n"));
    return os << "max: " << fold.maxSnapshot << "\nmin: " << fold.minSnapshot;
}

}
}
