#include "landlord/MatchSummary.hh"

#include <ostream>

namespace Landlord {

bool operator==(const MatchSummary& lhs, const MatchSummary& rhs)
{
    return &lhs == &rhs || (
        lhs.id == rhs.id &&
        lhs.playerIds == rhs.playerIds &&
        lhs.startedAt == rhs.startedAt &&
        lhs.endedAt == rhs.endedAt &&
        lhs.finalScore == rhs.finalScore &&
        lhs.totalRounds == rhs.totalRounds &&
        lhs.maxSnapshot == rhs.maxSnapshot &&
        lhs.minSnapshot == rhs.minSnapshot &&
        lhs.initialStarter == rhs.initialStarter);
}

std::ostream& operator<<(std::ostream& os, const MatchSummary& summary)
{
    os << summary.id << " players: " << summary.playerIds <<
        "; rounds: " << summary.totalRounds <<
        "; final: " << summary.finalScore <<
        "; max: " << summary.maxSnapshot <<
        "; min: " << summary.minSnapshot <<
        "; starter: " << summary.initialStarter;
    if (!summary.endedAt) {
        os << "; in progress";
    }
    return os;
}

}
