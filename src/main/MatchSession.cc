#include "main/MatchSession.hh"

#include "landlord/RoundInput.hh"
#include "scoring/FirstBidderRotation.hh"
#include "scoring/RoundScoring.hh"
#include "storage/RecordStore.hh"
#include "Enumerate.hh"
#include "Logging.hh"
#include "Utility.hh"

#include <stdexcept>
#include <string>
#include <utility>

namespace Landlord {
namespace Main {

namespace {

void applyScoredRound(
    RoundRecord& record, const RoundInput& input,
    const Scoring::ScoredRound& scored)
{
    record.landlord = scored.resolution.landlord;
    record.bids = input.bids;
    record.doubled = input.doubled;
    record.bombs = input.bombs;
    record.spring = input.spring;
    record.landlordWon = input.landlordWon;
    record.deltas = scored.score.deltas;
}

}

MatchSession::MatchSession(Storage::RecordStore& store, MatchSummary summary) :
    store {store},
    summary {std::move(summary)}
{
    refold();
    log(LogLevel::INFO, "Match %s started by %s, first bidder %s",
        this->summary.id, this->summary.playerIds,
        this->summary.initialStarter);
}

MatchSession::RoundResult MatchSession::addRound(
    const RoundInput& input, const Timestamp playedAt)
{
    if (finished) {
        throw std::logic_error {"Match already finished"};
    }
    const auto result = Scoring::scoreRound(input);
    if (const auto* error = std::get_if<Scoring::BidValidationError>(&result)) {
        log(LogLevel::INFO, "Round rejected in match %s: %s",
            summary.id, *error);
        return *error;
    }
    auto record = RoundRecord {};
    record.matchId = summary.id;
    record.roundIndex = static_cast<int>(rounds.size());
    record.playedAt = playedAt;
    record.playerIds = summary.playerIds;
    record.firstBidder = nextFirstBidder();
    applyScoredRound(record, input, std::get<Scoring::ScoredRound>(result));
    store.saveRoundRecord(record);
    rounds.push_back(record);
    refold();
    log(LogLevel::INFO, "Round %d of match %s: %s",
        record.roundIndex, summary.id, record.deltas);
    return record;
}

MatchSession::RoundResult MatchSession::editRound(
    const int index, const RoundInput& input)
{
    auto& record = rounds.at(checkIndex(index, rounds.size()));
    const auto result = Scoring::scoreRound(input);
    if (const auto* error = std::get_if<Scoring::BidValidationError>(&result)) {
        log(LogLevel::INFO, "Edit of round %d rejected in match %s: %s",
            index, summary.id, *error);
        return *error;
    }
    auto edited = record;
    applyScoredRound(edited, input, std::get<Scoring::ScoredRound>(result));
    store.updateRoundRecord(edited);
    record = edited;
    refold();
    if (finished) {
        store.updateMatchSummary(summary);
    }
    log(LogLevel::INFO, "Round %d of match %s edited: %s",
        index, summary.id, edited.deltas);
    return edited;
}

void MatchSession::removeRound(const int index)
{
    checkIndex(index, rounds.size());
    auto remaining = rounds;
    remaining.erase(remaining.begin() + index);
    for (auto n = index; n < static_cast<int>(remaining.size()); ++n) {
        remaining[n].roundIndex = n;
    }
    store.replaceRoundRecords(summary.id, remaining);
    rounds = std::move(remaining);
    refold();
    if (finished) {
        store.updateMatchSummary(summary);
    }
    log(LogLevel::INFO, "Round %d of match %s removed", index, summary.id);
}

Seat MatchSession::nextFirstBidder() const
{
    return Scoring::firstBidder(
        static_cast<int>(rounds.size()), summary.initialStarter);
}

const std::vector<RoundRecord>& MatchSession::getRounds() const
{
    return rounds;
}

const std::vector<ScoreTriple>& MatchSession::getScores() const
{
    return fold.scores;
}

ScoreTriple MatchSession::getTotals() const
{
    return Scoring::finalScore(fold);
}

const MatchSummary& MatchSession::getSummary() const
{
    return summary;
}

bool MatchSession::isFinished() const
{
    return finished;
}

std::optional<MatchSummary> MatchSession::finish(const Timestamp endedAt)
{
    if (finished) {
        throw std::logic_error {"Match already finished"};
    }
    finished = true;
    if (rounds.empty()) {
        log(LogLevel::INFO, "Discarding match %s without rounds", summary.id);
        return std::nullopt;
    }
    summary.endedAt = endedAt;
    store.saveMatchSummary(summary);
    log(LogLevel::INFO, "Match %s finished after %d rounds: %s",
        summary.id, summary.totalRounds, summary.finalScore);
    return summary;
}

void MatchSession::refold()
{
    fold = Scoring::foldMatch(rounds);
    summary = Scoring::summarizeMatch(std::move(summary), fold);
}

MatchSummary rebuildMatch(
    Storage::RecordStore& store, const std::string_view matchId)
{
    auto summary = store.loadMatchSummary(matchId);
    if (!summary) {
        throw std::invalid_argument {
            "Unknown match: " + std::string {matchId}};
    }
    const auto rounds = store.loadRoundRecordsForMatch(matchId);
    for (const auto [n, record] : enumerate(rounds)) {
        if (record.roundIndex != n) {
            log(LogLevel::WARNING, "Match %s: expected round %d, found %d",
                matchId, n, record.roundIndex);
        }
    }
    const auto updated = Scoring::summarizeMatch(
        std::move(*summary), Scoring::foldMatch(rounds));
    store.updateMatchSummary(updated);
    log(LogLevel::INFO, "Match %s rebuilt from %d rounds: %s",
        matchId, updated.totalRounds, updated.finalScore);
    return updated;
}

}
}
