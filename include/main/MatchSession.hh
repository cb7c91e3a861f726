/** \file
 *
 * \brief Definition of Landlord::Main::MatchSession class
 */

#ifndef MAIN_MATCHSESSION_HH_
#define MAIN_MATCHSESSION_HH_

#include "landlord/MatchSummary.hh"
#include "landlord/RoundRecord.hh"
#include "landlord/Timestamp.hh"
#include "scoring/BidValidationError.hh"
#include "scoring/MatchAggregator.hh"

#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace Landlord {

struct RoundInput;

namespace Storage {
class RecordStore;
}

namespace Main {

/** \brief The match currently being played
 *
 * MatchSession holds the state of one match: its summary, its rounds and
 * the running totals. The session is created and owned by the caller and it
 * writes every change through to a Storage::RecordStore.
 *
 * Rounds are scored with Scoring::scoreRound(). The running totals are
 * folded again from scratch whenever the rounds change.
 */
class MatchSession {
public:

    /** \brief Result of adding or editing a round
     *
     * Either the stored round, or the validation error explaining why the
     * round was rejected.
     */
    using RoundResult = std::variant<RoundRecord, Scoring::BidValidationError>;

    /** \brief Start a new match
     *
     * \param store the record store the rounds are written to
     * \param summary the summary whose identity fields (id, players, start
     * time, initial starter) are used for the match
     */
    MatchSession(Storage::RecordStore& store, MatchSummary summary);

    /** \brief Add a round to the match
     *
     * The round is scored and stored with the next round index and the
     * current first bidder. If the bids cannot be resolved, nothing is
     * stored.
     *
     * \param input the round input
     * \param playedAt the time the round was played
     *
     * \return the stored round or the validation error
     *
     * \throw std::logic_error if the match is already finished
     * \throw std::invalid_argument if the bomb count of \p input is out of
     * range
     */
    RoundResult addRound(const RoundInput& input, Timestamp playedAt = now());

    /** \brief Change the input of an existing round
     *
     * The round is scored again and its stored record replaced. The index,
     * the time and the recorded first bidder of the round are kept.
     *
     * \param index the index of the round
     * \param input the corrected round input
     *
     * \return the stored round or the validation error
     *
     * \throw std::out_of_range if there is no round with \p index
     */
    RoundResult editRound(int index, const RoundInput& input);

    /** \brief Remove a round
     *
     * The rounds after the removed round are renumbered.
     *
     * \param index the index of the round
     *
     * \throw std::out_of_range if there is no round with \p index
     */
    void removeRound(int index);

    /** \brief Determine the seat bidding first in the next round
     */
    Seat nextFirstBidder() const;

    /** \brief Get the rounds of the match
     */
    const std::vector<RoundRecord>& getRounds() const;

    /** \brief Get the running totals after each round
     */
    const std::vector<ScoreTriple>& getScores() const;

    /** \brief Get the current totals
     *
     * \return the running total after the last round, or zeros if no rounds
     * have been played
     */
    ScoreTriple getTotals() const;

    /** \brief Get the match summary reflecting the current rounds
     */
    const MatchSummary& getSummary() const;

    /** \brief Determine if the match has been finished
     */
    bool isFinished() const;

    /** \brief Finish the match
     *
     * Stores the match summary. A match without rounds is discarded.
     *
     * \param endedAt the time the match ended
     *
     * \return the stored summary, or none if the match had no rounds
     *
     * \throw std::logic_error if the match is already finished
     */
    std::optional<MatchSummary> finish(Timestamp endedAt = now());

private:

    void refold();

    Storage::RecordStore& store;
    MatchSummary summary;
    std::vector<RoundRecord> rounds;
    Scoring::MatchFold fold;
    bool finished {};
};

/** \brief Recompute the summary of a stored match
 *
 * The rounds of the match are loaded and folded from scratch, and the
 * stored summary is replaced with the result.
 *
 * \param store the record store
 * \param matchId the match
 *
 * \return the updated summary
 *
 * \throw std::invalid_argument if the match is not stored
 */
MatchSummary rebuildMatch(Storage::RecordStore& store, std::string_view matchId);

}
}

#endif // MAIN_MATCHSESSION_HH_
