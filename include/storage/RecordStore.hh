/** \file
 *
 * \brief Definition of Landlord::Storage::RecordStore interface
 */

#ifndef STORAGE_RECORDSTORE_HH_
#define STORAGE_RECORDSTORE_HH_

#include "landlord/MatchSummary.hh"
#include "landlord/Player.hh"
#include "landlord/RoundRecord.hh"

#include <optional>
#include <string_view>
#include <vector>

namespace Landlord {
namespace Storage {

/** \brief Persistence of round records and match summaries
 *
 * RecordStore is the interface through which the scorekeeper reads and
 * writes its history. The load methods return the records in the order the
 * computations expect them: the rounds of a player ordered by the time they
 * were played, the rounds of a match ordered by round index and the matches
 * of a player ordered by their start time. The ordering is applied here so
 * that the implementations may return the records in any order.
 *
 * The write methods do not refold the affected match. After updating a
 * round, the caller is responsible for recomputing and updating the summary
 * of its match.
 */
class RecordStore {
public:

    virtual ~RecordStore();

    /** \brief Load the rounds a player has played
     *
     * \param playerId the player
     *
     * \return the rounds of \p playerId in the order they were played
     */
    std::vector<RoundRecord> loadRoundRecordsForPlayer(
        const PlayerId& playerId) const;

    /** \brief Load the rounds of a match
     *
     * \param matchId the match
     *
     * \return the rounds of \p matchId ordered by round index
     */
    std::vector<RoundRecord> loadRoundRecordsForMatch(
        std::string_view matchId) const;

    /** \brief Load the matches a player has played
     *
     * \param playerId the player
     *
     * \return the matches of \p playerId ordered by start time
     */
    std::vector<MatchSummary> loadMatchSummaries(
        const PlayerId& playerId) const;

    /** \brief Load a match summary
     *
     * \param matchId the match
     *
     * \return the summary of \p matchId, or none if the match is not stored
     */
    std::optional<MatchSummary> loadMatchSummary(
        std::string_view matchId) const;

    /** \brief Save a new round
     *
     * \throw std::invalid_argument if a round with the same match id and round
     * index is already stored
     */
    void saveRoundRecord(const RoundRecord& record);

    /** \brief Replace a stored round
     *
     * The round to replace is identified by the match id and the round index
     * of \p record.
     *
     * \throw std::out_of_range if the round is not stored
     */
    void updateRoundRecord(const RoundRecord& record);

    /** \brief Replace all rounds of a match
     *
     * This is used when rounds are removed from a match and the remaining
     * rounds are renumbered.
     *
     * \param matchId the match
     * \param records the new rounds of the match
     */
    void replaceRoundRecords(
        std::string_view matchId, const std::vector<RoundRecord>& records);

    /** \brief Save a new match summary
     *
     * \throw std::invalid_argument if a match with the same id is already
     * stored
     */
    void saveMatchSummary(const MatchSummary& summary);

    /** \brief Replace a stored match summary
     *
     * \throw std::out_of_range if the match is not stored
     */
    void updateMatchSummary(const MatchSummary& summary);

private:

    virtual std::vector<RoundRecord> handleLoadRoundRecordsForPlayer(
        const PlayerId& playerId) const = 0;

    virtual std::vector<RoundRecord> handleLoadRoundRecordsForMatch(
        std::string_view matchId) const = 0;

    virtual std::vector<MatchSummary> handleLoadMatchSummaries(
        const PlayerId& playerId) const = 0;

    virtual std::optional<MatchSummary> handleLoadMatchSummary(
        std::string_view matchId) const = 0;

    virtual void handleSaveRoundRecord(const RoundRecord& record) = 0;

    virtual void handleUpdateRoundRecord(const RoundRecord& record) = 0;

    virtual void handleReplaceRoundRecords(
        std::string_view matchId, const std::vector<RoundRecord>& records) = 0;

    virtual void handleSaveMatchSummary(const MatchSummary& summary) = 0;

    virtual void handleUpdateMatchSummary(const MatchSummary& summary) = 0;
};

}
}

#endif // STORAGE_RECORDSTORE_HH_
