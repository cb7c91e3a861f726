/** \file
 *
 * \brief Definition of Landlord::Storage::JsonRecordStore class
 *
 * \page jsonrecordstore Record store JSON document
 *
 * The JsonRecordStore keeps the whole history in a single JSON document:
 *
 * \code{.json}
 * {
 *     "rounds": [ <round>, ... ],
 *     "matches": [ <match>, ... ]
 * }
 * \endcode
 *
 * - &lt;round&gt; is a round record, see \ref jsonroundrecord
 * - &lt;match&gt; is a match summary, see \ref jsonmatchsummary
 */

#ifndef STORAGE_JSONRECORDSTORE_HH_
#define STORAGE_JSONRECORDSTORE_HH_

#include "storage/RecordStore.hh"

#include <iosfwd>
#include <string>
#include <vector>

namespace Landlord {
namespace Storage {

/// \brief Key for the rounds in the record store document
extern const std::string RECORD_STORE_ROUNDS_KEY;

/// \brief Key for the matches in the record store document
extern const std::string RECORD_STORE_MATCHES_KEY;

/** \brief Record store backed by a JSON document
 *
 * The records are kept in memory. The document is read when the store is
 * created and written back by calling write().
 *
 * \sa \ref jsonrecordstore
 */
class JsonRecordStore : public RecordStore {
public:

    /** \brief Create empty record store
     */
    JsonRecordStore();

    /** \brief Create record store from a JSON document
     *
     * Individual rounds and matches that cannot be read are skipped with a
     * warning.
     *
     * \param in the stream the document is read from
     *
     * \throw SerializationFailureException if the stream does not contain a
     * valid record store document
     */
    explicit JsonRecordStore(std::istream& in);

    /** \brief Write the JSON document
     *
     * \param out the stream the document is written to
     */
    void write(std::ostream& out) const;

private:

    std::vector<RoundRecord> handleLoadRoundRecordsForPlayer(
        const PlayerId& playerId) const override;

    std::vector<RoundRecord> handleLoadRoundRecordsForMatch(
        std::string_view matchId) const override;

    std::vector<MatchSummary> handleLoadMatchSummaries(
        const PlayerId& playerId) const override;

    std::optional<MatchSummary> handleLoadMatchSummary(
        std::string_view matchId) const override;

    void handleSaveRoundRecord(const RoundRecord& record) override;

    void handleUpdateRoundRecord(const RoundRecord& record) override;

    void handleReplaceRoundRecords(
        std::string_view matchId,
        const std::vector<RoundRecord>& records) override;

    void handleSaveMatchSummary(const MatchSummary& summary) override;

    void handleUpdateMatchSummary(const MatchSummary& summary) override;

    std::vector<RoundRecord> rounds;
    std::vector<MatchSummary> matches;
};

}
}

#endif // STORAGE_JSONRECORDSTORE_HH_
