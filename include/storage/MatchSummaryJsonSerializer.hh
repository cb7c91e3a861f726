/** \file
 *
 * \brief Definition of JSON serializer for Landlord::MatchSummary
 *
 * \page jsonmatchsummary Match summary JSON representation
 *
 * A Landlord::MatchSummary is represented by a JSON object consisting of the
 * following:
 *
 * \code{.json}
 * {
 *     "id": <string>,
 *     "startedAt": <int>,
 *     "endedAt": <int> | null,
 *     "playerAId": <string>,
 *     "playerBId": <string>,
 *     "playerCId": <string>,
 *     "finalScoreA": <int>,
 *     "finalScoreB": <int>,
 *     "finalScoreC": <int>,
 *     "totalGames": <int>,
 *     "maxSnapshotA": <int>,
 *     "maxSnapshotB": <int>,
 *     "maxSnapshotC": <int>,
 *     "minSnapshotA": <int>,
 *     "minSnapshotB": <int>,
 *     "minSnapshotC": <int>,
 *     "initialStarter": <int>
 * }
 * \endcode
 *
 * - the times are milliseconds since the Unix epoch
 * - "initialStarter" is the order of the seat that bid first in the first
 *   round (0, 1 or 2)
 */

#ifndef STORAGE_MATCHSUMMARYJSONSERIALIZER_HH_
#define STORAGE_MATCHSUMMARYJSONSERIALIZER_HH_

#include <nlohmann/json.hpp>

#include <string>

namespace Landlord {

struct MatchSummary;

/// \brief Key for MatchSummary::id
extern const std::string MATCH_ID_KEY;
/// \brief Key for MatchSummary::startedAt
extern const std::string MATCH_STARTED_AT_KEY;
/// \brief Key for MatchSummary::endedAt
extern const std::string MATCH_ENDED_AT_KEY;
/// \brief Key for MatchSummary::totalRounds
extern const std::string MATCH_TOTAL_GAMES_KEY;
/// \brief Key for MatchSummary::initialStarter
extern const std::string MATCH_INITIAL_STARTER_KEY;

/** \brief Convert MatchSummary to JSON
 */
void to_json(nlohmann::json&, const MatchSummary&);

/** \brief Convert JSON to MatchSummary
 *
 * \throw Storage::SerializationFailureException if the object is not a
 * valid match summary
 */
void from_json(const nlohmann::json&, MatchSummary&);

}

#endif // STORAGE_MATCHSUMMARYJSONSERIALIZER_HH_
