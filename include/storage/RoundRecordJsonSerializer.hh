/** \file
 *
 * \brief Definition of JSON serializer for Landlord::RoundRecord
 *
 * \page jsonroundrecord Round record JSON representation
 *
 * A Landlord::RoundRecord is represented by a JSON object consisting of the
 * following:
 *
 * \code{.json}
 * {
 *     "matchId": <string>,
 *     "gameIndex": <int>,
 *     "playedAt": <int>,
 *     "playerAId": <string>,
 *     "playerBId": <string>,
 *     "playerCId": <string>,
 *     "bombs": <int>,
 *     "apoint": <bid>,
 *     "bpoint": <bid>,
 *     "cpoint": <bid>,
 *     "adouble": <bool>,
 *     "bdouble": <bool>,
 *     "cdouble": <bool>,
 *     "spring": <bool> | null,
 *     "landlordResult": <bool>,
 *     "landlord": <int>,
 *     "scoreA": <int>,
 *     "scoreB": <int>,
 *     "scoreC": <int>,
 *     "firstBidder": <int> | null
 * }
 * \endcode
 *
 * - "playedAt" is milliseconds since the Unix epoch
 * - &lt;bid&gt; is a bid level, see \ref jsonbidlevel
 * - "landlord" is the table position of the landlord (1, 2 or 3)
 * - "firstBidder" is the order of the seat that bid first (0, 1 or 2)
 *
 * The "spring" and "firstBidder" members may be missing.
 */

#ifndef STORAGE_ROUNDRECORDJSONSERIALIZER_HH_
#define STORAGE_ROUNDRECORDJSONSERIALIZER_HH_

#include <nlohmann/json.hpp>

#include <string>

namespace Landlord {

struct RoundRecord;

/// \brief Key for RoundRecord::matchId
extern const std::string ROUND_MATCH_ID_KEY;
/// \brief Key for RoundRecord::roundIndex
extern const std::string ROUND_INDEX_KEY;
/// \brief Key for RoundRecord::playedAt
extern const std::string ROUND_PLAYED_AT_KEY;
/// \brief Key for the player at Seat::A
extern const std::string ROUND_PLAYER_A_ID_KEY;
/// \brief Key for the player at Seat::B
extern const std::string ROUND_PLAYER_B_ID_KEY;
/// \brief Key for the player at Seat::C
extern const std::string ROUND_PLAYER_C_ID_KEY;
/// \brief Key for RoundRecord::bombs
extern const std::string ROUND_BOMBS_KEY;
/// \brief Key for the bid of Seat::A
extern const std::string ROUND_BID_A_KEY;
/// \brief Key for the bid of Seat::B
extern const std::string ROUND_BID_B_KEY;
/// \brief Key for the bid of Seat::C
extern const std::string ROUND_BID_C_KEY;
/// \brief Key for the doubling flag of Seat::A
extern const std::string ROUND_DOUBLED_A_KEY;
/// \brief Key for the doubling flag of Seat::B
extern const std::string ROUND_DOUBLED_B_KEY;
/// \brief Key for the doubling flag of Seat::C
extern const std::string ROUND_DOUBLED_C_KEY;
/// \brief Key for RoundRecord::spring
extern const std::string ROUND_SPRING_KEY;
/// \brief Key for RoundRecord::landlordWon
extern const std::string ROUND_LANDLORD_RESULT_KEY;
/// \brief Key for RoundRecord::landlord
extern const std::string ROUND_LANDLORD_KEY;
/// \brief Key for the score of Seat::A
extern const std::string ROUND_SCORE_A_KEY;
/// \brief Key for the score of Seat::B
extern const std::string ROUND_SCORE_B_KEY;
/// \brief Key for the score of Seat::C
extern const std::string ROUND_SCORE_C_KEY;
/// \brief Key for RoundRecord::firstBidder
extern const std::string ROUND_FIRST_BIDDER_KEY;

/** \brief Convert RoundRecord to JSON
 */
void to_json(nlohmann::json&, const RoundRecord&);

/** \brief Convert JSON to RoundRecord
 *
 * \throw Storage::SerializationFailureException if the object is not a
 * valid round record
 */
void from_json(const nlohmann::json&, RoundRecord&);

}

#endif // STORAGE_ROUNDRECORDJSONSERIALIZER_HH_
