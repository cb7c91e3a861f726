/** \file
 *
 * \brief Definition of JSON serialization utilities
 */

#ifndef STORAGE_JSONSERIALIZERUTILITY_HH_
#define STORAGE_JSONSERIALIZERUTILITY_HH_

#include "landlord/Timestamp.hh"
#include "storage/SerializationFailureException.hh"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace nlohmann {

/** \brief JSON converter for optional types
 */
template<typename T>
struct adl_serializer<std::optional<T>>
{
    /** \brief Convert optional type to JSON
     */
    static void to_json(json&, const std::optional<T>&);

    /** \brief Convert JSON to optional type
     */
    static void from_json(const json&, std::optional<T>&);
};

template<typename T>
void adl_serializer<std::optional<T>>::to_json(
    json& j, const std::optional<T>& t)
{
    if (t) {
        j = *t;
    } else {
        j = nullptr;
    }
}

template<typename T>
void adl_serializer<std::optional<T>>::from_json(
    const json& j, std::optional<T>& t)
{
    if (j.is_null()) {
        t = std::nullopt;
    } else {
        t = j.get<T>();
    }
}

}

namespace Landlord {
namespace Storage {

/** \brief Validate a deserialized value
 *
 * This function is intended to be used for an deserialized object when
 * additional validation is needed.
 *
 * \tparam Preds Predicates that can be invoked with \p t and whose return value
 * is convertible to bool.
 *
 * \param t the object to validate
 * \param preds the predicates used to validate \p t
 *
 * \return the object \p t if all predicates evaluate to true
 *
 * \throw SerializationFailureException if any predicate evaluates to false
 */
template<typename T, typename... Preds>
T validate(T&& t, Preds&&... preds)
{
    if ( ( ... && std::invoke(std::forward<Preds>(preds), t) ) ) {
        return t;
    }
    throw SerializationFailureException {};
}

/** \brief Convert an optional member of a JSON object
 *
 * \param j the JSON object
 * \param key the key of the member
 *
 * \return the member converted to \c T, or none if \p j has no member \p
 * key or the member is null
 */
template<typename T>
std::optional<T> getOptional(const nlohmann::json& j, const std::string& key)
{
    const auto iter = j.find(key);
    if (iter == j.end() || iter->is_null()) {
        return std::nullopt;
    }
    return iter->template get<T>();
}

/** \brief Convert timestamp to JSON
 *
 * \return integer JSON value containing milliseconds since the Unix epoch
 */
nlohmann::json timestampToJson(Timestamp timestamp);

/** \brief Convert JSON to timestamp
 *
 * \throw SerializationFailureException if \p j is not an integer
 */
Timestamp jsonToTimestamp(const nlohmann::json& j);

}
}

#endif // STORAGE_JSONSERIALIZERUTILITY_HH_
