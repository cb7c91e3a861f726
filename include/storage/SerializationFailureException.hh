/** \file
 *
 * \brief Definition of Landlord::Storage::SerializationFailureException class
 */

#ifndef STORAGE_SERIALIZATIONFAILUREEXCEPTION_HH_
#define STORAGE_SERIALIZATIONFAILUREEXCEPTION_HH_

#include <stdexcept>

namespace Landlord {
namespace Storage {

/** \brief Exception to indicate error in serialization or deserialization
 *
 * This exception is used to signal that a persisted document could not be
 * converted to records, or vice versa.
 */
class SerializationFailureException : public std::runtime_error {
public:

    /** \brief Create new serialization failure exception
     *
     * \param what the explanation of the failure
     */
    explicit SerializationFailureException(
        const std::string& what = "Serialization failure");
};

}
}

#endif // STORAGE_SERIALIZATIONFAILUREEXCEPTION_HH_
