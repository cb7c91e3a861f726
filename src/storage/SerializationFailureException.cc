#include "storage/SerializationFailureException.hh"

namespace Landlord {
namespace Storage {

SerializationFailureException::SerializationFailureException(
    const std::string& what) :
    std::runtime_error {what}
{
}

}
}
