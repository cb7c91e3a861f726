/** \file
 *
 * \brief Definition of general purpose utilities
 *
 * Although the utilities in this do not depend on any other classes or
 * functions inside the Landlord namespace, the functions are still inside the
 * namespace to avoid name conflicts.
 */

#ifndef LANDLORD_UTILITY_HH_
#define LANDLORD_UTILITY_HH_

#include <concepts>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace Landlord {

/** \brief Check if 0 <= i < n
 *
 * \param i the index to check
 * \param n the upper bound
 *
 * \return i, if 0 <= i < n
 *
 * \throw std::out_of_range, if i < 0 || i >= n
 */
template<std::integral Integer1, std::integral Integer2>
constexpr auto checkIndex(Integer1 i, Integer2 n)
{
    if (i < 0 || std::cmp_greater_equal(i, n)) {
        throw std::out_of_range("Index out of range");
    }
    return i;
}

/** \brief Ratio of two counts
 *
 * \param numerator the numerator
 * \param denominator the denominator
 *
 * \return \p numerator / \p denominator as floating point number, or zero if
 * \p denominator is zero
 */
template<std::integral Integer>
constexpr double ratio(Integer numerator, Integer denominator)
{
    if (denominator == 0) {
        return 0.0;
    }
    return static_cast<double>(numerator) / static_cast<double>(denominator);
}

}

#endif // LANDLORD_UTILITY_HH_
