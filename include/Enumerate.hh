/** \file
 *
 * \brief Definition of an utility to iterate index and contents of a range
 */

#ifndef LANDLORD_ENUMERATE_HH_
#define LANDLORD_ENUMERATE_HH_

#include <boost/iterator/iterator_adaptor.hpp>

#include <iterator>
#include <utility>

namespace Landlord {

/** \brief The value type for EnumerateIterator
 *
 * A pair containing the index and the reference obtained by dereferencing
 * the underlying iterator.
 */
template<typename Iterator>
using EnumerateIteratorValue = std::pair<
    int, typename std::iterator_traits<Iterator>::reference>;

/** \brief Forward iterator accessing both position and value
 *
 * The index of the iterator is the number of times it has been incremented.
 *
 * \tparam Iterator the type of the underlying iterator
 */
template<typename Iterator>
class EnumerateIterator : public boost::iterator_adaptor<
    EnumerateIterator<Iterator>,
    Iterator,
    EnumerateIteratorValue<Iterator>,
    boost::forward_traversal_tag,
    EnumerateIteratorValue<Iterator>>
{
public:

    /** \brief Create new enumerate iterator
     *
     * \param iter the underlying iterator
     */
    explicit EnumerateIterator(const Iterator& iter) :
        base_ {iter}
    {
    }

private:

    using base_ = typename EnumerateIterator::iterator_adaptor_;

    typename base_::reference dereference() const
    {
        return {index, *this->base()};
    }

    void increment()
    {
        ++index;
        ++this->base_reference();
    }

    int index {};
    friend class boost::iterator_core_access;
};

/** \brief Range of enumerate iterators
 *
 * \tparam Range the type of the underlying range, either a reference or a
 * value type (in which case the range is owned)
 *
 * \sa enumerate()
 */
template<typename Range>
class EnumerateRange
{
public:

    /** \brief Create new enumerate range
     */
    explicit EnumerateRange(Range&& range) :
        range(std::forward<Range>(range))
    {
    }

    /** \brief Iterator to the first element
     */
    auto begin()
    {
        return EnumerateIterator {std::begin(range)};
    }

    /** \brief Iterator past the last element
     */
    auto end()
    {
        return EnumerateIterator {std::end(range)};
    }

private:

    Range range;
};

/** \brief Simultaneously iterate index and value of a range
 *
 * Used in a range-based for loop, the elements are pairs containing the
 * 0-based index as the first and the element of \p range as the second
 * element:
 *
 * \code{.cc}
 * for (const auto [n, record] : enumerate(rounds)) {
 *     std::cout << n << ": " << record << std::endl;
 * }
 * \endcode
 *
 * \param range the range to iterate over
 *
 * \return EnumerateRange for iterating index and value of \p range
 */
template<typename Range>
auto enumerate(Range&& range)
{
    return EnumerateRange<Range> {std::forward<Range>(range)};
}

}

#endif // LANDLORD_ENUMERATE_HH_
