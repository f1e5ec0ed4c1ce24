/** \file
 *
 * \brief Definition of argument checking and range utilities
 */

#ifndef UTILITY_HH_
#define UTILITY_HH_

#include <boost/format.hpp>

#include <concepts>
#include <ranges>
#include <stdexcept>
#include <type_traits>

namespace Shuffle {

/** \brief Check that \p i is a valid index of a range of size \p n
 *
 * \return \p i
 *
 * \throw std::out_of_range unless 0 <= \p i < \p n
 */
template<std::integral Integer>
Integer checkIndex(Integer i, std::type_identity_t<Integer> n)
{
    if (i < 0 || i >= n) {
        throw std::out_of_range {
            (boost::format("Index %1% out of range [0, %2%)") % i % n).str()};
    }
    return i;
}

/** \brief Dereference a pointer that must not be null
 *
 * \param p pointer or pointer-like object
 *
 * \return \c *p
 *
 * \throw std::invalid_argument if \p p is null
 */
template<typename Pointer>
decltype(auto) dereference(const Pointer& p)
{
    if (!p) {
        throw std::invalid_argument {"Null pointer"};
    }
    return *p;
}

/** \brief Range of the integers 0, 1, ..., \p n - 1
 *
 * \throw std::invalid_argument if \p n < 0
 */
template<std::integral Integer>
auto to(const Integer n)
{
    if (n < 0) {
        throw std::invalid_argument {"Negative range size"};
    }
    return std::ranges::views::iota(Integer {}, n);
}

}

#endif // UTILITY_HH_
