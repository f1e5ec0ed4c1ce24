/** \file
 *
 * \brief Definition of Shuffle::InvalidBoundException class
 */

#ifndef INVALIDBOUNDEXCEPTION_HH_
#define INVALIDBOUNDEXCEPTION_HH_

#include "shuffle/IndexSource.hh"

#include <stdexcept>

namespace Shuffle {

/** \brief Exception to indicate that an index was requested from an empty
 * range
 *
 * Thrown by IndexSource::next() when the bound is less than one. The bound is
 * never clamped.
 */
class InvalidBoundException : public std::invalid_argument {
public:

    /** \brief Create new exception
     *
     * \param bound the offending bound
     */
    explicit InvalidBoundException(Index bound);

    /** \brief Get the offending bound
     */
    Index getBound() const noexcept;

private:

    Index bound;
};

}

#endif // INVALIDBOUNDEXCEPTION_HH_
