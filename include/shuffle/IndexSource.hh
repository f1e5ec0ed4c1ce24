/** \file
 *
 * \brief Definition of Shuffle::IndexSource interface
 */

#ifndef INDEXSOURCE_HH_
#define INDEXSOURCE_HH_

#include <cstddef>

/** \brief Top level namespace of the shuffle library
 *
 * The Shuffle namespace directly contains the unbiased shuffle engine and the
 * random index sources it draws from. It also contains subnamespaces for the
 * distribution verifier and the command line front end.
 */
namespace Shuffle {

/** \brief Signed integer type used for positions within a sequence
 */
using Index = std::ptrdiff_t;

/** \brief Source of uniformly distributed indices
 *
 * IndexSource is the sole source of nondeterminism in the shuffle
 * library. ShuffleEngine accepts it as an injected dependency, so that tests
 * can replace the random number generator with a scripted sequence of
 * indices.
 */
class IndexSource {
public:

    virtual ~IndexSource();

    /** \brief Draw next index
     *
     * \param bound the exclusive upper bound of the index
     *
     * \return an index uniformly distributed over 0, 1, ..., bound - 1
     *
     * \throw InvalidBoundException if \p bound < 1
     * \throw std::out_of_range if the implementation returns an index outside
     * the range
     */
    Index next(Index bound);

private:

    /** \brief Handle for drawing the next index
     *
     * It may be assumed that bound >= 1.
     *
     * \sa next()
     */
    virtual Index handleNext(Index bound) = 0;
};

}

#endif // INDEXSOURCE_HH_
