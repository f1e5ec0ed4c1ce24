/** \file
 *
 * \brief Utilities for shuffling ranges of indices
 */

#ifndef INDEXSHUFFLE_HH_
#define INDEXSHUFFLE_HH_

#include "shuffle/IndexSource.hh"

#include <vector>

namespace Shuffle {

/** \brief Generate randomly shuffled indices
 *
 * This is the shuffled deck of the shuffle library: a client that deals
 * cards or orders quiz questions shuffles the indices of its items instead of
 * the items themselves.
 *
 * \param n the number of indices
 * \param indexSource the index source
 *
 * \return Vector containing all integers 0, ..., n-1 in random order
 *
 * \throw std::invalid_argument if \p n < 0
 */
std::vector<Index> generateShuffledIndices(Index n, IndexSource& indexSource);

}

#endif // INDEXSHUFFLE_HH_
