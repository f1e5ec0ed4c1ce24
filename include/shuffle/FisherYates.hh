/** \file
 *
 * \brief Definition of the in‐place Fisher‐Yates shuffle
 */

#ifndef FISHERYATES_HH_
#define FISHERYATES_HH_

#include "shuffle/IndexSource.hh"

#include <iterator>
#include <utility>
#include <vector>

namespace Shuffle {

/** \brief Shuffle sequence in place
 *
 * Implements the modern Fisher‐Yates (Knuth) shuffle. Positions are
 * finalized from the last to the second: position \c i is swapped with
 * position \c j drawn from \p indexSource with bound \c i+1, so that \c j
 * ranges over 0, ..., i inclusive. For \c n elements exactly \c n-1 indices
 * are drawn, and the \c n! possible sequences of draws map one‐to‐one to the
 * permutations of the sequence.
 *
 * Before each swap \p onStep is called with \c i, \c j and the sequence as it
 * is before the swap. The call happens even when \c i == \c j, in which case
 * the swap is skipped.
 *
 * \param sequence the sequence to shuffle
 * \param indexSource the index source
 * \param onStep callable accepting the current index, the chosen index and
 * a const reference to \p sequence
 *
 * \throw Any exception thrown by \p indexSource or \p onStep. The sequence is
 * then left partially shuffled but is still a permutation of the original.
 */
template<typename T, typename StepFunction>
void shuffleInPlace(
    std::vector<T>& sequence, IndexSource& indexSource, StepFunction&& onStep)
{
    for (auto i = std::ssize(sequence) - 1; i > 0; --i) {
        const auto j = indexSource.next(i + 1);
        onStep(i, j, std::as_const(sequence));
        if (i != j) {
            using std::swap;
            swap(sequence[i], sequence[j]);
        }
    }
}

/** \brief Shuffle sequence in place without observing the steps
 *
 * \param sequence the sequence to shuffle
 * \param indexSource the index source
 *
 * \sa shuffleInPlace(std::vector<T>&, IndexSource&, StepFunction&&)
 */
template<typename T>
void shuffleInPlace(std::vector<T>& sequence, IndexSource& indexSource)
{
    shuffleInPlace(sequence, indexSource, [](auto, auto, const auto&) {});
}

}

#endif // FISHERYATES_HH_
