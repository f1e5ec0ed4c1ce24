/** \file
 *
 * \brief Definition of Shuffle::ShuffleStep struct
 */

#ifndef SHUFFLESTEP_HH_
#define SHUFFLESTEP_HH_

#include "shuffle/IndexSource.hh"

#include <boost/operators.hpp>

#include <ostream>
#include <utility>
#include <vector>

namespace Shuffle {

/** \brief One step of the Fisher‐Yates shuffle
 *
 * A step is published before the elements at currentIndex and chosenIndex
 * are swapped. When the indices are equal the element is already in its
 * final position and nothing is swapped.
 *
 * ShuffleStep objects are equality comparable. They compare equal when the
 * indices and the states are equal.
 *
 * \note Boost operators library is used to ensure that operator!= is
 * generated with usual semantics when operator== is supplied.
 *
 * \tparam T the element type of the shuffled sequence
 */
template<typename T>
struct ShuffleStep : private boost::equality_comparable<ShuffleStep<T>> {
    Index currentIndex;              ///< \brief The position being finalized
    Index chosenIndex;               ///< \brief The position drawn for it
    std::vector<T> stateBeforeSwap;  ///< \brief The sequence before the swap

    ShuffleStep() = default;

    /** \brief Create new step
     *
     * \param currentIndex the position being finalized
     * \param chosenIndex the position drawn for it
     * \param stateBeforeSwap the sequence before the swap
     */
    ShuffleStep(
        Index currentIndex, Index chosenIndex,
        std::vector<T> stateBeforeSwap) :
        currentIndex {currentIndex},
        chosenIndex {chosenIndex},
        stateBeforeSwap(std::move(stateBeforeSwap))
    {
    }

    /** \brief Determine if the step swaps two distinct positions
     *
     * \return false if the chosen index is the current index, true otherwise
     */
    bool isSwap() const
    {
        return currentIndex != chosenIndex;
    }
};

/** \brief Equality operator for shuffle steps
 *
 * \sa ShuffleStep
 */
template<typename T>
bool operator==(const ShuffleStep<T>& lhs, const ShuffleStep<T>& rhs)
{
    return lhs.currentIndex == rhs.currentIndex &&
        lhs.chosenIndex == rhs.chosenIndex &&
        lhs.stateBeforeSwap == rhs.stateBeforeSwap;
}

/** \brief Output a ShuffleStep to stream
 *
 * \param os the output stream
 * \param step the step to output
 *
 * \return parameter \p os
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const ShuffleStep<T>& step)
{
    os << "[";
    auto separator = "";
    for (const auto& element : step.stateBeforeSwap) {
        os << separator << element;
        separator = ", ";
    }
    os << "] " << step.currentIndex;
    if (step.isSwap()) {
        return os << " <-> " << step.chosenIndex;
    }
    return os << " stays";
}

}

#endif // SHUFFLESTEP_HH_
