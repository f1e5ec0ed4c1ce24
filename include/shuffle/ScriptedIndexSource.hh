/** \file
 *
 * \brief Definition of Shuffle::ScriptedIndexSource class
 */

#ifndef SCRIPTEDINDEXSOURCE_HH_
#define SCRIPTEDINDEXSOURCE_HH_

#include "shuffle/IndexSource.hh"

#include <cstddef>
#include <deque>
#include <initializer_list>

namespace Shuffle {

/** \brief Index source returning a predetermined sequence of indices
 *
 * ScriptedIndexSource replays the indices given in its constructor, in
 * order. Shuffling with a scripted source is fully deterministic. Each
 * scripted index must be below the bound it is drawn with, otherwise
 * IndexSource::next() throws std::out_of_range.
 */
class ScriptedIndexSource : public IndexSource {
public:

    /** \brief Create scripted index source
     *
     * \param first iterator to the first scripted index
     * \param last iterator one past the last scripted index
     */
    template<typename IndexIterator>
    ScriptedIndexSource(IndexIterator first, IndexIterator last);

    /** \brief Create scripted index source
     *
     * \param indices the scripted indices
     */
    ScriptedIndexSource(std::initializer_list<Index> indices);

    /** \brief Determine the number of indices not yet drawn
     */
    std::size_t remaining() const;

private:

    Index handleNext(Index bound) override;

    std::deque<Index> indices;
};

template<typename IndexIterator>
ScriptedIndexSource::ScriptedIndexSource(
    IndexIterator first, IndexIterator last) :
    indices(first, last)
{
}

}

#endif // SCRIPTEDINDEXSOURCE_HH_
