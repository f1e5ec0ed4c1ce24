/** \file
 *
 * \brief Definition of Shuffle::MersenneIndexSource class
 */

#ifndef MERSENNEINDEXSOURCE_HH_
#define MERSENNEINDEXSOURCE_HH_

#include "shuffle/IndexSource.hh"
#include "shuffle/Random.hh"

namespace Shuffle {

/** \brief Index source backed by the Mersenne Twister
 *
 * Draws indices with std::uniform_int_distribution from a privately owned
 * Rng. Two sources created with the same seed produce the same sequence of
 * indices when asked for the same bounds.
 *
 * \note The source is not thread safe. Threads verifying distributions in
 * parallel each need their own source.
 */
class MersenneIndexSource : public IndexSource {
public:

    /** \brief Create index source seeded from the OS random number source
     */
    MersenneIndexSource();

    /** \brief Create index source with fixed seed
     *
     * \param seed the seed of the underlying generator
     */
    explicit MersenneIndexSource(Seed seed);

private:

    Index handleNext(Index bound) override;

    Rng rng;
};

}

#endif // MERSENNEINDEXSOURCE_HH_
