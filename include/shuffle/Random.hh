/** \file
 *
 * \brief The common random number generator
 */

#ifndef RANDOM_HH_
#define RANDOM_HH_

#include <random>

namespace Shuffle {

/** \brief The preferred random number generator for the shuffle library
 *
 * A general purpose, non-cryptographic generator.
 */
using Rng = std::mt19937;

/** \brief Seed type of the random number generator
 */
using Seed = Rng::result_type;

/** \brief Generate seed from the OS random number source
 *
 * \return A fresh seed obtained from std::random_device
 */
Seed generateSeed();

}

#endif // RANDOM_HH_
