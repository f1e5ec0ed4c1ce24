/** \file
 *
 * \brief Definition of Shuffle::Verify::PermutationKey and canonicalKey()
 */

#ifndef VERIFY_PERMUTATIONKEY_HH_
#define VERIFY_PERMUTATIONKEY_HH_

#include <boost/lexical_cast.hpp>

#include <string>
#include <vector>

namespace Shuffle {

/** \brief Statistical verification of shuffles
 */
namespace Verify {

/** \brief Canonical key of a permutation
 *
 * The key is the ordered tuple of the textual values of the elements. Two
 * sequences whose elements appear in the same order and print the same have
 * identical keys, regardless of how the sequences were constructed.
 */
using PermutationKey = std::vector<std::string>;

/** \brief Compute the canonical key of a sequence
 *
 * Each element is converted to string with boost::lexical_cast, i.e. using
 * its output operator.
 *
 * \param sequence the sequence
 *
 * \return the canonical key of \p sequence
 */
template<typename T>
PermutationKey canonicalKey(const std::vector<T>& sequence)
{
    auto key = PermutationKey {};
    key.reserve(sequence.size());
    for (const auto& element : sequence) {
        key.emplace_back(boost::lexical_cast<std::string>(element));
    }
    return key;
}

/** \brief Format key for human readers
 *
 * \param key the key
 *
 * \return the elements of \p key separated by commas and enclosed in
 * brackets, e.g. “[1, 2, 3]”
 */
std::string formatKey(const PermutationKey& key);

}
}

#endif // VERIFY_PERMUTATIONKEY_HH_
