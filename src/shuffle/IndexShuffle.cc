#include "shuffle/IndexShuffle.hh"

#include "shuffle/FisherYates.hh"
#include "Utility.hh"

namespace Shuffle {

std::vector<Index> generateShuffledIndices(
    const Index n, IndexSource& indexSource)
{
    const auto indices_range = to(n);
    auto indices = std::vector<Index>(
        indices_range.begin(), indices_range.end());
    shuffleInPlace(indices, indexSource);
    return indices;
}

}
