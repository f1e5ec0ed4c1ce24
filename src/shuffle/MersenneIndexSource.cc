#include "shuffle/MersenneIndexSource.hh"

namespace Shuffle {

MersenneIndexSource::MersenneIndexSource() :
    MersenneIndexSource {generateSeed()}
{
}

MersenneIndexSource::MersenneIndexSource(const Seed seed) :
    rng {seed}
{
}

Index MersenneIndexSource::handleNext(const Index bound)
{
    auto distribution = std::uniform_int_distribution<Index> {0, bound - 1};
    return distribution(rng);
}

}
