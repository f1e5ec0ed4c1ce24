#include "shuffle/Random.hh"

namespace Shuffle {

Seed generateSeed()
{
    auto device = std::random_device {};
    return device();
}

}
