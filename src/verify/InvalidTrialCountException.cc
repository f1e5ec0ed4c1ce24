#include "verify/InvalidTrialCountException.hh"

#include <boost/format.hpp>

namespace Shuffle {
namespace Verify {

InvalidTrialCountException::InvalidTrialCountException(const long trials) :
    std::invalid_argument {
        (boost::format("Invalid trial count %1%, expected at least 1")
         % trials).str()},
    trials {trials}
{
}

long InvalidTrialCountException::getTrials() const noexcept
{
    return trials;
}

long checkTrialCount(const long trials)
{
    if (trials < 1) {
        throw InvalidTrialCountException {trials};
    }
    return trials;
}

}
}
