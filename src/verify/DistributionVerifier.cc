#include "verify/DistributionVerifier.hh"

namespace Shuffle {
namespace Verify {

void DistributionVerifier::recordKey(PermutationKey key)
{
    ++counts[std::move(key)];
    ++trialsCompleted;
}

long DistributionVerifier::getTrialsCompleted() const
{
    return trialsCompleted;
}

DistributionReport DistributionVerifier::getReport() const
{
    return DistributionReport {counts};
}

}
}
