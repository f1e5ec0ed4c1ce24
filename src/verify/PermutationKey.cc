#include "verify/PermutationKey.hh"

namespace Shuffle {
namespace Verify {

std::string formatKey(const PermutationKey& key)
{
    auto ret = std::string {"["};
    auto separator = "";
    for (const auto& element : key) {
        ret += separator;
        ret += element;
        separator = ", ";
    }
    ret += "]";
    return ret;
}

}
}
