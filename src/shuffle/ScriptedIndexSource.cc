#include "shuffle/ScriptedIndexSource.hh"

#include "Logging.hh"

#include <stdexcept>

namespace Shuffle {

ScriptedIndexSource::ScriptedIndexSource(
    std::initializer_list<Index> indices) :
    indices(indices)
{
}

std::size_t ScriptedIndexSource::remaining() const
{
    return indices.size();
}

Index ScriptedIndexSource::handleNext(const Index bound)
{
    if (indices.empty()) {
        log(LogLevel::ERROR,
            "Index script exhausted while drawing with bound %d", bound);
        throw std::out_of_range {"Index script exhausted"};
    }
    const auto ret = indices.front();
    indices.pop_front();
    return ret;
}

}
