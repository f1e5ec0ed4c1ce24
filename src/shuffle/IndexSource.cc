#include "shuffle/IndexSource.hh"

#include "shuffle/InvalidBoundException.hh"
#include "Utility.hh"

#include <boost/format.hpp>

namespace Shuffle {

IndexSource::~IndexSource() = default;

Index IndexSource::next(const Index bound)
{
    if (bound < 1) {
        throw InvalidBoundException {bound};
    }
    return checkIndex(handleNext(bound), bound);
}

InvalidBoundException::InvalidBoundException(const Index bound) :
    std::invalid_argument {
        (boost::format("Invalid index bound %1%, expected at least 1")
         % bound).str()},
    bound {bound}
{
}

Index InvalidBoundException::getBound() const noexcept
{
    return bound;
}

}
