/** \file
 *
 * \brief Definition of Shuffle::DeepCopy customization point
 */

#ifndef DEEPCOPY_HH_
#define DEEPCOPY_HH_

#include <algorithm>
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>
#include <vector>

namespace Shuffle {

/** \brief Function object that copies a value without sharing its parts
 *
 * ShuffleEngine copies the elements of its input with DeepCopy, so that the
 * shuffled sequence and the caller’s sequence never share sub‐objects. The
 * primary template copy constructs, which is a deep copy for value types. The
 * library specializes DeepCopy for std::shared_ptr, std::optional and
 * std::vector. Clients may specialize it for their own handle types.
 *
 * \tparam T the type of the copied value
 */
template<typename T>
struct DeepCopy {

    /** \brief Copy \p t
     */
    T operator()(const T& t) const
    {
        return t;
    }
};

/** \brief Deep copy of shared pointer
 *
 * Allocates a new object copied from the pointee. An empty pointer is copied
 * as an empty pointer.
 */
template<typename T>
struct DeepCopy<std::shared_ptr<T>> {

    /** \brief Copy the object \p p points to
     */
    std::shared_ptr<T> operator()(const std::shared_ptr<T>& p) const
    {
        if (!p) {
            return nullptr;
        }
        using ValueType = std::remove_const_t<T>;
        return std::make_shared<ValueType>(DeepCopy<ValueType> {}(*p));
    }
};

/** \brief Deep copy of optional value
 */
template<typename T>
struct DeepCopy<std::optional<T>> {

    /** \brief Copy the value \p t contains, if any
     */
    std::optional<T> operator()(const std::optional<T>& t) const
    {
        if (t) {
            return DeepCopy<T> {}(*t);
        }
        return std::nullopt;
    }
};

/** \brief Deep copy of vector
 *
 * Each element is copied using DeepCopy for the element type.
 */
template<typename T, typename Allocator>
struct DeepCopy<std::vector<T, Allocator>> {

    /** \brief Copy the elements of \p v
     */
    std::vector<T, Allocator> operator()(
        const std::vector<T, Allocator>& v) const
    {
        auto ret = std::vector<T, Allocator>(v.get_allocator());
        ret.reserve(v.size());
        std::transform(
            v.begin(), v.end(), std::back_inserter(ret), DeepCopy<T> {});
        return ret;
    }
};

/** \brief Utility for deep copying a value
 *
 * \param t the value to copy
 *
 * \return DeepCopy<T> {}(t)
 */
template<typename T>
T deepCopy(const T& t)
{
    return DeepCopy<T> {}(t);
}

}

#endif // DEEPCOPY_HH_
