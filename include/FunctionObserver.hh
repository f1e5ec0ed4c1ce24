/** \file
 *
 * \brief Definition of Shuffle::FunctionObserver class
 */

#ifndef FUNCTIONOBSERVER_HH_
#define FUNCTIONOBSERVER_HH_

#include "Observer.hh"

#include <memory>
#include <type_traits>
#include <utility>

namespace Shuffle {

/** \brief Observer forwarding the notifications to a callable
 *
 * \tparam Function the type of the callable
 * \tparam T the observer parameters
 *
 * \sa makeObserver()
 */
template<typename Function, typename... T>
class FunctionObserver : public Observer<T...> {
public:

    /** \brief Create new function observer
     *
     * \param function the callable invoked with each notification
     */
    explicit FunctionObserver(Function function) :
        function {std::move(function)}
    {
    }

private:

    void handleNotify(const T&... args) override
    {
        function(args...);
    }

    Function function;
};

/** \brief Wrap a callable into an observer
 *
 * The observer parameters must be given explicitly:
 *
 * \code{.cc}
 * const auto printer = makeObserver<ShuffleStep<int>>(
 *     [](const auto& step) { std::cout << step << std::endl; });
 * engine.subscribe(printer);
 * \endcode
 *
 * The returned pointer must be kept alive for as long as the notifications
 * are wanted.
 *
 * \param function the callable
 *
 * \return shared pointer to the observer
 */
template<typename... T, typename Function>
auto makeObserver(Function&& function)
{
    return std::make_shared<FunctionObserver<std::decay_t<Function>, T...>>(
        std::forward<Function>(function));
}

}

#endif // FUNCTIONOBSERVER_HH_
