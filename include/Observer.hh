/** \file
 *
 * \brief Definition of the observer pattern used to publish shuffle steps
 *
 * Observers are notified synchronously, in the thread calling
 * Observable::notifyAll(). The classes are not thread safe.
 */

#ifndef OBSERVER_HH_
#define OBSERVER_HH_

#include <deque>
#include <list>
#include <memory>
#include <tuple>
#include <utility>

namespace Shuffle {

template<typename... T> class Observable;

/** \brief Receiver of notifications from an Observable
 *
 * \sa Observable, FunctionObserver
 */
template<typename... T>
class Observer {
public:

    /** \brief Type of observable the observer can be subscribed to
     */
    using ObservableType = Observable<T...>;

    virtual ~Observer() = default;

    /** \brief Notify observer
     *
     * \param args the event published by the observable
     */
    void notify(const T&... args);

private:

    /** \brief Handle for notifying the observer
     *
     * \sa notify()
     */
    virtual void handleNotify(const T&... args) = 0;
};

template<typename... T>
void Observer<T...>::notify(const T&... args)
{
    handleNotify(args...);
}

/** \brief Publisher of events to Observer objects
 *
 * An Observable holds weak references to its observers. An observer whose
 * lifetime has ended is dropped from the list the next time the observable
 * goes through it.
 *
 * Events published from within a notification are not delivered
 * recursively. They are queued and delivered, in order, after every observer
 * has received the event being delivered.
 *
 * Publishing classes inherit Observable protectedly and expose subscribe()
 * with a using declaration, so that only the class itself can call
 * notifyAll().
 */
template<typename... T>
class Observable {
public:

    /** \brief Type of observer that can be subscribed to the observable
     */
    using ObserverType = Observer<T...>;

    /** \brief Subscribe observer to this Observable
     *
     * An observer subscribed during a notification also receives the event
     * being delivered, after the observers subscribed before it.
     *
     * \param observer the observer to be registered
     */
    void subscribe(std::weak_ptr<ObserverType> observer);

protected:

    /** \brief Notify all observers
     *
     * \param args the event, converted to the observer parameter types
     */
    template<typename... U>
    void notifyAll(U&&... args);

    /** \brief Determine if any subscribed observer is still alive
     *
     * Expired observers are removed as a side effect.
     */
    bool hasObservers();

private:

    using Event = std::tuple<T...>;

    void deliver(const Event& event);

    std::list<std::weak_ptr<ObserverType>> observers;
    std::deque<Event> pendingEvents;
    bool delivering {false};
};

template<typename... T>
void Observable<T...>::subscribe(std::weak_ptr<ObserverType> observer)
{
    observers.emplace_back(std::move(observer));
}

template<typename... T>
template<typename... U>
void Observable<T...>::notifyAll(U&&... args)
{
    pendingEvents.emplace_back(std::forward<U>(args)...);
    if (delivering) {
        return;
    }
    delivering = true;
    try {
        while (!pendingEvents.empty()) {
            const auto event = std::move(pendingEvents.front());
            pendingEvents.pop_front();
            deliver(event);
        }
    } catch (...) {
        pendingEvents.clear();
        delivering = false;
        throw;
    }
    delivering = false;
}

template<typename... T>
bool Observable<T...>::hasObservers()
{
    observers.remove_if(
        [](const auto& observer) { return observer.expired(); });
    return !observers.empty();
}

template<typename... T>
void Observable<T...>::deliver(const Event& event)
{
    for (auto iter = observers.begin(); iter != observers.end(); ) {
        if (const auto observer = iter->lock()) {
            std::apply(
                [&observer](const auto&... args) { observer->notify(args...); },
                event);
            ++iter;
        } else {
            iter = observers.erase(iter);
        }
    }
}

}

#endif // OBSERVER_HH_
