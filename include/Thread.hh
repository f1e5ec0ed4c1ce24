/** \file
 *
 * \brief Definition of Shuffle::Thread class
 */

#ifndef THREAD_HH_
#define THREAD_HH_

#include <exception>
#include <memory>
#include <thread>
#include <utility>

namespace Shuffle {

/** \brief Thread that is joined when destroyed and reports its failure
 *
 * Thread runs a function in a new thread of execution. An exception escaping
 * the function is stored and rethrown by join() in the joining thread. The
 * destructor joins the thread without rethrowing, so a scope owning threads
 * cannot be left before they have finished.
 */
class Thread {
public:

    /** \brief Create thread object without a thread of execution
     */
    Thread() noexcept;

    /** \brief Start thread calling \p f
     *
     * \param f the function run by the thread
     */
    template<typename Function>
    explicit Thread(Function&& f);

    Thread(Thread&& other) noexcept;

    /** \brief Join the thread, discarding a stored exception
     */
    ~Thread();

    /** \brief Join the current thread and take over the thread of \p other
     */
    Thread& operator=(Thread&& other) noexcept;

    /** \brief Wait for the thread to finish
     *
     * Does nothing if there is no thread of execution to join.
     *
     * \throw The exception that escaped the function run by the thread, if
     * any. It is rethrown only once.
     */
    void join();

private:

    void wait() noexcept;

    std::unique_ptr<std::exception_ptr> error;
    std::thread thread;
};

template<typename Function>
Thread::Thread(Function&& f) :
    error {std::make_unique<std::exception_ptr>()},
    thread {
        [&stored_error = *error, f = std::forward<Function>(f)]() mutable
        {
            try {
                f();
            } catch (...) {
                stored_error = std::current_exception();
            }
        }}
{
}

}

#endif // THREAD_HH_
