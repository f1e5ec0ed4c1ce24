#include "Thread.hh"

namespace Shuffle {

Thread::Thread() noexcept = default;

Thread::Thread(Thread&& other) noexcept = default;

Thread::~Thread()
{
    wait();
}

Thread& Thread::operator=(Thread&& other) noexcept
{
    if (this != &other) {
        wait();
        error = std::move(other.error);
        thread = std::move(other.thread);
    }
    return *this;
}

void Thread::join()
{
    wait();
    if (error && *error) {
        std::rethrow_exception(std::exchange(*error, nullptr));
    }
}

void Thread::wait() noexcept
{
    if (thread.joinable()) {
        thread.join();
    }
}

}
