#include "Thread.hh"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <utility>

using Shuffle::Thread;

TEST(ThreadTest, testJoin)
{
    auto done = std::atomic<bool> {false};
    auto thread = Thread {[&done]() { done = true; }};
    thread.join();
    EXPECT_TRUE(done);
}

TEST(ThreadTest, testDestructorJoins)
{
    auto done = std::atomic<bool> {false};
    {
        const auto thread = Thread {[&done]() { done = true; }};
    }
    EXPECT_TRUE(done);
}

TEST(ThreadTest, testJoinRethrows)
{
    auto thread = Thread {[]() { throw std::runtime_error {"failure"}; }};
    EXPECT_THROW(thread.join(), std::runtime_error);
    EXPECT_NO_THROW(thread.join());
}

TEST(ThreadTest, testMove)
{
    auto done = std::atomic<bool> {false};
    auto thread = Thread {};
    thread = Thread {[&done]() { done = true; }};
    auto other = std::move(thread);
    other.join();
    EXPECT_TRUE(done);
    EXPECT_NO_THROW(thread.join());
}

TEST(ThreadTest, testEmpty)
{
    auto thread = Thread {};
    EXPECT_NO_THROW(thread.join());
}
