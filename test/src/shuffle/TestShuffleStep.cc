#include "shuffle/ShuffleStep.hh"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using Step = Shuffle::ShuffleStep<int>;

TEST(ShuffleStepTest, testIsSwap)
{
    EXPECT_TRUE((Step {2, 0, {1, 2, 3}}).isSwap());
    EXPECT_FALSE((Step {2, 2, {1, 2, 3}}).isSwap());
}

TEST(ShuffleStepTest, testEquality)
{
    const auto step = Step {1, 0, {1, 2}};
    EXPECT_EQ(step, (Step {1, 0, {1, 2}}));
    EXPECT_NE(step, (Step {1, 1, {1, 2}}));
    EXPECT_NE(step, (Step {1, 0, {2, 1}}));
}

TEST(ShuffleStepTest, testOutputSwap)
{
    auto out = std::ostringstream {};
    out << Step {2, 0, {1, 2, 3}};
    EXPECT_EQ("[1, 2, 3] 2 <-> 0", out.str());
}

TEST(ShuffleStepTest, testOutputStay)
{
    auto out = std::ostringstream {};
    out << Step {1, 1, {3, 1, 2}};
    EXPECT_EQ("[3, 1, 2] 1 stays", out.str());
}
