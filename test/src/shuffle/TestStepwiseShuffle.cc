#include "shuffle/MersenneIndexSource.hh"
#include "shuffle/ScriptedIndexSource.hh"
#include "shuffle/ShuffleEngine.hh"
#include "shuffle/StepwiseShuffle.hh"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <vector>

using Shuffle::MersenneIndexSource;
using Shuffle::ScriptedIndexSource;

namespace {
using Stepwise = Shuffle::StepwiseShuffle<int>;
using Sequence = Stepwise::Sequence;
using Step = Stepwise::Step;
const auto INPUT = Sequence {1, 2, 3, 4};
}

class StepwiseShuffleTest : public testing::Test {
protected:
    std::shared_ptr<ScriptedIndexSource> indexSource {
        std::make_shared<ScriptedIndexSource>(
            std::initializer_list<Shuffle::Index> {1, 0, 1})};
    Stepwise stepwise {INPUT, indexSource};
};

TEST_F(StepwiseShuffleTest, testNoDrawBeforeAdvance)
{
    EXPECT_EQ(3u, indexSource->remaining());
    EXPECT_FALSE(stepwise.isCompleted());
    EXPECT_THROW(stepwise.getStep(), std::logic_error);
    EXPECT_THROW(stepwise.getResult(), std::logic_error);
}

TEST_F(StepwiseShuffleTest, testSteps)
{
    ASSERT_TRUE(stepwise.advance());
    EXPECT_EQ((Step {3, 1, {1, 2, 3, 4}}), stepwise.getStep());
    EXPECT_EQ(2u, indexSource->remaining());
    ASSERT_TRUE(stepwise.advance());
    EXPECT_EQ((Step {2, 0, {1, 4, 3, 2}}), stepwise.getStep());
    ASSERT_TRUE(stepwise.advance());
    EXPECT_EQ((Step {1, 1, {3, 4, 1, 2}}), stepwise.getStep());
    EXPECT_FALSE(stepwise.isCompleted());
    EXPECT_FALSE(stepwise.advance());
    EXPECT_TRUE(stepwise.isCompleted());
    EXPECT_THROW(stepwise.getStep(), std::logic_error);
    EXPECT_EQ((Sequence {3, 4, 1, 2}), stepwise.getResult());
    EXPECT_FALSE(stepwise.advance());
}

TEST_F(StepwiseShuffleTest, testIndexSourceFailure)
{
    auto failing = Stepwise {
        INPUT,
        std::make_shared<ScriptedIndexSource>(
            std::initializer_list<Shuffle::Index> {1})};
    ASSERT_TRUE(failing.advance());
    EXPECT_THROW(failing.advance(), std::out_of_range);
    EXPECT_TRUE(failing.isCompleted());
    EXPECT_FALSE(failing.advance());
    EXPECT_THROW(failing.getResult(), std::logic_error);
}

TEST(StepwiseShuffleEmptyTest, testEmptySequence)
{
    auto stepwise = Stepwise {
        Sequence {},
        std::make_shared<ScriptedIndexSource>(
            std::initializer_list<Shuffle::Index> {})};
    EXPECT_FALSE(stepwise.advance());
    EXPECT_TRUE(stepwise.isCompleted());
    EXPECT_EQ(Sequence {}, stepwise.getResult());
}

TEST(StepwiseShuffleEngineTest, testSameResultAsEngine)
{
    constexpr auto SEED = 2024u;
    const auto input = Sequence {1, 2, 3, 4, 5, 6, 7, 8};
    auto engine = Shuffle::ShuffleEngine<int> {
        std::make_shared<MersenneIndexSource>(SEED)};
    const auto expected = engine.shuffle(input);

    auto stepwise_engine = Shuffle::ShuffleEngine<int> {
        std::make_shared<MersenneIndexSource>(SEED)};
    auto stepwise = stepwise_engine.stepwise(input);
    auto n_steps = 0;
    while (stepwise.advance()) {
        ++n_steps;
    }
    EXPECT_EQ(7, n_steps);
    EXPECT_EQ(expected, stepwise.getResult());
}
