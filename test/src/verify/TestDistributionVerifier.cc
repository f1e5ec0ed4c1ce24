#include "shuffle/MersenneIndexSource.hh"
#include "shuffle/ShuffleEngine.hh"
#include "verify/DistributionVerifier.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <vector>

using Shuffle::Verify::DistributionVerifier;
using Shuffle::Verify::InvalidTrialCountException;
using Shuffle::Verify::PermutationKey;
using Shuffle::Verify::verify;
using Shuffle::Verify::verifyInBatches;

namespace {
using Sequence = std::vector<int>;
const auto INPUT = Sequence {1, 2, 3};
const auto KEY_123 = PermutationKey {"1", "2", "3"};
const auto KEY_321 = PermutationKey {"3", "2", "1"};

Sequence reverseEveryOther(const Sequence& input, int& calls)
{
    auto ret = input;
    if (calls++ % 2 == 1) {
        std::reverse(ret.begin(), ret.end());
    }
    return ret;
}
}

TEST(DistributionVerifierTest, testRecord)
{
    auto verifier = DistributionVerifier {};
    verifier.record(Sequence {1, 2, 3});
    verifier.record(Sequence {1, 2, 3});
    verifier.recordKey(KEY_321);
    EXPECT_EQ(3, verifier.getTrialsCompleted());
    const auto report = verifier.getReport();
    EXPECT_EQ(2, report.getCount(KEY_123));
    EXPECT_EQ(1, report.getCount(KEY_321));
}

TEST(DistributionVerifierTest, testVerify)
{
    auto calls = 0;
    const auto report = verify(
        INPUT, 10,
        [&calls](const auto& input) { return reverseEveryOther(input, calls); });
    EXPECT_EQ(10, calls);
    EXPECT_EQ(10, report.getTrials());
    EXPECT_EQ(5, report.getCount(KEY_123));
    EXPECT_EQ(5, report.getCount(KEY_321));
    EXPECT_DOUBLE_EQ(0.0, report.getStandardDeviation());
}

TEST(DistributionVerifierTest, testBaseInputIsPassedUnmodified)
{
    auto input = INPUT;
    verify(
        input, 5,
        [](const auto& sequence)
        {
            EXPECT_EQ(INPUT, sequence);
            return sequence;
        });
    EXPECT_EQ(INPUT, input);
}

TEST(DistributionVerifierTest, testVerifyWithEngine)
{
    auto engine = Shuffle::ShuffleEngine<int> {
        std::make_shared<Shuffle::MersenneIndexSource>(5)};
    const auto report = verify(INPUT, 600, engine);
    EXPECT_EQ(600, report.getTrials());
    EXPECT_EQ(6u, report.getNumberOfPermutations());
}

TEST(DistributionVerifierTest, testVerifyEmptySequence)
{
    auto engine = Shuffle::ShuffleEngine<int> {
        std::make_shared<Shuffle::MersenneIndexSource>(5)};
    const auto report = verify(Sequence {}, 3, engine);
    EXPECT_EQ(3, report.getCount(PermutationKey {}));
    EXPECT_EQ(1u, report.getNumberOfPermutations());
}

TEST(DistributionVerifierTest, testZeroTrials)
{
    EXPECT_THROW(
        verify(INPUT, 0, [](const auto& input) { return input; }),
        InvalidTrialCountException);
}

TEST(DistributionVerifierTest, testNegativeTrials)
{
    try {
        verify(INPUT, -5, [](const auto& input) { return input; });
        FAIL() << "Expected InvalidTrialCountException";
    } catch (const InvalidTrialCountException& e) {
        EXPECT_EQ(-5, e.getTrials());
    }
}

TEST(DistributionVerifierTest, testStop)
{
    auto stop_source = std::stop_source {};
    auto calls = 0;
    const auto report = verify(
        INPUT, 100,
        [&stop_source, &calls](const auto& input)
        {
            if (++calls == 5) {
                stop_source.request_stop();
            }
            return input;
        },
        stop_source.get_token());
    EXPECT_EQ(5, calls);
    EXPECT_EQ(5, report.getTrials());
    EXPECT_EQ(5, report.getCount(KEY_123));
}

TEST(DistributionVerifierTest, testStopBeforeFirstTrial)
{
    auto stop_source = std::stop_source {};
    stop_source.request_stop();
    const auto report = verify(
        INPUT, 100, [](const auto& input) { return input; },
        stop_source.get_token());
    EXPECT_EQ(0, report.getTrials());
    EXPECT_EQ(0u, report.getNumberOfPermutations());
    EXPECT_EQ(0.0, report.getStandardDeviation());
}

TEST(DistributionVerifierBatchTest, testVerifyInBatches)
{
    const auto report = verifyInBatches(
        INPUT, 1001, 4,
        [](const int batch)
        {
            return Shuffle::ShuffleEngine<int> {
                std::make_shared<Shuffle::MersenneIndexSource>(100 + batch)};
        });
    EXPECT_EQ(1001, report.getTrials());
    EXPECT_EQ(6u, report.getNumberOfPermutations());
}

TEST(DistributionVerifierBatchTest, testMoreBatchesThanTrials)
{
    auto batches_created = 0;
    const auto report = verifyInBatches(
        INPUT, 2, 4,
        [&batches_created](int)
        {
            ++batches_created;
            return [](const Sequence& input) { return input; };
        });
    EXPECT_EQ(2, batches_created);
    EXPECT_EQ(2, report.getTrials());
    EXPECT_EQ(2, report.getCount(KEY_123));
}

TEST(DistributionVerifierBatchTest, testInvalidBatchCount)
{
    EXPECT_THROW(
        verifyInBatches(
            INPUT, 10, 0,
            [](int) { return [](const Sequence& input) { return input; }; }),
        std::invalid_argument);
}

TEST(DistributionVerifierBatchTest, testInvalidTrialCount)
{
    EXPECT_THROW(
        verifyInBatches(
            INPUT, 0, 2,
            [](int) { return [](const Sequence& input) { return input; }; }),
        InvalidTrialCountException);
}

TEST(DistributionVerifierBatchTest, testFailingBatch)
{
    EXPECT_THROW(
        verifyInBatches(
            INPUT, 10, 2,
            [](const int batch)
            {
                return [batch](const Sequence& input)
                {
                    if (batch == 1) {
                        throw std::runtime_error {"batch failed"};
                    }
                    return input;
                };
            }),
        std::runtime_error);
}
