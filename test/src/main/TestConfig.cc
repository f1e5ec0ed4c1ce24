#include "main/Config.hh"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

using namespace std::string_literals;

using Shuffle::Main::Config;

class ConfigTest : public testing::Test {
protected:
    std::istringstream in;

    void assertThrows()
    {
        auto f = [this]() { static_cast<void>(Config {in}); };
        EXPECT_THROW(f(), std::runtime_error);
    }
};

TEST_F(ConfigTest, testBadStream)
{
    in.setstate(std::ios::failbit);
    assertThrows();
}

TEST_F(ConfigTest, testBadSyntax)
{
    in.str("this is invalid"s);
    assertThrows();
}

TEST_F(ConfigTest, testRuntimeError)
{
    in.str(R"EOF(
error("failure")
)EOF"s);
    assertThrows();
}

TEST_F(ConfigTest, testDefaults)
{
    const auto config = Config {in};
    EXPECT_EQ(1000000, config.getTrials());
    EXPECT_FALSE(config.getSeed());
    EXPECT_EQ(1, config.getBatches());
    EXPECT_EQ((Config::ElementVector {"1", "2", "3"}), config.getElements());
}

TEST_F(ConfigTest, testDefaultConstructedConfig)
{
    const auto config = Config {};
    EXPECT_EQ(1000000, config.getTrials());
    EXPECT_FALSE(config.getSeed());
    EXPECT_EQ(1, config.getBatches());
    EXPECT_EQ((Config::ElementVector {"1", "2", "3"}), config.getElements());
}

TEST_F(ConfigTest, testParseConfig)
{
    in.str(R"EOF(
trials = 500
seed = 42
batches = 4
elements = { "a", "b", "c", "d" }
)EOF"s);
    const auto config = Config {in};
    EXPECT_EQ(500, config.getTrials());
    EXPECT_EQ(42u, config.getSeed());
    EXPECT_EQ(4, config.getBatches());
    EXPECT_EQ(
        (Config::ElementVector {"a", "b", "c", "d"}), config.getElements());
}

TEST_F(ConfigTest, testComputedValues)
{
    in.str(R"EOF(
trials = 10 * 1000
elements = {}
for i = 1, 4 do
  elements[i] = i
end
)EOF"s);
    const auto config = Config {in};
    EXPECT_EQ(10000, config.getTrials());
    EXPECT_EQ(
        (Config::ElementVector {"1", "2", "3", "4"}), config.getElements());
}

TEST_F(ConfigTest, testWrongTypes)
{
    in.str(R"EOF(
trials = "many"
seed = 1.5
elements = "abc"
)EOF"s);
    const auto config = Config {in};
    EXPECT_EQ(1000000, config.getTrials());
    EXPECT_FALSE(config.getSeed());
    EXPECT_EQ((Config::ElementVector {"1", "2", "3"}), config.getElements());
}

TEST_F(ConfigTest, testWrongElementType)
{
    in.str(R"EOF(
elements = { "a", {} }
)EOF"s);
    const auto config = Config {in};
    EXPECT_EQ((Config::ElementVector {"1", "2", "3"}), config.getElements());
}

TEST_F(ConfigTest, testOutOfRangeValues)
{
    in.str(R"EOF(
seed = -1
batches = 0
)EOF"s);
    const auto config = Config {in};
    EXPECT_FALSE(config.getSeed());
    EXPECT_EQ(1, config.getBatches());
}

TEST(ConfigFromPathTest, testEmptyPath)
{
    const auto config = Shuffle::Main::configFromPath("");
    EXPECT_EQ(1000000, config.getTrials());
}

TEST(ConfigFromPathTest, testMissingFile)
{
    EXPECT_THROW(
        Shuffle::Main::configFromPath("/nonexistent/shuffle-config.lua"),
        std::runtime_error);
}
