#include "Logging.hh"

#include <gmock/gmock.h>

#include <iostream>

int main(int argc, char* argv[])
{
    Shuffle::setupLogging(Shuffle::LogLevel::NONE, std::cerr);
    testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
