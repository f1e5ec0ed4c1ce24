#include "main/Config.hh"
#include "shuffle/MersenneIndexSource.hh"
#include "shuffle/ShuffleEngine.hh"
#include "verify/DistributionVerifier.hh"
#include "FunctionObserver.hh"
#include "Logging.hh"

#include <boost/core/demangle.hpp>
#include <boost/lexical_cast.hpp>

#include <getopt.h>

#include <array>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <typeinfo>
#include <utility>

namespace {

using namespace Shuffle;

using Element = std::string;
using Engine = ShuffleEngine<Element>;

class ShuffleVerifyApp {
public:

    ShuffleVerifyApp(
        Main::Config config, std::optional<long> trials,
        std::optional<Seed> seed, std::optional<int> batches,
        Main::Config::ElementVector elements, bool trace) :
        trials {trials.value_or(config.getTrials())},
        seed {seed ? seed : config.getSeed()},
        batches {batches.value_or(config.getBatches())},
        elements {
            elements.empty() ? config.getElements() : std::move(elements)},
        trace {trace}
    {
        if (!this->seed) {
            this->seed = generateSeed();
        }
        log(LogLevel::INFO, "Using seed %d", *this->seed);
    }

    void run()
    {
        if (trace) {
            runTrace();
        } else {
            runVerification();
        }
    }

private:

    void runTrace()
    {
        auto engine = Engine {std::make_shared<MersenneIndexSource>(*seed)};
        const auto observer = makeObserver<Engine::Step>(
            [](const auto& step) { std::cout << step << "\n"; });
        engine.subscribe(observer);
        const auto result = engine.shuffle(elements);
        std::cout << Verify::formatKey(Verify::canonicalKey(result))
                  << std::endl;
    }

    void runVerification()
    {
        const auto base_seed = *seed;
        const auto report = Verify::verifyInBatches(
            elements, trials, batches,
            [base_seed](const int batch)
            {
                return Engine {
                    std::make_shared<MersenneIndexSource>(base_seed + batch)};
            });
        std::cout << report << std::flush;
    }

    long trials;
    std::optional<Seed> seed;
    int batches;
    Main::Config::ElementVector elements;
    bool trace;
};

ShuffleVerifyApp createApp(int argc, char* argv[])
{
    auto config_path = std::string {};
    auto trials = std::optional<long> {};
    auto seed = std::optional<Seed> {};
    auto batches = std::optional<int> {};
    auto trace = false;

    const auto short_opt = "vf:n:s:b:t";
    auto long_opt = std::array {
        option { "verbose", no_argument, 0, 'v' },
        option { "config", required_argument, 0, 'f' },
        option { "trials", required_argument, 0, 'n' },
        option { "seed", required_argument, 0, 's' },
        option { "batches", required_argument, 0, 'b' },
        option { "trace", no_argument, 0, 't' },
        option { nullptr, 0, 0, 0 },
    };
    auto verbosity = 0;
    auto opt_index = 0;
    while (true) {
        auto c = getopt_long(
            argc, argv, short_opt, long_opt.data(), &opt_index);
        if (c == -1) {
            break;
        } else if (c == 'v') {
            ++verbosity;
        } else if (c == 'f') {
            config_path = optarg;
        } else if (c == 'n') {
            trials = boost::lexical_cast<long>(optarg);
        } else if (c == 's') {
            seed = boost::lexical_cast<Seed>(optarg);
        } else if (c == 'b') {
            batches = boost::lexical_cast<int>(optarg);
        } else if (c == 't') {
            trace = true;
        } else {
            std::exit(EXIT_FAILURE);
        }
    }

    setupLogging(getLogLevel(verbosity), std::cerr);

    auto elements = Main::Config::ElementVector(argv + optind, argv + argc);
    return ShuffleVerifyApp {
        Main::configFromPath(config_path), trials, seed, batches,
        std::move(elements), trace};
}

}

int main(int argc, char* argv[])
{
    try {
        createApp(argc, argv).run();
    } catch (const std::exception& e) {
        log(Shuffle::LogLevel::FATAL, "%s failed with %s: %s", argv[0],
            boost::core::demangle(typeid(e).name()), e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
