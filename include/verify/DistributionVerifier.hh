/** \file
 *
 * \brief Definition of Shuffle::Verify::DistributionVerifier and the verify
 * functions
 */

#ifndef VERIFY_DISTRIBUTIONVERIFIER_HH_
#define VERIFY_DISTRIBUTIONVERIFIER_HH_

#include "verify/DistributionReport.hh"
#include "verify/InvalidTrialCountException.hh"
#include "verify/PermutationKey.hh"
#include "Logging.hh"
#include "Thread.hh"
#include "Utility.hh"

#include <exception>
#include <functional>
#include <stdexcept>
#include <stop_token>
#include <utility>
#include <vector>

namespace Shuffle {
namespace Verify {

/** \brief Tally of shuffle outcomes
 *
 * DistributionVerifier counts the permutations recorded to it. A report can
 * be taken at any point and is valid for the trials recorded so far.
 */
class DistributionVerifier {
public:

    /** \brief Record the outcome of one trial
     *
     * \param sequence the shuffled sequence
     */
    template<typename T>
    void record(const std::vector<T>& sequence);

    /** \brief Record the outcome of one trial by its key
     *
     * \param key the canonical key of the shuffled sequence
     */
    void recordKey(PermutationKey key);

    /** \brief Get the number of trials recorded
     */
    long getTrialsCompleted() const;

    /** \brief Create report of the trials recorded so far
     */
    DistributionReport getReport() const;

private:

    DistributionReport::CountMap counts;
    long trialsCompleted {};
};

template<typename T>
void DistributionVerifier::record(const std::vector<T>& sequence)
{
    recordKey(canonicalKey(sequence));
}

/// \cond DOXYGEN_IGNORE

namespace Impl {

template<typename T, typename ShuffleFunction>
void runTrials(
    DistributionVerifier& verifier, const std::vector<T>& baseInput,
    const long trials, ShuffleFunction& shuffleFn,
    const std::stop_token& stopToken)
{
    for ([[maybe_unused]] const auto trial : to(trials)) {
        if (stopToken.stop_requested()) {
            return;
        }
        verifier.record(std::invoke(shuffleFn, std::as_const(baseInput)));
    }
}

}

/// \endcond

/** \brief Verify the distribution of a shuffle
 *
 * Call \p shuffleFn with \p baseInput \p trials times and tabulate the
 * resulting permutations. Before each trial \p stopToken is examined, and
 * if stop has been requested, the trials completed so far are reported.
 *
 * \param baseInput the sequence to shuffle
 * \param trials the number of trials
 * \param shuffleFn the shuffle function. It is called with a const reference
 * to \p baseInput and must return the shuffled sequence as std::vector.
 * \param stopToken token for stopping the verification early
 *
 * \return report of the completed trials
 *
 * \throw InvalidTrialCountException if \p trials < 1
 * \throw Any exception thrown by \p shuffleFn
 */
template<typename T, typename ShuffleFunction>
DistributionReport verify(
    const std::vector<T>& baseInput, const long trials,
    ShuffleFunction&& shuffleFn, const std::stop_token& stopToken)
{
    checkTrialCount(trials);
    log(LogLevel::INFO, "Verifying distribution of %d elements over %d trials",
        baseInput.size(), trials);
    auto verifier = DistributionVerifier {};
    Impl::runTrials(verifier, baseInput, trials, shuffleFn, stopToken);
    if (verifier.getTrialsCompleted() < trials) {
        log(LogLevel::INFO, "Verification stopped after %d trials",
            verifier.getTrialsCompleted());
    }
    auto report = verifier.getReport();
    log(LogLevel::INFO,
        "Verification completed: %d permutations, standard deviation %f, "
        "ideal %f", report.getNumberOfPermutations(),
        report.getStandardDeviation(), report.getIdealStandardDeviation());
    return report;
}

/** \brief Verify the distribution of a shuffle
 *
 * Runs all \p trials without possibility to stop early.
 *
 * \sa verify(const std::vector<T>&, long, ShuffleFunction&&, const std::stop_token&)
 */
template<typename T, typename ShuffleFunction>
DistributionReport verify(
    const std::vector<T>& baseInput, const long trials,
    ShuffleFunction&& shuffleFn)
{
    return verify(
        baseInput, trials, std::forward<ShuffleFunction>(shuffleFn),
        std::stop_token {});
}

/** \brief Verify the distribution of a shuffle in parallel batches
 *
 * The trials are divided as evenly as possible into \p batches batches, each
 * run in its own thread. Each batch calls \p makeShuffleFn with the index of
 * the batch, in the calling thread, to create the shuffle function it
 * uses. Shuffle functions must not share mutable state, e.g. an index source,
 * with each other. Batches that would get no trials are not started.
 *
 * The reports of the batches are merged after all threads have finished.
 *
 * \param baseInput the sequence to shuffle
 * \param trials the total number of trials
 * \param batches the number of batches
 * \param makeShuffleFn factory accepting a batch index and returning a
 * shuffle function for that batch
 *
 * \return report of all trials
 *
 * \throw InvalidTrialCountException if \p trials < 1
 * \throw std::invalid_argument if \p batches < 1
 * \throw The first exception thrown by a shuffle function, after all threads
 * have finished
 */
template<typename T, typename ShuffleFunctionFactory>
DistributionReport verifyInBatches(
    const std::vector<T>& baseInput, const long trials, const int batches,
    ShuffleFunctionFactory&& makeShuffleFn)
{
    checkTrialCount(trials);
    if (batches < 1) {
        throw std::invalid_argument {"Invalid batch count"};
    }
    log(LogLevel::INFO,
        "Verifying distribution of %d elements over %d trials in %d batches",
        baseInput.size(), trials, batches);

    auto verifiers = std::vector<DistributionVerifier>(batches);
    auto threads = std::vector<Thread> {};
    threads.reserve(batches);
    for (const auto batch : to(batches)) {
        const auto batch_trials =
            trials / batches + (batch < trials % batches ? 1 : 0);
        if (batch_trials == 0) {
            continue;
        }
        log(LogLevel::DEBUG, "Starting batch %d with %d trials",
            batch, batch_trials);
        threads.emplace_back(
            [&baseInput, &verifier = verifiers[batch], batch_trials,
             shuffleFn = makeShuffleFn(batch)]() mutable
            {
                Impl::runTrials(
                    verifier, baseInput, batch_trials, shuffleFn,
                    std::stop_token {});
            });
    }

    auto error = std::exception_ptr {};
    for (auto& thread : threads) {
        try {
            thread.join();
        } catch (...) {
            if (!error) {
                error = std::current_exception();
            }
        }
    }
    if (error) {
        log(LogLevel::ERROR, "Verification batch failed");
        std::rethrow_exception(error);
    }

    auto report = DistributionReport {};
    for (const auto& verifier : verifiers) {
        report = mergeReports(report, verifier.getReport());
    }
    log(LogLevel::INFO,
        "Verification completed: %d permutations, standard deviation %f, "
        "ideal %f", report.getNumberOfPermutations(),
        report.getStandardDeviation(), report.getIdealStandardDeviation());
    return report;
}

}
}

#endif // VERIFY_DISTRIBUTIONVERIFIER_HH_
