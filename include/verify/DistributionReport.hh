/** \file
 *
 * \brief Definition of Shuffle::Verify::DistributionReport class
 */

#ifndef VERIFY_DISTRIBUTIONREPORT_HH_
#define VERIFY_DISTRIBUTIONREPORT_HH_

#include "verify/PermutationKey.hh"

#include <cstddef>
#include <iosfwd>
#include <map>

namespace Shuffle {
namespace Verify {

/** \brief Distribution of the permutations produced by a shuffle
 *
 * A report maps the canonical key of each observed permutation to the
 * number of trials that produced it. The statistics are computed over the
 * counts of the observed keys when the report is created. Keys that were
 * never observed do not take part in the statistics.
 *
 * A report is immutable. A report without any trials has no keys and all
 * statistics zero.
 */
class DistributionReport {
public:

    /** \brief Mapping from permutation key to the number of occurrences
     */
    using CountMap = std::map<PermutationKey, long>;

    /** \brief Create empty report
     */
    DistributionReport();

    /** \brief Create report from counts
     *
     * \param counts mapping from permutation keys to their counts
     *
     * \throw std::invalid_argument if any count is less than one
     */
    explicit DistributionReport(CountMap counts);

    /** \brief Get the counts of the observed permutations
     */
    const CountMap& getCounts() const;

    /** \brief Get the number of occurrences of a permutation
     *
     * \param key the permutation key
     *
     * \return the count of \p key, or zero if \p key was not observed
     */
    long getCount(const PermutationKey& key) const;

    /** \brief Get the share of a permutation
     *
     * \param key the permutation key
     *
     * \return the share of the trials that produced \p key in percent
     */
    double getPercentage(const PermutationKey& key) const;

    /** \brief Get the total number of trials
     */
    long getTrials() const;

    /** \brief Get the number of distinct permutations observed
     */
    std::size_t getNumberOfPermutations() const;

    /** \brief Get the mean count per observed permutation
     */
    double getMean() const;

    /** \brief Get the population variance of the counts
     */
    double getVariance() const;

    /** \brief Get the standard deviation of the counts
     */
    double getStandardDeviation() const;

    /** \brief Get the ideal standard deviation of the counts
     *
     * The reference deviation of a uniform multinomial distribution over the
     * k observed permutations, sqrt(trials * (1 - 1/k)). It is zero for an
     * empty report and when a single permutation was observed.
     */
    double getIdealStandardDeviation() const;

private:

    CountMap counts;
    long trials;
    double mean;
    double variance;
    double standardDeviation;
    double idealStandardDeviation;
};

/** \brief Merge two reports
 *
 * The counts are added key by key, and the statistics are computed over
 * the merged counts. Reports of independent batches of trials over the same
 * input can be merged into the report of the combined trials.
 *
 * \param report1 the first report
 * \param report2 the second report
 *
 * \return report whose counts are the sum of the counts in \p report1 and \p
 * report2
 */
DistributionReport mergeReports(
    const DistributionReport& report1, const DistributionReport& report2);

/** \brief Output a DistributionReport to stream
 *
 * Outputs a table with permutation, count and percentage columns, one row
 * per observed permutation, followed by the statistics of the report.
 *
 * \param os the output stream
 * \param report the report to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const DistributionReport& report);

}
}

#endif // VERIFY_DISTRIBUTIONREPORT_HH_
