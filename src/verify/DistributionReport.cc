#include "verify/DistributionReport.hh"

#include <boost/format.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace Shuffle {
namespace Verify {

namespace {

long sumCounts(const DistributionReport::CountMap& counts)
{
    return std::accumulate(
        counts.begin(), counts.end(), 0L,
        [](const auto sum, const auto& entry)
        {
            if (entry.second < 1) {
                throw std::invalid_argument {"Invalid permutation count"};
            }
            return sum + entry.second;
        });
}

}

DistributionReport::DistributionReport() :
    DistributionReport {CountMap {}}
{
}

DistributionReport::DistributionReport(CountMap counts) :
    counts(std::move(counts)),
    trials {sumCounts(this->counts)},
    mean {},
    variance {},
    standardDeviation {},
    idealStandardDeviation {}
{
    if (this->counts.empty()) {
        return;
    }
    const auto k = static_cast<double>(this->counts.size());
    mean = trials / k;
    variance = std::accumulate(
        this->counts.begin(), this->counts.end(), 0.0,
        [mean = mean](const auto sum, const auto& entry)
        {
            const auto deviation = entry.second - mean;
            return sum + deviation * deviation;
        }) / k;
    standardDeviation = std::sqrt(variance);
    idealStandardDeviation = std::sqrt(trials * (1.0 - 1.0 / k));
}

auto DistributionReport::getCounts() const -> const CountMap&
{
    return counts;
}

long DistributionReport::getCount(const PermutationKey& key) const
{
    const auto iter = counts.find(key);
    return iter != counts.end() ? iter->second : 0;
}

double DistributionReport::getPercentage(const PermutationKey& key) const
{
    if (trials == 0) {
        return 0.0;
    }
    return 100.0 * getCount(key) / trials;
}

long DistributionReport::getTrials() const
{
    return trials;
}

std::size_t DistributionReport::getNumberOfPermutations() const
{
    return counts.size();
}

double DistributionReport::getMean() const
{
    return mean;
}

double DistributionReport::getVariance() const
{
    return variance;
}

double DistributionReport::getStandardDeviation() const
{
    return standardDeviation;
}

double DistributionReport::getIdealStandardDeviation() const
{
    return idealStandardDeviation;
}

DistributionReport mergeReports(
    const DistributionReport& report1, const DistributionReport& report2)
{
    auto counts = report1.getCounts();
    for (const auto& [key, count] : report2.getCounts()) {
        counts[key] += count;
    }
    return DistributionReport {std::move(counts)};
}

std::ostream& operator<<(std::ostream& os, const DistributionReport& report)
{
    auto key_width = std::string::size_type {11};
    for (const auto& entry : report.getCounts()) {
        key_width = std::max(key_width, formatKey(entry.first).size());
    }
    const auto row_format = (boost::format("%%-%1%s  %%10s  %%10s\n")
                             % key_width).str();
    os << boost::format(row_format) % "Permutation" % "Count" % "Percentage";
    for (const auto& [key, count] : report.getCounts()) {
        const auto percentage =
            boost::format("%.2f%%") % report.getPercentage(key);
        os << boost::format(row_format) % formatKey(key) % count %
            percentage.str();
    }
    os << boost::format("Trials: %1%\n") % report.getTrials()
       << boost::format("Mean: %.2f\n") % report.getMean()
       << boost::format("Variance: %.2f\n") % report.getVariance()
       << boost::format("Standard deviation: %.2f\n") %
          report.getStandardDeviation()
       << boost::format("Ideal standard deviation: %.2f\n") %
          report.getIdealStandardDeviation();
    return os;
}

}
}
