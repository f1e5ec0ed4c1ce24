/** \file
 *
 * \brief Definition of Shuffle::Verify::InvalidTrialCountException class
 */

#ifndef VERIFY_INVALIDTRIALCOUNTEXCEPTION_HH_
#define VERIFY_INVALIDTRIALCOUNTEXCEPTION_HH_

#include <stdexcept>

namespace Shuffle {
namespace Verify {

/** \brief Exception to indicate that a verification was requested with less
 * than one trial
 */
class InvalidTrialCountException : public std::invalid_argument {
public:

    /** \brief Create new exception
     *
     * \param trials the offending number of trials
     */
    explicit InvalidTrialCountException(long trials);

    /** \brief Get the offending number of trials
     */
    long getTrials() const noexcept;

private:

    long trials;
};

/** \brief Check that the number of trials is positive
 *
 * \param trials the number of trials
 *
 * \return \p trials
 *
 * \throw InvalidTrialCountException if \p trials < 1
 */
long checkTrialCount(long trials);

}
}

#endif // VERIFY_INVALIDTRIALCOUNTEXCEPTION_HH_
