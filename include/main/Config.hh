/** \file
 *
 * \brief Definition of Shuffle::Main::Config class
 */

#ifndef MAIN_CONFIG_HH_
#define MAIN_CONFIG_HH_

#include "shuffle/Random.hh"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Shuffle {

/** \brief The shuffle-verify command line front end
 */
namespace Main {

/** \brief Configuration of the shuffle-verify tool
 *
 * The configuration is a Lua script. The following global variables are
 * recognized:
 *
 * - \c trials: the number of trials (integer, default 1000000)
 * - \c seed: seed of the random number generator (non-negative integer,
 *   default is to seed from the OS)
 * - \c batches: the number of parallel batches (integer, default 1)
 * - \c elements: the shuffled elements (array of strings, default
 *   <tt>{"1", "2", "3"}</tt>)
 *
 * A value of a wrong type is ignored with a warning.
 */
class Config {
public:

    /** \brief Vector of elements
     */
    using ElementVector = std::vector<std::string>;

    /** \brief Create default configs
     */
    Config();

    /** \brief Read configuration script
     *
     * The whole of \p in is read and run as a Lua script. Global variables
     * not set by the script keep their defaults.
     *
     * \throw std::runtime_error if \p in is not readable, or the script does
     * not compile or raises an error
     */
    explicit Config(std::istream& in);

    Config(Config&&);

    ~Config();

    Config& operator=(Config&&);

    /** \brief Get the number of trials
     */
    long getTrials() const;

    /** \brief Get the seed
     *
     * \return the configured seed, or nullopt if the generator should be
     * seeded from the OS
     */
    std::optional<Seed> getSeed() const;

    /** \brief Get the number of parallel batches
     */
    int getBatches() const;

    /** \brief Get the elements to shuffle
     */
    const ElementVector& getElements() const;

private:

    class Impl;
    std::unique_ptr<Impl> impl;
};

/** \brief Read configuration given on the command line
 *
 * \param path the path of the configuration script. An empty path gives the
 * default configuration, and a hyphen reads the script from stdin.
 *
 * \throw std::runtime_error if the configuration cannot be read
 */
Config configFromPath(std::string_view path);

}
}

#endif // MAIN_CONFIG_HH_
