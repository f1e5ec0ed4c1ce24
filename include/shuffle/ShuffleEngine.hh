/** \file
 *
 * \brief Definition of Shuffle::ShuffleEngine class
 */

#ifndef SHUFFLEENGINE_HH_
#define SHUFFLEENGINE_HH_

#include "shuffle/DeepCopy.hh"
#include "shuffle/FisherYates.hh"
#include "shuffle/IndexSource.hh"
#include "shuffle/ShuffleStep.hh"
#include "shuffle/StepwiseShuffle.hh"
#include "Logging.hh"
#include "Observer.hh"
#include "Utility.hh"

#include <memory>
#include <utility>
#include <vector>

namespace Shuffle {

/** \brief Unbiased shuffle of sequences
 *
 * ShuffleEngine produces uniformly random permutations of sequences using
 * the Fisher‐Yates algorithm (see shuffleInPlace()) and the injected
 * IndexSource. The input sequence is deep copied (see DeepCopy) and never
 * modified.
 *
 * Observers subscribed to the engine are notified synchronously of each
 * step, before the elements are swapped. The state of the sequence is only
 * copied into the step when at least one live observer is subscribed.
 *
 * ShuffleEngine is a function object and can be passed directly as the
 * shuffle function of the distribution verifier.
 *
 * \tparam T the element type of the shuffled sequences
 */
template<typename T>
class ShuffleEngine : protected Observable<ShuffleStep<T>> {
public:

    /** \brief The sequence type
     */
    using Sequence = std::vector<T>;

    /** \brief The step type
     */
    using Step = ShuffleStep<T>;

    /** \brief Create new shuffle engine
     *
     * \param indexSource the index source the engine draws from
     *
     * \throw std::invalid_argument if \p indexSource is null
     */
    explicit ShuffleEngine(std::shared_ptr<IndexSource> indexSource);

    using Observable<ShuffleStep<T>>::subscribe;

    /** \brief Shuffle sequence
     *
     * \param input the sequence to shuffle
     *
     * \return a uniformly random permutation of a deep copy of \p input
     *
     * \throw Any exception thrown by the index source
     */
    Sequence shuffle(const Sequence& input);

    /** \brief Shuffle sequence
     *
     * \sa shuffle()
     */
    Sequence operator()(const Sequence& input);

    /** \brief Create stepwise shuffle drawing from the index source of this
     * engine
     *
     * Observers of the engine are not notified of the steps of the stepwise
     * shuffle.
     *
     * \param input the sequence to shuffle
     *
     * \return StepwiseShuffle object shuffling a deep copy of \p input
     */
    StepwiseShuffle<T> stepwise(const Sequence& input) const;

private:

    std::shared_ptr<IndexSource> indexSource;
};

template<typename T>
ShuffleEngine<T>::ShuffleEngine(std::shared_ptr<IndexSource> indexSource) :
    indexSource {std::move(indexSource)}
{
    dereference(this->indexSource);
}

template<typename T>
auto ShuffleEngine<T>::shuffle(const Sequence& input) -> Sequence
{
    auto sequence = deepCopy(input);
    const auto notify = this->hasObservers();
    shuffleInPlace(
        sequence, *indexSource,
        [this, notify](const auto i, const auto j, const auto& state)
        {
            log(LogLevel::DEBUG, "Shuffle step: position %d, chosen %d",
                i, j);
            if (notify) {
                this->notifyAll(Step {i, j, state});
            }
        });
    return sequence;
}

template<typename T>
auto ShuffleEngine<T>::operator()(const Sequence& input) -> Sequence
{
    return shuffle(input);
}

template<typename T>
StepwiseShuffle<T> ShuffleEngine<T>::stepwise(const Sequence& input) const
{
    return StepwiseShuffle<T>(input, indexSource);
}

}

#endif // SHUFFLEENGINE_HH_
