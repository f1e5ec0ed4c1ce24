/** \file
 *
 * \brief Definition of Shuffle::StepwiseShuffle class
 */

#ifndef STEPWISESHUFFLE_HH_
#define STEPWISESHUFFLE_HH_

#include "shuffle/DeepCopy.hh"
#include "shuffle/FisherYates.hh"
#include "shuffle/IndexSource.hh"
#include "shuffle/ShuffleStep.hh"
#include "Utility.hh"

#include <boost/core/noncopyable.hpp>
#include <boost/coroutine2/all.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace Shuffle {

/** \brief Shuffle that yields control between its steps
 *
 * StepwiseShuffle runs the Fisher‐Yates shuffle inside a Boost.Coroutine2
 * coroutine (https://www.boost.org/doc/libs/release/libs/coroutine2/). Each
 * call to advance() resumes the coroutine until the next index has been
 * drawn, which lets a visualization pace the shuffle without the algorithm
 * knowing about it. The indices are drawn in the same order and with the same
 * bounds as in ShuffleEngine::shuffle(), so both produce the same permutation
 * from equivalent index sources.
 *
 * The coroutine refers to the object, so StepwiseShuffle objects can be
 * neither copied nor moved.
 *
 * \tparam T the element type of the shuffled sequence
 */
template<typename T>
class StepwiseShuffle : private boost::noncopyable {
public:

    /** \brief The sequence type
     */
    using Sequence = std::vector<T>;

    /** \brief The step type
     */
    using Step = ShuffleStep<T>;

    /** \brief Create new stepwise shuffle
     *
     * No index is drawn before the first call to advance().
     *
     * \param input the sequence to shuffle. It is deep copied and never
     * modified.
     * \param indexSource the index source
     *
     * \throw std::invalid_argument if \p indexSource is null
     */
    StepwiseShuffle(
        const Sequence& input, std::shared_ptr<IndexSource> indexSource);

    /** \brief Perform the next step
     *
     * The swap announced by the previous step is performed, and the next
     * index is drawn.
     *
     * \return true if a new step was drawn, false if the shuffle is completed
     *
     * \throw Any exception thrown by the index source. The shuffle is then
     * considered completed, but getResult() still throws.
     */
    bool advance();

    /** \brief Get the step drawn by the last call to advance()
     *
     * \throw std::logic_error if the last call to advance() did not draw a
     * step
     */
    const Step& getStep() const;

    /** \brief Determine if the shuffle is completed
     */
    bool isCompleted() const;

    /** \brief Get the shuffled sequence
     *
     * \throw std::logic_error if the shuffle is not completed
     */
    const Sequence& getResult() const;

private:

    using Coroutine = boost::coroutines2::coroutine<Step>;

    void run(typename Coroutine::push_type& sink);

    std::shared_ptr<IndexSource> indexSource;
    Sequence sequence;
    std::optional<typename Coroutine::pull_type> coroutine;
    std::optional<Step> step;
    bool completed;
    bool failed;
};

template<typename T>
StepwiseShuffle<T>::StepwiseShuffle(
    const Sequence& input, std::shared_ptr<IndexSource> indexSource) :
    indexSource {std::move(indexSource)},
    sequence(deepCopy(input)),
    completed {false},
    failed {false}
{
    dereference(this->indexSource);
}

template<typename T>
bool StepwiseShuffle<T>::advance()
{
    if (completed) {
        return false;
    }
    step.reset();
    try {
        if (coroutine) {
            (*coroutine)();
        } else {
            coroutine.emplace(
                [this](auto& sink)
                {
                    run(sink);
                });
        }
    } catch (...) {
        completed = true;
        failed = true;
        throw;
    }
    if (*coroutine) {
        step = coroutine->get();
        return true;
    }
    completed = true;
    return false;
}

template<typename T>
auto StepwiseShuffle<T>::getStep() const -> const Step&
{
    if (!step) {
        throw std::logic_error {"No shuffle step available"};
    }
    return *step;
}

template<typename T>
bool StepwiseShuffle<T>::isCompleted() const
{
    return completed;
}

template<typename T>
auto StepwiseShuffle<T>::getResult() const -> const Sequence&
{
    if (!completed || failed) {
        throw std::logic_error {"Shuffle not completed"};
    }
    return sequence;
}

template<typename T>
void StepwiseShuffle<T>::run(typename Coroutine::push_type& sink)
{
    shuffleInPlace(
        sequence, *indexSource,
        [&sink](const auto i, const auto j, const auto& state)
        {
            sink(Step {i, j, state});
        });
}

}

#endif // STEPWISESHUFFLE_HH_
