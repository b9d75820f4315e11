#ifndef EV_YIELD_HPP
#define EV_YIELD_HPP

#include<cstddef>

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::yield
 *
 * @brief Does nothing, but allows other Ev::Io greenthreads
 * to continue processing.
 *
 * @desc Other greenthreads may modify shared state
 * while the caller is suspended here, so anything
 * read before the yield must be re-checked after it.
 *
 * @param num_yields - How many times to yield.
 * Mostly used in tests to let concurrent tasks
 * make progress.
 */
Ev::Io<void> yield();

Ev::Io<void> yield(std::size_t num_yields);

}

#endif /* !defined(EV_YIELD_HPP) */
