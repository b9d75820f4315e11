#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief run the given action as the main
 * greenthread on the default libev loop.
 *
 * @return the exit code the action returned,
 * or 254 if it threw, or 255 if the loop could
 * not be created.
 */
int start(Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
