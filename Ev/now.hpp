#ifndef EV_NOW_HPP
#define EV_NOW_HPP

namespace Ev {

/** Ev::now
 *
 * @brief returns the current time, in seconds
 * from the epoch, with sub-second resolution.
 */
double now();

}

#endif /* !defined(EV_NOW_HPP) */
