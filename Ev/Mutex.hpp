#ifndef EV_MUTEX_HPP
#define EV_MUTEX_HPP

#include"Ev/Io.hpp"
#include"Util/make_unique.hpp"
#include<memory>
#include<utility>

namespace Ev {

namespace Detail {

template<typename a>
struct MutexRunHelper {
	template<typename f>
	static
	Ev::Io<a> run(Ev::Io<a> action, f core_run) {
		/* Park the result while the lock is released.  */
		auto ppresult = std::make_shared<std::unique_ptr<a>>();
		auto void_action = action.then([ppresult](a rv) {
			*ppresult = Util::make_unique<a>(std::move(rv));
			return Ev::lift();
		});
		return core_run(std::move(void_action)).then([ppresult]() {
			return Ev::lift(std::move(**ppresult));
		});
	}
};

template<>
struct MutexRunHelper<void> {
	template<typename f>
	static
	Ev::Io<void> run(Ev::Io<void> action, f core_run) {
		return core_run(std::move(action));
	}
};

}

/** class Ev::Mutex
 *
 * @brief exclusive lock for greenthreads.
 *
 * @desc At most one action passed to `run` executes
 * at a time; the others wait in FIFO order.
 * The lock is released when the action completes,
 * whether it returns a value or throws, so an
 * exception never leaves the mutex held.
 *
 * Other greenthreads not using this mutex still run
 * while the action is suspended.
 */
class Mutex {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	Ev::Io<void> core_run(Ev::Io<void> action);

public:
	Mutex();
	Mutex(Mutex const&) =delete;
	Mutex(Mutex&&);
	~Mutex();

	/* Whether some action currently holds the lock.  */
	bool locked() const;

	template<typename a>
	Ev::Io<a> run(Ev::Io<a> action) {
		return Detail::MutexRunHelper<a>::run(std::move(action), [this](Ev::Io<void> action) {
			return core_run(std::move(action));
		});
	}
};

}

#endif /* !defined(EV_MUTEX_HPP) */
