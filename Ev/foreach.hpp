#ifndef EV_FOREACH_HPP
#define EV_FOREACH_HPP

#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include<memory>
#include<vector>

namespace Ev {

namespace Detail {

/* Runs a batch of actions as separate greenthreads
 * and completes once every one of them has.
 */
class ForeachRun : public std::enable_shared_from_this<ForeachRun> {
private:
	std::vector<Io<void>> actions;
	std::size_t pending;
	std::exception_ptr exc;
	std::function<void()> pass;
	std::function<void(std::exception_ptr)> fail;

	explicit
	ForeachRun(std::vector<Io<void>> actions_);

	void finish();

public:
	ForeachRun() =delete;
	ForeachRun(ForeachRun const&) =delete;

	static
	std::shared_ptr<ForeachRun> create(std::vector<Io<void>> actions);

	Io<void> run();
};

}

/** Ev::foreach
 *
 * @brief executes the given function on each
 * item of the input vector, each in its own
 * greenthread, and completes once all have.
 *
 * @desc Each item is moved into the function.
 * If one or more of the calls throw, the others
 * still run to completion, then the first
 * exception caught is rethrown.
 */
template<typename f, typename a>
Io<void> foreach(f func, std::vector<a> as) {
	auto actions = std::vector<Io<void>>();
	actions.reserve(as.size());
	for (auto& item : as) {
		auto pitem = std::make_shared<a>(std::move(item));
		/* Defer the call so a throwing func fails
		 * only its own greenthread.  */
		actions.push_back(Ev::yield().then([func, pitem]() {
			return func(std::move(*pitem));
		}));
	}
	return Detail::ForeachRun::create(std::move(actions))->run();
}

}

#endif /* !defined(EV_FOREACH_HPP) */
