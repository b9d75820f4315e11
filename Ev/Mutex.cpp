#include"Ev/Io.hpp"
#include"Ev/Mutex.hpp"
#include"Ev/yield.hpp"
#include<functional>
#include<queue>
#include<utility>

namespace Ev {

class Mutex::Impl {
private:
	bool held;

	struct Waiter {
		Ev::Io<void> action;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;
	};
	std::queue<Waiter> waiters;

	void release() {
		if (waiters.empty()) {
			held = false;
			return;
		}
		/* Hand the lock directly to the next waiter.  */
		auto next = std::move(waiters.front());
		waiters.pop();
		enter( std::move(next.action)
		     , std::move(next.pass)
		     , std::move(next.fail)
		     );
	}
	void enter( Ev::Io<void> action
		  , std::function<void()> pass
		  , std::function<void(std::exception_ptr)> fail
		  ) {
		auto ppass = std::make_shared<std::function<void()>>(std::move(pass));
		auto pfail = std::make_shared<std::function<void(std::exception_ptr)>>(std::move(fail));
		action.run([ppass, this]() {
			release();
			(*ppass)();
		}, [pfail, this](std::exception_ptr e) {
			release();
			(*pfail)(e);
		});
	}

public:
	Impl() : held(false) { }

	bool locked() const { return held; }

	Ev::Io<void> run(Ev::Io<void> action_) {
		auto action = std::make_shared<Ev::Io<void>>(std::move(action_));
		return Ev::Io<void>([ this, action
				    ]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)> fail
				     ) {
			if (!held) {
				held = true;
				enter( *action
				     , std::move(pass)
				     , std::move(fail)
				     );
			} else {
				waiters.push(Waiter{ *action
						   , std::move(pass)
						   , std::move(fail)
						   });
			}
		}) + Ev::yield();
	}
};

Mutex::Mutex() : pimpl(Util::make_unique<Impl>()) { }
Mutex::Mutex(Mutex&&) =default;
Mutex::~Mutex() =default;

bool Mutex::locked() const {
	return pimpl->locked();
}

Ev::Io<void> Mutex::core_run(Ev::Io<void> action) {
	return pimpl->run(Ev::yield() + std::move(action));
}

}
