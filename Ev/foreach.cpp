#include"Ev/foreach.hpp"

namespace Ev { namespace Detail {

ForeachRun::ForeachRun(std::vector<Io<void>> actions_)
	: actions(std::move(actions_))
	, pending(0)
	, exc(nullptr)
	{ }

std::shared_ptr<ForeachRun>
ForeachRun::create(std::vector<Io<void>> actions) {
	/* Cannot use std::make_shared, constructor is private.  */
	return std::shared_ptr<ForeachRun>(new ForeachRun(std::move(actions)));
}

void ForeachRun::finish() {
	--pending;
	if (pending != 0)
		return;
	auto my_pass = std::move(pass);
	auto my_fail = std::move(fail);
	if (exc)
		my_fail(exc);
	else
		my_pass();
}

Io<void> ForeachRun::run() {
	auto self = shared_from_this();
	return Io<void>([self]( std::function<void()> pass
			      , std::function<void(std::exception_ptr)> fail
			      ) {
		if (self->actions.empty())
			return pass();
		self->pass = std::move(pass);
		self->fail = std::move(fail);
		self->pending = self->actions.size();

		auto my_actions = std::move(self->actions);
		for (auto& action : my_actions) {
			action.run([self]() {
				self->finish();
			}, [self](std::exception_ptr e) {
				if (!self->exc)
					self->exc = e;
				self->finish();
			});
		}
	});
}

}}
