#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/Mutex.hpp"
#include"Ev/foreach.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<stdexcept>
#include<string>
#include<vector>

int main() {
	auto mtx = Ev::Mutex();
	auto trace = std::string();
	auto inside = 0;

	/* Holds the lock across several yields.  */
	auto critical = [&](char c) {
		return mtx.run(Ev::lift().then([&, c]() {
			assert(inside == 0);
			++inside;
			trace.push_back(c);
			return Ev::yield(3);
		}).then([&, c]() {
			trace.push_back(c);
			--inside;
			return Ev::lift();
		}));
	};

	auto code = Ev::foreach(critical, std::vector<char>{'a', 'b', 'c'})
		  + Ev::lift().then([&]() {
		/* Never interleaved.  */
		assert(trace.size() == 6);
		assert(trace[0] == trace[1]);
		assert(trace[2] == trace[3]);
		assert(trace[4] == trace[5]);
		assert(!mtx.locked());

		/* A value passes through the lock.  */
		return mtx.run(Ev::lift(std::string("held")));
	}).then([&](std::string v) {
		assert(v == "held");

		/* An exception releases the lock.  */
		return mtx.run(Ev::lift().then([]() -> Ev::Io<int> {
			throw std::runtime_error("inside");
		})).catching<std::runtime_error>([](std::runtime_error const&) {
			return Ev::lift(-1);
		});
	}).then([&](int v) {
		assert(v == -1);
		assert(!mtx.locked());
		return mtx.run(Ev::lift(0));
	});

	return Ev::start(std::move(code));
}
