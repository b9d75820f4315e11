#ifndef UTIL_BACKTRACE_EXCEPTION_HPP
#define UTIL_BACKTRACE_EXCEPTION_HPP

#include<utility>

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief base wrapper for every exception this
 * library throws.
 *
 * @desc Catch sites that want any library error
 * can catch the wrapped standard exception type,
 * e.g. `std::runtime_error`.
 */
template<typename T>
class BacktraceException : public T {
public:
	template<typename... Args>
	BacktraceException(Args&&... args)
		: T(std::forward<Args>(args)...) { }

	const char* what() const noexcept override {
		return T::what();
	}
};

}

#endif /* !defined(UTIL_BACKTRACE_EXCEPTION_HPP) */
