#ifndef SDK_LOG_HPP
#define SDK_LOG_HPP

#include<string>

namespace Ev { template<typename a> class Io; }

namespace Sdk {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

/* Lowercase name of the level, e.g. "warn".  */
char const* log_level_name(LogLevel l);

/** class Sdk::LoggerIF
 *
 * @brief abstract sink for log messages.
 */
class LoggerIF {
public:
	virtual ~LoggerIF() { }

	virtual
	Ev::Io<void> log(LogLevel l, std::string msg) =0;
};

Ev::Io<void> log(LoggerIF& logger, LogLevel l, const char *fmt, ...)
#if defined(__GNUC__)
	__attribute__ ((format (printf, 3, 4)))
#endif
;

}

#endif /* SDK_LOG_HPP */
