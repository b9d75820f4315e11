#ifndef SDK_STREAMLOGGER_HPP
#define SDK_STREAMLOGGER_HPP

#include"Sdk/log.hpp"
#include<iosfwd>

namespace Sdk {

/** class Sdk::StreamLogger
 *
 * @brief writes each log message as one
 * `<level> <message>` line to a stream.
 * Messages below the minimum level are dropped.
 */
class StreamLogger : public LoggerIF {
private:
	std::ostream& os;
	LogLevel min_level;

public:
	explicit
	StreamLogger( std::ostream& os_
		    , LogLevel min_level_ = Info
		    ) : os(os_), min_level(min_level_) { }

	Ev::Io<void> log(LogLevel l, std::string msg) override;
};

}

#endif /* !defined(SDK_STREAMLOGGER_HPP) */
