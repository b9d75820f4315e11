#include"Ev/Io.hpp"
#include"Sdk/StreamLogger.hpp"
#include<ostream>

namespace Sdk {

Ev::Io<void> StreamLogger::log(LogLevel l, std::string msg) {
	return Ev::lift().then([this, l, msg]() {
		if (l < min_level)
			return Ev::lift();
		os << log_level_name(l) << " " << msg << std::endl;
		return Ev::lift();
	});
}

}
