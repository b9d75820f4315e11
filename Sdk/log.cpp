#include"Ev/Io.hpp"
#include"Sdk/log.hpp"
#include"Util/Str.hpp"
#include<stdarg.h>

namespace Sdk {

char const* log_level_name(LogLevel l) {
	switch (l) {
	case Trace: return "trace";
	case Debug: return "debug";
	case Info: return "info";
	case Warn: return "warn";
	case Error: return "error";
	}
	return "unknown";
}

Ev::Io<void> log(LoggerIF& logger, LogLevel l, const char *fmt, ...) {
	va_list ap;

	auto msg = std::string();

	va_start(ap, fmt);
	msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	return logger.log(l, std::move(msg));
}

}
