#ifndef __SPECINDEX_H__
#define __SPECINDEX_H__

#include <limits>
#include <exception>
#include <stdexcept>
#include <iostream>
#include <sstream>
#include <iomanip>

#ifdef _MSC_VER
#define DLL_EXPORT __declspec(dllexport)
#else
#define DLL_EXPORT
#endif

#define si_min(a, b) ((a) > (b) ? (b) : (a))
#define si_max(a, b) ((a) < (b) ? (b) : (a))

#define SI_LOG_TRACE 5
#define SI_LOG_DEBUG 4
#define SI_LOG_INFO 3
#define SI_LOG_WARN 2
#define SI_LOG_ERROR 1
#define SI_LOG_NONE 0

// Logging macros take a specindex::util::Logger (or anything with
// a level() and write(int, const std::string&)) as the first argument.
#define si_log(lg, x, y) { if((lg).level() >= y) { std::stringstream _ss; _ss << std::setprecision(12) << x; (lg).write(y, _ss.str()); } }
#define si_trace(lg, x) si_log(lg, x, SI_LOG_TRACE)
#define si_debug(lg, x) si_log(lg, x, SI_LOG_DEBUG)
#define si_info(lg, x)  si_log(lg, x, SI_LOG_INFO)
#define si_warn(lg, x)  si_log(lg, x, SI_LOG_WARN)
#define si_error(lg, x) si_log(lg, x, SI_LOG_ERROR)

#define si_argerr(x) {std::stringstream _ss; _ss << x; throw std::invalid_argument(_ss.str());}
#define si_runerr(x) {std::stringstream _ss; _ss << x; throw std::runtime_error(_ss.str());}
#define si_throw(T, x) {std::stringstream _ss; _ss << x; throw T(_ss.str());}

#endif
