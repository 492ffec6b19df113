#ifndef PMPP_LOG_HEADER
#define PMPP_LOG_HEADER

#include <atomic>
#include <iostream>
#include <sstream>

namespace pmp {
namespace log {

enum class level
{
    error = 0,
    warning = 1,
    info = 2,
    debug = 3,
    trace = 4,
};

namespace detail {
inline std::atomic<level> current_level{level::error};
} // detail

inline void set_level(level l) noexcept
{
    detail::current_level.store(l, std::memory_order_relaxed);
}

inline level get_level() noexcept
{
    return detail::current_level.load(std::memory_order_relaxed);
}

inline bool should_log(level l) noexcept
{
    return static_cast<int>(l) <= static_cast<int>(get_level());
}

inline const char* level_name(level l) noexcept
{
    switch(l) {
    case level::error: return "ERROR";
    case level::warning: return "WARNING";
    case level::info: return "INFO";
    case level::debug: return "DEBUG";
    case level::trace: return "TRACE";
    }
    return "UNKNOWN";
}

} // log
} // pmp

// The whole line is formatted first so that concurrent writers don't
// interleave within a message.
#define PMPP_LOG(lvl, message)                                               \
    do {                                                                     \
        if(pmp::log::should_log(pmp::log::level::lvl)) {                     \
            std::ostringstream pmpp_log_oss_;                                \
            pmpp_log_oss_ << "[natpmp] [" << pmp::log::level_name(           \
                    pmp::log::level::lvl) << "] " << __func__ << ": "        \
                << message << '\n';                                          \
            std::clog << pmpp_log_oss_.str();                                \
        }                                                                    \
    } while(0)

#define PMPP_LOG_ERROR(message) PMPP_LOG(error, message)
#define PMPP_LOG_WARNING(message) PMPP_LOG(warning, message)
#define PMPP_LOG_INFO(message) PMPP_LOG(info, message)
#define PMPP_LOG_DEBUG(message) PMPP_LOG(debug, message)
#define PMPP_LOG_TRACE(message) PMPP_LOG(trace, message)

#endif // PMPP_LOG_HEADER
