#ifndef TTLCACHE_LOG_HPP
#define TTLCACHE_LOG_HPP

#include <memory>
#include <spdlog/spdlog.h>

namespace ttlcache {

/** Name under which the library logger is registered with spdlog. */
constexpr const char* loggerName = "ttlcache";

/** Returns the library logger, creating a stderr logger at warn level unless the application already registered one named loggerName. */
std::shared_ptr<spdlog::logger> Logger();

/** Sets the level of the library logger. */
void SetLogLevel(spdlog::level::level_enum level);

}  // namespace ttlcache

#endif  // TTLCACHE_LOG_HPP
