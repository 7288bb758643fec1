#include "Log.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <fmt/color.h>
#include <mutex>

namespace rsl {
namespace logging {

static std::atomic<Level> sLevel{Level::Warn};
static std::mutex sWriteLock;

static std::string_view LevelName(Level l) {
  switch (l) {
  case Level::Error:
    return "error";
  case Level::Warn:
    return "warn";
  case Level::Info:
    return "info";
  case Level::Debug:
    return "debug";
  case Level::Trace:
    return "trace";
  }
  return "?";
}

static fmt::text_style LevelStyle(Level l) {
  switch (l) {
  case Level::Error:
    return fmt::fg(fmt::color::red) | fmt::emphasis::bold;
  case Level::Warn:
    return fmt::fg(fmt::color::gold);
  case Level::Info:
    return fmt::fg(fmt::color::light_green);
  case Level::Debug:
    return fmt::fg(fmt::color::light_blue);
  case Level::Trace:
    return fmt::fg(fmt::color::gray);
  }
  return {};
}

std::optional<Level> parseLevel(std::string_view name) {
  for (auto l : {Level::Error, Level::Warn, Level::Info, Level::Debug,
                 Level::Trace}) {
    if (name == LevelName(l))
      return l;
  }
  return std::nullopt;
}

void init() {
  const char* env = std::getenv("RSL_LOG");
  if (env == nullptr)
    return;
  if (auto level = parseLevel(env)) {
    setLevel(*level);
    return;
  }
  warn("RSL_LOG: unknown level \"{}\", keeping {}", env,
       LevelName(getLevel()));
}

void setLevel(Level level) { sLevel.store(level, std::memory_order_relaxed); }
Level getLevel() { return sLevel.load(std::memory_order_relaxed); }
bool enabled(Level level) {
  return static_cast<int>(level) <= static_cast<int>(getLevel());
}

void log(Level l, std::string_view s) {
  if (!enabled(l))
    return;
  std::lock_guard<std::mutex> guard(sWriteLock);
  fmt::print(stderr, "[{}] {}\n", fmt::styled(LevelName(l), LevelStyle(l)),
             s);
}

void debug(std::string_view s) { log(Level::Debug, s); }
void error(std::string_view s) { log(Level::Error, s); }
void info(std::string_view s) { log(Level::Info, s); }
void trace(std::string_view s) { log(Level::Trace, s); }
void warn(std::string_view s) { log(Level::Warn, s); }

} // namespace logging
} // namespace rsl
