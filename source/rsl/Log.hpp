#pragma once

#include <fmt/format.h>
#include <optional>
#include <string_view>

namespace rsl {

namespace logging {

enum class Level {
  Error,
  Warn,
  Info,
  Debug,
  Trace,
};

//! Read the `RSL_LOG` environment variable (error|warn|info|debug|trace) and
//! apply it as the active level. Safe to call more than once.
void init();

void setLevel(Level level);
Level getLevel();
bool enabled(Level level);

std::optional<Level> parseLevel(std::string_view name);

void debug(std::string_view s);
void error(std::string_view s);
void info(std::string_view s);
void log(Level level, std::string_view s);
void trace(std::string_view s);
void warn(std::string_view s);

template <typename... T>
inline void debug(fmt::format_string<T...> s, T&&... args) {
  if (!enabled(Level::Debug))
    return;
  auto buf = fmt::format(s, std::forward<T>(args)...);
  debug(std::string_view(buf));
}
template <typename... T>
inline void error(fmt::format_string<T...> s, T&&... args) {
  auto buf = fmt::format(s, std::forward<T>(args)...);
  error(std::string_view(buf));
}
template <typename... T>
inline void info(fmt::format_string<T...> s, T&&... args) {
  if (!enabled(Level::Info))
    return;
  auto buf = fmt::format(s, std::forward<T>(args)...);
  info(std::string_view(buf));
}
template <typename... T>
inline void log(Level level, fmt::format_string<T...> s, T&&... args) {
  if (!enabled(level))
    return;
  auto buf = fmt::format(s, std::forward<T>(args)...);
  log(level, std::string_view(buf));
}
template <typename... T>
inline void trace(fmt::format_string<T...> s, T&&... args) {
  if (!enabled(Level::Trace))
    return;
  auto buf = fmt::format(s, std::forward<T>(args)...);
  trace(std::string_view(buf));
}
template <typename... T>
inline void warn(fmt::format_string<T...> s, T&&... args) {
  if (!enabled(Level::Warn))
    return;
  auto buf = fmt::format(s, std::forward<T>(args)...);
  warn(std::string_view(buf));
}

} // namespace logging

using namespace logging;

} // namespace rsl
