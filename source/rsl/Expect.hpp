#pragma once

#include "Expected.hpp"
#include <fmt/format.h>
#include <string>

// clang: Merged May 16 2019, Clang 9
// GCC:   Merged May 20 2021, GCC 12 (likely to release April 2022)
#ifndef __FILE_NAME__
#define __FILE_NAME__ __FILE__
#endif

// Returns an unexpected std::string from the enclosing function when `expr`
// does not hold. Optional trailing arguments are a fmt format string and its
// arguments.
#define EXPECT(expr, ...)                                                      \
  if (!(expr)) [[unlikely]] {                                                  \
    return RSL_UNEXPECTED(                                                     \
        fmt::format("[{}:{}] {} [Internal: {}]", __FILE_NAME__, __LINE__,      \
                    rsl::detail::ExpectMessage(__VA_ARGS__), #expr));          \
  }

namespace rsl::detail {

inline std::string ExpectMessage() { return {}; }
template <typename... T>
inline std::string ExpectMessage(fmt::format_string<T...> s, T&&... args) {
  return fmt::format(s, std::forward<T>(args)...);
}

} // namespace rsl::detail
