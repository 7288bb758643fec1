#pragma once

#include <type_traits>
#include <utility>

#include <rsl/Expected.hpp>

// clang-format off
//
// ```cpp
//    std::expected<int, Err> GetInt();
//    std::expected<int, Err> Foo() {
//       return TRY(GetInt()) + 5;
//    }
// ```
//
// In particular:
// - Move-only types work
// - Copy-only types work
// - Result<void> types work
//
// The error is forwarded as-is, so a `Result<T, std::string>` may be TRY'd
// inside a function returning `Result<U, E>` whenever `E` is constructible
// from `std::string`.
//
#if defined(__clang__) || defined(__GNUC__)
template <typename T> auto MyMove(T&& t) {
  if constexpr (!std::is_void_v<typename std::remove_cvref_t<T>::value_type>) {
    return std::move(*t);
  }
}
#define TRY(...)                                                               \
  ({                                                                           \
    auto&& y = (__VA_ARGS__);                                                  \
    static_assert(!std::is_lvalue_reference_v<decltype(MyMove(y))>);           \
    if (!y) [[unlikely]] {                                                     \
      return RSL_UNEXPECTED(y.error());                                        \
    }                                                                          \
    MyMove(y);                                                                 \
  })
#else
#error "TRY requires statement expressions"
#endif
// clang-format on
