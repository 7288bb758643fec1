#pragma once

// libstdc++ ships <expected> from GCC 12 onward (C++23 mode).
#if __has_include(<expected>)
#include <expected>
#endif

#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202202L
#error "Unsupported compiler version: must support std::expected"
#endif

#define RSL_UNEXPECTED std::unexpected
