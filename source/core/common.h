#pragma once

// Fine as its a PCH

#include <array>
#include <cstdio>
#include <cstring>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <rsl/Expect.hpp>
#include <rsl/Log.hpp>
#include <rsl/Result.hpp>
#include <rsl/Try.hpp>
#include <rsl/Types.hpp>
