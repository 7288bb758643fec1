#pragma once

#include "Expected.hpp"
#include <string>

template <typename T, typename E = std::string>
using Result = std::expected<T, E>;
