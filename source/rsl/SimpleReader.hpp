#pragma once

#include <llvm/Support/Endian.h>
#include <span>
#include <stdint.h>

namespace rsl {

// On-disk little-endian fields. Safe to memcpy into; conversion happens on
// access.
using lu32 = llvm::support::ulittle32_t;

//! Unsafe API: Verify the operation before calling
template <typename T>
static void store(T obj, std::span<uint8_t> data, unsigned offset) {
  llvm::support::endian::write<T, llvm::support::little,
                               llvm::support::unaligned>(data.data() + offset,
                                                         obj);
}

} // namespace rsl
