#pragma once

#include <core/common.h>

namespace libcpk::lzo {

//! Decompress a raw LZO1X stream (no container header) into `dst`.
//!
//! The stream must end with the LZO end-of-stream marker and fill `dst`
//! exactly. Every read and copy is bounds-checked, so corrupt input yields an
//! error rather than touching memory outside either buffer.
[[nodiscard]] Result<void> decompress(std::span<u8> dst,
                                      std::span<const u8> src);

//! Convenience form that allocates an `expanded_size` buffer.
[[nodiscard]] Result<std::vector<u8>> decompress(std::span<const u8> src,
                                                 u32 expanded_size);

} // namespace libcpk::lzo
