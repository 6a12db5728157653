#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "model/record.hpp"
#include "model/status.hpp"

namespace dl100_bridge::codec {

// Wire layout, little-endian:
//   [0, 8)   uint64 timestamp, ms since Unix epoch
//   [8, 12)  int32  field1 (multi: distance, single: kind)
//   [12, 16) int32  field2 (multi: velocity, single: value)
// The layout is fixed. A future change has to add an explicit version tag.
inline constexpr std::size_t kFrameSize = 16;

using Frame = std::array<std::uint8_t, kFrameSize>;

// Two's-complement truncation to the low 32 bits.
std::int32_t wrap_int32(std::int64_t value) noexcept;

Frame encode(const model::Record& record) noexcept;
Frame encode(const model::SingleRecord& record) noexcept;

model::Status decode(const std::uint8_t* data, std::size_t size, model::Record& out) noexcept;
model::Status decode(const std::uint8_t* data, std::size_t size, model::SingleRecord& out) noexcept;

}  // namespace dl100_bridge::codec
