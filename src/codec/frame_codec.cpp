#include "codec/frame_codec.hpp"

namespace dl100_bridge::codec {
namespace {

void put_u64(Frame& frame, const std::size_t offset, const std::uint64_t value) noexcept {
  for (std::size_t i = 0; i < 8; ++i) {
    frame[offset + i] = static_cast<std::uint8_t>((value >> (8U * i)) & 0xFFU);
  }
}

void put_i32(Frame& frame, const std::size_t offset, const std::int32_t value) noexcept {
  const auto bits = static_cast<std::uint32_t>(value);
  for (std::size_t i = 0; i < 4; ++i) {
    frame[offset + i] = static_cast<std::uint8_t>((bits >> (8U * i)) & 0xFFU);
  }
}

std::uint64_t get_u64(const std::uint8_t* data, const std::size_t offset) noexcept {
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < 8; ++i) {
    value |= static_cast<std::uint64_t>(data[offset + i]) << (8U * i);
  }
  return value;
}

std::int32_t get_i32(const std::uint8_t* data, const std::size_t offset) noexcept {
  std::uint32_t bits = 0;
  for (std::size_t i = 0; i < 4; ++i) {
    bits |= static_cast<std::uint32_t>(data[offset + i]) << (8U * i);
  }
  return static_cast<std::int32_t>(bits);
}

Frame encode_fields(const std::uint64_t ts_ms, const std::int32_t field1, const std::int32_t field2) noexcept {
  Frame frame{};
  put_u64(frame, 0, ts_ms);
  put_i32(frame, 8, field1);
  put_i32(frame, 12, field2);
  return frame;
}

bool valid_input(const std::uint8_t* data, const std::size_t size) noexcept {
  return data != nullptr && size == kFrameSize;
}

}  // namespace

std::int32_t wrap_int32(const std::int64_t value) noexcept {
  return static_cast<std::int32_t>(static_cast<std::uint32_t>(static_cast<std::uint64_t>(value) & 0xFFFFFFFFULL));
}

Frame encode(const model::Record& record) noexcept {
  return encode_fields(record.ts_ms, record.distance, record.velocity);
}

Frame encode(const model::SingleRecord& record) noexcept {
  return encode_fields(record.ts_ms, record.kind, record.value);
}

model::Status decode(const std::uint8_t* data, const std::size_t size, model::Record& out) noexcept {
  if (!valid_input(data, size)) {
    return model::Status::MALFORMED_FRAME;
  }
  out.ts_ms = get_u64(data, 0);
  out.distance = get_i32(data, 8);
  out.velocity = get_i32(data, 12);
  return model::Status::OK;
}

model::Status decode(const std::uint8_t* data, const std::size_t size, model::SingleRecord& out) noexcept {
  if (!valid_input(data, size)) {
    return model::Status::MALFORMED_FRAME;
  }
  out.ts_ms = get_u64(data, 0);
  out.kind = get_i32(data, 8);
  out.value = get_i32(data, 12);
  return model::Status::OK;
}

}  // namespace dl100_bridge::codec
