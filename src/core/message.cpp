// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include "lanspeed/core/message.h"

namespace lanspeed {

namespace {

void PutU16(std::vector<uint8_t>& out, const uint16_t value) {
  out.push_back(static_cast<uint8_t>(value >> 8));
  out.push_back(static_cast<uint8_t>(value));
}

void PutU32(std::vector<uint8_t>& out, const uint32_t value) {
  for (int shift = 24; shift >= 0; shift -= 8) {
    out.push_back(static_cast<uint8_t>(value >> shift));
  }
}

void PutU64(std::vector<uint8_t>& out, const uint64_t value) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    out.push_back(static_cast<uint8_t>(value >> shift));
  }
}

uint16_t GetU16(const uint8_t* p) {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

uint32_t GetU32(const uint8_t* p) {
  uint32_t value = 0;
  for (int i = 0; i < 4; i++) {
    value = (value << 8) | p[i];
  }
  return value;
}

uint64_t GetU64(const uint8_t* p) {
  uint64_t value = 0;
  for (int i = 0; i < 8; i++) {
    value = (value << 8) | p[i];
  }
  return value;
}

void PutHeader(std::vector<uint8_t>& out, const MessageType type) {
  PutU32(out, MAGIC_COOKIE);
  out.push_back(type);
}

bool HasHeader(const uint8_t* data, const size_t size, const size_t min_size,
               const MessageType type) {
  if (data == nullptr || size < min_size) {
    return false;
  }
  return GetU32(data) == MAGIC_COOKIE && data[4] == type;
}

}

std::vector<uint8_t> EncodeOffer(const uint16_t udp_port, const uint16_t tcp_port) {
  std::vector<uint8_t> out;
  out.reserve(OFFER_SIZE);
  PutHeader(out, OFFER);
  PutU16(out, udp_port);
  PutU16(out, tcp_port);
  return out;
}

std::vector<uint8_t> EncodeRequest(const uint64_t file_size) {
  std::vector<uint8_t> out;
  out.reserve(REQUEST_SIZE);
  PutHeader(out, REQUEST);
  PutU64(out, file_size);
  return out;
}

std::vector<uint8_t> EncodePayload(const uint64_t total_segments,
                                   const uint64_t current_segment,
                                   const uint8_t* data, const size_t size) {
  std::vector<uint8_t> out;
  out.reserve(PAYLOAD_HEADER_SIZE + size);
  PutHeader(out, PAYLOAD);
  PutU64(out, total_segments);
  PutU64(out, current_segment);
  if (data != nullptr && size > 0) {
    out.insert(out.end(), data, data + size);
  }
  return out;
}

std::vector<uint8_t> EncodePayload(const uint64_t total_segments,
                                   const uint64_t current_segment,
                                   const std::vector<uint8_t>& data) {
  return EncodePayload(total_segments, current_segment, data.data(), data.size());
}

std::optional<Offer> DecodeOffer(const uint8_t* data, const size_t size) {
  if (!HasHeader(data, size, OFFER_SIZE, OFFER)) {
    return std::nullopt;
  }
  return Offer{GetU16(data + 5), GetU16(data + 7)};
}

std::optional<uint64_t> DecodeRequest(const uint8_t* data, const size_t size) {
  if (!HasHeader(data, size, REQUEST_SIZE, REQUEST)) {
    return std::nullopt;
  }
  return GetU64(data + 5);
}

std::optional<Payload> DecodePayload(const uint8_t* data, const size_t size) {
  if (!HasHeader(data, size, PAYLOAD_HEADER_SIZE, PAYLOAD)) {
    return std::nullopt;
  }
  Payload payload;
  payload.total_segments = GetU64(data + 5);
  payload.current_segment = GetU64(data + 13);
  payload.data.assign(data + PAYLOAD_HEADER_SIZE, data + size);
  return payload;
}

uint64_t SegmentCount(const uint64_t file_size, const uint64_t segment_size) {
  if (segment_size == 0) {
    return 0;
  }
  return file_size / segment_size + (file_size % segment_size != 0 ? 1 : 0);
}

}
