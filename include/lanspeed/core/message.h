// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_CORE_MESSAGE_H_
#define LANSPEED_CORE_MESSAGE_H_

#include <cstdint>
#include <cstddef>
#include <optional>
#include <vector>

namespace lanspeed {

const uint32_t MAGIC_COOKIE = 0xABCDDCBA;

enum MessageType : uint8_t {
  OFFER = 0x02,
  REQUEST = 0x03,
  PAYLOAD = 0x04
};

// All fields are big-endian on the wire.
// [ magic(4) | type(1) | udp_port(2) | tcp_port(2) ]
const size_t OFFER_SIZE = 4 + 1 + 2 + 2;
// [ magic(4) | type(1) | file_size(8) ]
const size_t REQUEST_SIZE = 4 + 1 + 8;
// [ magic(4) | type(1) | total_segments(8) | current_segment(8) | payload... ]
const size_t PAYLOAD_HEADER_SIZE = 4 + 1 + 8 + 8;

struct Offer {
  uint16_t udp_port;
  uint16_t tcp_port;
};

struct Payload {
  uint64_t total_segments;
  uint64_t current_segment;  // 1-based
  std::vector<uint8_t> data;
};

std::vector<uint8_t> EncodeOffer(const uint16_t udp_port, const uint16_t tcp_port);

std::vector<uint8_t> EncodeRequest(const uint64_t file_size);

std::vector<uint8_t> EncodePayload(const uint64_t total_segments,
                                   const uint64_t current_segment,
                                   const uint8_t* data, const size_t size);

std::vector<uint8_t> EncodePayload(const uint64_t total_segments,
                                   const uint64_t current_segment,
                                   const std::vector<uint8_t>& data);

// Decoders never throw. An empty optional means "not a message of this kind":
// too short, wrong magic cookie or wrong type tag.
std::optional<Offer> DecodeOffer(const uint8_t* data, const size_t size);

std::optional<uint64_t> DecodeRequest(const uint8_t* data, const size_t size);

std::optional<Payload> DecodePayload(const uint8_t* data, const size_t size);

inline std::optional<Offer> DecodeOffer(const std::vector<uint8_t>& data) {
  return DecodeOffer(data.data(), data.size());
}

inline std::optional<uint64_t> DecodeRequest(const std::vector<uint8_t>& data) {
  return DecodeRequest(data.data(), data.size());
}

inline std::optional<Payload> DecodePayload(const std::vector<uint8_t>& data) {
  return DecodePayload(data.data(), data.size());
}

// ceil(file_size / segment_size), safe for file_size up to 2^64 - 1.
uint64_t SegmentCount(const uint64_t file_size, const uint64_t segment_size);

}

#endif
