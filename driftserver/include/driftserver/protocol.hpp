// Copyright (c) 2025 <Your Name>
/**
 * @file protocol.hpp
 * @brief DRIFTsync wire protocol types and codec.
 *
 * A single fixed size packet is used for requests and replies so that the
 * request and reply travel with the same size and do not skew the measured
 * path delay.
 *
 * Layout (32 bytes, all little-endian):
 *
 *   - magic:      4 bytes, 0x74667264 ('drft')
 *   - flags:      4 bytes, bit0=REPLY
 *   - local:      8 bytes, sender time at request, echoed in reply
 *   - remote:     8 bytes, responder time at reply, zero in request
 *   - reserved:   8 bytes, zero
 *
 * Timestamps are microseconds on the sender's (or responder's) own clock.
 * The two clocks share neither epoch nor rate.
 *
 * @note Authentication is out of scope.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "driftserver/export.hpp"

namespace driftserver {

/** @brief Default UDP port of the reflector. */
constexpr uint16_t kDefaultPort = 4318;

/** @brief Protocol magic, ASCII "drft" read as a little-endian word. */
constexpr uint32_t kMagic = 0x74667264u;

/** @brief Serialized packet size in bytes. */
constexpr size_t kPacketSize = 32;

/** @brief flags bit positions */
enum : uint32_t {
  kFlagReply = 1u << 0,  ///< Set by the responder
};

/**
 * @brief Decoded packet (host order).
 */
struct Packet {
  uint32_t magic = kMagic;
  uint32_t flags = 0;
  uint64_t local = 0;   ///< Requester time at send (microseconds)
  uint64_t remote = 0;  ///< Responder time at reply (microseconds)
  uint64_t reserved = 0;
};

/**
 * @brief Serialize a packet into its 32-byte little-endian form.
 * @param p Input packet (host order).
 * @return Raw bytes ready to be sent as one datagram.
 */
DRIFT_SERVER_API std::vector<uint8_t> Serialize(const Packet& p);

/**
 * @brief Parse a datagram into a packet.
 * @param bytes Raw datagram.
 * @param out Parsed packet on success; untouched on failure.
 * @return false if the size is not exactly kPacketSize or magic mismatches.
 */
DRIFT_SERVER_API bool Parse(const std::vector<uint8_t>& bytes, Packet* out);

/**
 * @brief Parse a datagram and require the reply flag.
 * @param bytes Raw datagram.
 * @param out Parsed reply on success; untouched on failure.
 * @return false on any Parse() failure or when the reply flag is clear.
 */
DRIFT_SERVER_API bool DecodeReply(const std::vector<uint8_t>& bytes,
                                  Packet* out);

/** @brief True when the reply flag is set. */
inline bool IsReply(const Packet& p) { return (p.flags & kFlagReply) != 0U; }

/** @brief Build a request stamped with the sender's local time. */
DRIFT_SERVER_API Packet MakeRequest(int64_t local_us);

/**
 * @brief Build the reply to a request.
 *
 * Echoes the request's local timestamp and stamps the responder's clock.
 */
DRIFT_SERVER_API Packet MakeReply(const Packet& request, int64_t remote_us);

}  // namespace driftserver
