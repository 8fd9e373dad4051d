// Copyright (c) 2025 <Your Name>
/**
 * @file protocol.cc
 * @brief Implementation of the DRIFTsync packet codec.
 */
#include "driftserver/protocol.hpp"

#include <vector>

namespace driftserver {

namespace {

uint32_t ReadLe32(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t ReadLe64(const uint8_t* p) {
  return static_cast<uint64_t>(ReadLe32(p)) |
         (static_cast<uint64_t>(ReadLe32(p + 4)) << 32);
}

}  // namespace

std::vector<uint8_t> Serialize(const Packet& p) {
  std::vector<uint8_t> out;
  out.reserve(kPacketSize);

  auto append_le32 = [&](uint32_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xffU));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xffU));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xffU));
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xffU));
  };
  auto append_le64 = [&](uint64_t v) {
    append_le32(static_cast<uint32_t>(v & 0xffffffffULL));
    append_le32(static_cast<uint32_t>(v >> 32));
  };

  append_le32(p.magic);
  append_le32(p.flags);
  append_le64(p.local);
  append_le64(p.remote);
  append_le64(p.reserved);
  return out;
}

bool Parse(const std::vector<uint8_t>& bytes, Packet* out) {
  if (!out || bytes.size() != kPacketSize) return false;

  const uint8_t* p = bytes.data();
  Packet tmp;
  tmp.magic = ReadLe32(p + 0);
  if (tmp.magic != kMagic) return false;

  tmp.flags = ReadLe32(p + 4);
  tmp.local = ReadLe64(p + 8);
  tmp.remote = ReadLe64(p + 16);
  tmp.reserved = ReadLe64(p + 24);
  *out = tmp;
  return true;
}

bool DecodeReply(const std::vector<uint8_t>& bytes, Packet* out) {
  Packet tmp;
  if (!Parse(bytes, &tmp) || !IsReply(tmp)) return false;
  if (out) *out = tmp;
  return out != nullptr;
}

Packet MakeRequest(int64_t local_us) {
  Packet p;
  p.local = static_cast<uint64_t>(local_us);
  return p;
}

Packet MakeReply(const Packet& request, int64_t remote_us) {
  Packet p = request;
  p.flags |= kFlagReply;
  p.remote = static_cast<uint64_t>(remote_us);
  p.reserved = 0;
  return p;
}

}  // namespace driftserver
