#pragma once

#include <cstdint>

namespace cellroute::packed {

// 16 bits, bit 0 is the least significant:
//   [15..3] cost (13 bits, 0..8191)
//   [2]     one-way (traversable only from point 1 to point 2)
//   [1]     reserved, always written as 0
//   [0]     mode excluded (edge not usable by the mode owning this value)
constexpr int kCostShift = 3;
constexpr uint16_t kCostMask = 0x1FFF;
constexpr uint32_t kMaxCost = kCostMask;
constexpr uint16_t kOneWayBit = 1u << 2;
constexpr uint16_t kReservedBit = 1u << 1;
constexpr uint16_t kExcludedBit = 1u << 0;

inline uint16_t make(uint32_t cost, bool oneway, bool excluded) {
  uint16_t v = 0;
  v |= static_cast<uint16_t>((cost & kCostMask) << kCostShift);
  if (oneway) v |= kOneWayBit;
  if (excluded) v |= kExcludedBit;
  return v;
}

inline uint32_t cost(uint16_t v) { return (v >> kCostShift) & kCostMask; }
inline bool oneway(uint16_t v) { return (v & kOneWayBit) != 0; }
inline bool excluded(uint16_t v) { return (v & kExcludedBit) != 0; }
inline bool reserved(uint16_t v) { return (v & kReservedBit) != 0; }

} // namespace cellroute::packed
