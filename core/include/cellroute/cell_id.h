#pragma once

#include <array>
#include <cstdint>
#include <vector>

namespace cellroute {

// 64 bits: [face:3][child position:2 per level][1][0...]
// Level 0 is a whole cube face, level 30 is the finest.
using CellId = uint64_t;

constexpr int kMaxCellLevel = 30;
constexpr int kNumFaces = 6;

struct LatLng {
  double lat{};
  double lng{};
};

CellId cellFromLatLng(double lat, double lng, int level);
inline CellId cellFromLatLng(const LatLng& p, int level) { return cellFromLatLng(p.lat, p.lng, level); }

inline CellId cellLsb(CellId id) { return id & (~id + 1); }
inline CellId cellLsbForLevel(int level) { return CellId{1} << (2 * (kMaxCellLevel - level)); }

inline int cellFace(CellId id) { return static_cast<int>(id >> 61); }

int cellLevel(CellId id);
bool cellIsValid(CellId id);

CellId cellParent(CellId id);
CellId cellParentAt(CellId id, int level);
std::array<CellId, 4> cellChildren(CellId id);

// true when b lies inside a (or is a)
bool cellContains(CellId a, CellId b);

// Dense numbering of every cell of one level: [0, 6 * 4^level).
inline uint64_t cellCountAtLevel(int level) { return uint64_t{kNumFaces} << (2 * level); }
uint64_t cellDenseIndex(CellId id);
CellId cellFromDenseIndex(int level, uint64_t index);

// Cells at Chebyshev distance exactly k around id, same level,
// wrapping across cube faces.
std::vector<CellId> cellRing(CellId id, int k);

LatLng cellCenter(CellId id);

} // namespace cellroute
