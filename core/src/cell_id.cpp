#include "cellroute/cell_id.h"

#include <algorithm>
#include <cmath>

namespace cellroute {

namespace {

constexpr int kMaxSize = 1 << kMaxCellLevel;

struct XYZ { double x, y, z; };

XYZ xyzFromLatLng(double lat_deg, double lng_deg) {
  const double lat = lat_deg * M_PI / 180.0;
  const double lng = lng_deg * M_PI / 180.0;
  return {std::cos(lat) * std::cos(lng), std::cos(lat) * std::sin(lng), std::sin(lat)};
}

int faceOf(const XYZ& p) {
  const double ax = std::fabs(p.x), ay = std::fabs(p.y), az = std::fabs(p.z);
  int axis = 0;
  double comp = p.x;
  if (ay > ax) { axis = 1; comp = p.y; }
  if (az > std::max(ax, ay)) { axis = 2; comp = p.z; }
  return comp < 0 ? axis + 3 : axis;
}

void faceXYZToUV(int face, const XYZ& p, double& u, double& v) {
  switch (face) {
    case 0: u =  p.y / p.x; v =  p.z / p.x; break;
    case 1: u = -p.x / p.y; v =  p.z / p.y; break;
    case 2: u = -p.x / p.z; v = -p.y / p.z; break;
    case 3: u =  p.z / p.x; v =  p.y / p.x; break;
    case 4: u =  p.z / p.y; v = -p.x / p.y; break;
    default: u = -p.y / p.z; v = -p.x / p.z; break;
  }
}

XYZ faceUVToXYZ(int face, double u, double v) {
  switch (face) {
    case 0: return { 1.0,  u,    v};
    case 1: return {-u,    1.0,  v};
    case 2: return {-u,   -v,    1.0};
    case 3: return {-1.0, -v,   -u};
    case 4: return { v,   -1.0, -u};
    default: return { v,   u,   -1.0};
  }
}

// Quadratic projection keeps cell areas within a small ratio of each other.
double uvToST(double u) {
  if (u >= 0) return 0.5 * std::sqrt(1 + 3 * u);
  return 1 - 0.5 * std::sqrt(1 - 3 * u);
}

double stToUV(double s) {
  if (s >= 0.5) return (1.0 / 3.0) * (4 * s * s - 1);
  return (1.0 / 3.0) * (1 - 4 * (1 - s) * (1 - s));
}

int stToIJ(double s) {
  const int ij = static_cast<int>(std::floor(s * kMaxSize));
  return std::max(0, std::min(kMaxSize - 1, ij));
}

// i, j are coordinates at `level` (range [0, 2^level)).
CellId fromFaceIJ(int face, uint32_t i, uint32_t j, int level) {
  uint64_t path = 0;
  for (int b = level - 1; b >= 0; --b) {
    const uint64_t pos = (((i >> b) & 1u) << 1) | ((j >> b) & 1u);
    path = (path << 2) | pos;
  }
  CellId id = static_cast<CellId>(face) << 61;
  if (level > 0) id |= path << (61 - 2 * level);
  return id | cellLsbForLevel(level);
}

void toFaceIJ(CellId id, int& face, uint32_t& i, uint32_t& j, int& level) {
  face = cellFace(id);
  level = cellLevel(id);
  i = 0;
  j = 0;
  for (int l = 1; l <= level; ++l) {
    const int pos = static_cast<int>((id >> (61 - 2 * l)) & 3u);
    i = (i << 1) | static_cast<uint32_t>(pos >> 1);
    j = (j << 1) | static_cast<uint32_t>(pos & 1);
  }
}

CellId cellFromXYZ(const XYZ& p, int level) {
  const int face = faceOf(p);
  double u = 0, v = 0;
  faceXYZToUV(face, p, u, v);
  const int i = stToIJ(uvToST(u));
  const int j = stToIJ(uvToST(v));
  const CellId leaf = fromFaceIJ(face, static_cast<uint32_t>(i), static_cast<uint32_t>(j), kMaxCellLevel);
  return cellParentAt(leaf, level);
}

// Centre of (i, j) at `level` on `face`; i and j may fall outside the face,
// in which case the point is extended past the face edge and projected back
// onto whichever face it lands on.
XYZ faceIJCenter(int face, int64_t i, int64_t j, int level) {
  const double size = static_cast<double>(int64_t{1} << level);
  const double s = (static_cast<double>(i) + 0.5) / size;
  const double t = (static_cast<double>(j) + 0.5) / size;
  return faceUVToXYZ(face, stToUV(s), stToUV(t));
}

} // namespace

CellId cellFromLatLng(double lat, double lng, int level) {
  return cellFromXYZ(xyzFromLatLng(lat, lng), level);
}

int cellLevel(CellId id) {
  int zeros = 0;
  CellId lsb = cellLsb(id);
  while (lsb > 1) { lsb >>= 1; ++zeros; }
  return kMaxCellLevel - (zeros >> 1);
}

bool cellIsValid(CellId id) {
  return id != 0 && cellFace(id) < kNumFaces && (cellLsb(id) & 0x1555555555555555ULL) != 0;
}

CellId cellParentAt(CellId id, int level) {
  const CellId lsb = cellLsbForLevel(level);
  return (id & (~lsb + 1)) | lsb;
}

CellId cellParent(CellId id) {
  const int level = cellLevel(id);
  if (level == 0) return id;
  return cellParentAt(id, level - 1);
}

std::array<CellId, 4> cellChildren(CellId id) {
  const CellId lsb = cellLsb(id);
  const CellId step = lsb >> 1;
  const CellId first = id - lsb + (lsb >> 2);
  return {first, first + step, first + 2 * step, first + 3 * step};
}

bool cellContains(CellId a, CellId b) {
  const CellId lsb = cellLsb(a);
  return b >= a - (lsb - 1) && b <= a + (lsb - 1);
}

uint64_t cellDenseIndex(CellId id) {
  return id >> (61 - 2 * cellLevel(id));
}

CellId cellFromDenseIndex(int level, uint64_t index) {
  return (index << (61 - 2 * level)) | cellLsbForLevel(level);
}

std::vector<CellId> cellRing(CellId id, int k) {
  std::vector<CellId> out;
  if (k <= 0) {
    out.push_back(id);
    return out;
  }
  int face = 0, level = 0;
  uint32_t i = 0, j = 0;
  toFaceIJ(id, face, i, j, level);
  const int64_t size = int64_t{1} << level;

  auto add = [&](int64_t ni, int64_t nj) {
    CellId c;
    if (ni >= 0 && nj >= 0 && ni < size && nj < size) {
      c = fromFaceIJ(face, static_cast<uint32_t>(ni), static_cast<uint32_t>(nj), level);
    } else {
      c = cellFromXYZ(faceIJCenter(face, ni, nj, level), level);
    }
    if (c == id) return;
    if (std::find(out.begin(), out.end(), c) == out.end()) out.push_back(c);
  };

  for (int d = -k; d <= k; ++d) {
    add(int64_t{i} + d, int64_t{j} - k);
    add(int64_t{i} + d, int64_t{j} + k);
  }
  for (int d = -k + 1; d <= k - 1; ++d) {
    add(int64_t{i} - k, int64_t{j} + d);
    add(int64_t{i} + k, int64_t{j} + d);
  }
  return out;
}

LatLng cellCenter(CellId id) {
  int face = 0, level = 0;
  uint32_t i = 0, j = 0;
  toFaceIJ(id, face, i, j, level);
  const XYZ p = faceIJCenter(face, i, j, level);
  const double lat = std::atan2(p.z, std::sqrt(p.x * p.x + p.y * p.y));
  const double lng = std::atan2(p.y, p.x);
  return {lat * 180.0 / M_PI, lng * 180.0 / M_PI};
}

} // namespace cellroute
