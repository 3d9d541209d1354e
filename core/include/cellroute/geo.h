#pragma once

#include <algorithm>
#include <cmath>

#include "cellroute/cell_id.h"
#include "cellroute/graph_store.h"

namespace cellroute::geo {

constexpr double kEarthRadiusM = 6371000.0;

inline double haversine(double lat1, double lon1, double lat2, double lon2) {
  const double p1 = lat1 * M_PI / 180.0;
  const double p2 = lat2 * M_PI / 180.0;
  const double dphi = (lat2 - lat1) * M_PI / 180.0;
  const double dl = (lon2 - lon1) * M_PI / 180.0;
  const double a = std::sin(dphi / 2) * std::sin(dphi / 2) +
                   std::cos(p1) * std::cos(p2) * std::sin(dl / 2) * std::sin(dl / 2);
  const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
  return kEarthRadiusM * c;
}

inline double haversine(const LatLng& a, const LatLng& b) { return haversine(a.lat, a.lng, b.lat, b.lng); }

// Projection onto segment ab in a local equirectangular plane centred on p.
// Returns metres between p and the projected point.
inline double pointToSegmentMeters(const LatLng& p, const LatLng& a, const LatLng& b) {
  const double k = std::cos(p.lat * M_PI / 180.0);
  const double ax = (a.lng - p.lng) * k, ay = a.lat - p.lat;
  const double bx = (b.lng - p.lng) * k, by = b.lat - p.lat;
  const double vx = bx - ax, vy = by - ay;
  const double c2 = vx * vx + vy * vy;
  double t = 0.0;
  if (c2 > 1e-24) t = std::max(0.0, std::min(1.0, -(ax * vx + ay * vy) / c2));
  const LatLng proj{a.lat + t * (b.lat - a.lat), a.lng + t * (b.lng - a.lng)};
  return haversine(p, proj);
}

inline double pointToPolylineMeters(const LatLng& p, const PointRange& line) {
  if (line.empty()) return HUGE_VAL;
  if (line.size() == 1) return haversine(p, *line.begin());
  double best = HUGE_VAL;
  for (const LatLng* it = line.begin(); it + 1 != line.end(); ++it) {
    best = std::min(best, pointToSegmentMeters(p, it[0], it[1]));
  }
  return best;
}

inline double polylineLengthMeters(const LatLng* first, const LatLng* last) {
  double len = 0.0;
  for (const LatLng* it = first; it != last && it + 1 != last; ++it) len += haversine(it[0], it[1]);
  return len;
}

} // namespace cellroute::geo
