#include "cellroute/mode_profile.h"

namespace cellroute {

RoadClass roadClassFromHighway(const std::string& h) {
  if (h == "motorway" || h == "motorway_link") return RoadClass::Motorway;
  if (h == "trunk" || h == "trunk_link") return RoadClass::Trunk;
  if (h == "primary" || h == "primary_link") return RoadClass::Primary;
  if (h == "secondary" || h == "secondary_link") return RoadClass::Secondary;
  if (h == "tertiary" || h == "tertiary_link") return RoadClass::Tertiary;
  if (h == "residential") return RoadClass::Residential;
  if (h == "service") return RoadClass::Service;
  if (h == "living_street") return RoadClass::LivingStreet;
  if (h == "pedestrian") return RoadClass::Pedestrian;
  if (h == "cycleway") return RoadClass::Cycleway;
  if (h == "footway" || h == "path" || h == "steps") return RoadClass::Footway;
  return RoadClass::Unclassified;
}

double ModeProfile::costFor(double length_m, RoadClass rc, double maxspeed_kmh) const {
  double speed = speed_kmh[static_cast<size_t>(rc)];
  if (speed <= 0.0) return -1.0;
  // maxspeed only narrows/widens vehicular speeds on roads the mode may use
  if (maxspeed_kmh > 0.0 && (mode == TravelMode::Car || mode == TravelMode::Transit)) {
    speed = (mode == TravelMode::Transit) ? 0.8 * maxspeed_kmh : maxspeed_kmh;
  }
  return length_m / (speed / 3.6);
}

ModeProfile defaultModeProfile(TravelMode mode) {
  ModeProfile p;
  p.mode = mode;
  //                 mway trunk prim  sec  tert  res  serv  live  ped  cyc  foot  uncl
  switch (mode) {
    case TravelMode::Car:
      p.speed_kmh = {100.0, 80.0, 60.0, 50.0, 40.0, 30.0, 20.0, 10.0, 0.0, 0.0, 0.0, 30.0};
      p.respects_oneway = true;
      p.yield_penalty = 2;
      p.stop_penalty = 5;
      p.signal_penalty = 15;
      break;
    case TravelMode::Bike:
      p.speed_kmh = {0.0, 0.0, 15.0, 15.0, 15.0, 15.0, 15.0, 10.0, 5.0, 20.0, 5.0, 15.0};
      p.respects_oneway = true;
      p.yield_penalty = 1;
      p.stop_penalty = 3;
      p.signal_penalty = 10;
      break;
    case TravelMode::Walk:
      p.speed_kmh = {0.0, 0.0, 5.0, 5.0, 5.0, 5.0, 5.0, 5.0, 5.0, 5.0, 5.0, 5.0};
      p.respects_oneway = false;
      p.yield_penalty = 0;
      p.stop_penalty = 0;
      p.signal_penalty = 20;
      break;
    case TravelMode::Transit:
      p.speed_kmh = {80.0, 64.0, 48.0, 40.0, 32.0, 24.0, 16.0, 8.0, 0.0, 0.0, 0.0, 24.0};
      p.respects_oneway = true;
      p.yield_penalty = 3;
      p.stop_penalty = 8;
      p.signal_penalty = 20;
      break;
  }
  return p;
}

ModeProfiles defaultModeProfiles() {
  return {defaultModeProfile(TravelMode::Car), defaultModeProfile(TravelMode::Bike),
          defaultModeProfile(TravelMode::Walk), defaultModeProfile(TravelMode::Transit)};
}

} // namespace cellroute
