#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "cellroute/graph_store.h"

namespace cellroute {

enum class RoadClass : uint8_t {
  Motorway = 0,
  Trunk,
  Primary,
  Secondary,
  Tertiary,
  Residential,
  Service,
  LivingStreet,
  Pedestrian,
  Cycleway,
  Footway,
  Unclassified,
};
constexpr int kNumRoadClasses = 12;

// OSM highway=* value to road class; unknown values map to Unclassified.
RoadClass roadClassFromHighway(const std::string& highway);

struct ModeProfile {
  TravelMode mode {TravelMode::Car};
  bool respects_oneway {true};
  std::array<double, kNumRoadClasses> speed_kmh {}; // <= 0: road class not usable
  // Turn penalties in cost units (seconds), keyed by the controlling interaction.
  uint32_t yield_penalty {0};
  uint32_t stop_penalty {0};
  uint32_t signal_penalty {0};

  bool allows(RoadClass rc) const { return speed_kmh[static_cast<size_t>(rc)] > 0.0; }

  // Travel time in seconds; negative when the class is not usable.
  double costFor(double length_m, RoadClass rc, double maxspeed_kmh = 0.0) const;

  uint32_t penalty(Interaction i) const {
    switch (i) {
      case Interaction::Yield: return yield_penalty;
      case Interaction::StopSign: return stop_penalty;
      case Interaction::TrafficLight: return signal_penalty;
      case Interaction::None: break;
    }
    return 0;
  }
};

using ModeProfiles = std::array<ModeProfile, kNumModes>;

ModeProfile defaultModeProfile(TravelMode mode);
ModeProfiles defaultModeProfiles();

} // namespace cellroute
