#include "pbf_reader.h"

#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#ifdef HAVE_LIBOSMIUM
#  include <osmium/io/any_input.hpp>
#  include <osmium/osm/node.hpp>
#  include <osmium/osm/types.hpp>
#  include <osmium/osm/way.hpp>
#endif

namespace cellroute {

Interaction interactionFromHighway(const char* highway) {
  if (!highway) return Interaction::None;
  if (std::strcmp(highway, "traffic_signals") == 0) return Interaction::TrafficLight;
  if (std::strcmp(highway, "stop") == 0) return Interaction::StopSign;
  if (std::strcmp(highway, "give_way") == 0) return Interaction::Yield;
  return Interaction::None;
}

uint8_t priorityForRoadClass(RoadClass rc) {
  switch (rc) {
    case RoadClass::Motorway: return 10;
    case RoadClass::Trunk: return 9;
    case RoadClass::Primary: return 8;
    case RoadClass::Secondary: return 7;
    case RoadClass::Tertiary: return 6;
    case RoadClass::Unclassified: return 5;
    case RoadClass::Residential: return 4;
    case RoadClass::LivingStreet: return 3;
    case RoadClass::Service: return 2;
    case RoadClass::Cycleway: return 1;
    case RoadClass::Pedestrian:
    case RoadClass::Footway: return 0;
  }
  return 0;
}

double parseMaxspeedKmh(const char* value) {
  if (!value) return 0.0;
  char* end = nullptr;
  const double v = std::strtod(value, &end);
  if (end == value || v <= 0.0) return 0.0;
  while (*end == ' ') ++end;
  if (std::strncmp(end, "mph", 3) == 0) return v * 1.609344;
  if (*end == '\0' || std::strncmp(end, "km/h", 4) == 0 || std::strncmp(end, "kmh", 3) == 0) return v;
  return 0.0;
}

PbfReader::PbfReader(std::string input_path)
  : input_path_(std::move(input_path)) {}

#ifdef HAVE_LIBOSMIUM

namespace {

bool tagIs(const osmium::TagList& tags, const char* key, const char* value) {
  const char* v = tags.get_value_by_key(key);
  return v && std::strcmp(v, value) == 0;
}

uint8_t modeMaskFor(const osmium::TagList& tags) {
  const auto bit = [](TravelMode m) { return static_cast<uint8_t>(1u << static_cast<int>(m)); };
  uint8_t mask = 0x0F;
  if (tagIs(tags, "access", "no") || tagIs(tags, "access", "private")) mask = 0;
  if (tagIs(tags, "motor_vehicle", "no") || tagIs(tags, "motorcar", "no")) {
    mask &= static_cast<uint8_t>(~(bit(TravelMode::Car) | bit(TravelMode::Transit)));
  }
  if (tagIs(tags, "bicycle", "no")) mask &= static_cast<uint8_t>(~bit(TravelMode::Bike));
  if (tagIs(tags, "foot", "no")) mask &= static_cast<uint8_t>(~bit(TravelMode::Walk));
  return mask;
}

} // namespace

PbfStats PbfReader::read(GraphBuilder& builder) {
  PbfStats stats;

  // First pass: node coordinates and node-level controls
  std::unordered_map<osmium::object_id_type, NodeRecord> node_index;
  {
    osmium::io::Reader reader{input_path_, osmium::osm_entity_bits::node};
    while (osmium::memory::Buffer buffer = reader.read()) {
      for (const auto& n : buffer.select<osmium::Node>()) {
        if (!n.location().valid()) continue;
        NodeRecord rec;
        rec.id = n.id();
        rec.lat = n.location().lat();
        rec.lng = n.location().lon();
        rec.control = interactionFromHighway(n.tags().get_value_by_key("highway"));
        node_index[rec.id] = rec;
        ++stats.nodes_seen;
      }
    }
    reader.close();
  }

  // Second pass: ways with highway=*
  std::unordered_set<int64_t> referenced;
  {
    osmium::io::Reader reader{input_path_, osmium::osm_entity_bits::way};
    while (osmium::memory::Buffer buffer = reader.read()) {
      for (const auto& w : buffer.select<osmium::Way>()) {
        ++stats.ways_seen;
        const char* highway = w.tags().get_value_by_key("highway");
        if (!highway) continue;

        WayRecord way;
        way.id = w.id();
        way.road_class = roadClassFromHighway(highway);
        way.priority = priorityForRoadClass(way.road_class);
        way.oneway = tagIs(w.tags(), "oneway", "yes") || tagIs(w.tags(), "oneway", "1") ||
                     tagIs(w.tags(), "junction", "roundabout");
        way.maxspeed_kmh = parseMaxspeedKmh(w.tags().get_value_by_key("maxspeed"));
        way.mode_mask = modeMaskFor(w.tags());
        if (const char* name = w.tags().get_value_by_key("name")) way.names.emplace_back(name);
        if (const char* ref = w.tags().get_value_by_key("ref")) way.names.emplace_back(ref);

        way.points.reserve(w.nodes().size());
        for (const auto& nd_ref : w.nodes()) {
          auto it = node_index.find(nd_ref.ref());
          if (it == node_index.end()) continue;
          WayPoint p;
          p.pos = LatLng{it->second.lat, it->second.lng};
          p.node_id = it->second.id;
          way.points.push_back(p);
        }
        if (way.points.size() < 2) {
          ++stats.ways_skipped;
          continue;
        }
        for (const auto& p : way.points) referenced.insert(p.node_id);
        builder.addWay(std::move(way));
        ++stats.ways_kept;
      }
    }
    reader.close();
  }

  for (int64_t id : referenced) builder.addNode(node_index.at(id));
  return stats;
}

#else

PbfStats PbfReader::read(GraphBuilder&) {
  throw std::runtime_error("graphbuild was built without libosmium; cannot read " + input_path_);
}

#endif

} // namespace cellroute
