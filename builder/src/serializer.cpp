#include "serializer.h"

#include <flatbuffers/flatbuffers.h>
#include "graph_generated.h"
#include "snap_buckets_generated.h"

namespace cellroute {

namespace {

std::vector<uint8_t> finish(flatbuffers::FlatBufferBuilder& fbb) {
  auto ptr = fbb.GetBufferPointer();
  auto sz = fbb.GetSize();
  return std::vector<uint8_t>(ptr, ptr + sz);
}

fb::InteractionPair toFb(const InteractionPair& p) {
  return fb::InteractionPair(static_cast<fb::Interaction>(p.incoming),
                             static_cast<fb::Interaction>(p.outgoing));
}

} // namespace

std::vector<uint8_t> buildGraphBlob(const GraphStore& graph) {
  flatbuffers::FlatBufferBuilder fbb(1024 + graph.edges.size() * 16 + graph.nodes.size() * 32);

  std::vector<fb::Edge> edges;
  edges.reserve(graph.edges.size());
  for (const auto& e : graph.edges) {
    edges.emplace_back(e.from_node, e.to_node, e.cost_and_flags);
  }
  auto edges_vec = fbb.CreateVectorOfStructs(edges);

  std::vector<flatbuffers::Offset<fb::Node>> node_offsets;
  node_offsets.reserve(graph.nodes.size());
  std::vector<fb::InteractionPair> pairs;
  for (const auto& n : graph.nodes) {
    pairs.clear();
    for (const auto& p : n.interactions) pairs.push_back(toFb(p));
    auto ev = fbb.CreateVector(n.edges);
    auto iv = fbb.CreateVectorOfStructs(pairs);
    node_offsets.push_back(fb::CreateNode(fbb, ev, iv));
  }
  auto nodes_vec = fbb.CreateVector(node_offsets);

  std::vector<flatbuffers::Offset<fb::ModeCosts>> mode_offsets;
  for (int m = 0; m < kNumModes; ++m) {
    const auto& table = graph.mode_costs[static_cast<size_t>(m)];
    if (static_cast<TravelMode>(m) == TravelMode::Car || table.empty()) continue;
    auto cv = fbb.CreateVector(table);
    mode_offsets.push_back(fb::CreateModeCosts(fbb, static_cast<fb::TravelMode>(m), cv));
  }
  auto modes_vec = fbb.CreateVector(mode_offsets);

  auto name = fbb.CreateString(graph.name);
  fbb.Finish(fb::CreateGraphBlob(fbb, name, edges_vec, nodes_vec, modes_vec));
  return finish(fbb);
}

std::vector<uint8_t> buildLocationBlob(const GraphStore& graph) {
  flatbuffers::FlatBufferBuilder fbb(1024 + graph.points.size() * 16);

  std::vector<fb::LatLng> nodes;
  nodes.reserve(graph.node_locations.size());
  for (const auto& p : graph.node_locations) nodes.emplace_back(p.lat, p.lng);
  std::vector<fb::LatLng> points;
  points.reserve(graph.points.size());
  for (const auto& p : graph.points) points.emplace_back(p.lat, p.lng);

  auto nv = fbb.CreateVectorOfStructs(nodes);
  auto pv = fbb.CreateVectorOfStructs(points);
  auto ov = fbb.CreateVector(graph.edge_point_offsets);
  fbb.Finish(fb::CreateLocationBlob(fbb, nv, pv, ov));
  return finish(fbb);
}

std::vector<uint8_t> buildDescriptionBlob(const GraphStore& graph) {
  flatbuffers::FlatBufferBuilder fbb(1024);

  std::vector<flatbuffers::Offset<fb::EdgeDescription>> descs;
  descs.reserve(graph.descriptions.size());
  for (const auto& d : graph.descriptions) {
    auto names = fbb.CreateVectorOfStrings(d.names);
    descs.push_back(fb::CreateEdgeDescription(fbb, names, d.priority));
  }
  auto dv = fbb.CreateVector(descs);
  fbb.Finish(fb::CreateDescriptionBlob(fbb, dv));
  return finish(fbb);
}

std::vector<uint8_t> buildSnapBucketsBlob(const SnapBuckets& buckets) {
  flatbuffers::FlatBufferBuilder fbb(1024 + buckets.entryCount() * 12 + buckets.buckets.size() * 24);

  std::vector<flatbuffers::Offset<fb::SnapBucket>> offsets;
  offsets.reserve(buckets.buckets.size());
  for (const auto& b : buckets.buckets) {
    auto fine = fbb.CreateVector(b.fine_cell_ids);
    auto edges = fbb.CreateVector(b.edge_indexes);
    offsets.push_back(fb::CreateSnapBucket(fbb, b.cell_id, fine, edges));
  }
  auto bv = fbb.CreateVector(offsets);
  fbb.Finish(fb::CreateSnapBucketsBlob(fbb,
                                       static_cast<uint8_t>(buckets.outer_level),
                                       static_cast<uint8_t>(buckets.fine_level),
                                       bv));
  return finish(fbb);
}

} // namespace cellroute
