#include "cellroute/blob_reader.h"

#include <string>

#include <flatbuffers/flatbuffers.h>
#include "graph_generated.h"
#include "snap_buckets_generated.h"

#include "cellroute/errors.h"

namespace cellroute {

namespace {

template <typename Root>
const Root* verifiedRoot(const std::vector<uint8_t>& blob, const char* what) {
  if (blob.empty()) throw DataError(std::string(what) + " blob is empty");
  flatbuffers::Verifier verifier(blob.data(), blob.size());
  if (!verifier.VerifyBuffer<Root>(nullptr)) {
    throw DataError(std::string(what) + " blob failed verification");
  }
  return flatbuffers::GetRoot<Root>(blob.data());
}

Interaction fromFb(fb::Interaction i) {
  const auto v = static_cast<uint8_t>(i);
  if (v > static_cast<uint8_t>(Interaction::TrafficLight)) return Interaction::None;
  return static_cast<Interaction>(v);
}

} // namespace

GraphStore readGraph(const std::vector<uint8_t>& graph_blob,
                     const std::vector<uint8_t>& location_blob,
                     const std::vector<uint8_t>& description_blob) {
  GraphStore g;

  const auto* root = verifiedRoot<fb::GraphBlob>(graph_blob, "graph");
  if (root->name()) g.name = root->name()->str();
  if (root->edges()) {
    g.edges.reserve(root->edges()->size());
    for (const auto* e : *root->edges()) {
      g.edges.push_back(Edge{e->point_1_node_idx(), e->point_2_node_idx(), e->cost_and_flags()});
    }
  }
  if (root->nodes()) {
    g.nodes.reserve(root->nodes()->size());
    for (const auto* n : *root->nodes()) {
      Node node;
      if (n->edges()) node.edges.assign(n->edges()->begin(), n->edges()->end());
      if (n->interactions()) {
        for (const auto* p : *n->interactions()) {
          node.interactions.push_back(InteractionPair{fromFb(p->incoming()), fromFb(p->outgoing())});
        }
      }
      g.nodes.push_back(std::move(node));
    }
  }
  if (root->mode_costs()) {
    for (const auto* mc : *root->mode_costs()) {
      const auto m = static_cast<uint8_t>(mc->mode());
      if (m == static_cast<uint8_t>(TravelMode::Car) || m >= kNumModes || !mc->costs()) continue;
      g.mode_costs[m].assign(mc->costs()->begin(), mc->costs()->end());
    }
  }

  if (!location_blob.empty()) {
    const auto* loc = verifiedRoot<fb::LocationBlob>(location_blob, "location");
    if (loc->node_locations()) {
      for (const auto* p : *loc->node_locations()) g.node_locations.push_back(LatLng{p->lat(), p->lng()});
    }
    if (loc->points()) {
      g.points.reserve(loc->points()->size());
      for (const auto* p : *loc->points()) g.points.push_back(LatLng{p->lat(), p->lng()});
    }
    if (loc->edge_point_offsets()) {
      g.edge_point_offsets.assign(loc->edge_point_offsets()->begin(), loc->edge_point_offsets()->end());
    }
  }

  if (!description_blob.empty()) {
    const auto* desc = verifiedRoot<fb::DescriptionBlob>(description_blob, "description");
    if (desc->edges()) {
      g.descriptions.reserve(desc->edges()->size());
      for (const auto* d : *desc->edges()) {
        EdgeDescription ed;
        ed.priority = d->priority();
        if (d->names()) {
          for (const auto* s : *d->names()) ed.names.push_back(s->str());
        }
        g.descriptions.push_back(std::move(ed));
      }
    }
  }

  g.validate();
  return g;
}

SnapBuckets readSnapBuckets(const std::vector<uint8_t>& blob, size_t edge_count) {
  const auto* root = verifiedRoot<fb::SnapBucketsBlob>(blob, "snap buckets");
  SnapBuckets out;
  out.outer_level = root->outer_level();
  out.fine_level = root->fine_level();
  if (root->buckets()) {
    out.buckets.reserve(root->buckets()->size());
    for (const auto* b : *root->buckets()) {
      SnapBucket sb;
      sb.cell_id = b->cell_id();
      if (b->fine_cell_ids()) sb.fine_cell_ids.assign(b->fine_cell_ids()->begin(), b->fine_cell_ids()->end());
      if (b->edge_indexes()) sb.edge_indexes.assign(b->edge_indexes()->begin(), b->edge_indexes()->end());
      out.buckets.push_back(std::move(sb));
    }
  }
  // binary search in SnapIndex is only correct on a sorted layout
  out.validate(edge_count);
  return out;
}

} // namespace cellroute
