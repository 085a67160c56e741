/**
 * @file FragmentFilter.cpp
 * @brief Connected-component labelling and small fragment removal
 */

#include "FragmentFilter.h"
#include "../core/NeuroParcelExceptions.h"
#include <algorithm>
#include <map>
#include <queue>
#include <set>

namespace neuroparcel {
namespace mask {

// ===== Connectivity =====

Connectivity::Connectivity(std::vector<Offset> offsets)
    : m_offsets(std::move(offsets)) {
  if (m_offsets.empty()) {
    throw ConfigurationException("connectivity", "empty",
                                 "at least one neighbour offset");
  }

  std::set<Offset> seen;
  for (const auto &offset : m_offsets) {
    std::string text = "(" + std::to_string(offset[0]) + "," +
                       std::to_string(offset[1]) + "," +
                       std::to_string(offset[2]) + ")";
    for (int component : offset) {
      if (component < -1 || component > 1) {
        throw ConfigurationException("connectivity", text,
                                     "offsets within {-1,0,1}");
      }
    }
    if (offset[0] == 0 && offset[1] == 0 && offset[2] == 0) {
      throw ConfigurationException("connectivity", text, "non-zero offsets");
    }
    if (!seen.insert(offset).second) {
      throw ConfigurationException("connectivity", text, "unique offsets");
    }
  }

  for (const auto &offset : m_offsets) {
    Offset mirrored = {{-offset[0], -offset[1], -offset[2]}};
    if (seen.find(mirrored) == seen.end()) {
      throw ConfigurationException(
          "connectivity",
          "(" + std::to_string(offset[0]) + "," + std::to_string(offset[1]) +
              "," + std::to_string(offset[2]) + ")",
          "symmetric offsets");
    }
  }
}

namespace {

// Offsets with at most `max_nonzero` non-zero components
std::vector<Connectivity::Offset> NeighbourhoodOffsets(int max_nonzero) {
  std::vector<Connectivity::Offset> offsets;
  for (int dz = -1; dz <= 1; ++dz) {
    for (int dy = -1; dy <= 1; ++dy) {
      for (int dx = -1; dx <= 1; ++dx) {
        int nonzero = (dx != 0) + (dy != 0) + (dz != 0);
        if (nonzero > 0 && nonzero <= max_nonzero) {
          offsets.push_back({{dx, dy, dz}});
        }
      }
    }
  }
  return offsets;
}

} // namespace

Connectivity Connectivity::Face() { return Connectivity(NeighbourhoodOffsets(1)); }

Connectivity Connectivity::Edge() { return Connectivity(NeighbourhoodOffsets(2)); }

Connectivity Connectivity::Vertex() {
  return Connectivity(NeighbourhoodOffsets(3));
}

Connectivity Connectivity::FromNeighborCount(int count) {
  switch (count) {
  case 6:
    return Face();
  case 18:
    return Edge();
  case 26:
    return Vertex();
  default:
    throw ConfigurationException("connectivity", std::to_string(count),
                                 "6, 18 or 26");
  }
}

// ===== FragmentFilter =====

std::string FragmentFilter::RegionName(uint32_t region_id) const {
  const atlas::RegionNode *node = m_hierarchy.FindById(region_id);
  if (node) {
    return node->name;
  }
  return "Unknown ID " + std::to_string(region_id);
}

FragmentFilterResult FragmentFilter::Apply(const io::LabelImage &mask) const {
  FragmentFilterResult result;
  result.mask = mask;

  if (!mask.IsValid()) {
    return result;
  }

  const auto size = mask.GetSize();
  const size_t nx = size[0];
  const size_t ny = size[1];
  const size_t nz = size[2];
  const size_t plane = nx * ny;
  const uint32_t *labels = mask.GetDataPointer();

  // Regions never touch each other's voxels, so one component map covers
  // every region ID at once
  struct Component {
    uint32_t region_id;
    size_t fragment_index;
    size_t voxel_count;
  };
  std::vector<Component> components;
  std::vector<uint32_t> component_of(mask.GetTotalPixels(), 0);
  std::map<uint32_t, size_t> fragments_per_region;

  const auto &offsets = m_params.connectivity.GetOffsets();
  std::queue<size_t> queue;

  for (size_t start = 0; start < mask.GetTotalPixels(); ++start) {
    uint32_t region_id = labels[start];
    if (region_id == 0 || component_of[start] != 0) {
      continue;
    }

    Component component;
    component.region_id = region_id;
    component.fragment_index = ++fragments_per_region[region_id];
    component.voxel_count = 0;

    uint32_t component_label = static_cast<uint32_t>(components.size() + 1);
    component_of[start] = component_label;
    queue.push(start);

    while (!queue.empty()) {
      size_t current = queue.front();
      queue.pop();
      ++component.voxel_count;

      long x = static_cast<long>(current % nx);
      long y = static_cast<long>((current / nx) % ny);
      long z = static_cast<long>(current / plane);

      for (const auto &offset : offsets) {
        long px = x + offset[0];
        long py = y + offset[1];
        long pz = z + offset[2];
        if (px < 0 || py < 0 || pz < 0 || px >= static_cast<long>(nx) ||
            py >= static_cast<long>(ny) || pz >= static_cast<long>(nz)) {
          continue;
        }

        size_t neighbour = static_cast<size_t>(pz) * plane +
                           static_cast<size_t>(py) * nx +
                           static_cast<size_t>(px);
        if (component_of[neighbour] == 0 && labels[neighbour] == region_id) {
          component_of[neighbour] = component_label;
          queue.push(neighbour);
        }
      }
    }

    components.push_back(component);
  }

  // Decide every component before touching the output
  std::vector<bool> removed(components.size() + 1, false);
  result.fragments.reserve(components.size());
  for (size_t i = 0; i < components.size(); ++i) {
    const auto &component = components[i];

    FragmentRecord record;
    record.region_id = component.region_id;
    record.region_name = RegionName(component.region_id);
    record.fragment_index = component.fragment_index;
    record.voxel_count = component.voxel_count;
    record.removed = component.voxel_count < m_params.min_fragment_size;

    if (record.removed) {
      removed[i + 1] = true;
      ++result.removed_fragments;
      result.removed_voxels += component.voxel_count;
    }
    result.fragments.push_back(std::move(record));
  }

  std::stable_sort(result.fragments.begin(), result.fragments.end(),
                   [](const FragmentRecord &a, const FragmentRecord &b) {
                     return a.region_id < b.region_id;
                   });

  if (result.removed_fragments > 0) {
    uint32_t *output = result.mask.GetDataPointer();
    for (size_t i = 0; i < component_of.size(); ++i) {
      if (removed[component_of[i]]) {
        output[i] = 0;
      }
    }
  }

  return result;
}

} // namespace mask
} // namespace neuroparcel
