/**
 * @file FragmentFilter.h
 * @brief Removal of small disconnected pieces of each region
 */

#ifndef NEUROPARCEL_FRAGMENT_FILTER_H
#define NEUROPARCEL_FRAGMENT_FILTER_H

#include "../atlas/RegionHierarchy.h"
#include "../io/ImageIO.h"
#include <array>
#include <string>
#include <vector>

namespace neuroparcel {
namespace mask {

/**
 * @brief Neighbour offsets that make two voxels adjacent
 *
 * Face adjacency (6 neighbours) is the default: the thin parts of long
 * structures then split into separate fragments instead of bridging
 * through corners.
 */
class Connectivity {
public:
  using Offset = std::array<int, 3>;

  static Connectivity Face();   // 6 neighbours
  static Connectivity Edge();   // 18 neighbours
  static Connectivity Vertex(); // 26 neighbours

  // 6, 18 or 26; throws ConfigurationException otherwise
  static Connectivity FromNeighborCount(int count);

  /**
   * @brief Custom neighbourhood
   *
   * Offsets must lie in {-1,0,1}^3, exclude (0,0,0), be unique, and come in
   * symmetric pairs. Throws ConfigurationException.
   */
  explicit Connectivity(std::vector<Offset> offsets);

  const std::vector<Offset> &GetOffsets() const { return m_offsets; }
  size_t GetNeighborCount() const { return m_offsets.size(); }

private:
  std::vector<Offset> m_offsets;
};

/**
 * @brief One connected component of one region
 */
struct FragmentRecord {
  uint32_t region_id = 0;
  std::string region_name;
  size_t fragment_index = 0; // 1-based within region_id
  size_t voxel_count = 0;
  bool removed = false;
};

struct FragmentFilterParameters {
  size_t min_fragment_size = 50; // components below this many voxels go
  Connectivity connectivity = Connectivity::Face();
};

struct FragmentFilterResult {
  io::LabelImage mask;
  std::vector<FragmentRecord> fragments; // by region ID, then fragment index
  size_t removed_fragments = 0;
  size_t removed_voxels = 0;
};

class FragmentFilter {
public:
  FragmentFilter(const atlas::RegionHierarchy &hierarchy,
                 const FragmentFilterParameters &params)
      : m_hierarchy(hierarchy), m_params(params) {}

  /**
   * @brief Labels components of every region and zeroes the small ones
   *
   * Fragment indices follow the raster order (x fastest, then y, then z)
   * of each component's first voxel. Every component is recorded, kept or
   * removed.
   */
  FragmentFilterResult Apply(const io::LabelImage &mask) const;

  const FragmentFilterParameters &GetParameters() const { return m_params; }

  // Name used in the fragment table for a region ID
  std::string RegionName(uint32_t region_id) const;

private:
  const atlas::RegionHierarchy &m_hierarchy;
  FragmentFilterParameters m_params;
};

} // namespace mask
} // namespace neuroparcel

#endif // NEUROPARCEL_FRAGMENT_FILTER_H
