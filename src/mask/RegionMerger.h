/**
 * @file RegionMerger.h
 * @brief Hierarchy-driven relabelling of an atlas mask
 *
 * Rules are applied in a fixed order: every flatten-subtree rule, then every
 * flatten-to-depth rule, then every exclusion. Exclusion only matches the
 * excluded region's own ID, so a region that absorbed others through
 * flattening takes them with it, while a region folded into a different
 * target is not excluded by naming it.
 */

#ifndef NEUROPARCEL_REGION_MERGER_H
#define NEUROPARCEL_REGION_MERGER_H

#include "../atlas/RegionHierarchy.h"
#include "../io/ImageIO.h"
#include <string>
#include <unordered_map>
#include <vector>

namespace neuroparcel {
namespace mask {

/**
 * @brief Keep one generation `depth` levels below `acronym`
 */
struct DepthRule {
  std::string acronym;
  int depth = 1;
};

struct MergeRules {
  std::vector<std::string> flatten;
  std::vector<DepthRule> flatten_to_depth;
  std::vector<std::string> exclude;
};

struct MergeStatistics {
  size_t nonzero_before = 0;
  size_t nonzero_after = 0;
  size_t voxels_flattened = 0;
  size_t voxels_excluded = 0;
};

/**
 * @brief A rule resolved to a label lookup table
 */
struct LabelRewrite {
  std::string description;
  std::unordered_map<uint32_t, uint32_t> mapping;
};

class RegionMerger {
public:
  explicit RegionMerger(const atlas::RegionHierarchy &hierarchy)
      : m_hierarchy(hierarchy) {}

  // Every voxel of a descendant of `acronym` takes the ID of `acronym`
  io::LabelImage FlattenSubtree(const io::LabelImage &mask,
                                const std::string &acronym) const;

  // Every descendant k at `depth` absorbs its own subtree
  io::LabelImage FlattenToDepth(const io::LabelImage &mask,
                                const std::string &acronym, int depth) const;

  // Voxels carrying the ID of `acronym` become background
  io::LabelImage Exclude(const io::LabelImage &mask,
                         const std::string &acronym) const;

  /**
   * @brief Applies a full rule set to a copy of `mask`
   *
   * Every acronym and depth is resolved before the first voxel changes, so
   * an UnknownRegionException or InvalidDepthException leaves nothing
   * half-applied.
   */
  io::LabelImage Apply(const io::LabelImage &mask, const MergeRules &rules,
                       MergeStatistics *statistics = nullptr) const;

  std::vector<LabelRewrite> ResolveRules(const MergeRules &rules) const;

private:
  LabelRewrite ResolveFlatten(const std::string &acronym) const;
  LabelRewrite ResolveFlattenToDepth(const std::string &acronym,
                                     int depth) const;
  LabelRewrite ResolveExclude(const std::string &acronym) const;

  // Returns the number of voxels whose value changed
  static size_t ApplyRewrite(io::LabelImage &mask, const LabelRewrite &rewrite);

  const atlas::RegionHierarchy &m_hierarchy;
};

} // namespace mask
} // namespace neuroparcel

#endif // NEUROPARCEL_REGION_MERGER_H
