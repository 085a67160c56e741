/**
 * @file RegionHierarchy.h
 * @brief Anatomical region tree of a brain atlas
 *
 * Regions are stored in a flat node table; parent and child links are
 * indices into that table. The tree is immutable once constructed.
 */

#ifndef NEUROPARCEL_REGION_HIERARCHY_H
#define NEUROPARCEL_REGION_HIERARCHY_H

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace neuroparcel {
namespace atlas {

/**
 * @brief One row of an atlas structures table
 */
struct RegionRecord {
  uint32_t id = 0;
  std::string name;
  std::string acronym;
  std::optional<uint32_t> parent_id; // empty for the root
};

/**
 * @brief Arena node
 */
struct RegionNode {
  uint32_t id = 0;
  std::string name;
  std::string acronym;
  size_t parent = std::numeric_limits<size_t>::max();
  std::vector<size_t> children;
  size_t depth = 0; // parent hops from the root
};

class RegionHierarchy {
public:
  static constexpr size_t kNoParent = std::numeric_limits<size_t>::max();

  /**
   * @brief Builds the tree from unordered records
   *
   * Throws AtlasFormatException on duplicate IDs or acronyms, unknown
   * parents, a missing or repeated root, or nodes unreachable from the root.
   */
  explicit RegionHierarchy(const std::vector<RegionRecord> &records,
                           const std::string &source = "<memory>");

  /**
   * @brief Loads a BrainGlobe structures.csv
   *
   * Columns are located by header name: id, acronym, name and either
   * parent_structure_id or structure_id_path.
   */
  static RegionHierarchy LoadStructuresCsv(const std::string &filename);

  // Throws UnknownRegionException
  uint32_t IdOf(const std::string &acronym) const;

  // All regions below `acronym`, depth-first, the region itself excluded
  std::vector<std::string> DescendantsOf(const std::string &acronym) const;

  // Regions exactly `depth` parent hops below `acronym`; depth >= 1
  std::vector<std::string> DescendantsAtDepth(const std::string &acronym,
                                              int depth) const;

  const RegionNode *FindById(uint32_t id) const;
  const RegionNode *FindByAcronym(const std::string &acronym) const;
  bool Contains(const std::string &acronym) const {
    return FindByAcronym(acronym) != nullptr;
  }

  size_t DepthOf(const std::string &acronym) const;

  size_t Size() const { return m_nodes.size(); }
  const RegionNode &Root() const { return m_nodes[m_root]; }
  const RegionNode &Node(size_t index) const { return m_nodes.at(index); }
  const std::string &GetSource() const { return m_source; }

private:
  size_t IndexOf(const std::string &acronym, const std::string &function) const;
  void CollectDescendants(size_t index, std::vector<std::string> &out) const;

  std::vector<RegionNode> m_nodes;
  std::unordered_map<std::string, size_t> m_by_acronym;
  std::unordered_map<uint32_t, size_t> m_by_id;
  size_t m_root = kNoParent;
  std::string m_source;
};

} // namespace atlas
} // namespace neuroparcel

#endif // NEUROPARCEL_REGION_HIERARCHY_H
