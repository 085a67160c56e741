/**
 * @file MetadataBuilder.h
 * @brief Label mapping and fragment report tables
 */

#ifndef NEUROPARCEL_METADATA_BUILDER_H
#define NEUROPARCEL_METADATA_BUILDER_H

#include "../atlas/RegionHierarchy.h"
#include "../io/ImageIO.h"
#include "../io/TableWriter.h"
#include "FragmentFilter.h"
#include <map>
#include <string>
#include <vector>

namespace neuroparcel {
namespace mask {

/**
 * @brief One row of the label mapping table
 */
struct LabelMappingRow {
  uint32_t region_id = 0;
  std::string region_name;
  std::string region_acronym;
};

class MetadataBuilder {
public:
  explicit MetadataBuilder(const atlas::RegionHierarchy &hierarchy)
      : m_hierarchy(hierarchy) {}

  /**
   * @brief Names every distinct nonzero ID of the final mask, ascending
   *
   * An ID produced by the remapper is resolved through its original ID
   * (placeholder "Remapped_<old>"); any other ID is resolved directly
   * (placeholder "Unknown_<id>").
   */
  std::vector<LabelMappingRow>
  BuildLabelMapping(const io::LabelImage &final_mask,
                    const std::map<uint32_t, uint32_t> &new_to_old) const;

  // region_id, region_name, region_acronym
  static io::Table LabelMappingTable(const std::vector<LabelMappingRow> &rows);

  // region_id, region_name, fragment_index, fragment_size_voxels, removed
  static io::Table FragmentTable(const std::vector<FragmentRecord> &records);

private:
  const atlas::RegionHierarchy &m_hierarchy;
};

} // namespace mask
} // namespace neuroparcel

#endif // NEUROPARCEL_METADATA_BUILDER_H
