/**
 * @file MetadataBuilder.cpp
 * @brief Label mapping and fragment report tables
 */

#include "MetadataBuilder.h"

namespace neuroparcel {
namespace mask {

std::vector<LabelMappingRow> MetadataBuilder::BuildLabelMapping(
    const io::LabelImage &final_mask,
    const std::map<uint32_t, uint32_t> &new_to_old) const {
  std::vector<LabelMappingRow> rows;

  for (uint32_t id : final_mask.GetUniqueValues()) {
    LabelMappingRow row;
    row.region_id = id;

    auto remapped = new_to_old.find(id);
    uint32_t lookup = remapped == new_to_old.end() ? id : remapped->second;
    const atlas::RegionNode *node = m_hierarchy.FindById(lookup);

    if (node) {
      row.region_name = node->name;
      row.region_acronym = node->acronym;
    } else {
      std::string placeholder =
          remapped == new_to_old.end() ? "Unknown_" + std::to_string(id)
                                       : "Remapped_" + std::to_string(lookup);
      row.region_name = placeholder;
      row.region_acronym = placeholder;
    }
    rows.push_back(std::move(row));
  }

  return rows;
}

io::Table
MetadataBuilder::LabelMappingTable(const std::vector<LabelMappingRow> &rows) {
  io::Table table;
  table.columns = {"region_id", "region_name", "region_acronym"};
  table.rows.reserve(rows.size());
  for (const auto &row : rows) {
    table.rows.push_back(
        {std::to_string(row.region_id), row.region_name, row.region_acronym});
  }
  return table;
}

io::Table
MetadataBuilder::FragmentTable(const std::vector<FragmentRecord> &records) {
  io::Table table;
  table.columns = {"region_id", "region_name", "fragment_index",
                   "fragment_size_voxels", "removed"};
  table.rows.reserve(records.size());
  for (const auto &record : records) {
    table.rows.push_back({std::to_string(record.region_id), record.region_name,
                          std::to_string(record.fragment_index),
                          std::to_string(record.voxel_count),
                          record.removed ? "True" : "False"});
  }
  return table;
}

} // namespace mask
} // namespace neuroparcel
