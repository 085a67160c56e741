/**
 * @file IdRemapper.cpp
 * @brief Over-range ID compaction
 */

#include "IdRemapper.h"
#include <vector>

namespace neuroparcel {
namespace mask {

IdRemapper::IdRemapper(uint32_t max_value) : m_max_value(max_value) {
  if (m_max_value == 0) {
    throw ConfigurationException("max_label_value", "0", "at least 1");
  }
}

RemapResult IdRemapper::Apply(const io::LabelImage &mask) const {
  RemapResult result;
  result.mask = mask;

  // Ascending, zero excluded
  std::vector<uint32_t> present = mask.GetUniqueValues();

  std::vector<uint32_t> over_range;
  std::vector<bool> used(static_cast<size_t>(m_max_value) + 1, false);
  for (uint32_t id : present) {
    if (id > m_max_value) {
      over_range.push_back(id);
    } else {
      used[id] = true;
    }
  }

  if (over_range.empty()) {
    return result;
  }

  size_t in_range = present.size() - over_range.size();
  size_t available = static_cast<size_t>(m_max_value) - in_range;
  if (over_range.size() > available) {
    throw RemapExhaustedException(over_range.size(), available, m_max_value);
  }

  uint32_t candidate = 1;
  for (uint32_t old_id : over_range) {
    while (used[candidate]) {
      ++candidate;
    }
    used[candidate] = true;
    result.old_to_new[old_id] = candidate;
    result.new_to_old[candidate] = old_id;
  }

  uint32_t cached_from = 0;
  uint32_t cached_to = 0;
  for (auto &value : result.mask.GetDataVector()) {
    if (value <= m_max_value) {
      continue;
    }
    if (value != cached_from) {
      cached_from = value;
      cached_to = result.old_to_new.at(value);
    }
    value = cached_to;
  }

  return result;
}

} // namespace mask
} // namespace neuroparcel
