/**
 * @file PipelineConfig.h
 * @brief Settings of the mask simplification pipeline
 *
 * Defaults reproduce the mouse atlas simplification used for the Allen-style
 * BrainGlobe atlases. A config file overrides them with `key = value` lines:
 *
 *   # comment
 *   flatten = fiber tracts, VS, CB
 *   flatten_to_depth = Isocortex:1, OLF:1
 *   min_fragment_size = 50
 */

#ifndef NEUROPARCEL_PIPELINE_CONFIG_H
#define NEUROPARCEL_PIPELINE_CONFIG_H

#include "RegionMerger.h"
#include <string>

namespace neuroparcel {
namespace mask {

// Flatten, flatten-to-depth and exclusion lists of the default atlas cleanup
MergeRules DefaultMergeRules();

struct PipelineConfig {
  // Files, relative to the dataset directory unless absolute
  std::string input_mask = "registered_atlas_original_orientation.tiff";
  std::string output_mask = "adjusted_mask.tiff";
  std::string whole_brain_mask = "whole_brain_mask.tiff";
  std::string label_csv = "used_region_ids.csv";
  std::string fragment_csv = "region_fragments_with_sizes.csv";
  std::string structures = "structures.csv";

  MergeRules rules = DefaultMergeRules();

  size_t min_fragment_size = 50;
  uint32_t max_label_value = 65535; // adjusted mask is stored as uint16
  int connectivity = 6;             // 6, 18 or 26

  bool verbose = false;
};

/**
 * @brief Reads `path` over the defaults
 *
 * Throws ConfigurationException on unknown keys and malformed values, and
 * when the file cannot be opened.
 */
PipelineConfig LoadPipelineConfig(const std::string &path);

// Sets one key from its text form; shared by the file loader and the CLI
void SetConfigValue(PipelineConfig &config, const std::string &key,
                    const std::string &value);

// Throws ConfigurationException
void ValidatePipelineConfig(const PipelineConfig &config);

} // namespace mask
} // namespace neuroparcel

#endif // NEUROPARCEL_PIPELINE_CONFIG_H
