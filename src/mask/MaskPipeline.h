/**
 * @file MaskPipeline.h
 * @brief End-to-end atlas mask simplification
 *
 * Stages run strictly in sequence over whole volumes:
 *   whole-brain mask (from the raw labels) -> region merging ->
 *   fragment filtering -> ID remapping -> metadata tables.
 * Output files are written only once every stage has succeeded.
 */

#ifndef NEUROPARCEL_MASK_PIPELINE_H
#define NEUROPARCEL_MASK_PIPELINE_H

#include "../atlas/RegionHierarchy.h"
#include "../io/ImageIO.h"
#include "FragmentFilter.h"
#include "MetadataBuilder.h"
#include "PipelineConfig.h"
#include "RegionMerger.h"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace neuroparcel {
namespace mask {

enum class PipelineStage {
  CONFIGURATION,
  LOAD_HIERARCHY,
  LOAD_MASK,
  WHOLE_BRAIN_MASK,
  MERGE_REGIONS,
  FILTER_FRAGMENTS,
  REMAP_IDS,
  BUILD_METADATA,
  WRITE_OUTPUTS,
  COMPLETE
};

std::string StageToString(PipelineStage stage);

/**
 * @brief Everything the pipeline produces for one mask
 */
struct PipelineResult {
  io::OutputLabelImage adjusted_mask;
  io::BinaryMaskImage whole_brain_mask;

  std::vector<LabelMappingRow> label_mapping;
  std::vector<FragmentRecord> fragments;
  std::map<uint32_t, uint32_t> old_to_new;
  std::map<uint32_t, uint32_t> new_to_old;

  // Processing statistics
  MergeStatistics merge_statistics;
  size_t removed_fragments = 0;
  size_t removed_voxels = 0;
  double processing_time_ms = 0.0;
};

/**
 * @brief Outcome of ProcessDataset
 */
struct PipelineReport {
  bool success = false;
  PipelineStage failed_stage = PipelineStage::COMPLETE;
  std::string message;
  std::string error_report; // formatted report for NeuroParcelException
  std::vector<std::string> written_files;

  // Summary of a successful run
  size_t region_count = 0;
  size_t fragment_count = 0;
  size_t removed_fragments = 0;
  size_t remapped_ids = 0;
  double processing_time_ms = 0.0;
};

class MaskPipeline {
public:
  using ProgressCallback =
      std::function<void(double progress, const std::string &stage)>;

  MaskPipeline();
  explicit MaskPipeline(const PipelineConfig &config);

  void SetProgressCallback(ProgressCallback callback) {
    m_progress_callback = callback;
  }
  const PipelineConfig &GetConfig() const { return m_config; }

  /**
   * @brief Runs every stage on an in-memory mask
   *
   * Exceptions propagate unchanged; GetCurrentStage() then names the stage
   * that failed.
   */
  PipelineResult Run(const io::LabelImage &mask,
                     const atlas::RegionHierarchy &hierarchy);

  /**
   * @brief Loads the inputs from `directory`, runs and writes the outputs
   *
   * Never throws. On failure no output file is left behind.
   */
  PipelineReport ProcessDataset(const std::string &directory);

  PipelineStage GetCurrentStage() const { return m_stage; }

  // Absolute paths are kept, relative ones resolved against `directory`
  static std::string ResolvePath(const std::string &directory,
                                 const std::string &filename);

private:
  PipelineResult RunStages(const io::LabelImage &mask,
                           const atlas::RegionHierarchy &hierarchy);
  void EnterStage(PipelineStage stage, double progress);
  void ReportProgress(double progress, const std::string &stage);

  // Removes what it wrote when any write fails, then rethrows
  void WriteOutputs(const PipelineResult &result, const std::string &directory,
                    std::vector<std::string> &written) const;

  PipelineConfig m_config;
  ProgressCallback m_progress_callback;
  PipelineStage m_stage = PipelineStage::CONFIGURATION;
};

} // namespace mask
} // namespace neuroparcel

#endif // NEUROPARCEL_MASK_PIPELINE_H
