/**
 * @file MaskPipeline.cpp
 * @brief Stage sequencing, progress reporting and output handling
 */

#include "MaskPipeline.h"
#include "../core/NeuroParcelExceptions.h"
#include "../io/TableWriter.h"
#include "IdRemapper.h"
#include "WholeBrainMask.h"
#include <chrono>
#include <filesystem>
#include <iostream>

namespace neuroparcel {
namespace mask {

std::string StageToString(PipelineStage stage) {
  switch (stage) {
  case PipelineStage::CONFIGURATION:
    return "configuration";
  case PipelineStage::LOAD_HIERARCHY:
    return "load hierarchy";
  case PipelineStage::LOAD_MASK:
    return "load mask";
  case PipelineStage::WHOLE_BRAIN_MASK:
    return "whole-brain mask";
  case PipelineStage::MERGE_REGIONS:
    return "merge regions";
  case PipelineStage::FILTER_FRAGMENTS:
    return "filter fragments";
  case PipelineStage::REMAP_IDS:
    return "remap IDs";
  case PipelineStage::BUILD_METADATA:
    return "build metadata";
  case PipelineStage::WRITE_OUTPUTS:
    return "write outputs";
  case PipelineStage::COMPLETE:
    return "complete";
  default:
    return "unknown";
  }
}

MaskPipeline::MaskPipeline() : m_config(PipelineConfig()) {}

MaskPipeline::MaskPipeline(const PipelineConfig &config) : m_config(config) {}

std::string MaskPipeline::ResolvePath(const std::string &directory,
                                      const std::string &filename) {
  std::filesystem::path path(filename);
  if (path.is_absolute() || directory.empty()) {
    return path.string();
  }
  return (std::filesystem::path(directory) / path).string();
}

// ===== In-memory pipeline =====

PipelineResult MaskPipeline::Run(const io::LabelImage &mask,
                                 const atlas::RegionHierarchy &hierarchy) {
  EnterStage(PipelineStage::CONFIGURATION, 0.0);
  ValidatePipelineConfig(m_config);

  PipelineResult result = RunStages(mask, hierarchy);
  EnterStage(PipelineStage::COMPLETE, 1.0);
  return result;
}

PipelineResult
MaskPipeline::RunStages(const io::LabelImage &mask,
                        const atlas::RegionHierarchy &hierarchy) {
  auto start_time = std::chrono::high_resolution_clock::now();
  PipelineResult result;

  EnterStage(PipelineStage::WHOLE_BRAIN_MASK, 0.1);
  if (!mask.IsValid()) {
    throw ImageProcessingException("Run", "input mask is empty");
  }
  result.whole_brain_mask = CreateWholeBrainMask(mask);

  EnterStage(PipelineStage::MERGE_REGIONS, 0.2);
  RegionMerger merger(hierarchy);
  io::LabelImage merged =
      merger.Apply(mask, m_config.rules, &result.merge_statistics);

  if (m_config.verbose) {
    std::cout << "  Voxels flattened: "
              << result.merge_statistics.voxels_flattened << std::endl;
    std::cout << "  Voxels excluded: "
              << result.merge_statistics.voxels_excluded << std::endl;
  }

  EnterStage(PipelineStage::FILTER_FRAGMENTS, 0.4);
  FragmentFilterParameters filter_params;
  filter_params.min_fragment_size = m_config.min_fragment_size;
  filter_params.connectivity =
      Connectivity::FromNeighborCount(m_config.connectivity);
  FragmentFilter filter(hierarchy, filter_params);
  FragmentFilterResult filtered = filter.Apply(merged);
  merged.Clear();

  result.fragments = std::move(filtered.fragments);
  result.removed_fragments = filtered.removed_fragments;
  result.removed_voxels = filtered.removed_voxels;

  if (m_config.verbose) {
    std::cout << "  Fragments found: " << result.fragments.size()
              << ", removed: " << result.removed_fragments << " ("
              << result.removed_voxels << " voxels)" << std::endl;
  }

  EnterStage(PipelineStage::REMAP_IDS, 0.7);
  IdRemapper remapper(m_config.max_label_value);
  RemapResult remapped = remapper.Apply(filtered.mask);
  filtered.mask.Clear();

  result.old_to_new = std::move(remapped.old_to_new);
  result.new_to_old = std::move(remapped.new_to_old);
  result.adjusted_mask = ToOutputImage<uint16_t>(remapped.mask);

  if (m_config.verbose && !result.old_to_new.empty()) {
    std::cout << "  Remapped " << result.old_to_new.size()
              << " IDs above " << m_config.max_label_value << std::endl;
  }

  EnterStage(PipelineStage::BUILD_METADATA, 0.85);
  MetadataBuilder metadata(hierarchy);
  result.label_mapping =
      metadata.BuildLabelMapping(remapped.mask, result.new_to_old);

  auto end_time = std::chrono::high_resolution_clock::now();
  result.processing_time_ms =
      std::chrono::duration<double, std::milli>(end_time - start_time).count();

  return result;
}

// ===== Dataset processing =====

void MaskPipeline::WriteOutputs(const PipelineResult &result,
                                const std::string &directory,
                                std::vector<std::string> &written) const {
  const std::string output_mask = ResolvePath(directory, m_config.output_mask);
  const std::string brain_mask =
      ResolvePath(directory, m_config.whole_brain_mask);
  const std::string label_csv = ResolvePath(directory, m_config.label_csv);
  const std::string fragment_csv =
      ResolvePath(directory, m_config.fragment_csv);

  // Each path is recorded before its write so a half-written file is
  // removed along with the completed ones
  try {
    written.push_back(output_mask);
    io::ImageUtils::WriteImage(result.adjusted_mask, output_mask,
                               m_config.verbose);

    written.push_back(brain_mask);
    io::ImageUtils::WriteImage(result.whole_brain_mask, brain_mask,
                               m_config.verbose);

    io::TableWriter writer;
    written.push_back(label_csv);
    writer.WriteFile(MetadataBuilder::LabelMappingTable(result.label_mapping),
                     label_csv);

    written.push_back(fragment_csv);
    writer.WriteFile(MetadataBuilder::FragmentTable(result.fragments),
                     fragment_csv);
  } catch (const std::exception &) {
    for (const auto &file : written) {
      std::error_code ec;
      std::filesystem::remove(file, ec);
    }
    written.clear();
    throw;
  }
}

PipelineReport MaskPipeline::ProcessDataset(const std::string &directory) {
  PipelineReport report;
  auto start_time = std::chrono::high_resolution_clock::now();

  try {
    EnterStage(PipelineStage::CONFIGURATION, 0.0);
    ValidatePipelineConfig(m_config);
    if (!std::filesystem::is_directory(directory)) {
      throw io::FileNotFoundException(directory);
    }

    EnterStage(PipelineStage::LOAD_HIERARCHY, 0.0);
    auto hierarchy = atlas::RegionHierarchy::LoadStructuresCsv(
        ResolvePath(directory, m_config.structures));

    if (m_config.verbose) {
      std::cout << "  Atlas regions: " << hierarchy.Size() << std::endl;
    }

    EnterStage(PipelineStage::LOAD_MASK, 0.05);
    auto mask = io::ImageUtils::ReadLabelImage(
        ResolvePath(directory, m_config.input_mask), m_config.verbose);

    PipelineResult result = RunStages(*mask, hierarchy);
    mask.reset();

    EnterStage(PipelineStage::WRITE_OUTPUTS, 0.95);
    WriteOutputs(result, directory, report.written_files);

    report.success = true;
    report.message = "Processing complete";
    report.region_count = result.label_mapping.size();
    report.fragment_count = result.fragments.size();
    report.removed_fragments = result.removed_fragments;
    report.remapped_ids = result.old_to_new.size();

    EnterStage(PipelineStage::COMPLETE, 1.0);
  } catch (const NeuroParcelException &e) {
    report.failed_stage = m_stage;
    report.message = e.GetMessage();
    report.error_report = e.GetFormattedReport();
  } catch (const io::ImageIOException &e) {
    report.failed_stage = m_stage;
    report.message = std::string("I/O error: ") + e.what();
  } catch (const std::exception &e) {
    report.failed_stage = m_stage;
    report.message = std::string("Processing error: ") + e.what();
  }

  auto end_time = std::chrono::high_resolution_clock::now();
  report.processing_time_ms =
      std::chrono::duration<double, std::milli>(end_time - start_time).count();

  return report;
}

// ===== Helper Functions =====

void MaskPipeline::EnterStage(PipelineStage stage, double progress) {
  m_stage = stage;
  ReportProgress(progress, StageToString(stage));
}

void MaskPipeline::ReportProgress(double progress, const std::string &stage) {
  if (m_progress_callback) {
    m_progress_callback(progress, stage);
  }

  if (m_config.verbose) {
    std::cout << "Progress: " << static_cast<int>(progress * 100) << "% - "
              << stage << std::endl;
  }
}

} // namespace mask
} // namespace neuroparcel
