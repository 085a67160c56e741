/**
 * @file main.cpp
 * @brief Command-line atlas mask simplification
 *
 * Processes one dataset folder holding a registered atlas annotation and
 * writes the simplified mask, the whole-brain mask and the two CSV reports
 * next to it.
 */

#include "../core/NeuroParcelExceptions.h"
#include "../mask/MaskPipeline.h"
#include "../mask/PipelineConfig.h"
#include <iomanip>
#include <iostream>
#include <string>

using namespace neuroparcel;

namespace {

void PrintUsage(const char *program) {
  std::cout << "Usage: " << program << " <dataset_dir> [options]" << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --config <file>             key = value settings file"
            << std::endl;
  std::cout << "  --input <file>              atlas mask inside the dataset"
            << std::endl;
  std::cout << "  --atlas <file>              BrainGlobe structures.csv"
            << std::endl;
  std::cout << "  --min-fragment-size <n>     smallest fragment kept (50)"
            << std::endl;
  std::cout << "  --max-label <v>             largest output label (65535)"
            << std::endl;
  std::cout << "  --connectivity <6|18|26>    voxel adjacency (6)" << std::endl;
  std::cout << "  --verbose                   print stage progress" << std::endl;
  std::cout << std::endl;
  std::cout << "Example: " << program
            << " data/sample01 --atlas allen_mouse_25um/structures.csv"
            << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  std::cout << "NeuroParcel Atlas Mask Simplification" << std::endl;
  std::cout << "=====================================" << std::endl;
  std::cout << std::endl;

  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  std::string dataset_dir;
  mask::PipelineConfig config;

  try {
    // A config file is applied first so that other flags override it
    for (int i = 1; i < argc; ++i) {
      if (std::string(argv[i]) == "--config") {
        if (i + 1 >= argc) {
          throw ConfigurationException("--config", "", "a file name");
        }
        config = mask::LoadPipelineConfig(argv[i + 1]);
      }
    }

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--verbose" || arg == "-v") {
        config.verbose = true;
      } else if (arg == "--config") {
        ++i;
      } else if (arg == "--input" || arg == "--atlas" ||
                 arg == "--min-fragment-size" || arg == "--max-label" ||
                 arg == "--connectivity") {
        if (i + 1 >= argc) {
          throw ConfigurationException(arg, "", "a value");
        }
        std::string value = argv[++i];
        if (arg == "--input") {
          mask::SetConfigValue(config, "input_mask", value);
        } else if (arg == "--atlas") {
          mask::SetConfigValue(config, "structures", value);
        } else if (arg == "--min-fragment-size") {
          mask::SetConfigValue(config, "min_fragment_size", value);
        } else if (arg == "--max-label") {
          mask::SetConfigValue(config, "max_label_value", value);
        } else {
          mask::SetConfigValue(config, "connectivity", value);
        }
      } else if (!arg.empty() && arg[0] == '-') {
        throw ConfigurationException(arg, "", "a known option");
      } else if (dataset_dir.empty()) {
        dataset_dir = arg;
      } else {
        throw ConfigurationException("dataset_dir", arg,
                                     "a single dataset folder");
      }
    }

    if (dataset_dir.empty()) {
      throw ConfigurationException("dataset_dir", "", "a dataset folder");
    }
    mask::ValidatePipelineConfig(config);
  } catch (const NeuroParcelException &e) {
    std::cerr << e.GetFormattedReport() << std::endl;
    PrintUsage(argv[0]);
    return 1;
  }

  std::cout << "Dataset: " << dataset_dir << std::endl;
  std::cout << "Input mask: "
            << mask::MaskPipeline::ResolvePath(dataset_dir, config.input_mask)
            << std::endl;
  std::cout << "Atlas: "
            << mask::MaskPipeline::ResolvePath(dataset_dir, config.structures)
            << std::endl;
  std::cout << "Minimum fragment size: " << config.min_fragment_size
            << " voxels" << std::endl;
  std::cout << "Connectivity: " << config.connectivity << std::endl;
  std::cout << std::endl;

  mask::MaskPipeline pipeline(config);
  auto report = pipeline.ProcessDataset(dataset_dir);

  if (!report.success) {
    std::cerr << "Processing failed during "
              << mask::StageToString(report.failed_stage) << ": "
              << report.message << std::endl;
    if (!report.error_report.empty()) {
      std::cerr << std::endl << report.error_report;
    }
    return 1;
  }

  std::cout << "Processing Statistics:" << std::endl;
  std::cout << "Regions in output: " << report.region_count << std::endl;
  std::cout << "Fragments found: " << report.fragment_count << std::endl;
  std::cout << "Fragments removed: " << report.removed_fragments << std::endl;
  std::cout << "IDs remapped: " << report.remapped_ids << std::endl;
  std::cout << "Processing time: " << std::fixed << std::setprecision(2)
            << report.processing_time_ms / 1000.0 << " seconds" << std::endl;
  std::cout << std::endl;

  std::cout << "Outputs:" << std::endl;
  for (const auto &file : report.written_files) {
    std::cout << "  " << file << std::endl;
  }

  std::cout << std::endl;
  std::cout << "Mask simplification completed successfully!" << std::endl;

  return 0;
}
