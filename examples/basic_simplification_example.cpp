/**
 * @file basic_simplification_example.cpp
 * @brief Example running the simplification stages one at a time
 */

#include <iomanip>
#include <iostream>
#include "../src/atlas/RegionHierarchy.h"
#include "../src/core/NeuroParcelExceptions.h"
#include "../src/io/ImageIO.h"
#include "../src/io/TableWriter.h"
#include "../src/mask/FragmentFilter.h"
#include "../src/mask/IdRemapper.h"
#include "../src/mask/MetadataBuilder.h"
#include "../src/mask/RegionMerger.h"

using namespace neuroparcel;
using namespace neuroparcel::mask;

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <atlas_mask> <structures.csv> [min_fragment_size]\n";
    std::cout << "\nArguments:\n";
    std::cout << "  atlas_mask        : Registered annotation (TIFF or NIfTI)\n";
    std::cout << "  structures.csv    : BrainGlobe region table of the atlas\n";
    std::cout << "  min_fragment_size : Smallest fragment kept (default 50)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 3 || argc > 4) {
        printUsage(argv[0]);
        return 1;
    }

    std::string mask_file = argv[1];
    std::string structures_file = argv[2];

    std::cout << "NeuroParcel: Stage-by-stage Simplification\n";
    std::cout << "==========================================\n";
    std::cout << "Mask: " << mask_file << "\n";
    std::cout << "Atlas: " << structures_file << "\n\n";

    try {
        auto hierarchy = atlas::RegionHierarchy::LoadStructuresCsv(structures_file);
        auto mask = io::ImageUtils::ReadLabelImage(mask_file, true);

        std::cout << "Regions in atlas: " << hierarchy.Size() << "\n";
        std::cout << "Distinct labels in mask: " << mask->GetUniqueValues().size() << "\n\n";

        // Only merge the cerebellum and brain stem; keep everything else
        MergeRules rules;
        for (const char* acronym : {"CB", "HB", "MB"}) {
            if (hierarchy.Contains(acronym)) {
                rules.flatten.push_back(acronym);
            }
        }
        rules.exclude = {hierarchy.Root().acronym};

        MergeStatistics stats;
        auto merged = RegionMerger(hierarchy).Apply(*mask, rules, &stats);
        std::cout << "Merged " << stats.voxels_flattened << " voxels, excluded "
                  << stats.voxels_excluded << "\n";

        FragmentFilterParameters params;
        if (argc == 4) {
            params.min_fragment_size = std::stoul(argv[3]);
        }
        auto filtered = FragmentFilter(hierarchy, params).Apply(merged);
        std::cout << "Fragments: " << filtered.fragments.size() << ", removed "
                  << filtered.removed_fragments << " (" << filtered.removed_voxels
                  << " voxels)\n";

        auto remapped = IdRemapper().Apply(filtered.mask);
        for (const auto& entry : remapped.old_to_new) {
            std::cout << "Remapped " << entry.first << " -> " << entry.second << "\n";
        }

        auto rows = MetadataBuilder(hierarchy).BuildLabelMapping(remapped.mask,
                                                                  remapped.new_to_old);
        std::cout << "\nFinal labels:\n";
        io::TableWriter().Write(MetadataBuilder::LabelMappingTable(rows), std::cout);

    } catch (const NeuroParcelException& e) {
        std::cerr << e.GetFormattedReport();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
