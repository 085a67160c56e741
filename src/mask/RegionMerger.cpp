/**
 * @file RegionMerger.cpp
 * @brief Flatten-subtree, flatten-to-depth and exclusion rules
 */

#include "RegionMerger.h"

namespace neuroparcel {
namespace mask {

// ===== Rule resolution =====

LabelRewrite RegionMerger::ResolveFlatten(const std::string &acronym) const {
  LabelRewrite rewrite;
  rewrite.description = "flatten " + acronym;

  uint32_t target = m_hierarchy.IdOf(acronym);
  for (const auto &descendant : m_hierarchy.DescendantsOf(acronym)) {
    rewrite.mapping[m_hierarchy.IdOf(descendant)] = target;
  }
  return rewrite;
}

LabelRewrite RegionMerger::ResolveFlattenToDepth(const std::string &acronym,
                                                 int depth) const {
  LabelRewrite rewrite;
  rewrite.description =
      "flatten " + acronym + " to depth " + std::to_string(depth);

  for (const auto &kept : m_hierarchy.DescendantsAtDepth(acronym, depth)) {
    uint32_t kept_id = m_hierarchy.IdOf(kept);
    for (const auto &descendant : m_hierarchy.DescendantsOf(kept)) {
      rewrite.mapping[m_hierarchy.IdOf(descendant)] = kept_id;
    }
  }
  return rewrite;
}

LabelRewrite RegionMerger::ResolveExclude(const std::string &acronym) const {
  LabelRewrite rewrite;
  rewrite.description = "exclude " + acronym;
  rewrite.mapping[m_hierarchy.IdOf(acronym)] = 0;
  return rewrite;
}

std::vector<LabelRewrite>
RegionMerger::ResolveRules(const MergeRules &rules) const {
  std::vector<LabelRewrite> rewrites;
  rewrites.reserve(rules.flatten.size() + rules.flatten_to_depth.size() +
                   rules.exclude.size());

  for (const auto &acronym : rules.flatten) {
    rewrites.push_back(ResolveFlatten(acronym));
  }
  for (const auto &rule : rules.flatten_to_depth) {
    rewrites.push_back(ResolveFlattenToDepth(rule.acronym, rule.depth));
  }
  for (const auto &acronym : rules.exclude) {
    rewrites.push_back(ResolveExclude(acronym));
  }
  return rewrites;
}

// ===== Voxel rewriting =====

size_t RegionMerger::ApplyRewrite(io::LabelImage &mask,
                                  const LabelRewrite &rewrite) {
  if (rewrite.mapping.empty()) {
    return 0;
  }

  size_t changed = 0;
  uint32_t cached_from = 0;
  uint32_t cached_to = 0;
  bool have_cache = false;

  for (auto &value : mask.GetDataVector()) {
    if (value == 0) {
      continue;
    }
    if (!have_cache || value != cached_from) {
      auto it = rewrite.mapping.find(value);
      cached_from = value;
      cached_to = it == rewrite.mapping.end() ? value : it->second;
      have_cache = true;
    }
    if (cached_to != value) {
      value = cached_to;
      ++changed;
    }
  }
  return changed;
}

io::LabelImage RegionMerger::FlattenSubtree(const io::LabelImage &mask,
                                            const std::string &acronym) const {
  LabelRewrite rewrite = ResolveFlatten(acronym);
  io::LabelImage result(mask);
  ApplyRewrite(result, rewrite);
  return result;
}

io::LabelImage RegionMerger::FlattenToDepth(const io::LabelImage &mask,
                                            const std::string &acronym,
                                            int depth) const {
  LabelRewrite rewrite = ResolveFlattenToDepth(acronym, depth);
  io::LabelImage result(mask);
  ApplyRewrite(result, rewrite);
  return result;
}

io::LabelImage RegionMerger::Exclude(const io::LabelImage &mask,
                                     const std::string &acronym) const {
  LabelRewrite rewrite = ResolveExclude(acronym);
  io::LabelImage result(mask);
  ApplyRewrite(result, rewrite);
  return result;
}

io::LabelImage RegionMerger::Apply(const io::LabelImage &mask,
                                   const MergeRules &rules,
                                   MergeStatistics *statistics) const {
  std::vector<LabelRewrite> rewrites = ResolveRules(rules);

  io::LabelImage result(mask);
  MergeStatistics stats;
  stats.nonzero_before = mask.CountNonZero();

  size_t flatten_rules = rules.flatten.size() + rules.flatten_to_depth.size();
  for (size_t i = 0; i < rewrites.size(); ++i) {
    size_t changed = ApplyRewrite(result, rewrites[i]);
    if (i < flatten_rules) {
      stats.voxels_flattened += changed;
    } else {
      stats.voxels_excluded += changed;
    }
  }

  stats.nonzero_after = result.CountNonZero();
  if (statistics) {
    *statistics = stats;
  }
  return result;
}

} // namespace mask
} // namespace neuroparcel
