/**
 * @file PipelineConfig.cpp
 * @brief Config file parsing and validation
 */

#include "PipelineConfig.h"
#include "../core/NeuroParcelExceptions.h"
#include "../io/CompatUtils.h"
#include "FragmentFilter.h"
#include <fstream>
#include <limits>

namespace neuroparcel {
namespace mask {

namespace {

unsigned long ParseUnsigned(const std::string &key, const std::string &value,
                            unsigned long max_value) {
  std::string text = io::compat::trim(value);
  size_t consumed = 0;
  unsigned long parsed = 0;
  bool ok = !text.empty() && text[0] != '-' && text[0] != '+';
  if (ok) {
    try {
      parsed = std::stoul(text, &consumed);
    } catch (const std::exception &) {
      ok = false;
    }
  }
  if (!ok || consumed != text.size() || parsed > max_value) {
    throw ConfigurationException(key, value,
                                 "integer in [0, " + std::to_string(max_value) +
                                     "]");
  }
  return parsed;
}

bool ParseBool(const std::string &key, const std::string &value) {
  std::string text = io::compat::to_lower(io::compat::trim(value));
  if (text == "true" || text == "yes" || text == "on" || text == "1") {
    return true;
  }
  if (text == "false" || text == "no" || text == "off" || text == "0") {
    return false;
  }
  throw ConfigurationException(key, value, "true or false");
}

std::vector<DepthRule> ParseDepthRules(const std::string &key,
                                       const std::string &value) {
  std::vector<DepthRule> rules;
  for (const auto &entry : io::compat::split_trimmed(value, ',')) {
    size_t colon = entry.rfind(':');
    if (colon == std::string::npos) {
      throw ConfigurationException(key, entry, "ACRONYM:DEPTH");
    }

    DepthRule rule;
    rule.acronym = io::compat::trim(entry.substr(0, colon));
    std::string depth_text = io::compat::trim(entry.substr(colon + 1));
    if (rule.acronym.empty()) {
      throw ConfigurationException(key, entry, "ACRONYM:DEPTH");
    }

    size_t consumed = 0;
    try {
      rule.depth = std::stoi(depth_text, &consumed);
    } catch (const std::exception &) {
      throw ConfigurationException(key, entry, "ACRONYM:DEPTH");
    }
    if (consumed != depth_text.size()) {
      throw ConfigurationException(key, entry, "ACRONYM:DEPTH");
    }
    rules.push_back(rule);
  }
  return rules;
}

} // namespace

MergeRules DefaultMergeRules() {
  MergeRules rules;
  rules.flatten = {"fiber tracts", "VS", "CB",  "HB",  "MB",
                   "TH",           "HY", "STR", "PAL", "CTXsp"};
  rules.flatten_to_depth = {{"Isocortex", 1}, {"OLF", 1}};
  rules.exclude = {"fiber tracts", "root"};
  return rules;
}

void SetConfigValue(PipelineConfig &config, const std::string &key,
                    const std::string &value) {
  const std::string text = io::compat::trim(value);

  if (key == "input_mask") {
    config.input_mask = text;
  } else if (key == "output_mask") {
    config.output_mask = text;
  } else if (key == "whole_brain_mask") {
    config.whole_brain_mask = text;
  } else if (key == "label_csv") {
    config.label_csv = text;
  } else if (key == "fragment_csv") {
    config.fragment_csv = text;
  } else if (key == "structures") {
    config.structures = text;
  } else if (key == "flatten") {
    config.rules.flatten = io::compat::split_trimmed(text, ',');
  } else if (key == "flatten_to_depth") {
    config.rules.flatten_to_depth = ParseDepthRules(key, text);
  } else if (key == "exclude") {
    config.rules.exclude = io::compat::split_trimmed(text, ',');
  } else if (key == "min_fragment_size") {
    config.min_fragment_size = static_cast<size_t>(
        ParseUnsigned(key, text, std::numeric_limits<uint32_t>::max()));
  } else if (key == "max_label_value") {
    config.max_label_value = static_cast<uint32_t>(
        ParseUnsigned(key, text, std::numeric_limits<uint32_t>::max()));
  } else if (key == "connectivity") {
    config.connectivity = static_cast<int>(ParseUnsigned(key, text, 26));
  } else if (key == "verbose") {
    config.verbose = ParseBool(key, text);
  } else {
    throw ConfigurationException(key, value, "a known configuration key");
  }
}

PipelineConfig LoadPipelineConfig(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigurationException("config", path, "a readable config file");
  }

  PipelineConfig config;
  std::string line;
  size_t line_number = 0;
  while (std::getline(file, line)) {
    ++line_number;

    size_t comment = line.find('#');
    if (comment != std::string::npos) {
      line.erase(comment);
    }
    line = io::compat::trim(line);
    if (line.empty()) {
      continue;
    }

    size_t equals = line.find('=');
    if (equals == std::string::npos) {
      throw ConfigurationException("line " + std::to_string(line_number), line,
                                   "key = value");
    }
    SetConfigValue(config, io::compat::trim(line.substr(0, equals)),
                   line.substr(equals + 1));
  }

  return config;
}

void ValidatePipelineConfig(const PipelineConfig &config) {
  if (config.max_label_value < 1 || config.max_label_value > 65535) {
    throw ConfigurationException("max_label_value",
                                 std::to_string(config.max_label_value),
                                 "1 to 65535");
  }

  const std::pair<const char *, const std::string *> files[] = {
      {"input_mask", &config.input_mask},
      {"output_mask", &config.output_mask},
      {"whole_brain_mask", &config.whole_brain_mask},
      {"label_csv", &config.label_csv},
      {"fragment_csv", &config.fragment_csv},
      {"structures", &config.structures}};
  for (const auto &file : files) {
    if (file.second->empty()) {
      throw ConfigurationException(file.first, "", "a file name");
    }
  }

  for (const auto &rule : config.rules.flatten_to_depth) {
    if (rule.depth < 1) {
      throw ConfigurationException("flatten_to_depth",
                                   rule.acronym + ":" +
                                       std::to_string(rule.depth),
                                   "depth of at least 1");
    }
  }

  // Throws for anything but 6, 18 and 26
  Connectivity::FromNeighborCount(config.connectivity);
}

} // namespace mask
} // namespace neuroparcel
