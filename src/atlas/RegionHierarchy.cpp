/**
 * @file RegionHierarchy.cpp
 * @brief Region tree construction, queries and structures.csv loading
 */

#include "RegionHierarchy.h"
#include "../core/NeuroParcelExceptions.h"
#include "../io/CompatUtils.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <queue>

namespace neuroparcel {
namespace atlas {

namespace {

// Splits one CSV record, honouring double-quoted fields
std::vector<std::string> SplitCsvRecord(const std::string &line) {
  std::vector<std::string> fields;
  std::string field;
  bool in_quotes = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field += c;
      }
    } else if (c == '"') {
      in_quotes = true;
    } else if (c == ',') {
      fields.push_back(field);
      field.clear();
    } else if (c != '\r') {
      field += c;
    }
  }
  fields.push_back(field);
  return fields;
}

// Accepts "567" and the "567.0" a float-typed column produces
std::optional<uint32_t> ParseRegionId(const std::string &text) {
  std::string value = io::compat::trim(text);
  if (value.empty() || io::compat::to_lower(value) == "nan") {
    return std::nullopt;
  }

  size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::exception &) {
    return std::nullopt;
  }
  if (consumed != value.size() || parsed < 0.0 || std::floor(parsed) != parsed ||
      parsed > static_cast<double>(std::numeric_limits<uint32_t>::max())) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(parsed);
}

// "[997, 8, 567]" or "/997/8/567/" -> {997, 8, 567}; nullopt when an ID
// does not fit in 32 bits
std::optional<std::vector<uint32_t>> ParseIdPath(const std::string &text) {
  std::vector<uint32_t> ids;
  uint64_t value = 0;
  bool in_number = false;
  for (char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      value = value * 10 + static_cast<uint64_t>(c - '0');
      if (value > std::numeric_limits<uint32_t>::max()) {
        return std::nullopt;
      }
      in_number = true;
    } else if (in_number) {
      ids.push_back(static_cast<uint32_t>(value));
      value = 0;
      in_number = false;
    }
  }
  if (in_number) {
    ids.push_back(static_cast<uint32_t>(value));
  }
  return ids;
}

} // namespace

// ===== Construction =====

RegionHierarchy::RegionHierarchy(const std::vector<RegionRecord> &records,
                                 const std::string &source)
    : m_source(source) {
  if (records.empty()) {
    throw AtlasFormatException(source, "no regions");
  }

  m_nodes.reserve(records.size());
  for (const auto &record : records) {
    if (record.acronym.empty()) {
      throw AtlasFormatException(source, "region " + std::to_string(record.id) +
                                             " has an empty acronym");
    }
    if (!m_by_id.emplace(record.id, m_nodes.size()).second) {
      throw AtlasFormatException(source, "duplicate region id " +
                                             std::to_string(record.id));
    }
    if (!m_by_acronym.emplace(record.acronym, m_nodes.size()).second) {
      throw AtlasFormatException(source,
                                 "duplicate acronym '" + record.acronym + "'");
    }

    RegionNode node;
    node.id = record.id;
    node.name = record.name;
    node.acronym = record.acronym;
    m_nodes.push_back(std::move(node));
  }

  for (size_t i = 0; i < records.size(); ++i) {
    const auto &record = records[i];
    if (!record.parent_id) {
      if (m_root != kNoParent) {
        throw AtlasFormatException(source, "more than one root ('" +
                                               m_nodes[m_root].acronym +
                                               "', '" + record.acronym + "')");
      }
      m_root = i;
      continue;
    }

    auto parent = m_by_id.find(*record.parent_id);
    if (parent == m_by_id.end()) {
      throw AtlasFormatException(
          source, "region '" + record.acronym + "' has unknown parent id " +
                      std::to_string(*record.parent_id));
    }
    m_nodes[i].parent = parent->second;
    m_nodes[parent->second].children.push_back(i);
  }

  if (m_root == kNoParent) {
    throw AtlasFormatException(source, "no root region");
  }

  // Depths from the root; anything not reached sits on a parent cycle
  size_t reached = 0;
  std::queue<size_t> pending;
  pending.push(m_root);
  while (!pending.empty()) {
    size_t index = pending.front();
    pending.pop();
    ++reached;
    for (size_t child : m_nodes[index].children) {
      m_nodes[child].depth = m_nodes[index].depth + 1;
      pending.push(child);
    }
  }

  if (reached != m_nodes.size()) {
    throw AtlasFormatException(source,
                               std::to_string(m_nodes.size() - reached) +
                                   " regions are not reachable from the root");
  }
}

RegionHierarchy RegionHierarchy::LoadStructuresCsv(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw AtlasFormatException(filename, "cannot open file");
  }

  std::string line;
  if (!std::getline(file, line)) {
    throw AtlasFormatException(filename, "empty file");
  }

  // Strip a UTF-8 byte order mark
  if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
      static_cast<unsigned char>(line[1]) == 0xBB &&
      static_cast<unsigned char>(line[2]) == 0xBF) {
    line.erase(0, 3);
  }

  std::unordered_map<std::string, size_t> column;
  auto header = SplitCsvRecord(line);
  for (size_t i = 0; i < header.size(); ++i) {
    column[io::compat::trim(header[i])] = i;
  }

  for (const char *required : {"id", "acronym", "name"}) {
    if (column.find(required) == column.end()) {
      throw AtlasFormatException(filename, std::string("missing column '") +
                                               required + "'");
    }
  }
  bool has_parent_column = column.count("parent_structure_id") > 0;
  bool has_path_column = column.count("structure_id_path") > 0;
  if (!has_parent_column && !has_path_column) {
    throw AtlasFormatException(
        filename, "missing column 'parent_structure_id' or 'structure_id_path'");
  }

  std::vector<RegionRecord> records;
  size_t line_number = 1;
  while (std::getline(file, line)) {
    ++line_number;
    if (io::compat::trim(line).empty()) {
      continue;
    }

    auto fields = SplitCsvRecord(line);
    if (fields.size() != header.size()) {
      throw AtlasFormatException(filename,
                                 "line " + std::to_string(line_number) +
                                     " has " + std::to_string(fields.size()) +
                                     " fields, expected " +
                                     std::to_string(header.size()));
    }

    RegionRecord record;
    auto id = ParseRegionId(fields[column["id"]]);
    if (!id) {
      throw AtlasFormatException(filename, "line " +
                                               std::to_string(line_number) +
                                               ": invalid id '" +
                                               fields[column["id"]] + "'");
    }
    record.id = *id;
    record.acronym = io::compat::trim(fields[column["acronym"]]);
    record.name = io::compat::trim(fields[column["name"]]);

    if (has_parent_column) {
      const std::string &parent_text = fields[column["parent_structure_id"]];
      record.parent_id = ParseRegionId(parent_text);
      if (!record.parent_id && !io::compat::trim(parent_text).empty() &&
          io::compat::to_lower(io::compat::trim(parent_text)) != "nan") {
        throw AtlasFormatException(filename,
                                   "line " + std::to_string(line_number) +
                                       ": invalid parent id '" + parent_text +
                                       "'");
      }
    } else {
      auto parsed = ParseIdPath(fields[column["structure_id_path"]]);
      if (!parsed) {
        throw AtlasFormatException(filename,
                                   "line " + std::to_string(line_number) +
                                       ": invalid structure_id_path '" +
                                       fields[column["structure_id_path"]] +
                                       "'");
      }
      const auto &path = *parsed;
      if (path.empty() || path.back() != record.id) {
        throw AtlasFormatException(filename,
                                   "line " + std::to_string(line_number) +
                                       ": structure_id_path does not end in " +
                                       std::to_string(record.id));
      }
      if (path.size() > 1) {
        record.parent_id = path[path.size() - 2];
      }
    }

    records.push_back(std::move(record));
  }

  return RegionHierarchy(records, filename);
}

// ===== Queries =====

size_t RegionHierarchy::IndexOf(const std::string &acronym,
                                const std::string &function) const {
  auto it = m_by_acronym.find(acronym);
  if (it == m_by_acronym.end()) {
    throw UnknownRegionException(acronym, function);
  }
  return it->second;
}

uint32_t RegionHierarchy::IdOf(const std::string &acronym) const {
  return m_nodes[IndexOf(acronym, "IdOf")].id;
}

void RegionHierarchy::CollectDescendants(size_t index,
                                         std::vector<std::string> &out) const {
  for (size_t child : m_nodes[index].children) {
    out.push_back(m_nodes[child].acronym);
    CollectDescendants(child, out);
  }
}

std::vector<std::string>
RegionHierarchy::DescendantsOf(const std::string &acronym) const {
  std::vector<std::string> descendants;
  CollectDescendants(IndexOf(acronym, "DescendantsOf"), descendants);
  return descendants;
}

std::vector<std::string>
RegionHierarchy::DescendantsAtDepth(const std::string &acronym,
                                    int depth) const {
  if (depth < 1) {
    throw InvalidDepthException(depth, acronym);
  }

  std::vector<size_t> level = {IndexOf(acronym, "DescendantsAtDepth")};
  for (int d = 0; d < depth && !level.empty(); ++d) {
    std::vector<size_t> next;
    for (size_t index : level) {
      const auto &children = m_nodes[index].children;
      next.insert(next.end(), children.begin(), children.end());
    }
    level.swap(next);
  }

  std::vector<std::string> acronyms;
  acronyms.reserve(level.size());
  for (size_t index : level) {
    acronyms.push_back(m_nodes[index].acronym);
  }
  return acronyms;
}

const RegionNode *RegionHierarchy::FindById(uint32_t id) const {
  auto it = m_by_id.find(id);
  return it == m_by_id.end() ? nullptr : &m_nodes[it->second];
}

const RegionNode *
RegionHierarchy::FindByAcronym(const std::string &acronym) const {
  auto it = m_by_acronym.find(acronym);
  return it == m_by_acronym.end() ? nullptr : &m_nodes[it->second];
}

size_t RegionHierarchy::DepthOf(const std::string &acronym) const {
  return m_nodes[IndexOf(acronym, "DepthOf")].depth;
}

} // namespace atlas
} // namespace neuroparcel
