/**
 * @file TableWriter.cpp
 * @brief CSV serialization of report tables
 */

#include "TableWriter.h"
#include "ImageIO.h"
#include <cstdio>
#include <fstream>

namespace neuroparcel {
namespace io {

std::string TableWriter::EscapeField(const std::string &field) const {
  bool needs_quotes = field.find(m_delimiter) != std::string::npos ||
                      field.find('"') != std::string::npos ||
                      field.find('\n') != std::string::npos ||
                      field.find('\r') != std::string::npos;
  if (!needs_quotes) {
    return field;
  }

  std::string escaped = "\"";
  for (char c : field) {
    if (c == '"') {
      escaped += "\"\"";
    } else {
      escaped += c;
    }
  }
  escaped += "\"";
  return escaped;
}

void TableWriter::Write(const Table &table, std::ostream &out) const {
  for (size_t i = 0; i < table.columns.size(); ++i) {
    if (i > 0) {
      out << m_delimiter;
    }
    out << EscapeField(table.columns[i]);
  }
  out << '\n';

  for (const auto &row : table.rows) {
    for (size_t i = 0; i < row.size(); ++i) {
      if (i > 0) {
        out << m_delimiter;
      }
      out << EscapeField(row[i]);
    }
    out << '\n';
  }
}

void TableWriter::WriteFile(const Table &table,
                            const std::string &filename) const {
  std::ofstream file(filename);
  if (!file.is_open()) {
    throw ImageIOException("Cannot open '" + filename + "' for writing");
  }

  Write(table, file);
  file.close();

  if (!file) {
    std::remove(filename.c_str());
    throw ImageIOException("Failed to write table '" + filename + "'");
  }
}

} // namespace io
} // namespace neuroparcel
