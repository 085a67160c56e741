/**
 * @file TableWriter.h
 * @brief Delimited text export of row-oriented report tables
 */

#ifndef NEUROPARCEL_TABLE_WRITER_H
#define NEUROPARCEL_TABLE_WRITER_H

#include <ostream>
#include <string>
#include <vector>

namespace neuroparcel {
namespace io {

/**
 * @brief A header plus string-valued rows
 */
struct Table {
  std::vector<std::string> columns;
  std::vector<std::vector<std::string>> rows;
};

class TableWriter {
public:
  explicit TableWriter(char delimiter = ',') : m_delimiter(delimiter) {}

  // Quotes a field only when it contains the delimiter, a quote or a newline
  std::string EscapeField(const std::string &field) const;

  void Write(const Table &table, std::ostream &out) const;

  // Throws ImageIOException when the file cannot be written
  void WriteFile(const Table &table, const std::string &filename) const;

private:
  char m_delimiter;
};

} // namespace io
} // namespace neuroparcel

#endif // NEUROPARCEL_TABLE_WRITER_H
