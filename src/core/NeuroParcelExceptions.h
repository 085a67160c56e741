#ifndef NEUROPARCEL_EXCEPTIONS_H
#define NEUROPARCEL_EXCEPTIONS_H

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file NeuroParcelExceptions.h
 * @brief Exception hierarchy for NeuroParcel
 *
 * Every failure of the mask simplification pipeline is fatal. The exceptions
 * carry the failing component, the offending identifier and suggestions that
 * the command-line driver prints before exiting.
 */

namespace neuroparcel {

/**
 * @brief Base exception class for all NeuroParcel errors
 */
class NeuroParcelException : public std::exception {
public:
  enum class Severity {
    Info,     // Informational, processing can continue
    Warning,  // Warning, might affect results
    Error,    // Error, current operation failed
    Critical, // Critical, system state compromised
    Fatal     // Fatal, immediate termination required
  };

  enum class Category {
    InputOutput,     // File I/O and data access errors
    ImageProcessing, // Voxel-level processing errors
    Configuration,   // Configuration and parameter errors
    Validation,      // Data validation and integrity errors
    System           // System-level errors
  };

protected:
  std::string m_message;
  std::string m_component;
  std::string m_function;
  Severity m_severity;
  Category m_category;
  std::chrono::system_clock::time_point m_timestamp;
  std::vector<std::string> m_recovery_suggestions;
  std::string m_detailed_context;

public:
  explicit NeuroParcelException(const std::string &message,
                                const std::string &component = "Unknown",
                                const std::string &function = "Unknown",
                                Severity severity = Severity::Error,
                                Category category = Category::System)
      : m_message(message), m_component(component), m_function(function),
        m_severity(severity), m_category(category),
        m_timestamp(std::chrono::system_clock::now()) {}

  const char *what() const noexcept override { return m_message.c_str(); }

  const std::string &GetMessage() const { return m_message; }
  const std::string &GetComponent() const { return m_component; }
  const std::string &GetFunction() const { return m_function; }
  Severity GetSeverity() const { return m_severity; }
  Category GetCategory() const { return m_category; }

  std::string GetTimestamp() const {
    auto time_t = std::chrono::system_clock::to_time_t(m_timestamp);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    return ss.str();
  }

  void AddRecoverySuggestion(const std::string &suggestion) {
    m_recovery_suggestions.push_back(suggestion);
  }

  const std::vector<std::string> &GetRecoverySuggestions() const {
    return m_recovery_suggestions;
  }

  void SetDetailedContext(const std::string &context) {
    m_detailed_context = context;
  }

  const std::string &GetDetailedContext() const { return m_detailed_context; }

  std::string GetFormattedReport() const {
    std::stringstream ss;
    ss << "=== NeuroParcel Error Report ===" << std::endl;
    ss << "Timestamp: " << GetTimestamp() << std::endl;
    ss << "Severity: " << SeverityToString(m_severity) << std::endl;
    ss << "Category: " << CategoryToString(m_category) << std::endl;
    ss << "Component: " << m_component << std::endl;
    ss << "Function: " << m_function << std::endl;
    ss << "Message: " << m_message << std::endl;

    if (!m_detailed_context.empty()) {
      ss << "Context: " << m_detailed_context << std::endl;
    }

    if (!m_recovery_suggestions.empty()) {
      ss << "Recovery Suggestions:" << std::endl;
      for (size_t i = 0; i < m_recovery_suggestions.size(); ++i) {
        ss << "  " << (i + 1) << ". " << m_recovery_suggestions[i] << std::endl;
      }
    }

    return ss.str();
  }

  static std::string SeverityToString(Severity severity) {
    switch (severity) {
    case Severity::Info:
      return "INFO";
    case Severity::Warning:
      return "WARNING";
    case Severity::Error:
      return "ERROR";
    case Severity::Critical:
      return "CRITICAL";
    case Severity::Fatal:
      return "FATAL";
    default:
      return "UNKNOWN";
    }
  }

  static std::string CategoryToString(Category category) {
    switch (category) {
    case Category::InputOutput:
      return "INPUT_OUTPUT";
    case Category::ImageProcessing:
      return "IMAGE_PROCESSING";
    case Category::Configuration:
      return "CONFIGURATION";
    case Category::Validation:
      return "VALIDATION";
    case Category::System:
      return "SYSTEM";
    default:
      return "UNKNOWN";
    }
  }
};

/**
 * @brief An acronym has no entry in the region hierarchy
 */
class UnknownRegionException : public NeuroParcelException {
private:
  std::string m_acronym;

public:
  explicit UnknownRegionException(const std::string &acronym,
                                  const std::string &function = "IdOf")
      : NeuroParcelException("Unknown region '" + acronym + "'",
                             "RegionHierarchy", function, Severity::Fatal,
                             Category::Validation),
        m_acronym(acronym) {
    SetDetailedContext("Offending acronym: " + acronym);
    AddRecoverySuggestion("Check the acronym against the atlas structures table");
    AddRecoverySuggestion("Acronyms are case sensitive and may contain spaces");
  }

  const std::string &GetAcronym() const { return m_acronym; }
};

/**
 * @brief A descendant depth below 1 was requested
 */
class InvalidDepthException : public NeuroParcelException {
private:
  int m_depth;

public:
  explicit InvalidDepthException(int depth, const std::string &acronym = "")
      : NeuroParcelException("Invalid descendant depth " +
                                 std::to_string(depth) +
                                 (acronym.empty() ? "" : " for '" + acronym + "'") +
                                 " (depth must be at least 1)",
                             "RegionHierarchy", "DescendantsAtDepth",
                             Severity::Fatal, Category::Configuration),
        m_depth(depth) {
    AddRecoverySuggestion("Use depth 1 to keep the direct children");
  }

  int GetDepth() const { return m_depth; }
};

/**
 * @brief More over-range IDs than free slots in [1, V]
 */
class RemapExhaustedException : public NeuroParcelException {
private:
  size_t m_over_range_count;
  size_t m_available_count;
  uint32_t m_max_value;

public:
  RemapExhaustedException(size_t over_range_count, size_t available_count,
                          uint32_t max_value)
      : NeuroParcelException(
            "No free label IDs left: " + std::to_string(over_range_count) +
                " IDs exceed " + std::to_string(max_value) + " but only " +
                std::to_string(available_count) + " slots are unused",
            "IdRemapper", "RemapLargeIds", Severity::Fatal,
            Category::ImageProcessing),
        m_over_range_count(over_range_count),
        m_available_count(available_count), m_max_value(max_value) {
    AddRecoverySuggestion("Increase the maximum label value");
    AddRecoverySuggestion("Flatten more regions to reduce the label count");
  }

  size_t GetOverRangeCount() const { return m_over_range_count; }
  size_t GetAvailableCount() const { return m_available_count; }
  uint32_t GetMaxValue() const { return m_max_value; }
};

/**
 * @brief Malformed or inconsistent atlas structures table
 */
class AtlasFormatException : public NeuroParcelException {
public:
  explicit AtlasFormatException(const std::string &source,
                                const std::string &problem)
      : NeuroParcelException("Invalid atlas hierarchy in '" + source +
                                 "': " + problem,
                             "RegionHierarchy", "Load", Severity::Fatal,
                             Category::InputOutput) {
    AddRecoverySuggestion(
        "Use the structures.csv shipped with the BrainGlobe atlas");
    AddRecoverySuggestion(
        "Required columns: id, acronym, name and parent_structure_id or "
        "structure_id_path");
  }
};

/**
 * @brief Image processing and geometry exceptions
 */
class ImageProcessingException : public NeuroParcelException {
public:
  explicit ImageProcessingException(const std::string &operation,
                                    const std::string &problem_description,
                                    const std::string &image_info = "")
      : NeuroParcelException("Image processing error in " + operation + ": " +
                                 problem_description,
                             "ImageProcessing", operation, Severity::Error,
                             Category::ImageProcessing) {
    if (!image_info.empty()) {
      SetDetailedContext("Image information: " + image_info);
    }

    AddRecoverySuggestion("Verify image dimensions and data types");
  }
};

/**
 * @brief Configuration and parameter validation exceptions
 */
class ConfigurationException : public NeuroParcelException {
public:
  explicit ConfigurationException(const std::string &parameter_name,
                                  const std::string &invalid_value,
                                  const std::string &expected_format = "")
      : NeuroParcelException(
            "Invalid configuration parameter '" + parameter_name +
                "' with value '" + invalid_value + "'" +
                (expected_format.empty()
                     ? ""
                     : " (expected: " + expected_format + ")"),
            "Configuration", "Parameter Validation", Severity::Error,
            Category::Configuration) {
    AddRecoverySuggestion("Check parameter documentation for valid ranges");
    AddRecoverySuggestion("Use default parameter values as starting point");
  }
};

} // namespace neuroparcel

#endif // NEUROPARCEL_EXCEPTIONS_H
