#ifndef TRACTOSCORE_EXCEPTIONS_H
#define TRACTOSCORE_EXCEPTIONS_H

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file TractoScoreExceptions.h
 * @brief Exception hierarchy for TractoScore
 *
 * Every fatal condition of a scoring run is reported through one of these
 * exceptions. A run either returns a complete scorecard or throws one of
 * them before any scorecard is produced.
 */

namespace tractoscore {

/**
 * @brief Base exception class for all TractoScore errors
 *
 * Carries the failing component and function, a severity, a category and
 * a list of recovery suggestions for the formatted report.
 */
class TractoScoreException : public std::exception {
public:
  enum class Severity {
    Info,     // Informational, processing can continue
    Warning,  // Warning, might affect results
    Error,    // Error, current operation failed
    Critical, // Critical, run state compromised
    Fatal     // Fatal, the run must stop
  };

  enum class Category {
    InputOutput,   // Streamline and volume file access
    Configuration, // Parameters and ground-truth attributes
    Validation,    // Classification consistency checks
    Scoring,       // Scoring pipeline conditions
    Resource,      // Worker and memory management
    System         // Anything else
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
  explicit TractoScoreException(const std::string &message,
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
    ss << "=== TractoScore Error Report ===" << std::endl;
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
    case Category::Configuration:
      return "CONFIGURATION";
    case Category::Validation:
      return "VALIDATION";
    case Category::Scoring:
      return "SCORING";
    case Category::Resource:
      return "RESOURCE";
    case Category::System:
      return "SYSTEM";
    default:
      return "UNKNOWN";
    }
  }
};

/**
 * @brief Streamline file access errors (.tck, .trk, .vtk)
 */
class StreamlineIOException : public TractoScoreException {
public:
  explicit StreamlineIOException(const std::string &filename,
                                 const std::string &operation,
                                 const std::string &details = "")
      : TractoScoreException("Streamline I/O error during " + operation +
                                 " of '" + filename + "'" +
                                 (details.empty() ? "" : ": " + details),
                             "StreamlineIO", operation, Severity::Error,
                             Category::InputOutput),
        m_filename(filename) {
    AddRecoverySuggestion("Check if file exists and has correct permissions");
    AddRecoverySuggestion("Verify the format is supported (tck, trk, vtk)");
  }

  const std::string &GetFilename() const { return m_filename; }

private:
  std::string m_filename;
};

class UnsupportedFormatException : public StreamlineIOException {
public:
  explicit UnsupportedFormatException(const std::string &filename,
                                      const std::string &details = "")
      : StreamlineIOException(filename, "FormatDetection",
                              details.empty() ? "unsupported format"
                                              : details) {}
};

class FileNotFoundException : public StreamlineIOException {
public:
  explicit FileNotFoundException(const std::string &filename)
      : StreamlineIOException(filename, "Open", "file not found") {}
};

class CorruptedFileException : public StreamlineIOException {
public:
  explicit CorruptedFileException(const std::string &filename,
                                  const std::string &details)
      : StreamlineIOException(filename, "Read", details) {}
};

/**
 * @brief Volume (NIfTI) access errors raised around ITK readers and writers
 */
class VolumeIOException : public TractoScoreException {
public:
  explicit VolumeIOException(const std::string &filename,
                             const std::string &operation,
                             const std::string &details = "")
      : TractoScoreException("Volume I/O error during " + operation + " of '" +
                                 filename + "'" +
                                 (details.empty() ? "" : ": " + details),
                             "VolumeIO", operation, Severity::Error,
                             Category::InputOutput) {
    AddRecoverySuggestion("Check if file exists and has correct permissions");
    AddRecoverySuggestion("Verify all masks share the reference anatomy grid");
  }
};

/**
 * @brief Configuration and parameter validation exceptions
 */
class ConfigurationException : public TractoScoreException {
public:
  explicit ConfigurationException(const std::string &parameter_name,
                                  const std::string &invalid_value,
                                  const std::string &expected_format = "")
      : TractoScoreException(
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

/**
 * @brief A ground-truth bundle file has no entry in the attribute mapping
 */
class MissingAttributeException : public TractoScoreException {
public:
  explicit MissingAttributeException(const std::string &bundle_filename)
      : TractoScoreException("Missing basic bundle attribs for " +
                                 bundle_filename,
                             "GroundTruthLoader", "LoadBundles",
                             Severity::Fatal, Category::Configuration),
        m_bundle_filename(bundle_filename) {
    AddRecoverySuggestion("Add a {\"cluster_threshold\": ...} entry for '" +
                          bundle_filename + "' to the attributes file");
    AddRecoverySuggestion(
        "Remove stray files from the ground-truth bundles directory");
  }

  const std::string &GetBundleFilename() const { return m_bundle_filename; }

private:
  std::string m_bundle_filename;
};

/**
 * @brief The VC / IC / NC partition of the submission is inconsistent
 *
 * Raised when a streamline is left unclassified, classified twice, or when
 * the invalid-connection count disagrees with the rejected set.
 */
class PartitionConsistencyException : public TractoScoreException {
public:
  explicit PartitionConsistencyException(const std::string &details,
                                         size_t total_streamlines = 0)
      : TractoScoreException(
            "Some streamlines were not correctly assigned to NC: " + details,
            "SubmissionScorer", "ValidatePartition", Severity::Fatal,
            Category::Validation) {
    std::stringstream context;
    context << "Total streamlines: " << total_streamlines;
    SetDetailedContext(context.str());
    AddRecoverySuggestion("Report the submission; this is an internal "
                          "classification error");
  }
};

/**
 * @brief Unrecoverable scoring pipeline conditions
 */
class ScoringException : public TractoScoreException {
public:
  explicit ScoringException(const std::string &stage,
                            const std::string &problem_description)
      : TractoScoreException("Scoring failed in " + stage + ": " +
                                 problem_description,
                             "SubmissionScorer", stage, Severity::Error,
                             Category::Scoring) {
    AddRecoverySuggestion("Verify the submission is in the ground-truth space");
    AddRecoverySuggestion("Check the submission contains streamlines");
  }
};

} // namespace tractoscore

#endif // TRACTOSCORE_EXCEPTIONS_H
