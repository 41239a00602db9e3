// seiri/basic/diagnostic.hpp - Per-file diagnostics for extraction and resolution
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "seiri/basic/source_manager.hpp"

namespace seiri
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

/**
 * What went wrong. None of these aborts a run.
 */
enum class DiagnosticKind : uint8_t {
  UnsupportedLanguage,  ///< extension not recognized (skipped)
  ParseFailure,         ///< grammar could not parse the file
  MalformedFact,        ///< normalizer dropped an ill-formed fact
  UnresolvedImport,     ///< import downgraded to an external module
  Io,                   ///< file could not be read or written
  Config,               ///< project configuration problem
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;
[[nodiscard]] std::string_view to_string(DiagnosticKind kind) noexcept;
[[nodiscard]] std::optional<DiagnosticKind> diagnostic_kind_from_string(std::string_view s);

struct Diagnostic
{
  Severity severity = Severity::Warning;
  DiagnosticKind kind = DiagnosticKind::ParseFailure;
  std::filesystem::path file;
  LineColumn position;
  std::string message;

  /// Text of the offending line, when known (printed as context)
  std::string source_line;
  std::optional<std::string> help_message;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and registers it in the bag on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & at(LineColumn position);
  DiagnosticBuilder & with_source_line(std::string_view line);
  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

/// Ordered collection of diagnostics for one analysis run
class DiagnosticBag
{
public:
  /// The diagnostic is added when the returned builder goes out of scope
  DiagnosticBuilder report(
    Severity severity, DiagnosticKind kind, std::filesystem::path file, std::string message);
  DiagnosticBuilder report_error(
    DiagnosticKind kind, std::filesystem::path file, std::string message);
  DiagnosticBuilder report_warning(
    DiagnosticKind kind, std::filesystem::path file, std::string message);
  DiagnosticBuilder report_info(
    DiagnosticKind kind, std::filesystem::path file, std::string message);

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] std::vector<Diagnostic> of_kind(DiagnosticKind kind) const;
  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const { return count(Severity::Error) > 0; }
  [[nodiscard]] bool has_warnings() const { return count(Severity::Warning) > 0; }
  [[nodiscard]] bool has_kind(DiagnosticKind kind) const;

  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace seiri
