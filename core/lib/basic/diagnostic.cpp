// seiri/basic/diagnostic.cpp - Diagnostic implementation
#include "seiri/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace seiri
{

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

std::string_view to_string(DiagnosticKind kind) noexcept
{
  switch (kind) {
    case DiagnosticKind::UnsupportedLanguage:
      return "unsupported-language";
    case DiagnosticKind::ParseFailure:
      return "parse-failure";
    case DiagnosticKind::MalformedFact:
      return "malformed-fact";
    case DiagnosticKind::UnresolvedImport:
      return "unresolved-import";
    case DiagnosticKind::Io:
      return "io";
    case DiagnosticKind::Config:
      return "config";
  }
  return "parse-failure";
}

std::optional<DiagnosticKind> diagnostic_kind_from_string(std::string_view s)
{
  for (const auto kind :
       {DiagnosticKind::UnsupportedLanguage, DiagnosticKind::ParseFailure,
        DiagnosticKind::MalformedFact, DiagnosticKind::UnresolvedImport, DiagnosticKind::Io,
        DiagnosticKind::Config}) {
    if (to_string(kind) == s) {
      return kind;
    }
  }
  return std::nullopt;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::at(LineColumn position)
{
  diagnostic_.position = position;
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_source_line(std::string_view line)
{
  diagnostic_.source_line = std::string(line);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

namespace
{

template <typename Pred>
std::vector<Diagnostic> select(const std::vector<Diagnostic> & all, Pred pred)
{
  std::vector<Diagnostic> out;
  for (const auto & d : all) {
    if (pred(d)) {
      out.push_back(d);
    }
  }
  return out;
}

}  // namespace

DiagnosticBuilder DiagnosticBag::report(
  Severity severity, DiagnosticKind kind, std::filesystem::path file, std::string message)
{
  Diagnostic d;
  d.severity = severity;
  d.kind = kind;
  d.file = std::move(file);
  d.message = std::move(message);
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_error(
  DiagnosticKind kind, std::filesystem::path file, std::string message)
{
  return report(Severity::Error, kind, std::move(file), std::move(message));
}

DiagnosticBuilder DiagnosticBag::report_warning(
  DiagnosticKind kind, std::filesystem::path file, std::string message)
{
  return report(Severity::Warning, kind, std::move(file), std::move(message));
}

DiagnosticBuilder DiagnosticBag::report_info(
  DiagnosticKind kind, std::filesystem::path file, std::string message)
{
  return report(Severity::Info, kind, std::move(file), std::move(message));
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  return select(diagnostics_, [](const Diagnostic & d) { return d.severity == Severity::Error; });
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  return select(
    diagnostics_, [](const Diagnostic & d) { return d.severity == Severity::Warning; });
}

std::vector<Diagnostic> DiagnosticBag::of_kind(DiagnosticKind kind) const
{
  return select(diagnostics_, [kind](const Diagnostic & d) { return d.kind == kind; });
}

size_t DiagnosticBag::count(Severity severity) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [severity](const Diagnostic & d) { return d.severity == severity; }));
}

bool DiagnosticBag::has_kind(DiagnosticKind kind) const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [kind](const Diagnostic & d) {
    return d.kind == kind;
  });
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

}  // namespace seiri
