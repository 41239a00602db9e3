// seiri/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// fmt does the layout, rang does the colors.
//
#include "seiri/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <array>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace seiri
{

namespace
{

constexpr std::string_view k_gutter = "      |";
constexpr size_t k_tab_width = 4;

rang::fg severity_color(Severity s)
{
  switch (s) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
    case Severity::Info:
      return rang::fg::cyan;
    case Severity::Hint:
      return rang::fg::green;
  }
  return rang::fg::reset;
}

/// Path shown in the location line, relative to the working directory when possible
std::string display_path(const std::filesystem::path & file)
{
  if (file.empty()) {
    return "<project>";
  }
  std::error_code ec;
  const auto rel = std::filesystem::relative(file, std::filesystem::current_path(), ec);
  if (ec || rel.empty() || *rel.begin() == "..") {
    return file.generic_string();
  }
  return rel.generic_string();
}

/// Expand tabs and drop line terminators; `width_until` receives the
/// visual width of the first `column - 1` characters
std::string expand_line(std::string_view line, uint32_t column, size_t & width_until)
{
  std::string out;
  out.reserve(line.size());
  width_until = 0;
  for (size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (c == '\r' || c == '\n') {
      continue;
    }
    const size_t w = c == '\t' ? k_tab_width : 1;
    out.append(w, c == '\t' ? ' ' : c);
    if (i + 1 < column) {
      width_until += w;
    }
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  rang::setControlMode(use_color_ ? rang::control::Auto : rang::control::Off);
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  print_severity_header(diag);

  const std::string where = diag.position.is_valid()
                              ? fmt::format(
                                  "{}:{}:{}", display_path(diag.file), diag.position.line,
                                  diag.position.column)
                              : display_path(diag.file);
  accent(fmt::format("{:>5}", "-->"));
  fmt::print(os_, " {}\n", where);

  if (diag.position.is_valid() && !diag.source_line.empty()) {
    accent(k_gutter);
    os_ << '\n';
    print_source_line(diag);
  }
  if (diag.help_message) {
    print_help(*diag.help_message);
  }
  os_ << '\n';
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const auto & d : diags) {
    ordered.push_back(&d);
  }
  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    if (a->file != b->file) {
      return a->file < b->file;
    }
    return a->position.line < b->position.line;
  });

  for (const Diagnostic * d : ordered) {
    print(*d);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  // error, warning, info + hint
  std::array<size_t, 3> counts{};
  for (const auto & d : diags) {
    const size_t slot = d.severity == Severity::Error     ? 0
                        : d.severity == Severity::Warning ? 1
                                                          : 2;
    ++counts[slot];
  }
  if (counts[0] + counts[1] + counts[2] == 0) {
    return;
  }

  if (use_color_) {
    os_ << rang::style::bold;
  }
  fmt::print(
    os_, "{} error(s), {} warning(s), {} note(s)\n", counts[0], counts[1], counts[2]);
  if (use_color_) {
    os_ << rang::style::reset;
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string head = fmt::format("{}[{}]", to_string(diag.severity), to_string(diag.kind));
  if (!use_color_) {
    fmt::print(os_, "{}: {}\n", head, diag.message);
    return;
  }
  os_ << rang::style::bold << severity_color(diag.severity) << head << rang::fg::reset << ": "
      << diag.message << rang::style::reset << '\n';
}

void DiagnosticPrinter::print_source_line(const Diagnostic & diag)
{
  size_t marker_offset = 0;
  const std::string text = expand_line(diag.source_line, diag.position.column, marker_offset);

  accent(fmt::format(" {:>4} |", diag.position.line));
  fmt::print(os_, " {}\n", text);

  accent(k_gutter);
  os_ << ' ' << std::string(marker_offset, ' ');
  if (use_color_) {
    os_ << rang::style::bold << rang::fg::red << '^' << rang::fg::reset << rang::style::reset;
  } else {
    os_ << '^';
  }
  os_ << '\n';
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  accent(k_gutter);
  os_ << '\n';
  accent("   =");
  fmt::print(os_, " help: {}\n", message);
}

void DiagnosticPrinter::accent(std::string_view text)
{
  if (use_color_) {
    os_ << rang::style::bold << rang::fg::cyan << text << rang::fg::reset << rang::style::reset;
  } else {
    os_ << text;
  }
}

}  // namespace seiri
