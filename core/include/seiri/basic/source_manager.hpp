// seiri/basic/source_manager.hpp - Byte offsets, ranges and per-file line tables
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace seiri
{

// ============================================================================
// SourceLocation / SourceRange
// ============================================================================

/// Byte offset into one file; line and column come from SourceFile
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }
  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  friend constexpr bool operator==(SourceLocation a, SourceLocation b) noexcept
  {
    return a.offset_ == b.offset_;
  }
  friend constexpr bool operator!=(SourceLocation a, SourceLocation b) noexcept
  {
    return !(a == b);
  }
  friend constexpr bool operator<(SourceLocation a, SourceLocation b) noexcept
  {
    return a.offset_ < b.offset_;
  }

private:
  uint32_t offset_ = k_invalid_offset;
};

/// Half-open byte range [begin, end) of a syntax node
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(SourceLocation begin, SourceLocation end) noexcept
  : begin_(begin), end_(end)
  {
  }
  constexpr SourceRange(uint32_t begin, uint32_t end) noexcept
  : begin_(SourceLocation(begin)), end_(SourceLocation(end))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  friend constexpr bool operator==(SourceRange a, SourceRange b) noexcept
  {
    return a.begin_ == b.begin_ && a.end_ == b.end_;
  }
  friend constexpr bool operator!=(SourceRange a, SourceRange b) noexcept { return !(a == b); }

private:
  SourceLocation begin_;
  SourceLocation end_;
};

// ============================================================================
// LineColumn - Human-readable position
// ============================================================================

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

// ============================================================================
// SourceFile - One file's text plus a line table
// ============================================================================

/**
 * Owns the text of one source file and converts byte offsets to
 * line/column positions.
 */
class SourceFile
{
public:
  SourceFile() = default;
  SourceFile(std::filesystem::path path, std::string content);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }

  /// Number of lines (a trailing newline does not open a new counted line)
  [[nodiscard]] uint32_t line_count() const noexcept;

  /// Convert byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Get the content of a specific line (0-indexed), without the newline
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Get a slice of source by range (clamped to the file size)
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace seiri
