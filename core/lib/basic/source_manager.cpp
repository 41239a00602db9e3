// seiri/basic/source_manager.cpp - Line table for one source file
#include "seiri/basic/source_manager.hpp"

#include <algorithm>
#include <iterator>

namespace seiri
{

SourceFile::SourceFile(std::filesystem::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  build_line_table();
}

uint32_t SourceFile::line_count() const noexcept
{
  if (content_.empty()) {
    return 0;
  }
  const auto starts = static_cast<uint32_t>(line_offsets_.size());
  return content_.back() == '\n' ? starts - 1 : starts;
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  if (line_offsets_.empty()) {
    return {};
  }
  offset = std::min(offset, static_cast<uint32_t>(content_.size()));

  // line_offsets_ starts with 0, so the predecessor always exists
  const auto next = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  const auto index = static_cast<uint32_t>(std::distance(line_offsets_.begin(), next)) - 1;
  return {index + 1, offset - line_offsets_[index] + 1};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }
  std::string_view rest = std::string_view(content_).substr(line_offsets_[line_index]);
  rest = rest.substr(0, rest.find('\n'));
  if (!rest.empty() && rest.back() == '\r') {
    rest.remove_suffix(1);
  }
  return rest;
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  if (range.is_invalid()) {
    return {};
  }
  const uint32_t begin = range.get_begin().get_offset();
  const uint32_t end = range.get_end().get_offset();
  if (begin >= content_.size() || end < begin) {
    return {};
  }
  return std::string_view(content_).substr(begin, end - begin);
}

void SourceFile::build_line_table()
{
  line_offsets_.assign(1, 0);
  for (size_t pos = content_.find('\n'); pos != std::string::npos;
       pos = content_.find('\n', pos + 1)) {
    line_offsets_.push_back(static_cast<uint32_t>(pos + 1));
  }
}

}  // namespace seiri
