// seiri/extract/adapters/adapter_util.cpp - Shared CST helpers
#include "seiri/extract/adapters.hpp"

namespace seiri::adapter_util
{

std::vector<ts_ll::Node> children_by_field(ts_ll::Node n, std::string_view field)
{
  std::vector<ts_ll::Node> out;
  if (n.is_null()) {
    return out;
  }
  ts_ll::Cursor cursor(n);
  if (!cursor.goto_first_child()) {
    return out;
  }
  do {
    if (cursor.current_field_name() == field) {
      out.push_back(cursor.current_node());
    }
  } while (cursor.goto_next_sibling());
  return out;
}

std::vector<ts_ll::Node> named_children(ts_ll::Node n)
{
  std::vector<ts_ll::Node> out;
  if (n.is_null()) {
    return out;
  }
  const uint32_t count = n.named_child_count();
  out.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    out.push_back(n.named_child(i));
  }
  return out;
}

ts_ll::Node first_child_of_kind(ts_ll::Node n, std::string_view kind)
{
  if (n.is_null()) {
    return {};
  }
  const uint32_t count = n.named_child_count();
  for (uint32_t i = 0; i < count; ++i) {
    const ts_ll::Node c = n.named_child(i);
    if (c.kind() == kind) {
      return c;
    }
  }
  return {};
}

std::string strip_quotes(std::string_view s)
{
  if (s.size() >= 2) {
    const char f = s.front();
    if ((f == '"' || f == '\'' || f == '`') && s.back() == f) {
      return std::string(s.substr(1, s.size() - 2));
    }
  }
  return std::string(s);
}

std::string strip_template_args(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  int depth = 0;
  for (const char c : s) {
    if (c == '<') {
      ++depth;
    } else if (c == '>' && depth > 0) {
      --depth;
    } else if (depth == 0) {
      out.push_back(c);
    }
  }
  return out;
}

std::vector<std::string> split(std::string_view s, std::string_view sep)
{
  std::vector<std::string> out;
  if (sep.empty()) {
    out.emplace_back(s);
    return out;
  }
  size_t start = 0;
  while (true) {
    const auto pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      out.emplace_back(s.substr(start));
      break;
    }
    out.emplace_back(s.substr(start, pos - start));
    start = pos + sep.size();
  }
  return out;
}

}  // namespace seiri::adapter_util
