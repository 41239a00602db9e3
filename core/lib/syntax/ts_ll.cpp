// seiri/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "seiri/syntax/ts_ll.hpp"

namespace seiri::ts_ll
{

Parser::Parser(const TSLanguage * language)
{
  parser_ = ts_parser_new();
  if (parser_ && language) {
    ready_ = ts_parser_set_language(parser_, language);
  }
}

Parser::~Parser()
{
  if (parser_) ts_parser_delete(parser_);
  parser_ = nullptr;
}

Tree Parser::parse_string(std::string_view source) const
{
  if (!ready_) {
    return Tree();
  }
  // Tree-sitter consumes bytes; the grammars expect UTF-8.
  return Tree(ts_parser_parse_string(
    parser_, /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size())));
}

Node find_first_error(Node root)
{
  if (root.is_null() || !root.has_error()) {
    return Node();
  }

  Cursor cursor(root);
  while (true) {
    const Node n = cursor.current_node();
    if (n.is_error() || n.is_missing()) {
      return n;
    }
    // Descend only into subtrees that contain an error
    if (n.has_error() && cursor.goto_first_child()) {
      continue;
    }
    while (!cursor.goto_next_sibling()) {
      if (!cursor.goto_parent()) {
        return root;
      }
    }
  }
}

}  // namespace seiri::ts_ll
