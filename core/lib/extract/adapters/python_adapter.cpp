// seiri/extract/adapters/python_adapter.cpp - Python fact collection
#include <algorithm>
#include <cctype>
#include <string>

#include "seiri/extract/adapters.hpp"

namespace seiri
{

namespace
{

using adapter_util::children_by_field;
using adapter_util::named_children;

std::string without_spaces(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (const char c : s) {
    if (std::isspace(static_cast<unsigned char>(c)) == 0) {
      out.push_back(c);
    }
  }
  return out;
}

class PythonCollector
{
public:
  explicit PythonCollector(FactCollector & out) : out_(out) {}

  void visit(ts_ll::Node n)
  {
    const std::string_view k = n.kind();
    if (k == "import_statement") {
      on_import(n);
      return;
    }
    if (k == "import_from_statement") {
      on_import_from(n);
      return;
    }
    if (k == "future_import_statement") {
      return;
    }
    if (k == "function_definition") {
      on_function(n);
      return;
    }
    if (k == "class_definition") {
      on_class(n);
      return;
    }
    if (k == "call") {
      on_call(n);
    }
    visit_children(n);
  }

private:
  void visit_children(ts_ll::Node n)
  {
    const uint32_t count = n.named_child_count();
    for (uint32_t i = 0; i < count; ++i) {
      visit(n.named_child(i));
    }
  }

  // import a.b, c as d
  void on_import(ts_ll::Node n)
  {
    for (const auto & child : children_by_field(n, "name")) {
      if (child.kind() == "aliased_import") {
        out_.add_import(
          child, std::string(out_.text(child.child_by_field("name"))), {},
          std::string(out_.text(child.child_by_field("alias"))));
      } else {
        out_.add_import(child, std::string(out_.text(child)));
      }
    }
  }

  // from ..pkg import a as b, c
  void on_import_from(ts_ll::Node n)
  {
    const std::string module = without_spaces(out_.text(n.child_by_field("module_name")));

    const auto names = children_by_field(n, "name");
    if (names.empty()) {
      // `from m import *`
      out_.add_import(n, module);
      return;
    }
    for (const auto & child : names) {
      if (child.kind() == "aliased_import") {
        out_.add_import(
          child, module, std::string(out_.text(child.child_by_field("name"))),
          std::string(out_.text(child.child_by_field("alias"))));
      } else {
        out_.add_import(child, module, std::string(out_.text(child)));
      }
    }
  }

  void on_function(ts_ll::Node n)
  {
    // Functions local to another function body are not recorded, but their
    // calls still count against the enclosing function.
    if (!in_function_body_) {
      out_.add_definition(
        n, DefinitionKind::Function, std::string(out_.text(n.child_by_field("name"))));
    }
    const bool saved = in_function_body_;
    in_function_body_ = true;
    visit_children(n);
    in_function_body_ = saved;
  }

  void on_class(ts_ll::Node n)
  {
    out_.add_definition(
      n, DefinitionKind::Container, std::string(out_.text(n.child_by_field("name"))));

    for (const auto & base : named_children(n.child_by_field("superclasses"))) {
      std::string name = dotted(base);
      if (!name.empty()) {
        out_.add_reference(base, ReferenceKind::ContainerUse, std::move(name));
      }
    }

    const bool saved = in_function_body_;
    in_function_body_ = false;
    visit_children(n);
    in_function_body_ = saved;
  }

  void on_call(ts_ll::Node n)
  {
    std::string name = dotted(n.child_by_field("function"));
    if (!name.empty()) {
      out_.add_reference(n, ReferenceKind::FunctionCall, std::move(name));
    }
  }

  /// `a.b.c` for identifier/attribute chains; for other receivers
  /// (`f().m`) only the trailing attribute survives.
  std::string dotted(ts_ll::Node n) const
  {
    if (n.is_null()) {
      return {};
    }
    const std::string_view k = n.kind();
    if (k == "identifier") {
      return std::string(out_.text(n));
    }
    if (k == "attribute") {
      const std::string attr(out_.text(n.child_by_field("attribute")));
      const std::string object = dotted(n.child_by_field("object"));
      return object.empty() ? attr : object + "." + attr;
    }
    if (k == "subscript") {
      // Generic[T] -> Generic
      return dotted(n.child_by_field("value"));
    }
    return {};
  }

  FactCollector & out_;
  bool in_function_body_ = false;
};

void collect_python(ts_ll::Node root, FactCollector & out) { PythonCollector(out).visit(root); }

}  // namespace

LanguageAdapter make_python_adapter()
{
  LanguageAdapter a;
  a.language = Language::Python;
  a.extensions = default_extensions(Language::Python);
  a.grammar = &tree_sitter_python;
  a.collect = &collect_python;
  return a;
}

}  // namespace seiri
