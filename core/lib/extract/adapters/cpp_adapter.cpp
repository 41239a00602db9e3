// seiri/extract/adapters/cpp_adapter.cpp - C/C++ fact collection
#include <string>
#include <utility>

#include "seiri/extract/adapters.hpp"

namespace seiri
{

namespace
{

using adapter_util::named_children;
using adapter_util::strip_template_args;

bool is_record_specifier(std::string_view k)
{
  return k == "class_specifier" || k == "struct_specifier" || k == "union_specifier" ||
         k == "enum_specifier";
}

/// (container, name) of a declared function; container empty unless
/// written as `A::f`.
struct DeclaredName
{
  std::string container;
  std::string name;
};

class CppCollector
{
public:
  explicit CppCollector(FactCollector & out) : out_(out) {}

  void visit(ts_ll::Node n)
  {
    const std::string_view k = n.kind();
    if (k == "preproc_include") {
      const auto path = n.child_by_field("path");
      if (!path.is_null()) {
        // Delimiters are kept; the normalizer derives the level from them.
        out_.add_import(n, std::string(out_.text(path)));
      }
      return;
    }
    if (k == "function_definition") {
      on_function_definition(n);
      return;
    }
    if ((k == "field_declaration" || k == "declaration") && in_class_body_) {
      on_member_declaration(n);
    } else if (is_record_specifier(k) && !n.child_by_field("body").is_null()) {
      on_record(n);
      return;
    } else if (k == "call_expression") {
      std::string name = callee(n.child_by_field("function"));
      if (!name.empty()) {
        out_.add_reference(n, ReferenceKind::FunctionCall, std::move(name));
      }
    } else if (k == "new_expression") {
      std::string name = type_name(n.child_by_field("type"));
      if (!name.empty()) {
        out_.add_reference(n, ReferenceKind::ContainerUse, std::move(name));
      }
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

  void on_function_definition(ts_ll::Node n)
  {
    const DeclaredName declared = declared_name(n.child_by_field("declarator"));
    if (!in_function_body_ && !declared.name.empty()) {
      out_.add_definition(n, DefinitionKind::Function, declared.name, declared.container);
    }
    const bool saved_fn = in_function_body_;
    const bool saved_class = in_class_body_;
    in_function_body_ = true;
    in_class_body_ = false;
    visit_children(n);
    in_function_body_ = saved_fn;
    in_class_body_ = saved_class;
  }

  // void run(); inside a class body
  void on_member_declaration(ts_ll::Node n)
  {
    for (const auto & decl : adapter_util::children_by_field(n, "declarator")) {
      if (!is_function_declarator(decl)) {
        continue;
      }
      DeclaredName declared = declared_name(decl);
      if (!declared.name.empty()) {
        out_.add_definition(
          n, DefinitionKind::Function, std::move(declared.name), std::move(declared.container));
      }
    }
  }

  void on_record(ts_ll::Node n)
  {
    const std::string name = type_name(n.child_by_field("name"));
    if (!name.empty()) {
      out_.add_definition(n, DefinitionKind::Container, name);
    }

    for (const auto & child : named_children(n)) {
      if (child.kind() != "base_class_clause") {
        continue;
      }
      for (const auto & base : named_children(child)) {
        std::string base_name = type_name(base);
        if (!base_name.empty()) {
          out_.add_reference(base, ReferenceKind::ContainerUse, std::move(base_name));
        }
      }
    }

    const bool saved_fn = in_function_body_;
    const bool saved_class = in_class_body_;
    in_function_body_ = false;
    in_class_body_ = true;
    visit_children(n.child_by_field("body"));
    in_function_body_ = saved_fn;
    in_class_body_ = saved_class;
  }

  static bool is_function_declarator(ts_ll::Node d)
  {
    while (!d.is_null()) {
      const std::string_view k = d.kind();
      if (k == "function_declarator") {
        return true;
      }
      if (k != "pointer_declarator" && k != "reference_declarator") {
        return false;
      }
      d = d.child_by_field("declarator");
    }
    return false;
  }

  DeclaredName declared_name(ts_ll::Node d) const
  {
    // Unwrap pointer/reference/function declarators down to the name
    while (!d.is_null()) {
      const std::string_view k = d.kind();
      if (k == "function_declarator" || k == "pointer_declarator" ||
          k == "reference_declarator" || k == "parenthesized_declarator") {
        ts_ll::Node inner = d.child_by_field("declarator");
        if (inner.is_null() && d.named_child_count() > 0) {
          inner = d.named_child(0);
        }
        d = inner;
        continue;
      }
      break;
    }
    if (d.is_null()) {
      return {};
    }

    const std::string full = strip_template_args(out_.text(d));
    const auto pos = full.rfind("::");
    if (d.kind() == "qualified_identifier" && pos != std::string::npos) {
      return {full.substr(0, pos), full.substr(pos + 2)};
    }
    return {{}, full};
  }

  std::string type_name(ts_ll::Node n) const
  {
    if (n.is_null()) {
      return {};
    }
    const std::string_view k = n.kind();
    if (k == "template_type") {
      return type_name(n.child_by_field("name"));
    }
    if (k == "type_identifier" || k == "qualified_identifier" || k == "identifier") {
      return strip_template_args(out_.text(n));
    }
    return {};
  }

  std::string callee(ts_ll::Node n) const
  {
    if (n.is_null()) {
      return {};
    }
    const std::string_view k = n.kind();
    if (k == "identifier" || k == "qualified_identifier" || k == "this") {
      return strip_template_args(out_.text(n));
    }
    if (k == "template_function") {
      return callee(n.child_by_field("name"));
    }
    if (k == "field_expression") {
      const std::string field(out_.text(n.child_by_field("field")));
      const std::string object = callee(n.child_by_field("argument"));
      return object.empty() ? field : object + "." + field;
    }
    return {};
  }

  FactCollector & out_;
  bool in_function_body_ = false;
  bool in_class_body_ = false;
};

void collect_cpp(ts_ll::Node root, FactCollector & out) { CppCollector(out).visit(root); }

}  // namespace

LanguageAdapter make_cpp_adapter()
{
  LanguageAdapter a;
  a.language = Language::Cpp;
  a.extensions = default_extensions(Language::Cpp);
  a.grammar = &tree_sitter_cpp;
  a.collect = &collect_cpp;
  return a;
}

}  // namespace seiri
