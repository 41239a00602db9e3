// seiri/extract/adapters/typescript_adapter.cpp - TypeScript/TSX/JavaScript fact collection
//
// The three grammars share node names for everything collected here, so a
// single collector serves all of them.
//
#include <string>

#include "seiri/extract/adapters.hpp"

namespace seiri
{

namespace
{

using adapter_util::first_child_of_kind;
using adapter_util::named_children;
using adapter_util::strip_quotes;

bool is_function_value(std::string_view k)
{
  return k == "arrow_function" || k == "function_expression" || k == "function" ||
         k == "generator_function";
}

bool is_container_decl(std::string_view k)
{
  return k == "class_declaration" || k == "abstract_class_declaration" || k == "class" ||
         k == "interface_declaration" || k == "enum_declaration" || k == "type_alias_declaration";
}

class ScriptCollector
{
public:
  explicit ScriptCollector(FactCollector & out) : out_(out) {}

  void visit(ts_ll::Node n)
  {
    const std::string_view k = n.kind();
    if (k == "import_statement") {
      on_import(n);
      return;
    }
    if (k == "export_statement" && !n.child_by_field("source").is_null()) {
      on_reexport(n);
      return;
    }
    if (k == "function_declaration" || k == "generator_function_declaration" ||
        k == "method_definition") {
      on_function(n, std::string(out_.text(n.child_by_field("name"))));
      return;
    }
    if (k == "variable_declarator") {
      const auto value = n.child_by_field("value");
      const auto name = n.child_by_field("name");
      if (!value.is_null() && is_function_value(value.kind()) && name.kind() == "identifier") {
        on_function(n, std::string(out_.text(name)));
        return;
      }
    }
    if (is_container_decl(k)) {
      on_container(n);
      return;
    }
    if (k == "call_expression") {
      on_call(n);
    } else if (k == "new_expression") {
      std::string name = member_path(n.child_by_field("constructor"));
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

  // import def, { a as b } from './m';  import * as ns from 'm';  import 'm';
  void on_import(ts_ll::Node n)
  {
    const std::string module = strip_quotes(out_.text(n.child_by_field("source")));
    const auto clause = first_child_of_kind(n, "import_clause");
    if (clause.is_null()) {
      out_.add_import(n, module);
      return;
    }

    bool emitted = false;
    for (const auto & part : named_children(clause)) {
      const std::string_view pk = part.kind();
      if (pk == "identifier") {
        out_.add_import(part, module, "default", std::string(out_.text(part)));
        emitted = true;
      } else if (pk == "namespace_import") {
        const auto ident = first_child_of_kind(part, "identifier");
        out_.add_import(part, module, {}, std::string(out_.text(ident)));
        emitted = true;
      } else if (pk == "named_imports") {
        for (const auto & spec : named_children(part)) {
          if (spec.kind() != "import_specifier") {
            continue;
          }
          out_.add_import(
            spec, module, std::string(out_.text(spec.child_by_field("name"))),
            std::string(out_.text(spec.child_by_field("alias"))));
          emitted = true;
        }
      }
    }
    if (!emitted) {
      out_.add_import(n, module);
    }
  }

  // export { a } from './m';  export * from './m';
  void on_reexport(ts_ll::Node n)
  {
    const std::string module = strip_quotes(out_.text(n.child_by_field("source")));
    const auto clause = first_child_of_kind(n, "export_clause");
    bool emitted = false;
    for (const auto & spec : named_children(clause)) {
      if (spec.kind() != "export_specifier") {
        continue;
      }
      out_.add_import(
        spec, module, std::string(out_.text(spec.child_by_field("name"))),
        std::string(out_.text(spec.child_by_field("alias"))));
      emitted = true;
    }
    if (!emitted) {
      out_.add_import(n, module);
    }
  }

  void on_function(ts_ll::Node n, std::string name)
  {
    if (!in_function_body_ && !name.empty()) {
      out_.add_definition(n, DefinitionKind::Function, std::move(name));
    }
    const bool saved = in_function_body_;
    in_function_body_ = true;
    visit_children(n);
    in_function_body_ = saved;
  }

  void on_container(ts_ll::Node n)
  {
    const auto name_node = n.child_by_field("name");
    if (!name_node.is_null()) {
      out_.add_definition(n, DefinitionKind::Container, std::string(out_.text(name_node)));
    }

    // extends / implements clauses
    for (const auto & child : named_children(n)) {
      const std::string_view ck = child.kind();
      if (ck == "class_heritage") {
        for (const auto & clause : named_children(child)) {
          add_heritage(clause);
        }
      } else if (ck == "extends_type_clause" || ck == "extends_clause") {
        add_heritage(child);
      }
    }

    const bool saved = in_function_body_;
    in_function_body_ = false;
    visit_children(n);
    in_function_body_ = saved;
  }

  void add_heritage(ts_ll::Node clause)
  {
    const std::string_view ck = clause.kind();
    if (ck == "extends_clause" || ck == "implements_clause" || ck == "extends_type_clause") {
      for (const auto & t : named_children(clause)) {
        add_heritage(t);
      }
      return;
    }
    std::string name = member_path(clause);
    if (!name.empty()) {
      out_.add_reference(clause, ReferenceKind::ContainerUse, std::move(name));
    }
  }

  void on_call(ts_ll::Node n)
  {
    const auto fn = n.child_by_field("function");
    const std::string_view fk = fn.kind();

    // require('m') and import('m') are module loads, not calls
    if (fk == "import" || (fk == "identifier" && out_.text(fn) == "require")) {
      const auto args = named_children(n.child_by_field("arguments"));
      if (!args.empty() && (args.front().kind() == "string" ||
                            args.front().kind() == "template_string")) {
        out_.add_import(n, strip_quotes(out_.text(args.front())));
      }
      return;
    }

    std::string name = member_path(fn);
    if (!name.empty()) {
      out_.add_reference(n, ReferenceKind::FunctionCall, std::move(name));
    }
  }

  /// `a.b.c`, `this.m`; type arguments dropped
  std::string member_path(ts_ll::Node n) const
  {
    if (n.is_null()) {
      return {};
    }
    const std::string_view k = n.kind();
    if (k == "identifier" || k == "type_identifier" || k == "this" ||
        k == "property_identifier" || k == "nested_type_identifier" ||
        k == "nested_identifier") {
      return std::string(out_.text(n));
    }
    if (k == "member_expression") {
      const std::string prop(out_.text(n.child_by_field("property")));
      const std::string object = member_path(n.child_by_field("object"));
      return object.empty() ? prop : object + "." + prop;
    }
    if (k == "generic_type") {
      return member_path(n.child_by_field("name"));
    }
    if (k == "expression_with_type_arguments" || k == "instantiation_expression") {
      return member_path(n.named_child(0));
    }
    return {};
  }

  FactCollector & out_;
  bool in_function_body_ = false;
};

void collect_script(ts_ll::Node root, FactCollector & out) { ScriptCollector(out).visit(root); }

LanguageAdapter make_script_adapter(Language lang, GrammarFn grammar)
{
  LanguageAdapter a;
  a.language = lang;
  a.extensions = default_extensions(lang);
  a.grammar = grammar;
  a.collect = &collect_script;
  return a;
}

}  // namespace

LanguageAdapter make_typescript_adapter()
{
  return make_script_adapter(Language::TypeScript, &tree_sitter_typescript);
}

LanguageAdapter make_tsx_adapter() { return make_script_adapter(Language::Tsx, &tree_sitter_tsx); }

LanguageAdapter make_javascript_adapter()
{
  return make_script_adapter(Language::JavaScript, &tree_sitter_javascript);
}

}  // namespace seiri
