// seiri/extract/adapters/rust_adapter.cpp - Rust fact collection
#include <string>

#include "seiri/extract/adapters.hpp"

namespace seiri
{

namespace
{

using adapter_util::named_children;
using adapter_util::split;

bool is_path_keyword(std::string_view seg)
{
  return seg == "crate" || seg == "self" || seg == "super";
}

class RustCollector
{
public:
  explicit RustCollector(FactCollector & out) : out_(out) {}

  void visit(ts_ll::Node n)
  {
    const std::string_view k = n.kind();
    if (k == "use_declaration") {
      flatten_use(n.child_by_field("argument"), {}, n);
      return;
    }
    if (k == "mod_item") {
      on_mod(n);
      return;
    }
    if (k == "function_item" || k == "function_signature_item") {
      on_function(n);
      return;
    }
    if (k == "struct_item" || k == "enum_item" || k == "trait_item" || k == "union_item") {
      on_container(n, std::string(out_.text(n.child_by_field("name"))));
      return;
    }
    if (k == "impl_item") {
      on_impl(n);
      return;
    }
    if (k == "call_expression") {
      std::string name = callee(n.child_by_field("function"));
      if (!name.empty()) {
        out_.add_reference(n, ReferenceKind::FunctionCall, std::move(name));
      }
    } else if (k == "struct_expression") {
      std::string name = type_name(n.child_by_field("name"));
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

  /// Emit one import per leaf of a use tree. `prefix` ends with `::` when set.
  void flatten_use(ts_ll::Node n, const std::string & prefix, ts_ll::Node decl)
  {
    if (n.is_null()) {
      return;
    }
    const std::string_view k = n.kind();
    if (k == "use_list") {
      for (const auto & item : named_children(n)) {
        flatten_use(item, prefix, decl);
      }
      return;
    }
    if (k == "scoped_use_list") {
      const auto path = n.child_by_field("path");
      const std::string next =
        path.is_null() ? prefix : prefix + std::string(out_.text(path)) + "::";
      flatten_use(n.child_by_field("list"), next, decl);
      return;
    }
    if (k == "use_as_clause") {
      emit_path(
        n, prefix + std::string(out_.text(n.child_by_field("path"))),
        std::string(out_.text(n.child_by_field("alias"))));
      return;
    }
    if (k == "use_wildcard") {
      std::string text(out_.text(n));
      if (text.size() >= 3 && text.compare(text.size() - 3, 3, "::*") == 0) {
        text.resize(text.size() - 3);
      } else if (text == "*") {
        text.clear();
      }
      std::string module = prefix + text;
      if (module.size() >= 2 && module.compare(module.size() - 2, 2, "::") == 0) {
        module.resize(module.size() - 2);
      }
      out_.add_import(n, std::move(module));
      return;
    }
    if (k == "self" && !prefix.empty()) {
      // use a::{self, b}: the prefix itself
      emit_path(n, prefix.substr(0, prefix.size() - 2), {});
      return;
    }
    emit_path(n, prefix + std::string(out_.text(n)), {});
  }

  /// `a::b::Item` -> module `a::b`, name `Item`; a path made of keywords
  /// plus one segment (`crate::a`, `foo`) is imported as a whole module.
  void emit_path(ts_ll::Node at, const std::string & path, std::string alias)
  {
    const auto segs = split(path, "::");
    size_t keywords = 0;
    while (keywords < segs.size() && is_path_keyword(segs[keywords])) {
      ++keywords;
    }
    if (segs.size() - keywords <= 1) {
      out_.add_import(at, path, {}, std::move(alias));
      return;
    }
    const auto pos = path.rfind("::");
    out_.add_import(at, path.substr(0, pos), path.substr(pos + 2), std::move(alias));
  }

  void on_mod(ts_ll::Node n)
  {
    const std::string name(out_.text(n.child_by_field("name")));
    if (n.child_by_field("body").is_null()) {
      // mod x; pulls in x.rs / x/mod.rs next to this file
      out_.add_import(n, "self::" + name);
      return;
    }
    on_container(n, name);
  }

  void on_function(ts_ll::Node n)
  {
    if (!in_function_body_) {
      out_.add_definition(
        n, DefinitionKind::Function, std::string(out_.text(n.child_by_field("name"))));
    }
    const bool saved = in_function_body_;
    in_function_body_ = true;
    visit_children(n);
    in_function_body_ = saved;
  }

  void on_container(ts_ll::Node n, std::string name)
  {
    if (!name.empty()) {
      out_.add_definition(n, DefinitionKind::Container, std::move(name));
    }
    const bool saved = in_function_body_;
    in_function_body_ = false;
    visit_children(n);
    in_function_body_ = saved;
  }

  // impl [Trait for] Type { ... } is a container named after Type
  void on_impl(ts_ll::Node n)
  {
    const std::string type = type_name(n.child_by_field("type"));
    if (!type.empty()) {
      out_.add_definition(n, DefinitionKind::Container, type);
    }
    const auto trait = n.child_by_field("trait");
    if (!trait.is_null()) {
      std::string trait_name = type_name(trait);
      if (!trait_name.empty()) {
        out_.add_reference(trait, ReferenceKind::ContainerUse, std::move(trait_name));
      }
    }
    const bool saved = in_function_body_;
    in_function_body_ = false;
    visit_children(n.child_by_field("body"));
    in_function_body_ = saved;
  }

  /// Bare type name: generics, references and path qualifiers dropped
  std::string type_name(ts_ll::Node n) const
  {
    if (n.is_null()) {
      return {};
    }
    const std::string_view k = n.kind();
    if (k == "generic_type") {
      return type_name(n.child_by_field("type"));
    }
    if (k == "reference_type" || k == "pointer_type") {
      return type_name(n.child_by_field("type"));
    }
    if (k == "scoped_type_identifier" || k == "scoped_identifier") {
      return std::string(out_.text(n.child_by_field("name")));
    }
    return std::string(out_.text(n));
  }

  std::string callee(ts_ll::Node n) const
  {
    if (n.is_null()) {
      return {};
    }
    const std::string_view k = n.kind();
    if (k == "identifier" || k == "scoped_identifier" || k == "self") {
      return adapter_util::strip_template_args(out_.text(n));
    }
    if (k == "field_expression") {
      const std::string field(out_.text(n.child_by_field("field")));
      const std::string value = callee(n.child_by_field("value"));
      return value.empty() ? field : value + "." + field;
    }
    if (k == "generic_function") {
      return callee(n.child_by_field("function"));
    }
    return {};
  }

  FactCollector & out_;
  bool in_function_body_ = false;
};

void collect_rust(ts_ll::Node root, FactCollector & out) { RustCollector(out).visit(root); }

}  // namespace

LanguageAdapter make_rust_adapter()
{
  LanguageAdapter a;
  a.language = Language::Rust;
  a.extensions = default_extensions(Language::Rust);
  a.grammar = &tree_sitter_rust;
  a.collect = &collect_rust;
  return a;
}

}  // namespace seiri
