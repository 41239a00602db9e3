// seiri/extract/adapters.hpp - Bundled language adapters
//
// Each factory returns a descriptor binding a tree-sitter grammar to the
// collect routine for that language. The grammar entry points come from
// the tree-sitter grammar libraries found by the build.
//
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "seiri/extract/language_adapter.hpp"

extern "C" {
const TSLanguage * tree_sitter_python();
const TSLanguage * tree_sitter_rust();
const TSLanguage * tree_sitter_typescript();
const TSLanguage * tree_sitter_tsx();
const TSLanguage * tree_sitter_javascript();
const TSLanguage * tree_sitter_cpp();
}

namespace seiri
{

[[nodiscard]] LanguageAdapter make_python_adapter();
[[nodiscard]] LanguageAdapter make_rust_adapter();
[[nodiscard]] LanguageAdapter make_typescript_adapter();
[[nodiscard]] LanguageAdapter make_tsx_adapter();
[[nodiscard]] LanguageAdapter make_javascript_adapter();
[[nodiscard]] LanguageAdapter make_cpp_adapter();

// ============================================================================
// Shared CST helpers
// ============================================================================

namespace adapter_util
{

/// All children stored under `field` (fields may repeat, e.g. Python `name`)
[[nodiscard]] std::vector<ts_ll::Node> children_by_field(ts_ll::Node n, std::string_view field);

/// Named children in order
[[nodiscard]] std::vector<ts_ll::Node> named_children(ts_ll::Node n);

/// First named child of the given kind (null node if none)
[[nodiscard]] ts_ll::Node first_child_of_kind(ts_ll::Node n, std::string_view kind);

/// Drop one pair of surrounding quotes ('x', "x", `x`)
[[nodiscard]] std::string strip_quotes(std::string_view s);

/// Remove every `<...>` group (`Foo<T>::bar` -> `Foo::bar`)
[[nodiscard]] std::string strip_template_args(std::string_view s);

/// Split on a multi-character separator, keeping empty pieces
[[nodiscard]] std::vector<std::string> split(std::string_view s, std::string_view sep);

}  // namespace adapter_util

}  // namespace seiri
