// seiri/basic/language.cpp - Language table
#include "seiri/basic/language.hpp"

namespace seiri
{

std::string_view to_string(Language lang) noexcept
{
  switch (lang) {
    case Language::Python:
      return "python";
    case Language::Rust:
      return "rust";
    case Language::TypeScript:
      return "typescript";
    case Language::Tsx:
      return "tsx";
    case Language::JavaScript:
      return "javascript";
    case Language::Cpp:
      return "cpp";
  }
  return "python";
}

std::optional<Language> language_from_string(std::string_view name)
{
  for (const auto lang : all_languages()) {
    if (to_string(lang) == name) {
      return lang;
    }
  }
  // Accepted spellings in configuration files
  if (name == "c" || name == "c++") return Language::Cpp;
  if (name == "js") return Language::JavaScript;
  if (name == "ts") return Language::TypeScript;
  return std::nullopt;
}

const std::vector<Language> & all_languages()
{
  static const std::vector<Language> k_all = {
    Language::Python,     Language::Rust, Language::TypeScript,
    Language::Tsx,        Language::JavaScript, Language::Cpp,
  };
  return k_all;
}

ModuleStyle module_style(Language lang) noexcept
{
  switch (lang) {
    case Language::Python:
    case Language::Rust:
      return ModuleStyle::Dotted;
    case Language::TypeScript:
    case Language::Tsx:
    case Language::JavaScript:
    case Language::Cpp:
      return ModuleStyle::Path;
  }
  return ModuleStyle::Path;
}

char module_separator(Language lang) noexcept
{
  return module_style(lang) == ModuleStyle::Dotted ? '.' : '/';
}

namespace
{

int family_of(Language lang) noexcept
{
  switch (lang) {
    case Language::Python:
      return 0;
    case Language::Rust:
      return 1;
    case Language::TypeScript:
    case Language::Tsx:
    case Language::JavaScript:
      return 2;
    case Language::Cpp:
      return 3;
  }
  return -1;
}

}  // namespace

bool same_family(Language a, Language b) noexcept { return family_of(a) == family_of(b); }

std::vector<std::string> default_extensions(Language lang)
{
  switch (lang) {
    case Language::Python:
      return {"py", "pyi"};
    case Language::Rust:
      return {"rs"};
    case Language::TypeScript:
      return {"ts", "mts", "cts"};
    case Language::Tsx:
      return {"tsx"};
    case Language::JavaScript:
      return {"js", "jsx", "mjs", "cjs"};
    case Language::Cpp:
      return {"c", "h", "cc", "cpp", "cxx", "hpp", "hh", "hxx"};
  }
  return {};
}

std::string_view language_color(Language lang) noexcept
{
  switch (lang) {
    case Language::Python:
      return "#3572A5";
    case Language::Rust:
      return "#DEA584";
    case Language::TypeScript:
    case Language::Tsx:
      return "#3178C6";
    case Language::JavaScript:
      return "#F1E05A";
    case Language::Cpp:
      return "#F34B7D";
  }
  return "#CCCCCC";
}

}  // namespace seiri
