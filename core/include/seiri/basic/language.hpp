// seiri/basic/language.hpp - Supported source languages
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace seiri
{

/**
 * Languages with a bundled adapter.
 *
 * TSX is kept apart from TypeScript because it uses a different grammar;
 * both belong to the same resolution family.
 */
enum class Language : uint8_t {
  Python,
  Rust,
  TypeScript,
  Tsx,
  JavaScript,
  Cpp,
};

/// How a language spells module paths in import statements.
enum class ModuleStyle : uint8_t {
  Dotted,  ///< `a.b.c` (Python, Rust after `::` folding)
  Path,    ///< `a/b/c` (TypeScript, JavaScript, C/C++)
};

[[nodiscard]] std::string_view to_string(Language lang) noexcept;
[[nodiscard]] std::optional<Language> language_from_string(std::string_view name);

/// All languages in declaration order.
[[nodiscard]] const std::vector<Language> & all_languages();

[[nodiscard]] ModuleStyle module_style(Language lang) noexcept;

/// Separator used by module keys of this language ('.' or '/').
[[nodiscard]] char module_separator(Language lang) noexcept;

/**
 * Whether an import written in `a` may resolve to a file of language `b`.
 * C shares a family with C++; JavaScript shares one with TypeScript/TSX.
 */
[[nodiscard]] bool same_family(Language a, Language b) noexcept;

/// Default file extensions (without the leading dot).
[[nodiscard]] std::vector<std::string> default_extensions(Language lang);

/// Fill color used by renderers for nodes of this language.
[[nodiscard]] std::string_view language_color(Language lang) noexcept;

}  // namespace seiri
