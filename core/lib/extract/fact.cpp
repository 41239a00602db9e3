// seiri/extract/fact.cpp - Fact enum conversions
#include "seiri/extract/fact.hpp"

namespace seiri
{

std::string_view to_string(DefinitionKind kind) noexcept
{
  switch (kind) {
    case DefinitionKind::Function:
      return "function";
    case DefinitionKind::Container:
      return "container";
  }
  return "function";
}

std::string_view to_string(ReferenceKind kind) noexcept
{
  switch (kind) {
    case ReferenceKind::FunctionCall:
      return "function-call";
    case ReferenceKind::ContainerUse:
      return "container-use";
  }
  return "function-call";
}

std::optional<DefinitionKind> definition_kind_from_string(std::string_view s)
{
  if (s == "function") return DefinitionKind::Function;
  if (s == "container") return DefinitionKind::Container;
  return std::nullopt;
}

}  // namespace seiri
