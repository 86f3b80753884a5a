// typegraph/symbols/symbol_enums.cpp - Enumeration parsing
#include "typegraph/symbols/symbol_enums.hpp"

#include <array>
#include <utility>

namespace typegraph
{

namespace
{

template <typename E, size_t N>
std::optional<E> lookup(
  const std::array<std::pair<std::string_view, E>, N> & table, std::string_view text) noexcept
{
  for (const auto & [name, value] : table) {
    if (name == text) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace

std::optional<Accessibility> parse_accessibility(std::string_view text) noexcept
{
  static constexpr std::array<std::pair<std::string_view, Accessibility>, 7> k_table{{
    {"notApplicable", Accessibility::NotApplicable},
    {"private", Accessibility::Private},
    {"protectedAndInternal", Accessibility::ProtectedAndInternal},
    {"protected", Accessibility::Protected},
    {"internal", Accessibility::Internal},
    {"protectedOrInternal", Accessibility::ProtectedOrInternal},
    {"public", Accessibility::Public},
  }};
  return lookup(k_table, text);
}

std::optional<MethodKind> parse_method_kind(std::string_view text) noexcept
{
  static constexpr std::array<std::pair<std::string_view, MethodKind>, 12> k_table{{
    {"ordinary", MethodKind::Ordinary},
    {"constructor", MethodKind::Constructor},
    {"staticConstructor", MethodKind::StaticConstructor},
    {"destructor", MethodKind::Destructor},
    {"userDefinedOperator", MethodKind::UserDefinedOperator},
    {"conversion", MethodKind::Conversion},
    {"propertyGet", MethodKind::PropertyGet},
    {"propertySet", MethodKind::PropertySet},
    {"eventAdd", MethodKind::EventAdd},
    {"eventRemove", MethodKind::EventRemove},
    {"explicitInterfaceImplementation", MethodKind::ExplicitInterfaceImplementation},
    {"delegateInvoke", MethodKind::DelegateInvoke},
  }};
  return lookup(k_table, text);
}

std::optional<RefKind> parse_ref_kind(std::string_view text) noexcept
{
  static constexpr std::array<std::pair<std::string_view, RefKind>, 4> k_table{{
    {"none", RefKind::None},
    {"ref", RefKind::Ref},
    {"out", RefKind::Out},
    {"in", RefKind::In},
  }};
  return lookup(k_table, text);
}

std::optional<VarianceKind> parse_variance(std::string_view text) noexcept
{
  static constexpr std::array<std::pair<std::string_view, VarianceKind>, 3> k_table{{
    {"none", VarianceKind::None},
    {"out", VarianceKind::Out},
    {"in", VarianceKind::In},
  }};
  return lookup(k_table, text);
}

}  // namespace typegraph
