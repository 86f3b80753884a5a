// typegraph/symbols/symbol_enums.hpp - Symbol enumeration definitions
//
// Kinds and traits of the symbols in a loaded symbol graph. The string
// renderings are part of the emitted vocabulary and must stay stable.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace typegraph
{

// ============================================================================
// SymbolKind - Identifies all symbol classes
// ============================================================================

/**
 * Symbol kind enumeration for LLVM-style RTTI.
 * Type kinds and member kinds are contiguous for range-based classof checks.
 */
enum class SymbolKind : uint8_t {
  Module,
  Namespace,

  // === Types ===
  NamedType,
  ArrayType,
  PointerType,
  TypeParameter,

  // === Members ===
  Method,
  Property,
  Field,
  Event,

  Parameter,
};

namespace detail
{

inline constexpr SymbolKind k_first_type_kind = SymbolKind::NamedType;
inline constexpr SymbolKind k_last_type_kind = SymbolKind::TypeParameter;

inline constexpr SymbolKind k_first_member_kind = SymbolKind::Method;
inline constexpr SymbolKind k_last_member_kind = SymbolKind::Event;

}  // namespace detail

/// Check if a SymbolKind is a type
[[nodiscard]] constexpr bool is_type_kind(SymbolKind kind) noexcept
{
  return kind >= detail::k_first_type_kind && kind <= detail::k_last_type_kind;
}

/// Check if a SymbolKind is a type member
[[nodiscard]] constexpr bool is_member_kind(SymbolKind kind) noexcept
{
  return kind >= detail::k_first_member_kind && kind <= detail::k_last_member_kind;
}

// ============================================================================
// Traits
// ============================================================================

/**
 * Declared accessibility of a type or member.
 */
enum class Accessibility : uint8_t {
  NotApplicable,
  Private,
  ProtectedAndInternal,  ///< private protected
  Protected,
  Internal,
  ProtectedOrInternal,  ///< protected internal
  Public,
};

/**
 * Shape of a type.
 * Named types use Class..Delegate; the rest tag derived shapes.
 */
enum class TypeKind : uint8_t {
  Class,
  Struct,
  Interface,
  Enum,
  Delegate,
  Array,
  Pointer,
  TypeParameter,
};

enum class MethodKind : uint8_t {
  Ordinary,
  Constructor,
  StaticConstructor,
  Destructor,
  UserDefinedOperator,
  Conversion,
  PropertyGet,
  PropertySet,
  EventAdd,
  EventRemove,
  ExplicitInterfaceImplementation,
  DelegateInvoke,
};

enum class RefKind : uint8_t {
  None,
  Ref,
  Out,
  In,
};

enum class VarianceKind : uint8_t {
  None,
  Out,  ///< covariant
  In,   ///< contravariant
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(Accessibility accessibility) noexcept
{
  switch (accessibility) {
    case Accessibility::NotApplicable:
      return "NotApplicable";
    case Accessibility::Private:
      return "Private";
    case Accessibility::ProtectedAndInternal:
      return "ProtectedAndInternal";
    case Accessibility::Protected:
      return "Protected";
    case Accessibility::Internal:
      return "Internal";
    case Accessibility::ProtectedOrInternal:
      return "ProtectedOrInternal";
    case Accessibility::Public:
      return "Public";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(TypeKind kind) noexcept
{
  switch (kind) {
    case TypeKind::Class:
      return "Class";
    case TypeKind::Struct:
      return "Struct";
    case TypeKind::Interface:
      return "Interface";
    case TypeKind::Enum:
      return "Enum";
    case TypeKind::Delegate:
      return "Delegate";
    case TypeKind::Array:
      return "Array";
    case TypeKind::Pointer:
      return "Pointer";
    case TypeKind::TypeParameter:
      return "TypeParameter";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(MethodKind kind) noexcept
{
  switch (kind) {
    case MethodKind::Ordinary:
      return "Ordinary";
    case MethodKind::Constructor:
      return "Constructor";
    case MethodKind::StaticConstructor:
      return "StaticConstructor";
    case MethodKind::Destructor:
      return "Destructor";
    case MethodKind::UserDefinedOperator:
      return "UserDefinedOperator";
    case MethodKind::Conversion:
      return "Conversion";
    case MethodKind::PropertyGet:
      return "PropertyGet";
    case MethodKind::PropertySet:
      return "PropertySet";
    case MethodKind::EventAdd:
      return "EventAdd";
    case MethodKind::EventRemove:
      return "EventRemove";
    case MethodKind::ExplicitInterfaceImplementation:
      return "ExplicitInterfaceImplementation";
    case MethodKind::DelegateInvoke:
      return "DelegateInvoke";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(RefKind kind) noexcept
{
  switch (kind) {
    case RefKind::None:
      return "None";
    case RefKind::Ref:
      return "Ref";
    case RefKind::Out:
      return "Out";
    case RefKind::In:
      return "In";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(VarianceKind kind) noexcept
{
  switch (kind) {
    case VarianceKind::None:
      return "None";
    case VarianceKind::Out:
      return "Out";
    case VarianceKind::In:
      return "In";
  }
  return "";
}

// ============================================================================
// Parsing (symbol dump spelling: lower camelCase)
// ============================================================================

[[nodiscard]] std::optional<Accessibility> parse_accessibility(std::string_view text) noexcept;
[[nodiscard]] std::optional<MethodKind> parse_method_kind(std::string_view text) noexcept;
[[nodiscard]] std::optional<RefKind> parse_ref_kind(std::string_view text) noexcept;
[[nodiscard]] std::optional<VarianceKind> parse_variance(std::string_view text) noexcept;

}  // namespace typegraph
