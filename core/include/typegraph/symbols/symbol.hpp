// typegraph/symbols/symbol.hpp - Symbol class definitions
//
// Read-only model of a compiled module's type surface: modules,
// namespaces, types (named, array, pointer, type parameter), members
// and parameters. Follows the LLVM style with classof() for RTTI.
//
// All symbols live in a SymbolContext arena and must stay trivially
// destructible: names are interned string_views and child lists are
// arena-backed gsl::span. The graph is cyclic in general.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string_view>

#include "typegraph/basic/casting.hpp"
#include "typegraph/symbols/symbol_enums.hpp"

namespace typegraph
{

class ModuleSymbol;
class NamespaceSymbol;
class TypeSymbol;
class NamedTypeSymbol;
class TypeParameterSymbol;
class MethodSymbol;
class PropertySymbol;
class EventSymbol;
class ParameterSymbol;
struct AttributeData;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all symbols.
 *
 * Symbols are non-copyable and managed by SymbolContext.
 */
class Symbol
{
public:
  const SymbolKind kind;

  std::string_view name;
  Accessibility accessibility = Accessibility::NotApplicable;

  /// Synthesized by the compiler rather than written in source
  bool is_implicitly_declared = false;

  /// Documentation-comment XML blob (may be empty)
  std::string_view doc_comment;

  gsl::span<const AttributeData> attributes;

  // Non-copyable, non-movable (managed by SymbolContext)
  Symbol(const Symbol &) = delete;
  Symbol & operator=(const Symbol &) = delete;
  Symbol(Symbol &&) = delete;
  Symbol & operator=(Symbol &&) = delete;

  [[nodiscard]] SymbolKind get_kind() const noexcept { return kind; }

protected:
  explicit Symbol(SymbolKind k) : kind(k) {}
  ~Symbol() = default;  // Non-virtual, protected: prevents polymorphic delete
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * CRTP base class that automatically implements classof().
 *
 * @tparam Derived The concrete symbol class
 * @tparam Base The base class to inherit from
 * @tparam K The SymbolKind for this symbol class
 */
template <typename Derived, typename Base, SymbolKind K>
class SymbolBase : public Base
{
public:
  static constexpr SymbolKind static_kind = K;

  static bool classof(const Symbol * sym) { return sym->get_kind() == K; }

protected:
  SymbolBase() : Base(K) {}
};

/**
 * Base class for every type shape.
 */
class TypeSymbol : public Symbol
{
public:
  /// Module that defines the type; nullptr for built-ins, arrays and pointers
  const ModuleSymbol * containing_module = nullptr;

  static bool classof(const Symbol * sym) { return is_type_kind(sym->get_kind()); }

protected:
  explicit TypeSymbol(SymbolKind k) : Symbol(k) {}
};

/**
 * Base class for methods, properties, fields and events.
 */
class MemberSymbol : public Symbol
{
public:
  const NamedTypeSymbol * containing_type = nullptr;

  bool is_static = false;
  bool is_abstract = false;
  bool is_virtual = false;
  bool is_override = false;
  bool is_sealed = false;
  bool is_extern = false;

  static bool classof(const Symbol * sym) { return is_member_kind(sym->get_kind()); }

protected:
  explicit MemberSymbol(SymbolKind k) : Symbol(k) {}
};

// ============================================================================
// Attribute Data
// ============================================================================

enum class ConstantKind : uint8_t {
  Null,
  Primitive,  ///< numbers, booleans, chars, boxed enum values
  String,
  Type,  ///< typeof(...)
  Array,
};

/**
 * A constant argument of an attribute application.
 */
struct TypedConstant
{
  ConstantKind kind = ConstantKind::Null;

  /// Primitive or string payload (unquoted)
  std::string_view text;

  /// Payload of ConstantKind::Type
  const TypeSymbol * type_value = nullptr;

  /// Elements of ConstantKind::Array
  gsl::span<const TypedConstant *> values;
};

struct NamedArgument
{
  std::string_view name;
  TypedConstant value;
};

/**
 * One attribute application on a symbol.
 */
struct AttributeData
{
  /// Declaring attribute type; nullptr when it could not be resolved
  const NamedTypeSymbol * attribute_class = nullptr;

  gsl::span<const TypedConstant> constructor_arguments;
  gsl::span<const NamedArgument> named_arguments;
};

// ============================================================================
// Containers
// ============================================================================

class ModuleSymbol : public SymbolBase<ModuleSymbol, Symbol, SymbolKind::Module>
{
public:
  std::string_view version;  ///< "major.minor.build.revision"
  std::string_view culture;
  gsl::span<const uint8_t> public_key_token;
  bool is_interactive = false;

  const NamespaceSymbol * global_namespace = nullptr;
};

class NamespaceSymbol : public SymbolBase<NamespaceSymbol, Symbol, SymbolKind::Namespace>
{
public:
  /// Dotted path from the root, empty for the global namespace
  std::string_view full_name;

  const NamespaceSymbol * containing_namespace = nullptr;
  const ModuleSymbol * containing_module = nullptr;

  gsl::span<const NamespaceSymbol *> namespaces;
  gsl::span<const NamedTypeSymbol *> types;  ///< Top-level types only

  [[nodiscard]] bool is_global() const noexcept { return containing_namespace == nullptr; }
};

// ============================================================================
// Types
// ============================================================================

/**
 * Class, struct, interface, enum or delegate; generic definitions and
 * constructed instantiations alike.
 */
class NamedTypeSymbol : public SymbolBase<NamedTypeSymbol, TypeSymbol, SymbolKind::NamedType>
{
public:
  TypeKind type_kind = TypeKind::Class;

  const NamespaceSymbol * containing_namespace = nullptr;
  const NamedTypeSymbol * containing_type = nullptr;

  const NamedTypeSymbol * base_type = nullptr;
  gsl::span<const NamedTypeSymbol *> interfaces;

  gsl::span<const TypeParameterSymbol *> type_parameters;
  gsl::span<const TypeSymbol *> type_arguments;

  /// Generic definition this type was constructed from (nullptr: itself)
  const NamedTypeSymbol * original_definition = nullptr;
  bool is_unbound_generic = false;

  bool is_abstract = false;
  bool is_sealed = false;
  bool is_static = false;
  bool is_record = false;
  bool is_ref_like = false;
  bool is_read_only = false;
  bool is_unmanaged = false;

  /// Special-type tag such as "System_Object"; empty when none
  std::string_view special_type;
  const NamedTypeSymbol * enum_underlying_type = nullptr;

  /// Methods, properties, fields and events in declaration order
  gsl::span<const MemberSymbol *> members;
  gsl::span<const NamedTypeSymbol *> nested_types;

  /// Provider-supplied display name; computed when empty
  std::string_view display_name;

  [[nodiscard]] size_t arity() const noexcept
  {
    return type_parameters.empty() ? type_arguments.size() : type_parameters.size();
  }

  [[nodiscard]] bool is_generic() const noexcept { return arity() > 0; }

  [[nodiscard]] bool is_value_type() const noexcept
  {
    return type_kind == TypeKind::Struct || type_kind == TypeKind::Enum;
  }

  /// A generic instantiation with arguments, distinct from its definition
  [[nodiscard]] bool is_constructed() const noexcept
  {
    return !type_arguments.empty() && !is_unbound_generic && original_definition != nullptr &&
           original_definition != this;
  }

  [[nodiscard]] const NamedTypeSymbol * definition() const noexcept
  {
    return original_definition != nullptr ? original_definition : this;
  }
};

class ArrayTypeSymbol : public SymbolBase<ArrayTypeSymbol, TypeSymbol, SymbolKind::ArrayType>
{
public:
  const TypeSymbol * element_type = nullptr;
  int32_t rank = 1;
};

class PointerTypeSymbol
: public SymbolBase<PointerTypeSymbol, TypeSymbol, SymbolKind::PointerType>
{
public:
  const TypeSymbol * pointed_at_type = nullptr;
};

class TypeParameterSymbol
: public SymbolBase<TypeParameterSymbol, TypeSymbol, SymbolKind::TypeParameter>
{
public:
  int32_t ordinal = 0;
  VarianceKind variance = VarianceKind::None;

  bool has_reference_type_constraint = false;
  bool has_value_type_constraint = false;
  bool has_unmanaged_type_constraint = false;
  bool has_not_null_constraint = false;
  bool has_constructor_constraint = false;

  gsl::span<const TypeSymbol *> constraint_types;

  /// Exactly one of the two owners is set
  const NamedTypeSymbol * declaring_type = nullptr;
  const MethodSymbol * declaring_method = nullptr;
};

// ============================================================================
// Members
// ============================================================================

class MethodSymbol : public SymbolBase<MethodSymbol, MemberSymbol, SymbolKind::Method>
{
public:
  MethodKind method_kind = MethodKind::Ordinary;

  /// nullptr when the method returns void
  const TypeSymbol * return_type = nullptr;

  gsl::span<const ParameterSymbol *> parameters;
  gsl::span<const TypeParameterSymbol *> type_parameters;

  const MethodSymbol * overridden_method = nullptr;
  gsl::span<const MethodSymbol *> explicit_interface_implementations;

  bool is_async = false;
  bool is_extension_method = false;
  bool is_partial_definition = false;
  bool is_read_only = false;
  bool is_init_only = false;

  gsl::span<const AttributeData> return_type_attributes;

  [[nodiscard]] bool returns_void() const noexcept { return return_type == nullptr; }
};

class PropertySymbol : public SymbolBase<PropertySymbol, MemberSymbol, SymbolKind::Property>
{
public:
  const TypeSymbol * type = nullptr;

  /// Non-empty only for indexers
  gsl::span<const ParameterSymbol *> parameters;

  const MethodSymbol * get_method = nullptr;
  const MethodSymbol * set_method = nullptr;

  bool is_required = false;

  const PropertySymbol * overridden_property = nullptr;
  gsl::span<const PropertySymbol *> explicit_interface_implementations;

  [[nodiscard]] bool is_indexer() const noexcept { return !parameters.empty(); }
};

class FieldSymbol : public SymbolBase<FieldSymbol, MemberSymbol, SymbolKind::Field>
{
public:
  const TypeSymbol * type = nullptr;

  bool is_read_only = false;
  bool is_const = false;
  bool is_volatile = false;
  bool is_required = false;

  /// Rendered constant ("null" for a null constant); empty optional when none
  std::optional<std::string_view> constant_value;
};

class EventSymbol : public SymbolBase<EventSymbol, MemberSymbol, SymbolKind::Event>
{
public:
  const TypeSymbol * type = nullptr;

  const MethodSymbol * add_method = nullptr;
  const MethodSymbol * remove_method = nullptr;

  const EventSymbol * overridden_event = nullptr;
  gsl::span<const EventSymbol *> explicit_interface_implementations;
};

class ParameterSymbol : public SymbolBase<ParameterSymbol, Symbol, SymbolKind::Parameter>
{
public:
  int32_t ordinal = 0;
  const TypeSymbol * type = nullptr;
  RefKind ref_kind = RefKind::None;

  bool is_optional = false;
  bool is_params = false;
  bool is_this = false;
  bool is_discard = false;

  /// Rendered explicit default ("null" for a null default); empty optional when none
  std::optional<std::string_view> default_value;

  /// Owning method or indexer property
  const MemberSymbol * containing_symbol = nullptr;

  [[nodiscard]] bool has_explicit_default_value() const noexcept
  {
    return default_value.has_value();
  }
};

}  // namespace typegraph
