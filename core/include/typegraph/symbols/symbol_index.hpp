// typegraph/symbols/symbol_index.hpp - Lookup of types and members by name
//
// Used to resolve documentation-comment references ("T:Ns.Type",
// "M:Ns.Type.Method(System.String)") against a loaded symbol graph.
//
#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "typegraph/symbols/symbol.hpp"

namespace typegraph
{

/// Transparent hash functor for string_view heterogeneous lookup
struct SymbolNameHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct SymbolNameEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

/**
 * Index of generic definitions and ordinary named types keyed by their
 * full metadata name (`Ns.Outer+Inner`, `Ns.List`1`).
 *
 * Types of the target module shadow same-named types from other modules;
 * among the rest the first registration wins.
 */
class SymbolIndex
{
public:
  SymbolIndex() = default;

  /**
   * Register every type declared in the module's namespace tree,
   * including nested types.
   */
  void add_module(const ModuleSymbol & module);

  /// Register one type (no-op if the name is taken)
  void add_type(const NamedTypeSymbol & type);

  [[nodiscard]] const NamedTypeSymbol * find_type(std::string_view metadata_name) const;

  /// Members of `type` with the given name, in declaration order
  [[nodiscard]] static std::vector<const MemberSymbol *> find_members(
    const NamedTypeSymbol & type, std::string_view name);

  [[nodiscard]] size_t size() const noexcept { return types_.size(); }

private:
  void add_namespace(const NamespaceSymbol & ns);
  void add_type_tree(const NamedTypeSymbol & type);

  std::unordered_map<std::string, const NamedTypeSymbol *, SymbolNameHash, SymbolNameEqual> types_;
};

}  // namespace typegraph
