// typegraph/symbols/symbol_graph.hpp - A loaded, read-only symbol forest
#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "typegraph/symbols/symbol.hpp"
#include "typegraph/symbols/symbol_context.hpp"
#include "typegraph/symbols/symbol_index.hpp"

namespace typegraph
{

/**
 * Owns the arena of one loaded symbol dump together with its modules,
 * the module selected for extraction and the name index.
 *
 * Movable so that loaders can return it by value; symbol pointers stay
 * valid because the arena itself never moves.
 */
class SymbolGraph
{
public:
  SymbolGraph() : context_(std::make_unique<SymbolContext>()) {}

  [[nodiscard]] SymbolContext & context() noexcept { return *context_; }

  void add_module(const ModuleSymbol * module) { modules_.push_back(module); }

  [[nodiscard]] const std::vector<const ModuleSymbol *> & modules() const noexcept
  {
    return modules_;
  }

  [[nodiscard]] const ModuleSymbol * find_module(std::string_view name) const noexcept
  {
    for (const ModuleSymbol * m : modules_) {
      if (m->name == name) {
        return m;
      }
    }
    return nullptr;
  }

  /// Register a named type that belongs to no module (a built-in)
  void add_builtin_type(const NamedTypeSymbol * type) { builtin_types_.push_back(type); }

  [[nodiscard]] const std::vector<const NamedTypeSymbol *> & builtin_types() const noexcept
  {
    return builtin_types_;
  }

  /// Module the dump designates for extraction (may be nullptr)
  [[nodiscard]] const ModuleSymbol * target_module() const noexcept { return target_; }
  void set_target_module(const ModuleSymbol * module) noexcept { target_ = module; }

  /**
   * Rebuild the name index. Target module types are registered first,
   * built-ins last.
   */
  void build_index()
  {
    index_ = SymbolIndex{};
    if (target_ != nullptr) {
      index_.add_module(*target_);
    }
    for (const ModuleSymbol * m : modules_) {
      if (m != target_) {
        index_.add_module(*m);
      }
    }
    for (const NamedTypeSymbol * type : builtin_types_) {
      index_.add_type(*type);
    }
  }

  [[nodiscard]] const SymbolIndex & index() const noexcept { return index_; }

private:
  std::unique_ptr<SymbolContext> context_;
  std::vector<const ModuleSymbol *> modules_;
  std::vector<const NamedTypeSymbol *> builtin_types_;
  const ModuleSymbol * target_ = nullptr;
  SymbolIndex index_;
};

}  // namespace typegraph
