// typegraph/extraction/xref_provider.hpp - Auxiliary cross-reference edges
#pragma once

#include <vector>

#include "typegraph/symbols/symbol.hpp"

namespace typegraph
{

/**
 * Supplies extra `throws` and `relatedTo` edges for a symbol.
 *
 * Results are in source order. Unresolvable references are simply
 * absent; implementations never fail.
 */
class CrossReferenceProvider
{
public:
  virtual ~CrossReferenceProvider() = default;

  /// Exception types the symbol documents as thrown
  [[nodiscard]] virtual std::vector<const TypeSymbol *> exception_types_for(
    const Symbol & symbol) const = 0;

  /// Related types or members (a type result is a TypeSymbol)
  [[nodiscard]] virtual std::vector<const Symbol *> see_also_for(const Symbol & symbol) const = 0;
};

}  // namespace typegraph
