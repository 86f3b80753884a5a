// typegraph/extraction/doc_comment_xrefs.hpp - Cross references from doc comments
//
// Reads the documentation-comment XML attached to a symbol and resolves
// the `cref` attributes of <exception> and <seealso> elements against a
// SymbolIndex. This is not a general doc-comment parser.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "typegraph/extraction/xref_provider.hpp"
#include "typegraph/symbols/symbol_index.hpp"

namespace typegraph
{

class DocCommentCrossReferences final : public CrossReferenceProvider
{
public:
  /// The index must outlive the provider
  explicit DocCommentCrossReferences(const SymbolIndex & index) : index_(index) {}

  [[nodiscard]] std::vector<const TypeSymbol *> exception_types_for(
    const Symbol & symbol) const override;

  [[nodiscard]] std::vector<const Symbol *> see_also_for(const Symbol & symbol) const override;

  /**
   * Resolve one cref string.
   *
   * Supported forms: `T:Ns.Type`, `M:Ns.Type.Method(System.String,System.Int32)`,
   * `P:`, `F:`, `E:` member references, and unprefixed names (type first,
   * then member). `N:` and `!:` references resolve to nothing. `#` in a
   * member name stands for `.` (explicit interface implementations).
   *
   * @return nullptr when the reference does not resolve
   */
  [[nodiscard]] const Symbol * resolve_cref(std::string_view cref) const;

  /// Split a cref parameter list at top-level commas
  [[nodiscard]] static std::vector<std::string> parse_parameter_types(std::string_view params);

private:
  [[nodiscard]] const NamedTypeSymbol * resolve_type(std::string_view name) const;
  [[nodiscard]] const Symbol * resolve_method(std::string_view name) const;
  [[nodiscard]] const Symbol * resolve_member(
    std::string_view member_path, const std::optional<std::vector<std::string>> & param_types) const;

  const SymbolIndex & index_;
};

/**
 * Collect the non-empty `cref` attributes of every element named
 * `element_name` in document order. Malformed XML yields nothing.
 */
[[nodiscard]] std::vector<std::string> collect_crefs(std::string_view xml, const char * element_name);

}  // namespace typegraph
