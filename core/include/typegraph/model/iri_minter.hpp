// typegraph/model/iri_minter.hpp - Stable identifiers for symbols
//
// Every emitted entity is named `{base}/{category}/{segments...}`. The
// recipes are pure functions of the symbol, so the same symbol always
// mints the same IRI and distinct symbols mint distinct IRIs (with the
// documented exception of generic methods that differ only in arity).
//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "typegraph/symbols/symbol.hpp"

namespace typegraph
{

inline constexpr std::string_view k_default_base_uri = "http://dotnet.example/";

class IriMinter
{
public:
  /// Trailing slashes of base_uri are ignored
  explicit IriMinter(std::string_view base_uri = k_default_base_uri);

  [[nodiscard]] const std::string & base_uri() const noexcept { return base_; }

  /// `{base}/ontology/`: namespace of platform-specific vocabulary
  [[nodiscard]] std::string platform_ontology_iri() const;

  /// `{base}/assembly/{name}/{version}`
  [[nodiscard]] std::string module_iri(const ModuleSymbol & module) const;

  /// `{base}/namespace/_global_` or `{base}/namespace/{full.dotted.name}`
  [[nodiscard]] std::string namespace_iri(const NamespaceSymbol & ns) const;

  /**
   * `{base}/type/{module}/{version}/{metadata-name}`, or
   * `{base}/type/_builtin_/{metadata-name}` for types without a module.
   */
  [[nodiscard]] std::string type_iri(const TypeSymbol & type) const;

  /**
   * `{type}/member/{name}{signature}`.
   *
   * Methods carry `(p1,ref p2)` and indexers `[p1,p2]` built from
   * parameter metadata names; other members carry no signature.
   */
  [[nodiscard]] std::string member_iri(const MemberSymbol & member) const;

  /// `{member}/param/{ordinal}`
  [[nodiscard]] std::string parameter_iri(const ParameterSymbol & param) const;

  /**
   * `{owner}/typeparam/{ordinal}`.
   *
   * @throws std::invalid_argument if owner is neither a named type nor a method
   */
  [[nodiscard]] std::string type_parameter_iri(
    const Symbol & owner, const TypeParameterSymbol & type_param) const;

  /**
   * `{target}/attr/{index}`.
   *
   * @throws std::invalid_argument unless target is a module, named type,
   *         method, property, field, event or parameter
   */
  [[nodiscard]] std::string attribute_iri(const Symbol & target, size_t index) const;

  /// Signature suffix used by member_iri (unescaped)
  [[nodiscard]] static std::string member_signature(const MemberSymbol & member);

  /**
   * Percent-encode everything except ASCII letters, digits and `-_.~`.
   * Multi-byte UTF-8 sequences are encoded byte by byte.
   */
  [[nodiscard]] static std::string escape(std::string_view value);

private:
  std::string base_;
};

}  // namespace typegraph
