// typegraph/extraction/graph_extractor.hpp - Symbol graph to triples
//
// Walks the namespace tree of a target module depth-first, applies the
// inclusion policy, mints identifiers and emits facts to a TripleSink.
// Referenced types outside the walk are described lazily on first
// reference; visited sets keyed by IRI guarantee that every entity is
// emitted once and that cyclic type graphs terminate.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "typegraph/emit/triple_sink.hpp"
#include "typegraph/extraction/extraction_options.hpp"
#include "typegraph/extraction/xref_provider.hpp"
#include "typegraph/model/iri_minter.hpp"
#include "typegraph/symbols/symbol.hpp"
#include "typegraph/symbols/symbol_graph.hpp"

namespace typegraph
{

/**
 * Raised when extraction cannot continue (currently: referenced-type
 * nesting deeper than ExtractionOptions::max_type_depth).
 */
class ExtractionError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

struct ExtractionStats
{
  /// Target-module types that passed the inclusion policy
  size_t types_extracted = 0;
  /// Sink fact count after the run
  int64_t facts_emitted = 0;
};

/**
 * Extracts the type graph of one module.
 *
 * One instance serves one run at a time; it is not re-entrant. The sink
 * and the optional cross-reference provider must outlive the extractor.
 *
 * Example:
 * @code
 *   NTriplesSink sink(out);
 *   GraphExtractor extractor(sink, options);
 *   auto stats = extractor.extract(graph, *graph.target_module());
 *   sink.flush();
 * @endcode
 */
class GraphExtractor
{
public:
  /// Declares the standard prefixes on the sink
  GraphExtractor(TripleSink & sink, ExtractionOptions options = {});

  /**
   * Use `provider` for throws/relatedTo edges instead of the built-in
   * documentation-comment reader. Pass nullptr to restore the default.
   */
  void set_cross_reference_provider(const CrossReferenceProvider * provider) noexcept
  {
    external_xrefs_ = provider;
  }

  /**
   * Emit the module fact set, then every included type declared in the
   * module's namespace tree (nested types included).
   *
   * @throws ExtractionError on pathological type nesting
   * @throws std::invalid_argument on malformed symbols (type parameter or
   *         attribute attached to an unsupported owner)
   */
  ExtractionStats extract(const SymbolGraph & graph, const ModuleSymbol & target);

  [[nodiscard]] const IriMinter & iris() const noexcept { return iris_; }
  [[nodiscard]] const ExtractionOptions & options() const noexcept { return options_; }

private:
  // ---------------------------------------------------------------------------
  // graph_extractor.cpp: module and type walk
  // ---------------------------------------------------------------------------
  void extract_module(const ModuleSymbol & module, const std::string & module_iri);
  /// False when the type's IRI was already described
  bool extract_type(const NamedTypeSymbol & type, const std::string & module_iri);
  void extract_type_parameter(
    const std::string & owner_iri, const Symbol & owner, const TypeParameterSymbol & tp);
  void extract_type_arguments(const std::string & type_iri, const NamedTypeSymbol & type);
  void extract_cross_references(const std::string & subject_iri, const Symbol & symbol);

  [[nodiscard]] static std::vector<const NamedTypeSymbol *> collect_types(
    const NamespaceSymbol & root);

  // ---------------------------------------------------------------------------
  // graph_extractor_members.cpp: members, parameters, attributes
  // ---------------------------------------------------------------------------
  void extract_member(const std::string & type_iri, const MemberSymbol & member);
  void extract_method(const std::string & type_iri, const MethodSymbol & method);
  void extract_property(const std::string & type_iri, const PropertySymbol & property);
  void extract_field(const std::string & type_iri, const FieldSymbol & field);
  void extract_event(const std::string & type_iri, const EventSymbol & evt);
  void extract_parameter(const std::string & member_iri, const ParameterSymbol & param);
  void extract_attributes(
    const std::string & target_iri, const Symbol & target, gsl::span<const AttributeData> attrs,
    size_t & index);
  void extract_attribute(
    const std::string & target_iri, const Symbol & target, const AttributeData & attr, size_t index);

  [[nodiscard]] static std::string format_constant(const TypedConstant & constant);

  // ---------------------------------------------------------------------------
  // graph_extractor_helpers.cpp: referenced types and namespaces
  // ---------------------------------------------------------------------------
  std::string ensure_type_emitted(const TypeSymbol & type);
  std::string ensure_named_type_emitted(const NamedTypeSymbol & type);
  std::string ensure_array_type_emitted(const ArrayTypeSymbol & type);
  std::string ensure_pointer_type_emitted(const PointerTypeSymbol & type);
  std::string ensure_namespace_emitted(const NamespaceSymbol & ns);

  /// Core ontology IRI of a local name
  [[nodiscard]] std::string term(std::string_view local_name) const;
  /// Platform ontology IRI of a local name
  [[nodiscard]] std::string platform_term(std::string_view local_name) const;

  void emit_kind(const std::string & subject, std::string_view class_name);

  IriMinter iris_;
  TripleSink & sink_;
  ExtractionOptions options_;

  std::string platform_ontology_;

  /// Module of the current run; its included types are left to the walk
  const ModuleSymbol * target_ = nullptr;

  std::unordered_set<std::string> emitted_types_;
  std::unordered_set<std::string> emitted_namespaces_;

  const CrossReferenceProvider * external_xrefs_ = nullptr;
  std::unique_ptr<CrossReferenceProvider> default_xrefs_;
  const CrossReferenceProvider * xrefs_ = nullptr;  ///< Active provider of the current run

  size_t type_depth_ = 0;
};

}  // namespace typegraph
