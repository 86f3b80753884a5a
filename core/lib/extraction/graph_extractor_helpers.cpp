// typegraph/extraction/graph_extractor_helpers.cpp - Referenced types and namespaces
#include <fmt/core.h>

#include <string>

#include "typegraph/extraction/graph_extractor.hpp"
#include "typegraph/extraction/inclusion_policy.hpp"
#include "typegraph/model/ontology.hpp"
#include "typegraph/symbols/symbol_display.hpp"

namespace typegraph
{

namespace cls = ontology::cls;
namespace prop = ontology::prop;
namespace rel = ontology::rel;

namespace
{

/// Decrements the nesting counter when an ensure call unwinds
class DepthGuard
{
public:
  explicit DepthGuard(size_t & depth) noexcept : depth_(depth) { ++depth_; }
  ~DepthGuard() { --depth_; }

  DepthGuard(const DepthGuard &) = delete;
  DepthGuard & operator=(const DepthGuard &) = delete;

private:
  size_t & depth_;
};

}  // namespace

// ============================================================================
// Vocabulary
// ============================================================================

std::string GraphExtractor::term(std::string_view local_name) const
{
  return fmt::format("{}{}", ontology::k_ontology_iri, local_name);
}

std::string GraphExtractor::platform_term(std::string_view local_name) const
{
  return fmt::format("{}{}", platform_ontology_, local_name);
}

void GraphExtractor::emit_kind(const std::string & subject, std::string_view class_name)
{
  sink_.emit_iri(subject, ontology::k_rdf_type, term(class_name));
}

// ============================================================================
// Referenced Types
// ============================================================================

std::string GraphExtractor::ensure_type_emitted(const TypeSymbol & type)
{
  const DepthGuard guard(type_depth_);
  if (type_depth_ > options_.max_type_depth) {
    throw ExtractionError(fmt::format(
      "type reference nesting exceeds {} levels at '{}'", options_.max_type_depth,
      display_string(type)));
  }

  switch (type.get_kind()) {
    case SymbolKind::ArrayType:
      return ensure_array_type_emitted(*cast<ArrayTypeSymbol>(&type));
    case SymbolKind::PointerType:
      return ensure_pointer_type_emitted(*cast<PointerTypeSymbol>(&type));
    case SymbolKind::NamedType:
      return ensure_named_type_emitted(*cast<NamedTypeSymbol>(&type));
    default:
      // Type parameters are described where they are declared
      return iris_.type_iri(type);
  }
}

std::string GraphExtractor::ensure_array_type_emitted(const ArrayTypeSymbol & type)
{
  std::string type_iri = iris_.type_iri(type);
  if (!emitted_types_.insert(type_iri).second) {
    return type_iri;
  }

  emit_kind(type_iri, cls::k_type);
  sink_.emit_literal(type_iri, term(prop::k_name), display_string(type));
  sink_.emit_literal(type_iri, term(prop::k_type_kind), to_string(TypeKind::Array));
  sink_.emit_int(type_iri, term(prop::k_array_rank), type.rank);

  if (type.element_type != nullptr) {
    sink_.emit_iri(
      type_iri, term(rel::k_array_element_type), ensure_type_emitted(*type.element_type));
  }
  return type_iri;
}

std::string GraphExtractor::ensure_pointer_type_emitted(const PointerTypeSymbol & type)
{
  std::string type_iri = iris_.type_iri(type);
  if (!emitted_types_.insert(type_iri).second) {
    return type_iri;
  }

  emit_kind(type_iri, cls::k_type);
  sink_.emit_literal(type_iri, term(prop::k_name), display_string(type));
  sink_.emit_literal(type_iri, term(prop::k_type_kind), to_string(TypeKind::Pointer));

  if (type.pointed_at_type != nullptr) {
    sink_.emit_iri(
      type_iri, term(rel::k_pointer_element_type), ensure_type_emitted(*type.pointed_at_type));
  }
  return type_iri;
}

std::string GraphExtractor::ensure_named_type_emitted(const NamedTypeSymbol & type)
{
  std::string type_iri = iris_.type_iri(type);

  // Node<T> inside Node`1 names the definition itself
  if (type.is_constructed() && type_iri == iris_.type_iri(*type.original_definition)) {
    return ensure_named_type_emitted(*type.original_definition);
  }
  if (emitted_types_.count(type_iri) != 0) {
    return type_iri;
  }

  // Included definitions of the target module get their full fact set from the walk
  if (
    target_ != nullptr && type.containing_module == target_ && !type.is_constructed() &&
    is_included(type, options_)) {
    return type_iri;
  }

  emitted_types_.insert(type_iri);
  if (!options_.include_external_types) {
    return type_iri;
  }

  emit_kind(type_iri, cls::k_type);
  sink_.emit_literal(type_iri, term(prop::k_name), type.name);
  sink_.emit_literal(type_iri, term(prop::k_full_name), display_string(type));
  sink_.emit_literal(type_iri, term(prop::k_type_kind), to_string(type.type_kind));

  if (type.containing_module != nullptr) {
    sink_.emit_iri(
      type_iri, term(rel::k_defined_in_assembly), iris_.module_iri(*type.containing_module));
  }
  if (type.containing_namespace != nullptr && !type.containing_namespace->is_global()) {
    sink_.emit_iri(
      type_iri, term(rel::k_in_namespace), ensure_namespace_emitted(*type.containing_namespace));
  }

  if (type.is_constructed()) {
    sink_.emit_iri(
      type_iri, term(rel::k_generic_definition), ensure_type_emitted(*type.original_definition));
    extract_type_arguments(type_iri, type);
  }
  return type_iri;
}

// ============================================================================
// Namespaces
// ============================================================================

std::string GraphExtractor::ensure_namespace_emitted(const NamespaceSymbol & ns)
{
  std::string ns_iri = iris_.namespace_iri(ns);
  if (!emitted_namespaces_.insert(ns_iri).second) {
    return ns_iri;
  }

  emit_kind(ns_iri, cls::k_namespace);
  sink_.emit_literal(ns_iri, term(prop::k_name), ns.name);
  sink_.emit_literal(ns_iri, term(prop::k_full_name), ns.full_name);

  if (ns.containing_namespace != nullptr && !ns.containing_namespace->is_global()) {
    sink_.emit_iri(
      ns_iri, term(rel::k_parent_namespace), ensure_namespace_emitted(*ns.containing_namespace));
  }
  return ns_iri;
}

}  // namespace typegraph
