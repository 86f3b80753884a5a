// typegraph/extraction/graph_extractor.cpp - Module and type walk
#include "typegraph/extraction/graph_extractor.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <string>
#include <utility>

#include "typegraph/extraction/doc_comment_xrefs.hpp"
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

std::string_view type_class(const NamedTypeSymbol & type) noexcept
{
  if (type.is_record) {
    return cls::k_record;
  }
  switch (type.type_kind) {
    case TypeKind::Struct:
      return cls::k_struct;
    case TypeKind::Interface:
      return cls::k_interface;
    case TypeKind::Enum:
      return cls::k_enum;
    case TypeKind::Delegate:
      return cls::k_delegate;
    default:
      return cls::k_class;
  }
}

std::string to_hex(gsl::span<const uint8_t> bytes)
{
  std::string out;
  out.reserve(bytes.size() * 2);
  for (const uint8_t b : bytes) {
    out += fmt::format("{:02x}", b);
  }
  return out;
}

void append_types(const NamedTypeSymbol & type, std::vector<const NamedTypeSymbol *> & out)
{
  out.push_back(&type);
  for (const NamedTypeSymbol * nested : type.nested_types) {
    append_types(*nested, out);
  }
}

void append_namespace(const NamespaceSymbol & ns, std::vector<const NamedTypeSymbol *> & out)
{
  for (const NamedTypeSymbol * type : ns.types) {
    append_types(*type, out);
  }
  for (const NamespaceSymbol * child : ns.namespaces) {
    append_namespace(*child, out);
  }
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

GraphExtractor::GraphExtractor(TripleSink & sink, ExtractionOptions options)
: iris_(options.base_uri),
  sink_(sink),
  options_(std::move(options)),
  platform_ontology_(iris_.platform_ontology_iri())
{
  sink_.add_prefix("rdf", ontology::k_rdf);
  sink_.add_prefix("rdfs", ontology::k_rdfs);
  sink_.add_prefix("xsd", ontology::k_xsd);
  sink_.add_prefix(ontology::k_ontology_prefix, ontology::k_ontology_iri);
  sink_.add_prefix(ontology::k_platform_prefix, platform_ontology_);
}

// ============================================================================
// Entry Point
// ============================================================================

ExtractionStats GraphExtractor::extract(const SymbolGraph & graph, const ModuleSymbol & target)
{
  emitted_types_.clear();
  emitted_namespaces_.clear();
  type_depth_ = 0;
  target_ = &target;

  xrefs_ = external_xrefs_;
  if (xrefs_ == nullptr && (options_.extract_exceptions || options_.extract_see_also)) {
    default_xrefs_ = std::make_unique<DocCommentCrossReferences>(graph.index());
    xrefs_ = default_xrefs_.get();
  }

  spdlog::info("[Extractor] Extracting {} {}", target.name, target.version);

  const std::string module_iri = iris_.module_iri(target);
  extract_module(target, module_iri);

  ExtractionStats stats;
  if (target.global_namespace != nullptr) {
    for (const NamedTypeSymbol * type : collect_types(*target.global_namespace)) {
      if (!is_included(*type, options_)) {
        continue;
      }
      if (extract_type(*type, module_iri)) {
        ++stats.types_extracted;
      }
    }
  }

  stats.facts_emitted = sink_.fact_count();
  spdlog::info(
    "[Extractor] Extracted {} types, {} triples", stats.types_extracted, stats.facts_emitted);

  target_ = nullptr;
  return stats;
}

std::vector<const NamedTypeSymbol *> GraphExtractor::collect_types(const NamespaceSymbol & root)
{
  std::vector<const NamedTypeSymbol *> types;
  append_namespace(root, types);
  return types;
}

// ============================================================================
// Module
// ============================================================================

void GraphExtractor::extract_module(const ModuleSymbol & module, const std::string & module_iri)
{
  emit_kind(module_iri, cls::k_assembly);
  sink_.emit_literal(module_iri, term(prop::k_name), module.name);
  sink_.emit_literal(module_iri, term(prop::k_version), module.version);

  if (!module.culture.empty()) {
    sink_.emit_literal(module_iri, platform_term(prop::k_culture), module.culture);
  }
  if (!module.public_key_token.empty()) {
    sink_.emit_literal(
      module_iri, platform_term(prop::k_public_key_token), to_hex(module.public_key_token));
  }
  sink_.emit_bool(module_iri, platform_term(prop::k_is_interactive), module.is_interactive);
  sink_.emit_literal(module_iri, term(prop::k_language), ontology::k_language);

  if (options_.include_attributes) {
    size_t index = 0;
    extract_attributes(module_iri, module, module.attributes, index);
  }
}

// ============================================================================
// Types
// ============================================================================

bool GraphExtractor::extract_type(const NamedTypeSymbol & type, const std::string & module_iri)
{
  const std::string type_iri = iris_.type_iri(type);
  if (!emitted_types_.insert(type_iri).second) {
    return false;
  }

  spdlog::debug("[Extractor]   Type: {}", display_string(type));

  // Identity
  emit_kind(type_iri, cls::k_type);
  emit_kind(type_iri, type_class(type));
  sink_.emit_literal(type_iri, term(prop::k_name), type.name);
  sink_.emit_literal(type_iri, term(prop::k_full_name), display_string(type));
  sink_.emit_literal(type_iri, term(prop::k_type_kind), to_string(type.type_kind));
  sink_.emit_literal(type_iri, term(prop::k_accessibility), to_string(type.accessibility));

  // Traits
  sink_.emit_bool(type_iri, term(prop::k_is_abstract), type.is_abstract);
  sink_.emit_bool(type_iri, term(prop::k_is_sealed), type.is_sealed);
  sink_.emit_bool(type_iri, term(prop::k_is_static), type.is_static);
  sink_.emit_bool(type_iri, term(prop::k_is_generic), type.is_generic());
  sink_.emit_bool(type_iri, term(prop::k_is_value_type), type.is_value_type());
  sink_.emit_bool(type_iri, term(prop::k_is_record), type.is_record);
  sink_.emit_bool(type_iri, platform_term(prop::k_is_ref_like_type), type.is_ref_like);
  sink_.emit_bool(type_iri, term(prop::k_is_read_only), type.is_read_only);
  sink_.emit_bool(type_iri, platform_term(prop::k_is_unmanaged_type), type.is_unmanaged);

  if (!type.special_type.empty()) {
    sink_.emit_literal(type_iri, platform_term(prop::k_special_type), type.special_type);
  }
  if (type.type_kind == TypeKind::Enum && type.enum_underlying_type != nullptr) {
    sink_.emit_iri(
      type_iri, platform_term(rel::k_enum_underlying_type),
      ensure_type_emitted(*type.enum_underlying_type));
  }

  // Placement
  sink_.emit_iri(type_iri, term(rel::k_defined_in_assembly), module_iri);
  if (type.containing_namespace != nullptr && !type.containing_namespace->is_global()) {
    sink_.emit_iri(
      type_iri, term(rel::k_in_namespace), ensure_namespace_emitted(*type.containing_namespace));
  }

  // Hierarchy
  if (type.base_type != nullptr && type.base_type->special_type != "System_Object") {
    sink_.emit_iri(type_iri, term(rel::k_inherits), ensure_type_emitted(*type.base_type));
  }
  for (const NamedTypeSymbol * iface : type.interfaces) {
    sink_.emit_iri(type_iri, term(rel::k_implements), ensure_type_emitted(*iface));
  }
  if (type.containing_type != nullptr) {
    sink_.emit_iri(type_iri, term(rel::k_nested_in), iris_.type_iri(*type.containing_type));
  }

  // Generics
  for (const TypeParameterSymbol * tp : type.type_parameters) {
    extract_type_parameter(type_iri, type, *tp);
  }
  if (type.is_constructed()) {
    sink_.emit_iri(
      type_iri, term(rel::k_generic_definition), iris_.type_iri(*type.original_definition));
    extract_type_arguments(type_iri, type);
  }

  if (options_.include_attributes) {
    size_t index = 0;
    extract_attributes(type_iri, type, type.attributes, index);
  }

  extract_cross_references(type_iri, type);

  for (const MemberSymbol * member : type.members) {
    if (is_included(*member, options_)) {
      extract_member(type_iri, *member);
    }
  }
  return true;
}

void GraphExtractor::extract_type_arguments(
  const std::string & type_iri, const NamedTypeSymbol & type)
{
  for (size_t i = 0; i < type.type_arguments.size(); ++i) {
    const std::string arg_iri = ensure_type_emitted(*type.type_arguments[i]);
    const std::string node_iri = fmt::format("{}/typearg/{}", type_iri, i);

    sink_.emit_iri(type_iri, term(rel::k_type_argument), node_iri);
    sink_.emit_int(node_iri, term(prop::k_index), static_cast<int32_t>(i));
    sink_.emit_iri(node_iri, term(rel::k_type), arg_iri);
  }
}

void GraphExtractor::extract_type_parameter(
  const std::string & owner_iri, const Symbol & owner, const TypeParameterSymbol & tp)
{
  const std::string tp_iri = iris_.type_parameter_iri(owner, tp);

  emit_kind(tp_iri, cls::k_type_parameter);
  sink_.emit_literal(tp_iri, term(prop::k_name), tp.name);
  sink_.emit_int(tp_iri, term(prop::k_ordinal), tp.ordinal);
  sink_.emit_literal(tp_iri, term(prop::k_variance), to_string(tp.variance));

  sink_.emit_bool(
    tp_iri, platform_term(prop::k_has_reference_type_constraint), tp.has_reference_type_constraint);
  sink_.emit_bool(
    tp_iri, platform_term(prop::k_has_value_type_constraint), tp.has_value_type_constraint);
  sink_.emit_bool(
    tp_iri, platform_term(prop::k_has_unmanaged_type_constraint), tp.has_unmanaged_type_constraint);
  sink_.emit_bool(
    tp_iri, platform_term(prop::k_has_not_null_constraint), tp.has_not_null_constraint);
  sink_.emit_bool(
    tp_iri, platform_term(prop::k_has_constructor_constraint), tp.has_constructor_constraint);

  sink_.emit_iri(owner_iri, term(rel::k_has_type_parameter), tp_iri);
  sink_.emit_iri(tp_iri, term(rel::k_type_parameter_of), owner_iri);

  for (const TypeSymbol * constraint : tp.constraint_types) {
    sink_.emit_iri(tp_iri, term(rel::k_constrained_to_type), ensure_type_emitted(*constraint));
  }
}

// ============================================================================
// Cross References
// ============================================================================

void GraphExtractor::extract_cross_references(
  const std::string & subject_iri, const Symbol & symbol)
{
  if (xrefs_ == nullptr) {
    return;
  }

  if (options_.extract_exceptions) {
    for (const TypeSymbol * exception : xrefs_->exception_types_for(symbol)) {
      sink_.emit_iri(subject_iri, term(rel::k_throws), ensure_type_emitted(*exception));
    }
  }

  if (options_.extract_see_also) {
    for (const Symbol * related : xrefs_->see_also_for(symbol)) {
      if (const auto * type = dyn_cast<TypeSymbol>(related)) {
        sink_.emit_iri(subject_iri, term(rel::k_related_to), ensure_type_emitted(*type));
      } else if (const auto * member = dyn_cast<MemberSymbol>(related)) {
        sink_.emit_iri(subject_iri, term(rel::k_related_to), iris_.member_iri(*member));
      }
    }
  }
}

}  // namespace typegraph
