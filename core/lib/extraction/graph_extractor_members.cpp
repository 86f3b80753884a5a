// typegraph/extraction/graph_extractor_members.cpp - Members, parameters, attributes
#include <fmt/core.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <string>
#include <vector>

#include "typegraph/extraction/graph_extractor.hpp"
#include "typegraph/model/ontology.hpp"
#include "typegraph/symbols/symbol_display.hpp"

namespace typegraph
{

namespace cls = ontology::cls;
namespace prop = ontology::prop;
namespace rel = ontology::rel;

namespace
{

/// Method kinds extracted as standalone members; accessors belong to their property/event
bool is_routed_method_kind(MethodKind kind) noexcept
{
  switch (kind) {
    case MethodKind::Ordinary:
    case MethodKind::Constructor:
    case MethodKind::StaticConstructor:
    case MethodKind::Destructor:
    case MethodKind::UserDefinedOperator:
    case MethodKind::Conversion:
      return true;
    default:
      return false;
  }
}

}  // namespace

// ============================================================================
// Dispatch
// ============================================================================

void GraphExtractor::extract_member(const std::string & type_iri, const MemberSymbol & member)
{
  switch (member.get_kind()) {
    case SymbolKind::Method: {
      const auto & method = *cast<MethodSymbol>(&member);
      if (is_routed_method_kind(method.method_kind)) {
        extract_method(type_iri, method);
      }
      break;
    }
    case SymbolKind::Property:
      extract_property(type_iri, *cast<PropertySymbol>(&member));
      break;
    case SymbolKind::Field:
      extract_field(type_iri, *cast<FieldSymbol>(&member));
      break;
    case SymbolKind::Event:
      extract_event(type_iri, *cast<EventSymbol>(&member));
      break;
    default:
      break;
  }
}

// ============================================================================
// Methods
// ============================================================================

void GraphExtractor::extract_method(const std::string & type_iri, const MethodSymbol & method)
{
  const std::string method_iri = iris_.member_iri(method);
  spdlog::debug("[Extractor]     Method: {}", display_string(method));

  const bool is_ctor = method.method_kind == MethodKind::Constructor ||
                       method.method_kind == MethodKind::StaticConstructor;

  emit_kind(method_iri, cls::k_member);
  emit_kind(method_iri, is_ctor ? cls::k_constructor : cls::k_method);
  sink_.emit_literal(method_iri, term(prop::k_name), method.name);
  sink_.emit_literal(method_iri, term(prop::k_accessibility), to_string(method.accessibility));
  sink_.emit_literal(method_iri, term(prop::k_method_kind), to_string(method.method_kind));

  sink_.emit_bool(method_iri, term(prop::k_is_static), method.is_static);
  sink_.emit_bool(method_iri, term(prop::k_is_abstract), method.is_abstract);
  sink_.emit_bool(method_iri, term(prop::k_is_virtual), method.is_virtual);
  sink_.emit_bool(method_iri, term(prop::k_is_override), method.is_override);
  sink_.emit_bool(method_iri, term(prop::k_is_sealed), method.is_sealed);
  sink_.emit_bool(method_iri, term(prop::k_is_extern), method.is_extern);
  sink_.emit_bool(method_iri, term(prop::k_is_async), method.is_async);
  sink_.emit_bool(method_iri, term(prop::k_is_extension_method), method.is_extension_method);
  sink_.emit_bool(method_iri, term(prop::k_is_partial_definition), method.is_partial_definition);
  sink_.emit_bool(method_iri, term(prop::k_is_read_only), method.is_read_only);

  sink_.emit_iri(type_iri, term(rel::k_has_member), method_iri);
  sink_.emit_iri(method_iri, term(rel::k_member_of), type_iri);

  if (!method.returns_void()) {
    sink_.emit_iri(method_iri, term(rel::k_return_type), ensure_type_emitted(*method.return_type));
  }

  for (const TypeParameterSymbol * tp : method.type_parameters) {
    extract_type_parameter(method_iri, method, *tp);
  }
  for (const ParameterSymbol * param : method.parameters) {
    extract_parameter(method_iri, *param);
  }

  if (method.overridden_method != nullptr) {
    sink_.emit_iri(
      method_iri, term(rel::k_overrides_method), iris_.member_iri(*method.overridden_method));
  }
  for (const MethodSymbol * impl : method.explicit_interface_implementations) {
    sink_.emit_iri(
      method_iri, term(rel::k_explicit_interface_implementation), iris_.member_iri(*impl));
  }

  if (options_.include_attributes) {
    // Return-type attributes hang off a pseudo node but share the method's index sequence
    size_t index = 0;
    extract_attributes(method_iri, method, method.attributes, index);
    const std::string return_iri = method_iri + "/return";
    extract_attributes(return_iri, method, method.return_type_attributes, index);
  }

  extract_cross_references(method_iri, method);
}

// ============================================================================
// Properties, Fields, Events
// ============================================================================

void GraphExtractor::extract_property(const std::string & type_iri, const PropertySymbol & property)
{
  const std::string prop_iri = iris_.member_iri(property);
  spdlog::debug("[Extractor]     Property: {}", property.name);

  emit_kind(prop_iri, cls::k_member);
  emit_kind(prop_iri, cls::k_property);
  sink_.emit_literal(prop_iri, term(prop::k_name), property.name);
  sink_.emit_literal(prop_iri, term(prop::k_accessibility), to_string(property.accessibility));

  sink_.emit_bool(prop_iri, term(prop::k_is_static), property.is_static);
  sink_.emit_bool(prop_iri, term(prop::k_is_abstract), property.is_abstract);
  sink_.emit_bool(prop_iri, term(prop::k_is_virtual), property.is_virtual);
  sink_.emit_bool(prop_iri, term(prop::k_is_override), property.is_override);
  sink_.emit_bool(prop_iri, term(prop::k_is_sealed), property.is_sealed);
  sink_.emit_bool(prop_iri, term(prop::k_is_required), property.is_required);
  sink_.emit_bool(prop_iri, term(prop::k_has_getter), property.get_method != nullptr);
  sink_.emit_bool(prop_iri, term(prop::k_has_setter), property.set_method != nullptr);

  if (property.get_method != nullptr) {
    sink_.emit_literal(
      prop_iri, term(prop::k_getter_accessibility), to_string(property.get_method->accessibility));
  }
  if (property.set_method != nullptr) {
    sink_.emit_literal(
      prop_iri, term(prop::k_setter_accessibility), to_string(property.set_method->accessibility));
    sink_.emit_bool(prop_iri, term(prop::k_is_init_only), property.set_method->is_init_only);
  }

  sink_.emit_iri(type_iri, term(rel::k_has_member), prop_iri);
  sink_.emit_iri(prop_iri, term(rel::k_member_of), type_iri);
  if (property.type != nullptr) {
    sink_.emit_iri(prop_iri, term(rel::k_property_type), ensure_type_emitted(*property.type));
  }

  for (const ParameterSymbol * param : property.parameters) {
    extract_parameter(prop_iri, *param);
  }

  if (property.overridden_property != nullptr) {
    sink_.emit_iri(
      prop_iri, term(rel::k_overrides_method), iris_.member_iri(*property.overridden_property));
  }
  for (const PropertySymbol * impl : property.explicit_interface_implementations) {
    sink_.emit_iri(
      prop_iri, term(rel::k_explicit_interface_implementation), iris_.member_iri(*impl));
  }

  if (options_.include_attributes) {
    size_t index = 0;
    extract_attributes(prop_iri, property, property.attributes, index);
  }

  extract_cross_references(prop_iri, property);
}

void GraphExtractor::extract_field(const std::string & type_iri, const FieldSymbol & field)
{
  const std::string field_iri = iris_.member_iri(field);
  spdlog::debug("[Extractor]     Field: {}", field.name);

  emit_kind(field_iri, cls::k_member);
  emit_kind(field_iri, cls::k_field);
  sink_.emit_literal(field_iri, term(prop::k_name), field.name);
  sink_.emit_literal(field_iri, term(prop::k_accessibility), to_string(field.accessibility));

  sink_.emit_bool(field_iri, term(prop::k_is_static), field.is_static);
  sink_.emit_bool(field_iri, term(prop::k_is_read_only), field.is_read_only);
  sink_.emit_bool(field_iri, term(prop::k_is_const), field.is_const);
  sink_.emit_bool(field_iri, term(prop::k_is_volatile), field.is_volatile);
  sink_.emit_bool(field_iri, term(prop::k_is_required), field.is_required);

  if (field.constant_value) {
    sink_.emit_literal(field_iri, term(prop::k_const_value), *field.constant_value);
  }

  sink_.emit_iri(type_iri, term(rel::k_has_member), field_iri);
  sink_.emit_iri(field_iri, term(rel::k_member_of), type_iri);
  if (field.type != nullptr) {
    sink_.emit_iri(field_iri, term(rel::k_field_type), ensure_type_emitted(*field.type));
  }

  if (options_.include_attributes) {
    size_t index = 0;
    extract_attributes(field_iri, field, field.attributes, index);
  }
}

void GraphExtractor::extract_event(const std::string & type_iri, const EventSymbol & evt)
{
  const std::string event_iri = iris_.member_iri(evt);
  spdlog::debug("[Extractor]     Event: {}", evt.name);

  emit_kind(event_iri, cls::k_member);
  emit_kind(event_iri, cls::k_event);
  sink_.emit_literal(event_iri, term(prop::k_name), evt.name);
  sink_.emit_literal(event_iri, term(prop::k_accessibility), to_string(evt.accessibility));

  sink_.emit_bool(event_iri, term(prop::k_is_static), evt.is_static);
  sink_.emit_bool(event_iri, term(prop::k_is_abstract), evt.is_abstract);
  sink_.emit_bool(event_iri, term(prop::k_is_virtual), evt.is_virtual);
  sink_.emit_bool(event_iri, term(prop::k_is_override), evt.is_override);
  sink_.emit_bool(event_iri, term(prop::k_is_sealed), evt.is_sealed);

  sink_.emit_iri(type_iri, term(rel::k_has_member), event_iri);
  sink_.emit_iri(event_iri, term(rel::k_member_of), type_iri);
  if (evt.type != nullptr) {
    sink_.emit_iri(event_iri, term(rel::k_event_type), ensure_type_emitted(*evt.type));
  }

  if (evt.overridden_event != nullptr) {
    sink_.emit_iri(
      event_iri, term(rel::k_overrides_method), iris_.member_iri(*evt.overridden_event));
  }
  for (const EventSymbol * impl : evt.explicit_interface_implementations) {
    sink_.emit_iri(
      event_iri, term(rel::k_explicit_interface_implementation), iris_.member_iri(*impl));
  }

  if (options_.include_attributes) {
    size_t index = 0;
    extract_attributes(event_iri, evt, evt.attributes, index);
  }
}

// ============================================================================
// Parameters
// ============================================================================

void GraphExtractor::extract_parameter(
  const std::string & member_iri, const ParameterSymbol & param)
{
  const std::string param_iri = fmt::format("{}/param/{}", member_iri, param.ordinal);

  emit_kind(param_iri, cls::k_parameter);
  sink_.emit_literal(param_iri, term(prop::k_name), param.name);
  sink_.emit_int(param_iri, term(prop::k_ordinal), param.ordinal);

  sink_.emit_bool(param_iri, term(prop::k_is_optional), param.is_optional);
  sink_.emit_bool(param_iri, term(prop::k_is_params), param.is_params);
  sink_.emit_bool(param_iri, term(prop::k_is_this), param.is_this);
  sink_.emit_bool(param_iri, term(prop::k_is_discard), param.is_discard);
  sink_.emit_literal(param_iri, term(prop::k_ref_kind), to_string(param.ref_kind));
  sink_.emit_bool(
    param_iri, term(prop::k_has_explicit_default_value), param.has_explicit_default_value());
  if (param.default_value) {
    sink_.emit_literal(param_iri, term(prop::k_default_value), *param.default_value);
  }

  sink_.emit_iri(member_iri, term(rel::k_has_parameter), param_iri);
  sink_.emit_iri(param_iri, term(rel::k_parameter_of), member_iri);
  if (param.type != nullptr) {
    sink_.emit_iri(param_iri, term(rel::k_parameter_type), ensure_type_emitted(*param.type));
  }

  if (options_.include_attributes) {
    size_t index = 0;
    extract_attributes(param_iri, param, param.attributes, index);
  }
}

// ============================================================================
// Attributes
// ============================================================================

void GraphExtractor::extract_attributes(
  const std::string & target_iri, const Symbol & target, gsl::span<const AttributeData> attrs,
  size_t & index)
{
  for (const AttributeData & attr : attrs) {
    extract_attribute(target_iri, target, attr, index++);
  }
}

void GraphExtractor::extract_attribute(
  const std::string & target_iri, const Symbol & target, const AttributeData & attr, size_t index)
{
  if (attr.attribute_class == nullptr) {
    return;
  }

  const std::string attr_iri = iris_.attribute_iri(target, index);

  emit_kind(attr_iri, cls::k_attribute);
  sink_.emit_iri(target_iri, term(rel::k_has_attribute), attr_iri);
  sink_.emit_iri(attr_iri, term(rel::k_attribute_of), target_iri);
  sink_.emit_iri(attr_iri, term(rel::k_attribute_type), ensure_type_emitted(*attr.attribute_class));

  if (!attr.constructor_arguments.empty()) {
    std::vector<std::string> args;
    args.reserve(attr.constructor_arguments.size());
    for (const TypedConstant & arg : attr.constructor_arguments) {
      args.push_back(format_constant(arg));
    }
    sink_.emit_literal(
      attr_iri, term(prop::k_constructor_arguments), fmt::format("{}", fmt::join(args, ", ")));
  }

  if (!attr.named_arguments.empty()) {
    std::vector<std::string> args;
    args.reserve(attr.named_arguments.size());
    for (const NamedArgument & arg : attr.named_arguments) {
      args.push_back(fmt::format("{}={}", arg.name, format_constant(arg.value)));
    }
    sink_.emit_literal(
      attr_iri, term(prop::k_named_arguments), fmt::format("{}", fmt::join(args, ", ")));
  }
}

std::string GraphExtractor::format_constant(const TypedConstant & constant)
{
  switch (constant.kind) {
    case ConstantKind::Null:
      return "null";
    case ConstantKind::String:
      return fmt::format("\"{}\"", constant.text);
    case ConstantKind::Type:
      if (constant.type_value == nullptr) {
        return "null";
      }
      return fmt::format("typeof({})", display_string(*constant.type_value));
    case ConstantKind::Array: {
      std::vector<std::string> items;
      items.reserve(constant.values.size());
      for (const TypedConstant * item : constant.values) {
        items.push_back(item != nullptr ? format_constant(*item) : std::string("null"));
      }
      return fmt::format("[{}]", fmt::join(items, ", "));
    }
    case ConstantKind::Primitive:
      return std::string(constant.text);
  }
  return std::string(constant.text);
}

}  // namespace typegraph
