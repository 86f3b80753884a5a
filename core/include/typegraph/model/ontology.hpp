// typegraph/model/ontology.hpp - Vocabulary of the emitted type graph
//
// Local names are appended to either the core ontology namespace
// (k_ontology_iri) or the per-base platform namespace
// ({base}/ontology/, see IriMinter::platform_ontology_iri()).
//
#pragma once

#include <string_view>

namespace typegraph::ontology
{

// ============================================================================
// Namespaces and prefixes
// ============================================================================

inline constexpr std::string_view k_rdf = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
inline constexpr std::string_view k_rdfs = "http://www.w3.org/2000/01/rdf-schema#";
inline constexpr std::string_view k_xsd = "http://www.w3.org/2001/XMLSchema#";

inline constexpr std::string_view k_rdf_type = "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";
inline constexpr std::string_view k_xsd_boolean = "http://www.w3.org/2001/XMLSchema#boolean";
inline constexpr std::string_view k_xsd_integer = "http://www.w3.org/2001/XMLSchema#integer";
inline constexpr std::string_view k_xsd_long = "http://www.w3.org/2001/XMLSchema#long";

/// Core vocabulary, independent of the configured base IRI
inline constexpr std::string_view k_ontology_iri = "http://typegraph.example/ontology/";

inline constexpr std::string_view k_ontology_prefix = "tg";
inline constexpr std::string_view k_platform_prefix = "dotnet";

/// Value of the module "language" fact
inline constexpr std::string_view k_language = "dotnet";

// ============================================================================
// Classes
// ============================================================================

namespace cls
{
inline constexpr std::string_view k_assembly = "Assembly";
inline constexpr std::string_view k_namespace = "Namespace";
inline constexpr std::string_view k_type = "Type";
inline constexpr std::string_view k_class = "Class";
inline constexpr std::string_view k_struct = "Struct";
inline constexpr std::string_view k_interface = "Interface";
inline constexpr std::string_view k_enum = "Enum";
inline constexpr std::string_view k_delegate = "Delegate";
inline constexpr std::string_view k_record = "Record";
inline constexpr std::string_view k_member = "Member";
inline constexpr std::string_view k_method = "Method";
inline constexpr std::string_view k_constructor = "Constructor";
inline constexpr std::string_view k_property = "Property";
inline constexpr std::string_view k_field = "Field";
inline constexpr std::string_view k_event = "Event";
inline constexpr std::string_view k_parameter = "Parameter";
inline constexpr std::string_view k_type_parameter = "TypeParameter";
inline constexpr std::string_view k_attribute = "Attribute";
}  // namespace cls

// ============================================================================
// Literal-valued properties
// ============================================================================

namespace prop
{
// Shared
inline constexpr std::string_view k_name = "name";
inline constexpr std::string_view k_full_name = "fullName";
inline constexpr std::string_view k_accessibility = "accessibility";
inline constexpr std::string_view k_ordinal = "ordinal";
inline constexpr std::string_view k_language = "language";

// Module
inline constexpr std::string_view k_version = "version";
inline constexpr std::string_view k_culture = "culture";                   // platform
inline constexpr std::string_view k_public_key_token = "publicKeyToken";   // platform
inline constexpr std::string_view k_is_interactive = "isInteractive";      // platform

// Type
inline constexpr std::string_view k_type_kind = "typeKind";
inline constexpr std::string_view k_is_abstract = "isAbstract";
inline constexpr std::string_view k_is_sealed = "isSealed";
inline constexpr std::string_view k_is_static = "isStatic";
inline constexpr std::string_view k_is_generic = "isGeneric";
inline constexpr std::string_view k_is_value_type = "isValueType";
inline constexpr std::string_view k_is_record = "isRecord";
inline constexpr std::string_view k_is_ref_like_type = "isRefLikeType";      // platform
inline constexpr std::string_view k_is_read_only = "isReadOnly";
inline constexpr std::string_view k_is_unmanaged_type = "isUnmanagedType";  // platform
inline constexpr std::string_view k_special_type = "specialType";           // platform
inline constexpr std::string_view k_array_rank = "arrayRank";
inline constexpr std::string_view k_index = "index";

// Member
inline constexpr std::string_view k_is_virtual = "isVirtual";
inline constexpr std::string_view k_is_override = "isOverride";
inline constexpr std::string_view k_is_extern = "isExtern";
inline constexpr std::string_view k_is_async = "isAsync";
inline constexpr std::string_view k_is_const = "isConst";
inline constexpr std::string_view k_is_volatile = "isVolatile";
inline constexpr std::string_view k_is_required = "isRequired";
inline constexpr std::string_view k_is_init_only = "isInitOnly";
inline constexpr std::string_view k_has_getter = "hasGetter";
inline constexpr std::string_view k_has_setter = "hasSetter";
inline constexpr std::string_view k_getter_accessibility = "getterAccessibility";
inline constexpr std::string_view k_setter_accessibility = "setterAccessibility";
inline constexpr std::string_view k_const_value = "constValue";
inline constexpr std::string_view k_is_extension_method = "isExtensionMethod";
inline constexpr std::string_view k_is_partial_definition = "isPartialDefinition";
inline constexpr std::string_view k_method_kind = "methodKind";

// Parameter
inline constexpr std::string_view k_is_optional = "isOptional";
inline constexpr std::string_view k_is_params = "isParams";
inline constexpr std::string_view k_is_this = "isThis";
inline constexpr std::string_view k_is_discard = "isDiscard";
inline constexpr std::string_view k_ref_kind = "refKind";
inline constexpr std::string_view k_default_value = "defaultValue";
inline constexpr std::string_view k_has_explicit_default_value = "hasExplicitDefaultValue";

// Type parameter
inline constexpr std::string_view k_variance = "variance";
inline constexpr std::string_view k_has_reference_type_constraint =
  "hasReferenceTypeConstraint";                                                      // platform
inline constexpr std::string_view k_has_value_type_constraint = "hasValueTypeConstraint";  // platform
inline constexpr std::string_view k_has_unmanaged_type_constraint =
  "hasUnmanagedTypeConstraint";                                                      // platform
inline constexpr std::string_view k_has_not_null_constraint = "hasNotNullConstraint";      // platform
inline constexpr std::string_view k_has_constructor_constraint =
  "hasConstructorConstraint";  // platform

// Attribute
inline constexpr std::string_view k_constructor_arguments = "constructorArguments";
inline constexpr std::string_view k_named_arguments = "namedArguments";
}  // namespace prop

// ============================================================================
// Relationships
// ============================================================================

namespace rel
{
// Type
inline constexpr std::string_view k_defined_in_assembly = "definedInAssembly";
inline constexpr std::string_view k_in_namespace = "inNamespace";
inline constexpr std::string_view k_inherits = "inherits";
inline constexpr std::string_view k_implements = "implements";
inline constexpr std::string_view k_nested_in = "nestedIn";
inline constexpr std::string_view k_has_member = "hasMember";
inline constexpr std::string_view k_has_type_parameter = "hasTypeParameter";
inline constexpr std::string_view k_has_attribute = "hasAttribute";
inline constexpr std::string_view k_generic_definition = "genericDefinition";
inline constexpr std::string_view k_type_argument = "typeArgument";
inline constexpr std::string_view k_type = "type";
inline constexpr std::string_view k_array_element_type = "arrayElementType";
inline constexpr std::string_view k_pointer_element_type = "pointerElementType";
inline constexpr std::string_view k_enum_underlying_type = "enumUnderlyingType";  // platform
inline constexpr std::string_view k_throws = "throws";
inline constexpr std::string_view k_related_to = "relatedTo";

// Member
inline constexpr std::string_view k_member_of = "memberOf";
inline constexpr std::string_view k_return_type = "returnType";
inline constexpr std::string_view k_property_type = "propertyType";
inline constexpr std::string_view k_field_type = "fieldType";
inline constexpr std::string_view k_event_type = "eventType";
inline constexpr std::string_view k_has_parameter = "hasParameter";
inline constexpr std::string_view k_overrides_method = "overridesMethod";
inline constexpr std::string_view k_explicit_interface_implementation =
  "explicitInterfaceImplementation";

// Parameter
inline constexpr std::string_view k_parameter_type = "parameterType";
inline constexpr std::string_view k_parameter_of = "parameterOf";

// Type parameter
inline constexpr std::string_view k_type_parameter_of = "typeParameterOf";
inline constexpr std::string_view k_constrained_to_type = "constrainedToType";

// Attribute
inline constexpr std::string_view k_attribute_of = "attributeOf";
inline constexpr std::string_view k_attribute_type = "attributeType";

// Namespace
inline constexpr std::string_view k_parent_namespace = "parentNamespace";
}  // namespace rel

}  // namespace typegraph::ontology
