// typegraph/model/iri_minter.cpp - Stable identifiers for symbols
#include "typegraph/model/iri_minter.hpp"

#include <fmt/core.h>

#include <stdexcept>

#include "typegraph/symbols/symbol_display.hpp"

namespace typegraph
{

namespace
{

constexpr std::string_view k_builtin_segment = "_builtin_";
constexpr std::string_view k_global_namespace_segment = "_global_";

bool is_unreserved(unsigned char c) noexcept
{
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
         c == '_' || c == '.' || c == '~';
}

std::string_view kind_name(SymbolKind kind) noexcept
{
  switch (kind) {
    case SymbolKind::Module:
      return "module";
    case SymbolKind::Namespace:
      return "namespace";
    case SymbolKind::NamedType:
      return "named type";
    case SymbolKind::ArrayType:
      return "array type";
    case SymbolKind::PointerType:
      return "pointer type";
    case SymbolKind::TypeParameter:
      return "type parameter";
    case SymbolKind::Method:
      return "method";
    case SymbolKind::Property:
      return "property";
    case SymbolKind::Field:
      return "field";
    case SymbolKind::Event:
      return "event";
    case SymbolKind::Parameter:
      return "parameter";
  }
  return "symbol";
}

}  // namespace

IriMinter::IriMinter(std::string_view base_uri) : base_(base_uri)
{
  while (!base_.empty() && base_.back() == '/') {
    base_.pop_back();
  }
}

std::string IriMinter::platform_ontology_iri() const { return base_ + "/ontology/"; }

std::string IriMinter::module_iri(const ModuleSymbol & module) const
{
  return fmt::format("{}/assembly/{}/{}", base_, escape(module.name), escape(module.version));
}

std::string IriMinter::namespace_iri(const NamespaceSymbol & ns) const
{
  if (ns.is_global()) {
    return fmt::format("{}/namespace/{}", base_, k_global_namespace_segment);
  }
  return fmt::format("{}/namespace/{}", base_, escape(ns.full_name));
}

std::string IriMinter::type_iri(const TypeSymbol & type) const
{
  const std::string full_name = metadata_name(type);

  const ModuleSymbol * module = type.containing_module;
  if (module == nullptr) {
    return fmt::format("{}/type/{}/{}", base_, k_builtin_segment, escape(full_name));
  }
  return fmt::format(
    "{}/type/{}/{}/{}", base_, escape(module->name), escape(module->version), escape(full_name));
}

std::string IriMinter::member_iri(const MemberSymbol & member) const
{
  if (member.containing_type == nullptr) {
    throw std::invalid_argument(
      fmt::format("{} '{}' has no containing type", kind_name(member.get_kind()), member.name));
  }
  return fmt::format(
    "{}/member/{}{}", type_iri(*member.containing_type), escape(member.name),
    escape(member_signature(member)));
}

std::string IriMinter::parameter_iri(const ParameterSymbol & param) const
{
  if (param.containing_symbol == nullptr) {
    throw std::invalid_argument(fmt::format("parameter '{}' has no owner", param.name));
  }
  return fmt::format("{}/param/{}", member_iri(*param.containing_symbol), param.ordinal);
}

std::string IriMinter::type_parameter_iri(
  const Symbol & owner, const TypeParameterSymbol & type_param) const
{
  std::string owner_iri;
  if (const auto * type = dyn_cast<NamedTypeSymbol>(&owner)) {
    owner_iri = type_iri(*type);
  } else if (const auto * method = dyn_cast<MethodSymbol>(&owner)) {
    owner_iri = member_iri(*method);
  } else {
    throw std::invalid_argument(fmt::format(
      "unexpected type-parameter owner: {} '{}'", kind_name(owner.get_kind()), owner.name));
  }
  return fmt::format("{}/typeparam/{}", owner_iri, type_param.ordinal);
}

std::string IriMinter::attribute_iri(const Symbol & target, size_t index) const
{
  std::string target_iri;
  switch (target.get_kind()) {
    case SymbolKind::Module:
      target_iri = module_iri(*cast<ModuleSymbol>(&target));
      break;
    case SymbolKind::NamedType:
      target_iri = type_iri(*cast<NamedTypeSymbol>(&target));
      break;
    case SymbolKind::Method:
    case SymbolKind::Property:
    case SymbolKind::Field:
    case SymbolKind::Event:
      target_iri = member_iri(*cast<MemberSymbol>(&target));
      break;
    case SymbolKind::Parameter:
      target_iri = parameter_iri(*cast<ParameterSymbol>(&target));
      break;
    default:
      throw std::invalid_argument(fmt::format(
        "unexpected attribute target: {} '{}'", kind_name(target.get_kind()), target.name));
  }
  return fmt::format("{}/attr/{}", target_iri, index);
}

std::string IriMinter::member_signature(const MemberSymbol & member)
{
  if (const auto * method = dyn_cast<MethodSymbol>(&member)) {
    std::string sig = "(";
    for (size_t i = 0; i < method->parameters.size(); ++i) {
      if (i > 0) sig += ',';
      const ParameterSymbol * param = method->parameters[i];
      sig += ref_kind_prefix(param->ref_kind);
      sig += metadata_name(*param->type);
    }
    sig += ')';
    return sig;
  }

  if (const auto * prop = dyn_cast<PropertySymbol>(&member); prop != nullptr && prop->is_indexer()) {
    std::string sig = "[";
    for (size_t i = 0; i < prop->parameters.size(); ++i) {
      if (i > 0) sig += ',';
      sig += metadata_name(*prop->parameters[i]->type);
    }
    sig += ']';
    return sig;
  }

  return {};
}

std::string IriMinter::escape(std::string_view value)
{
  static constexpr char k_hex[] = "0123456789ABCDEF";

  std::string out;
  out.reserve(value.size());
  for (const char ch : value) {
    const auto c = static_cast<unsigned char>(ch);
    if (is_unreserved(c)) {
      out += ch;
    } else {
      out += '%';
      out += k_hex[c >> 4];
      out += k_hex[c & 0x0F];
    }
  }
  return out;
}

}  // namespace typegraph
