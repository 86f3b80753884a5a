// typegraph/symbols/symbol_display.cpp - Metadata and display names
#include "typegraph/symbols/symbol_display.hpp"

#include <algorithm>
#include <vector>

namespace typegraph
{

namespace
{

void append_arity(std::string & out, const NamedTypeSymbol & type)
{
  if (type.type_parameters.empty() && type.type_arguments.empty()) {
    return;
  }

  out += '`';
  out += std::to_string(type.arity());

  const bool all_parameters = std::all_of(
    type.type_arguments.begin(), type.type_arguments.end(),
    [](const TypeSymbol * arg) { return isa<TypeParameterSymbol>(arg); });
  if (type.type_arguments.empty() || all_parameters) {
    return;
  }

  out += '[';
  bool first = true;
  for (const TypeSymbol * arg : type.type_arguments) {
    if (!first) out += ',';
    first = false;
    out += metadata_name(*arg);
  }
  out += ']';
}

std::string array_suffix(int32_t rank)
{
  std::string suffix = "[";
  for (int32_t i = 1; i < rank; ++i) {
    suffix += ',';
  }
  suffix += ']';
  return suffix;
}

std::string named_metadata_name(const NamedTypeSymbol & type)
{
  std::string out;

  if (type.containing_namespace != nullptr && !type.containing_namespace->is_global()) {
    out += type.containing_namespace->full_name;
    out += '.';
  }

  // Containing types, outermost first
  std::vector<const NamedTypeSymbol *> containing;
  for (const auto * cur = type.containing_type; cur != nullptr; cur = cur->containing_type) {
    containing.push_back(cur);
  }
  for (auto it = containing.rbegin(); it != containing.rend(); ++it) {
    out += (*it)->name;
    append_arity(out, **it);
    out += '+';
  }

  out += type.name;
  append_arity(out, type);
  return out;
}

std::string named_display_string(const NamedTypeSymbol & type)
{
  if (!type.display_name.empty()) {
    return std::string(type.display_name);
  }

  std::string out;
  if (type.containing_type != nullptr) {
    out += display_string(*type.containing_type);
    out += '.';
  } else if (type.containing_namespace != nullptr && !type.containing_namespace->is_global()) {
    out += type.containing_namespace->full_name;
    out += '.';
  }
  out += type.name;

  if (type.is_unbound_generic) {
    out += '<';
    out.append(type.arity() > 0 ? type.arity() - 1 : 0, ',');
    out += '>';
  } else if (!type.type_arguments.empty()) {
    out += '<';
    for (size_t i = 0; i < type.type_arguments.size(); ++i) {
      if (i > 0) out += ", ";
      out += display_string(*type.type_arguments[i]);
    }
    out += '>';
  } else if (!type.type_parameters.empty()) {
    out += '<';
    for (size_t i = 0; i < type.type_parameters.size(); ++i) {
      if (i > 0) out += ", ";
      out += type.type_parameters[i]->name;
    }
    out += '>';
  }
  return out;
}

}  // namespace

std::string metadata_name(const TypeSymbol & type)
{
  switch (type.get_kind()) {
    case SymbolKind::ArrayType: {
      const auto * array = cast<ArrayTypeSymbol>(&type);
      return metadata_name(*array->element_type) + array_suffix(array->rank);
    }
    case SymbolKind::PointerType:
      return metadata_name(*cast<PointerTypeSymbol>(&type)->pointed_at_type) + "*";
    case SymbolKind::TypeParameter: {
      // Owner is part of the name so A<T>.T and B<T>.T stay distinct
      const auto * tp = cast<TypeParameterSymbol>(&type);
      std::string owner;
      if (tp->declaring_type != nullptr) {
        owner = metadata_name(*tp->declaring_type);
      } else if (tp->declaring_method != nullptr) {
        owner = display_string(*tp->declaring_method);
      }
      return "T:" + owner + "." + std::string(tp->name);
    }
    case SymbolKind::NamedType:
      return named_metadata_name(*cast<NamedTypeSymbol>(&type));
    default:
      return std::string(type.name);
  }
}

std::string display_string(const TypeSymbol & type)
{
  switch (type.get_kind()) {
    case SymbolKind::ArrayType: {
      const auto * array = cast<ArrayTypeSymbol>(&type);
      return display_string(*array->element_type) + array_suffix(array->rank);
    }
    case SymbolKind::PointerType:
      return display_string(*cast<PointerTypeSymbol>(&type)->pointed_at_type) + "*";
    case SymbolKind::NamedType:
      return named_display_string(*cast<NamedTypeSymbol>(&type));
    default:
      return std::string(type.name);
  }
}

std::string display_string(const MethodSymbol & method)
{
  std::string out;
  if (method.containing_type != nullptr) {
    out += display_string(*method.containing_type);
    out += '.';
  }
  out += method.name;

  if (!method.type_parameters.empty()) {
    out += '<';
    for (size_t i = 0; i < method.type_parameters.size(); ++i) {
      if (i > 0) out += ", ";
      out += method.type_parameters[i]->name;
    }
    out += '>';
  }

  out += '(';
  for (size_t i = 0; i < method.parameters.size(); ++i) {
    if (i > 0) out += ", ";
    const ParameterSymbol * param = method.parameters[i];
    out += ref_kind_prefix(param->ref_kind);
    out += display_string(*param->type);
  }
  out += ')';
  return out;
}

std::string_view ref_kind_prefix(RefKind kind) noexcept
{
  switch (kind) {
    case RefKind::Ref:
      return "ref ";
    case RefKind::Out:
      return "out ";
    case RefKind::In:
      return "in ";
    case RefKind::None:
      break;
  }
  return "";
}

}  // namespace typegraph
