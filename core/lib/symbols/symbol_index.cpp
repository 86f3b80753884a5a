// typegraph/symbols/symbol_index.cpp - Lookup of types and members by name
#include "typegraph/symbols/symbol_index.hpp"

#include "typegraph/symbols/symbol_display.hpp"

namespace typegraph
{

void SymbolIndex::add_module(const ModuleSymbol & module)
{
  if (module.global_namespace != nullptr) {
    add_namespace(*module.global_namespace);
  }
}

void SymbolIndex::add_namespace(const NamespaceSymbol & ns)
{
  for (const NamedTypeSymbol * type : ns.types) {
    add_type_tree(*type);
  }
  for (const NamespaceSymbol * child : ns.namespaces) {
    add_namespace(*child);
  }
}

void SymbolIndex::add_type_tree(const NamedTypeSymbol & type)
{
  add_type(type);
  for (const NamedTypeSymbol * nested : type.nested_types) {
    add_type_tree(*nested);
  }
}

void SymbolIndex::add_type(const NamedTypeSymbol & type)
{
  types_.try_emplace(metadata_name(type), &type);
}

const NamedTypeSymbol * SymbolIndex::find_type(std::string_view metadata_name) const
{
  auto it = types_.find(metadata_name);
  if (it == types_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<const MemberSymbol *> SymbolIndex::find_members(
  const NamedTypeSymbol & type, std::string_view name)
{
  std::vector<const MemberSymbol *> result;
  for (const MemberSymbol * member : type.members) {
    if (member->name == name) {
      result.push_back(member);
    }
  }
  return result;
}

}  // namespace typegraph
