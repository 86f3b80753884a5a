// typegraph/extraction/doc_comment_xrefs.cpp - Cross references from doc comments
#include "typegraph/extraction/doc_comment_xrefs.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstring>

#include "tinyxml2.h"
#include "typegraph/symbols/symbol_display.hpp"

namespace typegraph
{

namespace
{

std::string_view trim(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

void collect_from(
  const tinyxml2::XMLElement * elem, const char * element_name, std::vector<std::string> & out)
{
  for (; elem != nullptr; elem = elem->NextSiblingElement()) {
    if (std::strcmp(elem->Name(), element_name) == 0) {
      const char * cref = elem->Attribute("cref");
      if (cref != nullptr && *cref != '\0') {
        out.emplace_back(cref);
      }
    }
    collect_from(elem->FirstChildElement(), element_name, out);
  }
}

bool matches_parameters(const MethodSymbol & method, const std::vector<std::string> & expected)
{
  if (method.parameters.size() != expected.size()) {
    return false;
  }

  for (size_t i = 0; i < expected.size(); ++i) {
    const TypeSymbol & actual = *method.parameters[i]->type;
    if (
      expected[i] != display_string(actual) && expected[i] != metadata_name(actual) &&
      expected[i] != actual.name) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::vector<std::string> collect_crefs(std::string_view xml, const char * element_name)
{
  std::vector<std::string> crefs;
  if (trim(xml).empty()) {
    return crefs;
  }

  tinyxml2::XMLDocument doc;
  const tinyxml2::XMLError err = doc.Parse(xml.data(), xml.size());
  if (err != tinyxml2::XML_SUCCESS) {
    spdlog::debug("[DocComment] Ignoring malformed documentation XML: {}", doc.ErrorStr());
    return crefs;
  }

  collect_from(doc.FirstChildElement(), element_name, crefs);
  return crefs;
}

std::vector<const TypeSymbol *> DocCommentCrossReferences::exception_types_for(
  const Symbol & symbol) const
{
  std::vector<const TypeSymbol *> result;
  for (const auto & cref : collect_crefs(symbol.doc_comment, "exception")) {
    if (const auto * type = dyn_cast<TypeSymbol>(resolve_cref(cref))) {
      result.push_back(type);
    }
  }
  return result;
}

std::vector<const Symbol *> DocCommentCrossReferences::see_also_for(const Symbol & symbol) const
{
  std::vector<const Symbol *> result;
  for (const auto & cref : collect_crefs(symbol.doc_comment, "seealso")) {
    if (const Symbol * resolved = resolve_cref(cref)) {
      result.push_back(resolved);
    }
  }
  return result;
}

const Symbol * DocCommentCrossReferences::resolve_cref(std::string_view cref) const
{
  if (cref.empty()) {
    return nullptr;
  }

  // "X:" prefix of one or two characters
  std::string_view prefix;
  std::string_view name = cref;
  const size_t colon = cref.find(':');
  if (colon != std::string_view::npos && colon > 0 && colon < 3) {
    prefix = cref.substr(0, colon);
    name = cref.substr(colon + 1);
  }

  if (prefix.empty()) {
    if (const NamedTypeSymbol * type = resolve_type(name)) {
      return type;
    }
    return resolve_member(name, std::nullopt);
  }
  if (prefix == "T") return resolve_type(name);
  if (prefix == "M") return resolve_method(name);
  if (prefix == "P" || prefix == "F" || prefix == "E") return resolve_member(name, std::nullopt);

  // "N:" namespaces are not linked; "!:" marks a reference the compiler could not bind
  return nullptr;
}

std::vector<std::string> DocCommentCrossReferences::parse_parameter_types(std::string_view params)
{
  std::vector<std::string> types;
  int depth = 0;
  size_t start = 0;

  for (size_t i = 0; i < params.size(); ++i) {
    switch (params[i]) {
      case '{':
      case '<':
      case '[':
        ++depth;
        break;
      case '}':
      case '>':
      case ']':
        --depth;
        break;
      case ',':
        if (depth == 0) {
          types.emplace_back(trim(params.substr(start, i - start)));
          start = i + 1;
        }
        break;
      default:
        break;
    }
  }

  if (start < params.size()) {
    types.emplace_back(trim(params.substr(start)));
  }
  return types;
}

const NamedTypeSymbol * DocCommentCrossReferences::resolve_type(std::string_view name) const
{
  return index_.find_type(name);
}

const Symbol * DocCommentCrossReferences::resolve_method(std::string_view name) const
{
  const size_t paren = name.find('(');
  if (paren == std::string_view::npos || paren == 0) {
    return resolve_member(name, std::nullopt);
  }

  std::string_view params = name.substr(paren + 1);
  while (!params.empty() && params.back() == ')') params.remove_suffix(1);

  std::vector<std::string> param_types;
  if (!params.empty()) {
    param_types = parse_parameter_types(params);
  }
  return resolve_member(name.substr(0, paren), param_types);
}

const Symbol * DocCommentCrossReferences::resolve_member(
  std::string_view member_path, const std::optional<std::vector<std::string>> & param_types) const
{
  const size_t last_dot = member_path.rfind('.');
  if (last_dot == std::string_view::npos) {
    return nullptr;
  }

  const NamedTypeSymbol * type = resolve_type(member_path.substr(0, last_dot));
  if (type == nullptr) {
    return nullptr;
  }

  std::string member_name(member_path.substr(last_dot + 1));
  std::replace(member_name.begin(), member_name.end(), '#', '.');

  const auto members = SymbolIndex::find_members(*type, member_name);
  if (members.empty()) {
    return nullptr;
  }
  if (members.size() == 1 || !param_types) {
    return members.front();
  }

  for (const MemberSymbol * member : members) {
    if (const auto * method = dyn_cast<MethodSymbol>(member)) {
      if (matches_parameters(*method, *param_types)) {
        return method;
      }
    }
  }
  return members.front();
}

}  // namespace typegraph
