// typegraph/loader/symbol_loader.cpp - JSON symbol dump reader
//
// Dump layout (formatVersion 1):
//
//   {
//     "formatVersion": 1,
//     "targetModule": "<module id>",        // optional with a single module
//     "modules": [ { "id", "name", "version", "culture", "publicKeyToken",
//                    "interactive", "attributes" } ],
//     "types":   [ <named type> | <array type> | <pointer type> ]
//   }
//
// Symbols refer to each other by id. Type ids and type-parameter ids share
// one id space; member ids have their own. A named type without "module"
// is a built-in. Constructed generics inherit name, module, namespace,
// containing type, kind and accessibility from "genericDefinition" when
// they omit them. Missing accessibility means public.
//
// Loading runs in passes so references may point forward:
//   1. declare modules, then types, type parameters and members by id
//   2. fill named-type identity (names, namespaces, nesting)
//   3. resolve references and member details
//   4. copy child lists into the arena and build the name index
//
#include "typegraph/loader/symbol_loader.hpp"

#include <fmt/core.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace typegraph
{

namespace
{

using json = nlohmann::json;

// Diagnostic codes
constexpr const char * k_code_syntax = "L001";
constexpr const char * k_code_version = "L002";
constexpr const char * k_code_missing = "L003";
constexpr const char * k_code_wrong_type = "L004";
constexpr const char * k_code_unknown_value = "L005";
constexpr const char * k_code_duplicate_id = "L006";
constexpr const char * k_code_unknown_id = "L007";
constexpr const char * k_code_target = "L008";
constexpr const char * k_code_nesting = "L009";
constexpr const char * k_code_reference_cycle = "L010";

enum class DeclKind : uint8_t {
  Named,
  Array,
  Pointer,
};

std::optional<DeclKind> parse_decl_kind(std::string_view text) noexcept
{
  if (text == "array") return DeclKind::Array;
  if (text == "pointer") return DeclKind::Pointer;
  if (
    text == "class" || text == "struct" || text == "interface" || text == "enum" ||
    text == "delegate") {
    return DeclKind::Named;
  }
  return std::nullopt;
}

std::optional<TypeKind> parse_named_kind(std::string_view text) noexcept
{
  if (text == "class") return TypeKind::Class;
  if (text == "struct") return TypeKind::Struct;
  if (text == "interface") return TypeKind::Interface;
  if (text == "enum") return TypeKind::Enum;
  if (text == "delegate") return TypeKind::Delegate;
  return std::nullopt;
}

/// Member of `obj`, treating an explicit null as absent
const json * find(const json & obj, const char * key)
{
  const auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

std::optional<uint8_t> hex_digit(char c) noexcept
{
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
  if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
  return std::nullopt;
}

/**
 * Types spelled inside the metadata name of `type`. A cycle among these
 * makes the name infinite. Argument lists made only of type parameters are
 * not spelled out, and method type parameters name their method by display
 * string, which stops at type parameters.
 */
std::vector<const TypeSymbol *> name_references(const TypeSymbol & type)
{
  std::vector<const TypeSymbol *> refs;
  if (const auto * array = dyn_cast<ArrayTypeSymbol>(&type)) {
    refs.push_back(array->element_type);
  } else if (const auto * pointer = dyn_cast<PointerTypeSymbol>(&type)) {
    refs.push_back(pointer->pointed_at_type);
  } else if (const auto * named = dyn_cast<NamedTypeSymbol>(&type)) {
    refs.push_back(named->containing_type);
    const bool all_parameters = std::all_of(
      named->type_arguments.begin(), named->type_arguments.end(),
      [](const TypeSymbol * arg) { return isa<TypeParameterSymbol>(arg); });
    if (!all_parameters) {
      refs.insert(refs.end(), named->type_arguments.begin(), named->type_arguments.end());
    }
  } else if (const auto * tp = dyn_cast<TypeParameterSymbol>(&type)) {
    refs.push_back(tp->declaring_type);
  }
  refs.erase(std::remove(refs.begin(), refs.end(), nullptr), refs.end());
  return refs;
}

// ============================================================================
// Loader State
// ============================================================================

struct MemberEntry
{
  const json * node = nullptr;
  std::string pointer;
  MemberSymbol * symbol = nullptr;
};

struct TypeEntry
{
  const json * node = nullptr;
  std::string pointer;
  DeclKind decl = DeclKind::Named;

  NamedTypeSymbol * named = nullptr;
  ArrayTypeSymbol * array = nullptr;
  PointerTypeSymbol * pointer_type = nullptr;

  /// Index of the generic definition entry, when this is a constructed type
  std::optional<size_t> definition;

  std::vector<MemberEntry> members;
  std::vector<const NamedTypeSymbol *> nested;
};

struct TypeParamEntry
{
  const json * node = nullptr;
  std::string pointer;
  TypeParameterSymbol * symbol = nullptr;
};

struct NamespaceNode
{
  NamespaceSymbol * symbol = nullptr;
  std::vector<const NamespaceSymbol *> children;
  std::vector<const NamedTypeSymbol *> types;
};

class SymbolLoader
{
public:
  SymbolLoader(SymbolGraph & graph, DiagnosticBag & diagnostics, std::string file)
  : graph_(graph), ctx_(graph.context()), diagnostics_(diagnostics), file_(std::move(file))
  {
  }

  void load(const json & root);

private:
  // Passes
  void declare_modules(const json & modules);
  void declare_types(const json & types);
  void declare_members(TypeEntry & entry);
  gsl::span<const TypeParameterSymbol *> declare_type_parameters(
    const json & owner, const std::string & pointer, const NamedTypeSymbol * declaring_type,
    const MethodSymbol * declaring_method);
  void define_identity(size_t index);
  void check_nesting(TypeEntry & entry);
  void define_links(TypeEntry & entry);
  void define_member(const NamedTypeSymbol & owner, const MemberEntry & entry,
                     std::vector<const MemberSymbol *> & members);
  void define_method(
    const NamedTypeSymbol & owner, const MemberEntry & entry, MethodSymbol & method);
  void define_property(const NamedTypeSymbol & owner, const MemberEntry & entry,
                       PropertySymbol & property, std::vector<const MemberSymbol *> & members);
  void define_field(const MemberEntry & entry, FieldSymbol & field);
  void define_event(const NamedTypeSymbol & owner, const MemberEntry & entry, EventSymbol & evt,
                    std::vector<const MemberSymbol *> & members);
  void define_type_parameter(const TypeParamEntry & entry);
  void check_reference_cycles();
  bool visit_references(
    const TypeSymbol & type, std::unordered_map<const TypeSymbol *, uint8_t> & state,
    std::vector<const TypeSymbol *> & path);
  [[nodiscard]] std::string pointer_of(const TypeSymbol & type) const;
  void select_target(const json & root);
  void finalize();

  // Pieces
  gsl::span<const ParameterSymbol *> parse_parameters(
    const json & obj, const std::string & pointer, const MemberSymbol & owner);
  gsl::span<const AttributeData> parse_attributes(
    const json & obj, const std::string & pointer, const char * key);
  TypedConstant parse_constant(const json & value, const std::string & pointer);
  MethodSymbol * make_accessor(
    const NamedTypeSymbol & owner, const MemberSymbol & parent, MethodKind kind,
    std::string_view prefix, const json * node, const std::string & pointer);
  std::optional<std::string_view> read_rendered(
    const json & obj, const std::string & pointer, const char * key);

  // References
  const TypeSymbol * resolve_type(const json & value, const std::string & pointer);
  const TypeSymbol * resolve_type_field(const json & obj, const std::string & pointer,
                                        const char * key);
  const TypeSymbol * resolve_required_type(const json & obj, const std::string & pointer,
                                           const char * key);
  const NamedTypeSymbol * resolve_named_type(const json & value, const std::string & pointer);
  gsl::span<const TypeSymbol *> resolve_type_list(
    const json & obj, const std::string & pointer, const char * key);
  template <typename T>
  const T * resolve_member(const json & value, const std::string & pointer);
  template <typename T>
  gsl::span<const T *> resolve_member_list(
    const json & obj, const std::string & pointer, const char * key);

  // Field readers
  bool read_bool(const json & obj, const std::string & pointer, const char * key,
                 bool fallback = false);
  std::string_view read_string(const json & obj, const std::string & pointer, const char * key,
                               std::string_view fallback = {});
  std::optional<std::string_view> read_required_string(
    const json & obj, const std::string & pointer, const char * key);
  const json * read_array(const json & obj, const std::string & pointer, const char * key);
  bool expect_object(const json & value, const std::string & pointer);
  template <typename E, typename Parser>
  E read_enum(const json & obj, const std::string & pointer, const char * key, Parser parse,
              E fallback);

  /// Field of a named type, falling back to its generic definition
  const json * inherited(const TypeEntry & entry, const char * key) const;

  NamespaceSymbol * namespace_for(const ModuleSymbol * module, std::string_view full_name);
  size_t namespace_node(const ModuleSymbol * module, std::string_view full_name);

  void error(const std::string & pointer, const char * code, std::string message)
  {
    diagnostics_.report_error(SymbolLocation{file_, pointer}, std::move(message)).with_code(code);
  }

  SymbolGraph & graph_;
  SymbolContext & ctx_;
  DiagnosticBag & diagnostics_;
  std::string file_;

  std::unordered_map<std::string, ModuleSymbol *> modules_by_id_;
  std::vector<std::pair<const json *, std::string>> module_nodes_;
  std::vector<ModuleSymbol *> modules_;

  std::vector<TypeEntry> types_;
  std::unordered_map<std::string, size_t> types_by_id_;

  std::vector<TypeParamEntry> type_params_;
  std::unordered_map<std::string, TypeParameterSymbol *> type_params_by_id_;

  std::unordered_map<std::string, MemberSymbol *> members_by_id_;

  std::vector<NamespaceNode> namespaces_;
  std::map<std::pair<const ModuleSymbol *, std::string>, size_t> namespace_index_;
};

// ============================================================================
// Top Level
// ============================================================================

void SymbolLoader::load(const json & root)
{
  if (!expect_object(root, "")) {
    return;
  }

  if (const json * version = find(root, "formatVersion")) {
    if (!version->is_number_integer()) {
      error("/formatVersion", k_code_wrong_type, "formatVersion must be an integer");
      return;
    }
    const auto value = version->get<int64_t>();
    if (value < 1 || value > k_symbol_format_version) {
      diagnostics_
        .report_error(
          SymbolLocation{file_, "/formatVersion"},
          fmt::format("unsupported symbol dump format version {}", value))
        .with_code(k_code_version)
        .with_help(fmt::format("this reader supports version {}", k_symbol_format_version));
      return;
    }
  }

  const json * modules = read_array(root, "", "modules");
  if (modules == nullptr || modules->empty()) {
    error("/modules", k_code_missing, "symbol dump declares no modules");
    return;
  }

  declare_modules(*modules);
  if (const json * types = read_array(root, "", "types")) {
    declare_types(*types);
  }

  for (size_t i = 0; i < types_.size(); ++i) {
    if (types_[i].decl == DeclKind::Named) {
      define_identity(i);
    }
  }
  for (TypeEntry & entry : types_) {
    if (entry.decl == DeclKind::Named) {
      check_nesting(entry);
    }
  }
  for (TypeEntry & entry : types_) {
    define_links(entry);
  }
  for (const TypeParamEntry & entry : type_params_) {
    define_type_parameter(entry);
  }
  check_reference_cycles();
  for (size_t i = 0; i < modules_.size(); ++i) {
    const auto & [node, pointer] = module_nodes_[i];
    modules_[i]->attributes = parse_attributes(*node, pointer, "attributes");
  }

  select_target(root);
  finalize();
}

// ============================================================================
// Pass 1: Declarations
// ============================================================================

void SymbolLoader::declare_modules(const json & modules)
{
  for (size_t i = 0; i < modules.size(); ++i) {
    const std::string pointer = pointer_child("/modules", i);
    const json & node = modules[i];
    if (!expect_object(node, pointer)) {
      continue;
    }

    const auto id = read_required_string(node, pointer, "id");
    const auto name = read_required_string(node, pointer, "name");
    if (!id || !name) {
      continue;
    }

    auto * module = ctx_.create<ModuleSymbol>();
    module->name = *name;
    module->accessibility = Accessibility::Public;
    module->version = read_string(node, pointer, "version", "0.0.0.0");
    module->culture = read_string(node, pointer, "culture");
    module->is_interactive = read_bool(node, pointer, "interactive");

    const std::string_view token = read_string(node, pointer, "publicKeyToken");
    if (!token.empty()) {
      std::vector<uint8_t> bytes;
      bool valid = token.size() % 2 == 0;
      for (size_t k = 0; valid && k < token.size(); k += 2) {
        const auto hi = hex_digit(token[k]);
        const auto lo = hex_digit(token[k + 1]);
        valid = hi && lo;
        if (valid) {
          bytes.push_back(static_cast<uint8_t>((*hi << 4) | *lo));
        }
      }
      if (valid) {
        module->public_key_token = ctx_.copy_to_arena(bytes);
      } else {
        error(pointer_child(pointer, "publicKeyToken"), k_code_wrong_type,
              "publicKeyToken must be an even-length hex string");
      }
    }

    if (!modules_by_id_.emplace(std::string(*id), module).second) {
      error(
        pointer_child(pointer, "id"), k_code_duplicate_id,
        fmt::format("duplicate module id '{}'", *id));
      continue;
    }
    modules_.push_back(module);
    module_nodes_.emplace_back(&node, pointer);
    graph_.add_module(module);

    // Every module owns a global namespace, even an empty one
    namespace_node(module, "");
  }
}

void SymbolLoader::declare_types(const json & types)
{
  types_.reserve(types.size());
  for (size_t i = 0; i < types.size(); ++i) {
    const std::string pointer = pointer_child("/types", i);
    const json & node = types[i];
    if (!expect_object(node, pointer)) {
      continue;
    }

    const auto id = read_required_string(node, pointer, "id");
    if (!id) {
      continue;
    }

    TypeEntry entry;
    entry.node = &node;
    entry.pointer = pointer;

    // Constructed generics may omit the kind of their definition
    const std::string_view kind_text = read_string(node, pointer, "kind");
    if (kind_text.empty()) {
      if (find(node, "genericDefinition") == nullptr) {
        error(
          pointer_child(pointer, "kind"), k_code_missing, "type is missing required field 'kind'");
        continue;
      }
      entry.decl = DeclKind::Named;
    } else {
      const auto decl = parse_decl_kind(kind_text);
      if (!decl) {
        error(pointer_child(pointer, "kind"), k_code_unknown_value,
              fmt::format("unknown type kind '{}'", kind_text));
        continue;
      }
      entry.decl = *decl;
    }

    if (
      types_by_id_.count(std::string(*id)) != 0 ||
      type_params_by_id_.count(std::string(*id)) != 0) {
      error(
        pointer_child(pointer, "id"), k_code_duplicate_id,
        fmt::format("duplicate type id '{}'", *id));
      continue;
    }

    switch (entry.decl) {
      case DeclKind::Named:
        entry.named = ctx_.create<NamedTypeSymbol>();
        entry.named->type_parameters = declare_type_parameters(node, pointer, entry.named, nullptr);
        break;
      case DeclKind::Array:
        entry.array = ctx_.create<ArrayTypeSymbol>();
        break;
      case DeclKind::Pointer:
        entry.pointer_type = ctx_.create<PointerTypeSymbol>();
        break;
    }

    types_by_id_.emplace(std::string(*id), types_.size());
    types_.push_back(std::move(entry));
    if (types_.back().decl == DeclKind::Named) {
      declare_members(types_.back());
    }
  }
}

gsl::span<const TypeParameterSymbol *> SymbolLoader::declare_type_parameters(
  const json & owner, const std::string & pointer, const NamedTypeSymbol * declaring_type,
  const MethodSymbol * declaring_method)
{
  const json * params = read_array(owner, pointer, "typeParameters");
  if (params == nullptr) {
    return {};
  }

  const std::string list_pointer = pointer_child(pointer, "typeParameters");
  std::vector<const TypeParameterSymbol *> result;
  for (size_t i = 0; i < params->size(); ++i) {
    const std::string tp_pointer = pointer_child(list_pointer, i);
    const json & node = (*params)[i];
    if (!expect_object(node, tp_pointer)) {
      continue;
    }

    const auto id = read_required_string(node, tp_pointer, "id");
    const auto name = read_required_string(node, tp_pointer, "name");
    if (!id || !name) {
      continue;
    }
    if (
      types_by_id_.count(std::string(*id)) != 0 ||
      type_params_by_id_.count(std::string(*id)) != 0) {
      error(pointer_child(tp_pointer, "id"), k_code_duplicate_id,
            fmt::format("duplicate type id '{}'", *id));
      continue;
    }

    auto * tp = ctx_.create<TypeParameterSymbol>();
    tp->name = *name;
    tp->ordinal = static_cast<int32_t>(i);
    tp->declaring_type = declaring_type;
    tp->declaring_method = declaring_method;

    type_params_by_id_.emplace(std::string(*id), tp);
    type_params_.push_back(TypeParamEntry{&node, tp_pointer, tp});
    result.push_back(tp);
  }
  return ctx_.copy_to_arena(result);
}

void SymbolLoader::declare_members(TypeEntry & entry)
{
  const json * members = read_array(*entry.node, entry.pointer, "members");
  if (members == nullptr) {
    return;
  }

  const std::string list_pointer = pointer_child(entry.pointer, "members");
  for (size_t i = 0; i < members->size(); ++i) {
    const std::string pointer = pointer_child(list_pointer, i);
    const json & node = (*members)[i];
    if (!expect_object(node, pointer)) {
      continue;
    }

    const auto kind = read_required_string(node, pointer, "kind");
    if (!kind) {
      continue;
    }

    MemberSymbol * member = nullptr;
    if (*kind == "method") {
      auto * method = ctx_.create<MethodSymbol>();
      method->type_parameters = declare_type_parameters(node, pointer, nullptr, method);
      member = method;
    } else if (*kind == "property") {
      member = ctx_.create<PropertySymbol>();
    } else if (*kind == "field") {
      member = ctx_.create<FieldSymbol>();
    } else if (*kind == "event") {
      member = ctx_.create<EventSymbol>();
    } else {
      error(pointer_child(pointer, "kind"), k_code_unknown_value,
            fmt::format("unknown member kind '{}'", *kind));
      continue;
    }

    const std::string_view id = read_string(node, pointer, "id");
    if (!id.empty() && !members_by_id_.emplace(std::string(id), member).second) {
      error(
        pointer_child(pointer, "id"), k_code_duplicate_id,
        fmt::format("duplicate member id '{}'", id));
      continue;
    }

    entry.members.push_back(MemberEntry{&node, pointer, member});
  }
}

// ============================================================================
// Pass 2: Named-Type Identity
// ============================================================================

void SymbolLoader::define_identity(size_t index)
{
  TypeEntry & entry = types_[index];
  NamedTypeSymbol & type = *entry.named;
  const json & node = *entry.node;

  if (const json * def = find(node, "genericDefinition")) {
    const NamedTypeSymbol * definition = resolve_named_type(
      *def, pointer_child(entry.pointer, "genericDefinition"));
    if (definition != nullptr && definition != &type) {
      entry.definition = types_by_id_.at(def->get<std::string>());
      type.original_definition = definition;
    }
  }
  type.is_unbound_generic = read_bool(node, entry.pointer, "unbound");

  // Identity, inherited from the definition when omitted
  const json * name = inherited(entry, "name");
  if (name == nullptr || !name->is_string()) {
    error(
      pointer_child(entry.pointer, "name"), k_code_missing, "named type requires a string 'name'");
  } else {
    type.name = ctx_.intern(name->get<std::string>());
  }

  if (const json * kind = inherited(entry, "kind")) {
    if (kind->is_string()) {
      type.type_kind = parse_named_kind(kind->get<std::string>()).value_or(TypeKind::Class);
    }
  }

  type.accessibility = Accessibility::Public;
  if (const json * access = inherited(entry, "accessibility")) {
    const auto parsed = access->is_string() ? parse_accessibility(access->get<std::string>())
                                            : std::nullopt;
    if (!parsed) {
      error(pointer_child(entry.pointer, "accessibility"), k_code_unknown_value,
            fmt::format("invalid accessibility {}", access->dump()));
    } else {
      type.accessibility = *parsed;
    }
  }

  if (const json * module = inherited(entry, "module")) {
    const auto it = module->is_string() ? modules_by_id_.find(module->get<std::string>())
                                        : modules_by_id_.end();
    if (it == modules_by_id_.end()) {
      error(pointer_child(entry.pointer, "module"), k_code_unknown_id,
            fmt::format("unknown module id {}", module->dump()));
    } else {
      type.containing_module = it->second;
    }
  }

  if (const json * containing = inherited(entry, "containingType")) {
    type.containing_type = resolve_named_type(
      *containing, pointer_child(entry.pointer, "containingType"));
  }

  // Flags and display data
  type.is_implicitly_declared = read_bool(node, entry.pointer, "implicit");
  type.is_abstract = read_bool(node, entry.pointer, "abstract");
  type.is_sealed = read_bool(node, entry.pointer, "sealed");
  type.is_static = read_bool(node, entry.pointer, "static");
  type.is_record = read_bool(node, entry.pointer, "record");
  type.is_ref_like = read_bool(node, entry.pointer, "refLike");
  type.is_read_only = read_bool(node, entry.pointer, "readOnly");
  type.is_unmanaged = read_bool(node, entry.pointer, "unmanaged");
  type.special_type = read_string(node, entry.pointer, "specialType");
  type.display_name = read_string(node, entry.pointer, "displayName");
  type.doc_comment = read_string(node, entry.pointer, "doc");

  if (type.type_parameters.empty() && entry.definition) {
    type.type_parameters = types_[*entry.definition].named->type_parameters;
  }
}

void SymbolLoader::check_nesting(TypeEntry & entry)
{
  NamedTypeSymbol & type = *entry.named;

  size_t depth = 0;
  for (const auto * cur = type.containing_type; cur != nullptr; cur = cur->containing_type) {
    if (cur == &type || ++depth > types_.size()) {
      error(pointer_child(entry.pointer, "containingType"), k_code_nesting,
            fmt::format("type '{}' is nested inside itself", type.name));
      type.containing_type = nullptr;
      break;
    }
  }

  // Namespace: own, else the definition's, else the outermost containing type's
  const json * ns = inherited(entry, "namespace");
  std::string_view ns_name;
  if (ns != nullptr && ns->is_string()) {
    ns_name = ctx_.intern(ns->get<std::string>());
  } else if (ns != nullptr) {
    error(
      pointer_child(entry.pointer, "namespace"), k_code_wrong_type, "namespace must be a string");
  } else if (type.containing_type != nullptr) {
    const NamedTypeSymbol * outer = type.containing_type;
    while (outer->containing_type != nullptr) {
      outer = outer->containing_type;
    }
    const auto it = std::find_if(
      types_.begin(), types_.end(), [outer](const TypeEntry & e) { return e.named == outer; });
    if (it != types_.end()) {
      if (const json * outer_ns = inherited(*it, "namespace"); outer_ns && outer_ns->is_string()) {
        ns_name = ctx_.intern(outer_ns->get<std::string>());
      }
    }
  }
  type.containing_namespace = namespace_for(type.containing_module, ns_name);

  // Only definitions are placed in the namespace tree
  if (entry.definition) {
    return;
  }
  if (type.containing_module == nullptr) {
    graph_.add_builtin_type(&type);
  }
  if (type.containing_type != nullptr) {
    const auto it = std::find_if(types_.begin(), types_.end(), [&type](const TypeEntry & e) {
      return e.named == type.containing_type;
    });
    if (it != types_.end()) {
      it->nested.push_back(&type);
    }
  } else {
    namespaces_[namespace_node(type.containing_module, ns_name)].types.push_back(&type);
  }
}

// ============================================================================
// Pass 3: References and Members
// ============================================================================

void SymbolLoader::define_links(TypeEntry & entry)
{
  const json & node = *entry.node;

  if (entry.decl == DeclKind::Array) {
    entry.array->element_type = resolve_required_type(node, entry.pointer, "elementType");
    if (const json * rank = find(node, "rank")) {
      if (!rank->is_number_integer() || rank->get<int64_t>() < 1) {
        error(
          pointer_child(entry.pointer, "rank"), k_code_wrong_type,
          "rank must be a positive integer");
      } else {
        entry.array->rank = static_cast<int32_t>(rank->get<int64_t>());
      }
    }
    return;
  }
  if (entry.decl == DeclKind::Pointer) {
    entry.pointer_type->pointed_at_type = resolve_required_type(
      node, entry.pointer, "pointedAtType");
    return;
  }

  NamedTypeSymbol & type = *entry.named;

  if (const json * base = find(node, "baseType")) {
    type.base_type = resolve_named_type(*base, pointer_child(entry.pointer, "baseType"));
  }
  if (const json * ifaces = read_array(node, entry.pointer, "interfaces")) {
    std::vector<const NamedTypeSymbol *> result;
    const std::string list_pointer = pointer_child(entry.pointer, "interfaces");
    for (size_t i = 0; i < ifaces->size(); ++i) {
      if (const auto * iface = resolve_named_type((*ifaces)[i], pointer_child(list_pointer, i))) {
        result.push_back(iface);
      }
    }
    type.interfaces = ctx_.copy_to_arena(result);
  }
  if (const json * underlying = find(node, "enumUnderlyingType")) {
    type.enum_underlying_type =
      resolve_named_type(*underlying, pointer_child(entry.pointer, "enumUnderlyingType"));
  }

  type.type_arguments = resolve_type_list(node, entry.pointer, "typeArguments");
  type.attributes = parse_attributes(node, entry.pointer, "attributes");

  std::vector<const MemberSymbol *> members;
  members.reserve(entry.members.size());
  for (const MemberEntry & member : entry.members) {
    define_member(type, member, members);
  }
  type.members = ctx_.copy_to_arena(members);
  type.nested_types = ctx_.copy_to_arena(entry.nested);
}

void SymbolLoader::define_member(
  const NamedTypeSymbol & owner, const MemberEntry & entry,
  std::vector<const MemberSymbol *> & members)
{
  const json & node = *entry.node;
  MemberSymbol & member = *entry.symbol;

  const auto name = read_required_string(node, entry.pointer, "name");
  member.name = name.value_or("");
  member.containing_type = &owner;
  member.accessibility =
    read_enum(node, entry.pointer, "accessibility", parse_accessibility, Accessibility::Public);
  member.is_implicitly_declared = read_bool(node, entry.pointer, "implicit");
  member.is_static = read_bool(node, entry.pointer, "static");
  member.is_abstract = read_bool(node, entry.pointer, "abstract");
  member.is_virtual = read_bool(node, entry.pointer, "virtual");
  member.is_override = read_bool(node, entry.pointer, "override");
  member.is_sealed = read_bool(node, entry.pointer, "sealed");
  member.is_extern = read_bool(node, entry.pointer, "extern");
  member.doc_comment = read_string(node, entry.pointer, "doc");
  member.attributes = parse_attributes(node, entry.pointer, "attributes");

  members.push_back(&member);

  if (auto * method = dyn_cast<MethodSymbol>(&member)) {
    define_method(owner, entry, *method);
  } else if (auto * property = dyn_cast<PropertySymbol>(&member)) {
    define_property(owner, entry, *property, members);
  } else if (auto * field = dyn_cast<FieldSymbol>(&member)) {
    define_field(entry, *field);
  } else if (auto * evt = dyn_cast<EventSymbol>(&member)) {
    define_event(owner, entry, *evt, members);
  }
}

void SymbolLoader::define_method(
  const NamedTypeSymbol & owner, const MemberEntry & entry, MethodSymbol & method)
{
  const json & node = *entry.node;

  method.method_kind =
    read_enum(node, entry.pointer, "methodKind", parse_method_kind, MethodKind::Ordinary);
  method.return_type = resolve_type_field(node, entry.pointer, "returnType");
  method.is_async = read_bool(node, entry.pointer, "async");
  method.is_extension_method = read_bool(node, entry.pointer, "extensionMethod");
  method.is_partial_definition = read_bool(node, entry.pointer, "partialDefinition");
  method.is_read_only = read_bool(node, entry.pointer, "readOnly");
  method.is_init_only = read_bool(node, entry.pointer, "initOnly");

  method.parameters = parse_parameters(node, entry.pointer, method);
  if (const json * overrides = find(node, "overrides")) {
    method.overridden_method =
      resolve_member<MethodSymbol>(*overrides, pointer_child(entry.pointer, "overrides"));
  }
  method.explicit_interface_implementations =
    resolve_member_list<MethodSymbol>(node, entry.pointer, "explicitImplementations");
  method.return_type_attributes = parse_attributes(node, entry.pointer, "returnAttributes");
}

void SymbolLoader::define_property(
  const NamedTypeSymbol & owner, const MemberEntry & entry, PropertySymbol & property,
  std::vector<const MemberSymbol *> & members)
{
  const json & node = *entry.node;

  property.type = resolve_type_field(node, entry.pointer, "type");
  property.is_required = read_bool(node, entry.pointer, "required");
  property.parameters = parse_parameters(node, entry.pointer, property);
  if (const json * overrides = find(node, "overrides")) {
    property.overridden_property =
      resolve_member<PropertySymbol>(*overrides, pointer_child(entry.pointer, "overrides"));
  }
  property.explicit_interface_implementations =
    resolve_member_list<PropertySymbol>(node, entry.pointer, "explicitImplementations");

  // Accessors follow their property in the member list
  if (const json * getter = find(node, "getter")) {
    property.get_method = make_accessor(
      owner, property, MethodKind::PropertyGet, "get_", getter,
      pointer_child(entry.pointer, "getter"));
    if (property.get_method != nullptr) {
      members.push_back(property.get_method);
    }
  }
  if (const json * setter = find(node, "setter")) {
    property.set_method = make_accessor(
      owner, property, MethodKind::PropertySet, "set_", setter,
      pointer_child(entry.pointer, "setter"));
    if (property.set_method != nullptr) {
      members.push_back(property.set_method);
    }
  }
}

void SymbolLoader::define_field(const MemberEntry & entry, FieldSymbol & field)
{
  const json & node = *entry.node;

  field.type = resolve_type_field(node, entry.pointer, "type");
  field.is_read_only = read_bool(node, entry.pointer, "readOnly");
  field.is_const = read_bool(node, entry.pointer, "const");
  field.is_volatile = read_bool(node, entry.pointer, "volatile");
  field.is_required = read_bool(node, entry.pointer, "required");
  field.constant_value = read_rendered(node, entry.pointer, "constantValue");
}

void SymbolLoader::define_event(
  const NamedTypeSymbol & owner, const MemberEntry & entry, EventSymbol & evt,
  std::vector<const MemberSymbol *> & members)
{
  const json & node = *entry.node;

  evt.type = resolve_type_field(node, entry.pointer, "type");
  if (const json * overrides = find(node, "overrides")) {
    evt.overridden_event = resolve_member<EventSymbol>(
      *overrides, pointer_child(entry.pointer, "overrides"));
  }
  evt.explicit_interface_implementations =
    resolve_member_list<EventSymbol>(node, entry.pointer, "explicitImplementations");

  evt.add_method = make_accessor(owner, evt, MethodKind::EventAdd, "add_", nullptr, entry.pointer);
  evt.remove_method =
    make_accessor(owner, evt, MethodKind::EventRemove, "remove_", nullptr, entry.pointer);
  members.push_back(evt.add_method);
  members.push_back(evt.remove_method);
}

MethodSymbol * SymbolLoader::make_accessor(
  const NamedTypeSymbol & owner, const MemberSymbol & parent, MethodKind kind,
  std::string_view prefix, const json * node, const std::string & pointer)
{
  if (node != nullptr && !node->is_object() && !node->is_boolean()) {
    error(pointer, k_code_wrong_type, "accessor must be an object or a boolean");
    return nullptr;
  }
  if (node != nullptr && node->is_boolean() && !node->get<bool>()) {
    return nullptr;
  }

  auto * accessor = ctx_.create<MethodSymbol>();
  accessor->method_kind = kind;
  accessor->name = ctx_.intern(fmt::format("{}{}", prefix, parent.name));
  accessor->containing_type = &owner;
  accessor->accessibility = parent.accessibility;
  accessor->is_implicitly_declared = true;
  accessor->is_static = parent.is_static;
  accessor->is_abstract = parent.is_abstract;
  accessor->is_virtual = parent.is_virtual;
  accessor->is_override = parent.is_override;
  accessor->is_sealed = parent.is_sealed;

  if (node != nullptr && node->is_object()) {
    accessor->accessibility =
      read_enum(*node, pointer, "accessibility", parse_accessibility, parent.accessibility);
    accessor->is_init_only = read_bool(*node, pointer, "initOnly");
  }
  return accessor;
}

void SymbolLoader::define_type_parameter(const TypeParamEntry & entry)
{
  const json & node = *entry.node;
  TypeParameterSymbol & tp = *entry.symbol;

  // Type parameters live in the module of their owner
  if (tp.declaring_type != nullptr) {
    tp.containing_module = tp.declaring_type->containing_module;
  } else if (tp.declaring_method != nullptr && tp.declaring_method->containing_type != nullptr) {
    tp.containing_module = tp.declaring_method->containing_type->containing_module;
  }

  tp.variance = read_enum(node, entry.pointer, "variance", parse_variance, VarianceKind::None);
  tp.has_reference_type_constraint = read_bool(node, entry.pointer, "referenceTypeConstraint");
  tp.has_value_type_constraint = read_bool(node, entry.pointer, "valueTypeConstraint");
  tp.has_unmanaged_type_constraint = read_bool(node, entry.pointer, "unmanagedTypeConstraint");
  tp.has_not_null_constraint = read_bool(node, entry.pointer, "notNullConstraint");
  tp.has_constructor_constraint = read_bool(node, entry.pointer, "constructorConstraint");
  tp.constraint_types = resolve_type_list(node, entry.pointer, "constraintTypes");
  tp.attributes = parse_attributes(node, entry.pointer, "attributes");
}

gsl::span<const ParameterSymbol *> SymbolLoader::parse_parameters(
  const json & obj, const std::string & pointer, const MemberSymbol & owner)
{
  const json * params = read_array(obj, pointer, "parameters");
  if (params == nullptr) {
    return {};
  }

  const std::string list_pointer = pointer_child(pointer, "parameters");
  std::vector<const ParameterSymbol *> result;
  for (size_t i = 0; i < params->size(); ++i) {
    const std::string param_pointer = pointer_child(list_pointer, i);
    const json & node = (*params)[i];
    if (!expect_object(node, param_pointer)) {
      continue;
    }

    auto * param = ctx_.create<ParameterSymbol>();
    param->name = read_string(node, param_pointer, "name");
    param->ordinal = static_cast<int32_t>(i);
    param->containing_symbol = &owner;
    param->type = resolve_required_type(node, param_pointer, "type");
    param->ref_kind = read_enum(node, param_pointer, "refKind", parse_ref_kind, RefKind::None);
    param->is_optional = read_bool(node, param_pointer, "optional");
    param->is_params = read_bool(node, param_pointer, "params");
    param->is_this = read_bool(node, param_pointer, "this");
    param->is_discard = read_bool(node, param_pointer, "discard");
    param->default_value = read_rendered(node, param_pointer, "defaultValue");
    param->attributes = parse_attributes(node, param_pointer, "attributes");
    result.push_back(param);
  }
  return ctx_.copy_to_arena(result);
}

// ============================================================================
// Attributes and Constants
// ============================================================================

gsl::span<const AttributeData> SymbolLoader::parse_attributes(
  const json & obj, const std::string & pointer, const char * key)
{
  const json * attrs = read_array(obj, pointer, key);
  if (attrs == nullptr || attrs->empty()) {
    return {};
  }

  const std::string list_pointer = pointer_child(pointer, key);
  auto result = ctx_.allocate_array<AttributeData>(attrs->size());
  for (size_t i = 0; i < attrs->size(); ++i) {
    const std::string attr_pointer = pointer_child(list_pointer, i);
    const json & node = (*attrs)[i];
    if (!expect_object(node, attr_pointer)) {
      continue;
    }

    AttributeData & attr = result[i];
    if (const json * type = find(node, "type")) {
      attr.attribute_class = resolve_named_type(*type, pointer_child(attr_pointer, "type"));
    }

    if (const json * args = read_array(node, attr_pointer, "arguments")) {
      auto values = ctx_.allocate_array<TypedConstant>(args->size());
      for (size_t k = 0; k < args->size(); ++k) {
        values[k] = parse_constant(
          (*args)[k], pointer_child(pointer_child(attr_pointer, "arguments"), k));
      }
      attr.constructor_arguments = values;
    }

    if (const json * named = read_array(node, attr_pointer, "namedArguments")) {
      const std::string named_pointer = pointer_child(attr_pointer, "namedArguments");
      auto values = ctx_.allocate_array<NamedArgument>(named->size());
      for (size_t k = 0; k < named->size(); ++k) {
        const std::string arg_pointer = pointer_child(named_pointer, k);
        if (!expect_object((*named)[k], arg_pointer)) {
          continue;
        }
        values[k].name = read_string((*named)[k], arg_pointer, "name");
        const auto it = (*named)[k].find("value");
        values[k].value = it == (*named)[k].end()
                            ? TypedConstant{}
                            : parse_constant(*it, pointer_child(arg_pointer, "value"));
      }
      attr.named_arguments = values;
    }
  }
  return result;
}

TypedConstant SymbolLoader::parse_constant(const json & value, const std::string & pointer)
{
  TypedConstant constant;
  if (value.is_null()) {
    constant.kind = ConstantKind::Null;
  } else if (value.is_string()) {
    constant.kind = ConstantKind::String;
    constant.text = ctx_.intern(value.get<std::string>());
  } else if (value.is_boolean() || value.is_number()) {
    constant.kind = ConstantKind::Primitive;
    constant.text = ctx_.intern(value.dump());
  } else if (value.is_array()) {
    constant.kind = ConstantKind::Array;
    std::vector<const TypedConstant *> items;
    items.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
      items.push_back(
        ctx_.create_value<TypedConstant>(parse_constant(value[i], pointer_child(pointer, i))));
    }
    constant.values = ctx_.copy_to_arena(items);
  } else if (const json * type = find(value, "typeof")) {
    constant.kind = ConstantKind::Type;
    constant.type_value = resolve_type(*type, pointer_child(pointer, "typeof"));
  } else if (const auto boxed = value.find("value"); boxed != value.end()) {
    constant.kind = ConstantKind::Primitive;
    if (const auto text = read_rendered(value, pointer, "value")) {
      constant.text = *text;
    }
  } else {
    error(pointer, k_code_wrong_type,
          "attribute constant object must have a 'typeof' or 'value' field");
  }
  return constant;
}

std::optional<std::string_view> SymbolLoader::read_rendered(
  const json & obj, const std::string & pointer, const char * key)
{
  const auto it = obj.find(key);
  if (it == obj.end()) {
    return std::nullopt;
  }
  if (it->is_null()) {
    return ctx_.intern("null");
  }
  if (it->is_string()) {
    return ctx_.intern(it->get<std::string>());
  }
  if (it->is_boolean() || it->is_number()) {
    return ctx_.intern(it->dump());
  }
  error(pointer_child(pointer, key), k_code_wrong_type, fmt::format("'{}' must be a scalar", key));
  return std::nullopt;
}

// ============================================================================
// Reference Cycles
// ============================================================================

void SymbolLoader::check_reference_cycles()
{
  std::unordered_map<const TypeSymbol *, uint8_t> state;  // 1: on path, 2: done
  std::vector<const TypeSymbol *> path;

  for (const TypeEntry & entry : types_) {
    const TypeSymbol * type = entry.named;
    if (entry.decl == DeclKind::Array) {
      type = entry.array;
    } else if (entry.decl == DeclKind::Pointer) {
      type = entry.pointer_type;
    }
    if (type != nullptr && !visit_references(*type, state, path)) {
      return;
    }
  }
}

/// Depth-first search; false after reporting the first cycle found
bool SymbolLoader::visit_references(
  const TypeSymbol & type, std::unordered_map<const TypeSymbol *, uint8_t> & state,
  std::vector<const TypeSymbol *> & path)
{
  uint8_t & mark = state[&type];
  if (mark == 2) {
    return true;
  }
  if (mark == 1) {
    const auto start = std::find(path.begin(), path.end(), &type);
    std::vector<std::string> pointers;
    for (auto it = start; it != path.end(); ++it) {
      pointers.push_back(pointer_of(**it));
    }
    pointers.push_back(pointer_of(type));

    diagnostics_
      .report_error(
        SymbolLocation{file_, pointer_of(type)},
        "type name refers to itself through its element, pointee or argument types")
      .with_code(k_code_reference_cycle)
      .with_help(fmt::format("reference chain: {}", fmt::join(pointers, " -> ")));
    return false;
  }

  mark = 1;
  path.push_back(&type);
  for (const TypeSymbol * ref : name_references(type)) {
    if (!visit_references(*ref, state, path)) {
      return false;
    }
  }
  path.pop_back();
  state[&type] = 2;
  return true;
}

std::string SymbolLoader::pointer_of(const TypeSymbol & type) const
{
  for (const TypeEntry & entry : types_) {
    if (entry.named == &type || entry.array == &type || entry.pointer_type == &type) {
      return entry.pointer;
    }
  }
  for (const TypeParamEntry & entry : type_params_) {
    if (entry.symbol == &type) {
      return entry.pointer;
    }
  }
  return "";
}

// ============================================================================
// Target Selection and Finalization
// ============================================================================

void SymbolLoader::select_target(const json & root)
{
  if (const json * target = find(root, "targetModule")) {
    const auto it =
      target->is_string() ? modules_by_id_.find(target->get<std::string>()) : modules_by_id_.end();
    if (it == modules_by_id_.end()) {
      error(
        "/targetModule", k_code_unknown_id, fmt::format("unknown module id {}", target->dump()));
      return;
    }
    graph_.set_target_module(it->second);
    return;
  }

  if (modules_.size() == 1) {
    graph_.set_target_module(modules_.front());
    return;
  }

  diagnostics_
    .report_error(
      SymbolLocation{file_, ""}, "symbol dump declares several modules but no target module")
    .with_code(k_code_target)
    .with_help("set \"targetModule\" to the id of the module to extract");
}

void SymbolLoader::finalize()
{
  for (NamespaceNode & node : namespaces_) {
    node.symbol->namespaces = ctx_.copy_to_arena(node.children);
    node.symbol->types = ctx_.copy_to_arena(node.types);
  }
  for (ModuleSymbol * module : modules_) {
    module->global_namespace = namespace_for(module, "");
  }
  // Names of a graph with broken links are not computable
  if (!diagnostics_.has_errors()) {
    graph_.build_index();
  }
}

// ============================================================================
// Namespaces
// ============================================================================

NamespaceSymbol * SymbolLoader::namespace_for(
  const ModuleSymbol * module, std::string_view full_name)
{
  return namespaces_[namespace_node(module, full_name)].symbol;
}

size_t SymbolLoader::namespace_node(const ModuleSymbol * module, std::string_view full_name)
{
  const auto key = std::make_pair(module, std::string(full_name));
  if (const auto it = namespace_index_.find(key); it != namespace_index_.end()) {
    return it->second;
  }

  auto * ns = ctx_.create<NamespaceSymbol>();
  ns->full_name = ctx_.intern(full_name);
  ns->containing_module = module;
  ns->accessibility = Accessibility::Public;

  if (!full_name.empty()) {
    const size_t dot = full_name.rfind('.');
    const std::string_view parent_name =
      dot == std::string_view::npos ? std::string_view{} : full_name.substr(0, dot);
    ns->name = dot == std::string_view::npos ? ns->full_name : ns->full_name.substr(dot + 1);

    const size_t parent = namespace_node(module, parent_name);
    ns->containing_namespace = namespaces_[parent].symbol;
    namespaces_[parent].children.push_back(ns);
  }

  namespaces_.push_back(NamespaceNode{ns, {}, {}});
  namespace_index_.emplace(key, namespaces_.size() - 1);
  return namespaces_.size() - 1;
}

// ============================================================================
// References
// ============================================================================

const TypeSymbol * SymbolLoader::resolve_type(const json & value, const std::string & pointer)
{
  if (!value.is_string()) {
    error(pointer, k_code_wrong_type, "type reference must be a string id");
    return nullptr;
  }

  const auto id = value.get<std::string>();
  if (const auto it = types_by_id_.find(id); it != types_by_id_.end()) {
    const TypeEntry & entry = types_[it->second];
    switch (entry.decl) {
      case DeclKind::Named:
        return entry.named;
      case DeclKind::Array:
        return entry.array;
      case DeclKind::Pointer:
        return entry.pointer_type;
    }
  }
  if (const auto it = type_params_by_id_.find(id); it != type_params_by_id_.end()) {
    return it->second;
  }

  error(pointer, k_code_unknown_id, fmt::format("unknown type id '{}'", id));
  return nullptr;
}

const TypeSymbol * SymbolLoader::resolve_type_field(
  const json & obj, const std::string & pointer, const char * key)
{
  const json * value = find(obj, key);
  return value == nullptr ? nullptr : resolve_type(*value, pointer_child(pointer, key));
}

const TypeSymbol * SymbolLoader::resolve_required_type(
  const json & obj, const std::string & pointer, const char * key)
{
  const json * value = find(obj, key);
  if (value == nullptr) {
    error(
      pointer_child(pointer, key), k_code_missing, fmt::format("missing required field '{}'", key));
    return nullptr;
  }
  return resolve_type(*value, pointer_child(pointer, key));
}

const NamedTypeSymbol * SymbolLoader::resolve_named_type(
  const json & value, const std::string & pointer)
{
  const TypeSymbol * type = resolve_type(value, pointer);
  if (type == nullptr) {
    return nullptr;
  }
  const auto * named = dyn_cast<NamedTypeSymbol>(type);
  if (named == nullptr) {
    error(pointer, k_code_wrong_type, fmt::format("type {} is not a named type", value.dump()));
  }
  return named;
}

gsl::span<const TypeSymbol *> SymbolLoader::resolve_type_list(
  const json & obj, const std::string & pointer, const char * key)
{
  const json * list = read_array(obj, pointer, key);
  if (list == nullptr) {
    return {};
  }

  std::vector<const TypeSymbol *> result;
  result.reserve(list->size());
  const std::string list_pointer = pointer_child(pointer, key);
  for (size_t i = 0; i < list->size(); ++i) {
    if (const TypeSymbol * type = resolve_type((*list)[i], pointer_child(list_pointer, i))) {
      result.push_back(type);
    }
  }
  return ctx_.copy_to_arena(result);
}

template <typename T>
const T * SymbolLoader::resolve_member(const json & value, const std::string & pointer)
{
  if (!value.is_string()) {
    error(pointer, k_code_wrong_type, "member reference must be a string id");
    return nullptr;
  }

  const auto id = value.get<std::string>();
  const auto it = members_by_id_.find(id);
  if (it == members_by_id_.end()) {
    error(pointer, k_code_unknown_id, fmt::format("unknown member id '{}'", id));
    return nullptr;
  }

  const T * member = dyn_cast<T>(static_cast<const MemberSymbol *>(it->second));
  if (member == nullptr) {
    error(pointer, k_code_wrong_type, fmt::format("member '{}' has the wrong kind", id));
  }
  return member;
}

template <typename T>
gsl::span<const T *> SymbolLoader::resolve_member_list(
  const json & obj, const std::string & pointer, const char * key)
{
  const json * list = read_array(obj, pointer, key);
  if (list == nullptr) {
    return {};
  }

  std::vector<const T *> result;
  const std::string list_pointer = pointer_child(pointer, key);
  for (size_t i = 0; i < list->size(); ++i) {
    if (const T * member = resolve_member<T>((*list)[i], pointer_child(list_pointer, i))) {
      result.push_back(member);
    }
  }
  return ctx_.copy_to_arena(result);
}

// ============================================================================
// Field Readers
// ============================================================================

bool SymbolLoader::expect_object(const json & value, const std::string & pointer)
{
  if (value.is_object()) {
    return true;
  }
  error(pointer, k_code_wrong_type, "expected a JSON object");
  return false;
}

bool SymbolLoader::read_bool(
  const json & obj, const std::string & pointer, const char * key, bool fallback)
{
  const json * value = find(obj, key);
  if (value == nullptr) {
    return fallback;
  }
  if (!value->is_boolean()) {
    error(
      pointer_child(pointer, key), k_code_wrong_type, fmt::format("'{}' must be a boolean", key));
    return fallback;
  }
  return value->get<bool>();
}

std::string_view SymbolLoader::read_string(
  const json & obj, const std::string & pointer, const char * key, std::string_view fallback)
{
  const json * value = find(obj, key);
  if (value == nullptr) {
    return fallback;
  }
  if (!value->is_string()) {
    error(
      pointer_child(pointer, key), k_code_wrong_type, fmt::format("'{}' must be a string", key));
    return fallback;
  }
  return ctx_.intern(value->get<std::string>());
}

std::optional<std::string_view> SymbolLoader::read_required_string(
  const json & obj, const std::string & pointer, const char * key)
{
  const json * value = find(obj, key);
  if (value == nullptr) {
    error(
      pointer_child(pointer, key), k_code_missing, fmt::format("missing required field '{}'", key));
    return std::nullopt;
  }
  if (!value->is_string()) {
    error(
      pointer_child(pointer, key), k_code_wrong_type, fmt::format("'{}' must be a string", key));
    return std::nullopt;
  }
  return ctx_.intern(value->get<std::string>());
}

const json * SymbolLoader::read_array(
  const json & obj, const std::string & pointer, const char * key)
{
  const json * value = find(obj, key);
  if (value == nullptr) {
    return nullptr;
  }
  if (!value->is_array()) {
    error(
      pointer_child(pointer, key), k_code_wrong_type, fmt::format("'{}' must be an array", key));
    return nullptr;
  }
  return value;
}

template <typename E, typename Parser>
E SymbolLoader::read_enum(
  const json & obj, const std::string & pointer, const char * key, Parser parse, E fallback)
{
  const std::string_view text = read_string(obj, pointer, key);
  if (text.empty()) {
    return fallback;
  }
  const std::optional<E> parsed = parse(text);
  if (!parsed) {
    error(
      pointer_child(pointer, key), k_code_unknown_value, fmt::format("invalid {} '{}'", key, text));
    return fallback;
  }
  return *parsed;
}

const json * SymbolLoader::inherited(const TypeEntry & entry, const char * key) const
{
  if (const json * own = find(*entry.node, key)) {
    return own;
  }
  if (entry.definition) {
    return find(*types_[*entry.definition].node, key);
  }
  return nullptr;
}

SymbolLoadResult finish(SymbolLoadResult result)
{
  result.success = !result.diagnostics.has_errors();
  return result;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

SymbolLoadResult load_symbol_json(std::string_view text, std::string_view label)
{
  SymbolLoadResult result;

  json root;
  try {
    root = json::parse(text.begin(), text.end());
  } catch (const json::parse_error & e) {
    result.diagnostics
      .report_error(SymbolLocation{std::string(label), ""}, "malformed JSON in symbol dump")
      .with_code(k_code_syntax)
      .with_help(e.what());
    return finish(std::move(result));
  }

  SymbolLoader loader(result.graph, result.diagnostics, std::string(label));
  loader.load(root);
  return finish(std::move(result));
}

SymbolLoadResult load_symbol_file(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    SymbolLoadResult result;
    result.diagnostics
      .report_error(SymbolLocation{path.string(), ""}, "cannot open symbol dump")
      .with_code(k_code_syntax)
      .with_help("check that the file exists and is readable");
    return finish(std::move(result));
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  return load_symbol_json(buffer.str(), path.string());
}

}  // namespace typegraph
