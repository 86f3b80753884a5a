// tests/unit/loader/test_symbol_loader.cpp - JSON symbol dump reader tests

#include <gtest/gtest.h>

#include <string>

#include "typegraph/loader/symbol_loader.hpp"
#include "typegraph/symbols/symbol_display.hpp"

using namespace typegraph;

namespace
{

SymbolLoadResult load(std::string_view text) { return load_symbol_json(text, "dump.json"); }

/// True when a diagnostic with `code` points at `pointer`
bool has_error(const SymbolLoadResult & result, std::string_view code, std::string_view pointer)
{
  for (const auto & d : result.diagnostics) {
    if (d.code == code && d.location.pointer == pointer) {
      return true;
    }
  }
  return false;
}

std::string dump_errors(const SymbolLoadResult & result)
{
  std::string out;
  for (const auto & d : result.diagnostics) {
    out += d.code + " " + d.location.pointer + ": " + d.message + "\n";
  }
  return out;
}

}  // namespace

// ============================================================================
// Successful Loads
// ============================================================================

TEST(SymbolLoader, LoadsModulesTypesAndMembers)
{
  const auto result = load(R"json({
    "formatVersion": 1,
    "modules": [{"id": "m", "name": "Sample", "version": "1.2.0.0", "culture": "de-DE",
                 "publicKeyToken": "00ff10", "interactive": true}],
    "types": [
      {"id": "System.String", "kind": "class", "name": "String", "namespace": "System"},
      {"id": "Greeter", "kind": "class", "name": "Greeter", "module": "m",
       "namespace": "Sample.Text", "sealed": true,
       "members": [
         {"kind": "method", "name": "Greet", "returnType": "System.String",
          "parameters": [{"name": "who", "type": "System.String", "refKind": "in"}]},
         {"kind": "field", "name": "greeting", "type": "System.String", "readOnly": true,
          "accessibility": "private"}
       ]}
    ]
  })json");
  ASSERT_TRUE(result.success) << dump_errors(result);
  EXPECT_TRUE(result.diagnostics.empty());

  const ModuleSymbol * module = result.graph.target_module();
  ASSERT_NE(module, nullptr);
  EXPECT_EQ(module->name, "Sample");
  EXPECT_EQ(module->version, "1.2.0.0");
  EXPECT_EQ(module->culture, "de-DE");
  EXPECT_TRUE(module->is_interactive);
  ASSERT_EQ(module->public_key_token.size(), 3U);
  EXPECT_EQ(module->public_key_token[1], 0xFF);

  const NamedTypeSymbol * greeter = result.graph.index().find_type("Sample.Text.Greeter");
  ASSERT_NE(greeter, nullptr);
  EXPECT_EQ(greeter->containing_module, module);
  EXPECT_TRUE(greeter->is_sealed);
  EXPECT_EQ(greeter->accessibility, Accessibility::Public);
  ASSERT_EQ(greeter->members.size(), 2U);

  const auto * greet = dyn_cast<MethodSymbol>(greeter->members[0]);
  ASSERT_NE(greet, nullptr);
  EXPECT_EQ(greet->containing_type, greeter);
  ASSERT_EQ(greet->parameters.size(), 1U);
  EXPECT_EQ(greet->parameters[0]->ref_kind, RefKind::In);
  EXPECT_EQ(greet->parameters[0]->ordinal, 0);
  EXPECT_EQ(greet->parameters[0]->containing_symbol, greet);

  const auto * field = dyn_cast<FieldSymbol>(greeter->members[1]);
  ASSERT_NE(field, nullptr);
  EXPECT_EQ(field->accessibility, Accessibility::Private);
  EXPECT_TRUE(field->is_read_only);
}

TEST(SymbolLoader, NamespaceTreeIsBuiltPerModule)
{
  const auto result = load(R"json({
    "modules": [{"id": "m", "name": "Sample"}],
    "types": [
      {"id": "A", "kind": "class", "name": "A", "module": "m", "namespace": "One.Two"},
      {"id": "B", "kind": "struct", "name": "B", "module": "m", "namespace": "One"},
      {"id": "G", "kind": "interface", "name": "G", "module": "m"}
    ]
  })json");
  ASSERT_TRUE(result.success) << dump_errors(result);

  const ModuleSymbol * module = result.graph.target_module();
  ASSERT_NE(module, nullptr);
  EXPECT_EQ(module->version, "0.0.0.0");

  const NamespaceSymbol * global = module->global_namespace;
  ASSERT_NE(global, nullptr);
  EXPECT_TRUE(global->is_global());
  ASSERT_EQ(global->types.size(), 1U);
  EXPECT_EQ(global->types[0]->name, "G");

  ASSERT_EQ(global->namespaces.size(), 1U);
  const NamespaceSymbol * one = global->namespaces[0];
  EXPECT_EQ(one->full_name, "One");
  ASSERT_EQ(one->namespaces.size(), 1U);
  EXPECT_EQ(one->namespaces[0]->full_name, "One.Two");
  EXPECT_EQ(one->namespaces[0]->name, "Two");
  EXPECT_EQ(one->namespaces[0]->containing_namespace, one);
}

TEST(SymbolLoader, BuiltinsHaveNoModule)
{
  const auto result = load(R"json({
    "modules": [{"id": "m", "name": "Sample"}],
    "types": [{"id": "System.Object", "kind": "class", "name": "Object", "namespace": "System",
               "specialType": "System_Object"}]
  })json");
  ASSERT_TRUE(result.success) << dump_errors(result);

  ASSERT_EQ(result.graph.builtin_types().size(), 1U);
  const NamedTypeSymbol * object = result.graph.index().find_type("System.Object");
  ASSERT_NE(object, nullptr);
  EXPECT_EQ(object->containing_module, nullptr);
  EXPECT_EQ(object->special_type, "System_Object");
}

TEST(SymbolLoader, ReferencesMayPointForward)
{
  const auto result = load(R"json({
    "modules": [{"id": "m", "name": "Sample"}],
    "types": [
      {"id": "Derived", "kind": "class", "name": "Derived", "module": "m", "baseType": "Base",
       "members": [{"kind": "method", "name": "Run", "override": true, "overrides": "Base.Run"}]},
      {"id": "Base", "kind": "class", "name": "Base", "module": "m",
       "members": [{"id": "Base.Run", "kind": "method", "name": "Run", "virtual": true}]}
    ]
  })json");
  ASSERT_TRUE(result.success) << dump_errors(result);

  const NamedTypeSymbol * derived = result.graph.index().find_type("Derived");
  const NamedTypeSymbol * base = result.graph.index().find_type("Base");
  ASSERT_NE(derived, nullptr);
  ASSERT_NE(base, nullptr);
  EXPECT_EQ(derived->base_type, base);

  const auto * run = cast<MethodSymbol>(derived->members[0]);
  EXPECT_EQ(run->overridden_method, base->members[0]);
}

TEST(SymbolLoader, AccessorsFollowTheirProperty)
{
  const auto result = load(R"json({
    "modules": [{"id": "m", "name": "Sample"}],
    "types": [
      {"id": "System.Int32", "kind": "struct", "name": "Int32", "namespace": "System"},
      {"id": "System.EventHandler", "kind": "delegate", "name": "EventHandler", "namespace": "System"},
      {"id": "C", "kind": "class", "name": "C", "module": "m",
       "members": [
         {"kind": "property", "name": "Size", "type": "System.Int32", "static": true,
          "getter": true, "setter": {"accessibility": "private", "initOnly": true}},
         {"kind": "event", "name": "Changed", "type": "System.EventHandler"},
         {"kind": "field", "name": "raw", "type": "System.Int32"}
       ]}
    ]
  })json");
  ASSERT_TRUE(result.success) << dump_errors(result);

  const NamedTypeSymbol * c = result.graph.index().find_type("C");
  ASSERT_NE(c, nullptr);
  ASSERT_EQ(c->members.size(), 7U);

  const auto * size = cast<PropertySymbol>(c->members[0]);
  const auto * getter = dyn_cast<MethodSymbol>(c->members[1]);
  const auto * setter = dyn_cast<MethodSymbol>(c->members[2]);
  ASSERT_NE(getter, nullptr);
  ASSERT_NE(setter, nullptr);

  EXPECT_EQ(getter->name, "get_Size");
  EXPECT_EQ(getter->method_kind, MethodKind::PropertyGet);
  EXPECT_TRUE(getter->is_implicitly_declared);
  EXPECT_TRUE(getter->is_static);
  EXPECT_EQ(getter->accessibility, Accessibility::Public);
  EXPECT_EQ(size->get_method, getter);

  EXPECT_EQ(setter->name, "set_Size");
  EXPECT_EQ(setter->accessibility, Accessibility::Private);
  EXPECT_TRUE(setter->is_init_only);
  EXPECT_EQ(size->set_method, setter);

  // Events always get both accessors
  const auto * changed = cast<EventSymbol>(c->members[3]);
  EXPECT_EQ(c->members[4]->name, "add_Changed");
  EXPECT_EQ(c->members[5]->name, "remove_Changed");
  EXPECT_EQ(changed->add_method, c->members[4]);
  EXPECT_EQ(changed->remove_method, c->members[5]);

  EXPECT_EQ(c->members[6]->name, "raw");
}

TEST(SymbolLoader, ConstructedTypeInheritsFromDefinition)
{
  const auto result = load(R"json({
    "modules": [{"id": "m", "name": "Sample"}],
    "types": [
      {"id": "System.Int32", "kind": "struct", "name": "Int32", "namespace": "System"},
      {"id": "Numbers", "kind": "class", "name": "Numbers", "module": "m", "namespace": "Sample",
       "baseType": "List<int>"},
      {"id": "List<int>", "genericDefinition": "List`1", "typeArguments": ["System.Int32"]},
      {"id": "List`1", "kind": "class", "name": "List", "module": "m", "namespace": "Sample",
       "accessibility": "internal",
       "typeParameters": [{"id": "List.T", "name": "T", "variance": "in"}]}
    ]
  })json");
  ASSERT_TRUE(result.success) << dump_errors(result);

  const NamedTypeSymbol * definition = result.graph.index().find_type("Sample.List`1");
  const NamedTypeSymbol * numbers = result.graph.index().find_type("Sample.Numbers");
  ASSERT_NE(definition, nullptr);
  ASSERT_NE(numbers, nullptr);
  ASSERT_EQ(definition->type_parameters.size(), 1U);
  EXPECT_EQ(definition->type_parameters[0]->variance, VarianceKind::In);
  EXPECT_EQ(definition->type_parameters[0]->declaring_type, definition);

  const NamedTypeSymbol * constructed = numbers->base_type;
  ASSERT_NE(constructed, nullptr);
  EXPECT_TRUE(constructed->is_constructed());
  EXPECT_EQ(constructed->original_definition, definition);
  EXPECT_EQ(constructed->name, "List");
  EXPECT_EQ(constructed->containing_module, definition->containing_module);
  EXPECT_EQ(constructed->accessibility, Accessibility::Internal);
  ASSERT_EQ(constructed->type_parameters.size(), 1U);
  EXPECT_EQ(constructed->type_parameters[0], definition->type_parameters[0]);
  EXPECT_EQ(metadata_name(*constructed), "Sample.List`1[System.Int32]");

  // Only the definition is placed in the namespace tree
  const NamespaceSymbol * sample = result.graph.target_module()->global_namespace->namespaces[0];
  EXPECT_EQ(sample->types.size(), 2U);
  for (const NamedTypeSymbol * type : sample->types) {
    EXPECT_NE(type, constructed);
  }
}

TEST(SymbolLoader, ExplicitTargetAmongSeveralModules)
{
  const auto result = load(R"json({
    "targetModule": "lib",
    "modules": [{"id": "core", "name": "Core"}, {"id": "lib", "name": "Lib"}],
    "types": []
  })json");
  ASSERT_TRUE(result.success) << dump_errors(result);
  ASSERT_NE(result.graph.target_module(), nullptr);
  EXPECT_EQ(result.graph.target_module()->name, "Lib");
  EXPECT_EQ(result.graph.modules().size(), 2U);
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST(SymbolLoaderErrors, MalformedJson)
{
  const auto result = load(R"json({"modules": [)json");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_error(result, "L001", "")) << dump_errors(result);
  EXPECT_EQ(result.diagnostics.all()[0].location.file, "dump.json");
}

TEST(SymbolLoaderErrors, MissingFile)
{
  const auto result = load_symbol_file("/nonexistent/typegraph/dump.json");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_error(result, "L001", "")) << dump_errors(result);
}

TEST(SymbolLoaderErrors, UnsupportedFormatVersion)
{
  const auto result = load(R"json({"formatVersion": 2, "modules": [{"id": "m", "name": "M"}]})json");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_error(result, "L002", "/formatVersion")) << dump_errors(result);
  ASSERT_TRUE(result.diagnostics.all()[0].help_message.has_value());
}

TEST(SymbolLoaderErrors, MissingRequiredFields)
{
  EXPECT_TRUE(has_error(load(R"json({"types": []})json"), "L003", "/modules"));

  const auto result = load(R"json({
    "modules": [{"id": "m"}],
    "types": [
      {"id": "A", "name": "A"},
      {"id": "E", "kind": "array"},
      {"id": "C", "kind": "class", "name": "C",
       "members": [{"kind": "method", "name": "F", "parameters": [{"name": "x"}]}]}
    ]
  })json");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_error(result, "L003", "/modules/0/name")) << dump_errors(result);
  EXPECT_TRUE(has_error(result, "L003", "/types/0/kind")) << dump_errors(result);
  EXPECT_TRUE(has_error(result, "L003", "/types/1/elementType")) << dump_errors(result);
  EXPECT_TRUE(has_error(result, "L003", "/types/2/members/0/parameters/0/type"))
    << dump_errors(result);
}

TEST(SymbolLoaderErrors, WrongValueTypes)
{
  const auto result = load(R"json({
    "modules": [{"id": "m", "name": "M", "publicKeyToken": "abc"}],
    "types": [
      {"id": "C", "kind": "class", "name": "C", "abstract": "yes", "interfaces": "I"},
      42
    ]
  })json");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_error(result, "L004", "/modules/0/publicKeyToken")) << dump_errors(result);
  EXPECT_TRUE(has_error(result, "L004", "/types/0/abstract")) << dump_errors(result);
  EXPECT_TRUE(has_error(result, "L004", "/types/0/interfaces")) << dump_errors(result);
  EXPECT_TRUE(has_error(result, "L004", "/types/1")) << dump_errors(result);
}

TEST(SymbolLoaderErrors, UnknownEnumValues)
{
  const auto result = load(R"json({
    "modules": [{"id": "m", "name": "M"}],
    "types": [
      {"id": "U", "kind": "union", "name": "U"},
      {"id": "C", "kind": "class", "name": "C", "accessibility": "friend",
       "members": [
         {"kind": "method", "name": "F", "methodKind": "lambda"},
         {"kind": "indexer", "name": "G"}
       ]}
    ]
  })json");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_error(result, "L005", "/types/0/kind")) << dump_errors(result);
  EXPECT_TRUE(has_error(result, "L005", "/types/1/accessibility")) << dump_errors(result);
  EXPECT_TRUE(has_error(result, "L005", "/types/1/members/0/methodKind")) << dump_errors(result);
  EXPECT_TRUE(has_error(result, "L005", "/types/1/members/1/kind")) << dump_errors(result);
}

TEST(SymbolLoaderErrors, DuplicateIds)
{
  const auto result = load(R"json({
    "modules": [{"id": "m", "name": "M"}, {"id": "m", "name": "N"}],
    "types": [
      {"id": "C", "kind": "class", "name": "C", "module": "m"},
      {"id": "D", "kind": "class", "name": "D", "typeParameters": [{"id": "C", "name": "T"}]},
      {"id": "C", "kind": "class", "name": "E"}
    ]
  })json");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_error(result, "L006", "/modules/1/id")) << dump_errors(result);
  EXPECT_TRUE(has_error(result, "L006", "/types/1/typeParameters/0/id")) << dump_errors(result);
  EXPECT_TRUE(has_error(result, "L006", "/types/2/id")) << dump_errors(result);
}

TEST(SymbolLoaderErrors, UnknownIds)
{
  const auto result = load(R"json({
    "modules": [{"id": "m", "name": "M"}],
    "types": [
      {"id": "C", "kind": "class", "name": "C", "module": "nope"},
      {"id": "D", "kind": "class", "name": "D", "module": "m", "baseType": "Missing",
       "members": [{"kind": "method", "name": "F", "overrides": "Missing.F"}]}
    ]
  })json");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_error(result, "L007", "/types/0/module")) << dump_errors(result);
  EXPECT_TRUE(has_error(result, "L007", "/types/1/baseType")) << dump_errors(result);
  EXPECT_TRUE(has_error(result, "L007", "/types/1/members/0/overrides")) << dump_errors(result);
}

TEST(SymbolLoaderErrors, NoTargetModule)
{
  const auto several = load(R"json({
    "modules": [{"id": "a", "name": "A"}, {"id": "b", "name": "B"}]
  })json");
  EXPECT_FALSE(several.success);
  EXPECT_TRUE(has_error(several, "L008", "")) << dump_errors(several);
  EXPECT_EQ(several.graph.target_module(), nullptr);

  const auto unknown = load(R"json({
    "targetModule": "c",
    "modules": [{"id": "a", "name": "A"}]
  })json");
  EXPECT_FALSE(unknown.success);
  EXPECT_TRUE(has_error(unknown, "L007", "/targetModule")) << dump_errors(unknown);
}

TEST(SymbolLoaderErrors, NestingCycle)
{
  const auto result = load(R"json({
    "modules": [{"id": "m", "name": "M"}],
    "types": [
      {"id": "A", "kind": "class", "name": "A", "module": "m", "containingType": "B"},
      {"id": "B", "kind": "class", "name": "B", "module": "m", "containingType": "A"}
    ]
  })json");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_error(result, "L009", "/types/0/containingType")) << dump_errors(result);
}

TEST(SymbolLoaderErrors, ArrayOfItselfIsRejected)
{
  const auto result = load(R"json({
    "modules": [{"id": "m", "name": "M"}],
    "types": [{"id": "a", "kind": "array", "elementType": "a"}]
  })json");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_error(result, "L010", "/types/0")) << dump_errors(result);
}

TEST(SymbolLoaderErrors, PointerArrayCycleIsRejected)
{
  const auto result = load(R"json({
    "modules": [{"id": "m", "name": "M"}],
    "types": [
      {"id": "p", "kind": "pointer", "pointedAtType": "q"},
      {"id": "q", "kind": "array", "elementType": "p"}
    ]
  })json");
  EXPECT_FALSE(result.success);
  ASSERT_TRUE(has_error(result, "L010", "/types/0")) << dump_errors(result);

  const auto & errors = result.diagnostics.all();
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0].help_message.value_or(""), "reference chain: /types/0 -> /types/1 -> /types/0");
}

TEST(SymbolLoaderErrors, TypeArgumentCycleIsRejected)
{
  const auto result = load(R"json({
    "modules": [{"id": "m", "name": "M"}],
    "types": [
      {"id": "Box`1", "kind": "class", "name": "Box", "module": "m",
       "typeParameters": [{"id": "Box.T", "name": "T"}]},
      {"id": "Box<a>", "genericDefinition": "Box`1", "typeArguments": ["a"]},
      {"id": "a", "kind": "array", "elementType": "Box<a>"}
    ]
  })json");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_error(result, "L010", "/types/1")) << dump_errors(result);
}

TEST(SymbolLoader, SelfReferenceThroughMembersIsAccepted)
{
  const auto result = load(R"json({
    "modules": [{"id": "m", "name": "M"}],
    "types": [
      {"id": "Node`1", "kind": "class", "name": "Node", "module": "m",
       "typeParameters": [{"id": "Node.T", "name": "T"}],
       "members": [{"kind": "field", "name": "next", "type": "Node<T>"},
                   {"kind": "field", "name": "all", "type": "nodes"}]},
      {"id": "Node<T>", "genericDefinition": "Node`1", "typeArguments": ["Node.T"]},
      {"id": "nodes", "kind": "array", "elementType": "Node<T>"}
    ]
  })json");
  EXPECT_TRUE(result.success) << dump_errors(result);
}

TEST(SymbolLoaderErrors, ErrorsDoNotStopLaterChecks)
{
  const auto result = load(R"json({
    "modules": [{"id": "m", "name": "M"}],
    "types": [
      {"id": "A", "kind": "class", "name": "A", "baseType": "X"},
      {"id": "B", "kind": "class", "name": "B", "baseType": "Y"}
    ]
  })json");
  EXPECT_EQ(result.diagnostics.size(), 2U);
}
