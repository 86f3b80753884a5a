// tests/unit/symbols/test_symbol_display.cpp - Metadata names, display strings and the name index

#include <gtest/gtest.h>

#include <vector>

#include "typegraph/loader/symbol_loader.hpp"
#include "typegraph/symbols/symbol_context.hpp"
#include "typegraph/symbols/symbol_display.hpp"
#include "typegraph/symbols/symbol_enums.hpp"

using namespace typegraph;

namespace
{

constexpr const char * k_dump = R"json({
  "modules": [{"id": "m", "name": "Sample", "version": "1.0.0.0"}],
  "types": [
    {"id": "System.Int32", "kind": "struct", "name": "Int32", "namespace": "System"},
    {"id": "System.String", "kind": "class", "name": "String", "namespace": "System"},
    {"id": "Outer`1", "kind": "class", "name": "Outer", "module": "m", "namespace": "Sample",
     "typeParameters": [{"id": "Outer.T", "name": "T"}]},
    {"id": "Inner`2", "kind": "class", "name": "Inner", "module": "m", "containingType": "Outer`1",
     "typeParameters": [{"id": "Inner.K", "name": "K"}, {"id": "Inner.V", "name": "V"}]},
    {"id": "Outer<T>", "genericDefinition": "Outer`1", "typeArguments": ["Outer.T"]},
    {"id": "Outer<>", "genericDefinition": "Outer`1", "typeArguments": ["Outer.T"], "unbound": true},
    {"id": "Outer<int>", "genericDefinition": "Outer`1", "typeArguments": ["System.Int32"]},
    {"id": "int[,]", "kind": "array", "elementType": "System.Int32", "rank": 2},
    {"id": "int*", "kind": "pointer", "pointedAtType": "System.Int32"},
    {"id": "Holder", "kind": "class", "name": "Holder", "module": "m", "namespace": "Sample",
     "members": [
       {"kind": "field", "name": "a", "type": "Outer<T>"},
       {"kind": "field", "name": "b", "type": "Outer<>"},
       {"kind": "field", "name": "c", "type": "Outer<int>"},
       {"kind": "field", "name": "d", "type": "int[,]"},
       {"kind": "field", "name": "e", "type": "int*"},
       {"kind": "method", "name": "Swap", "typeParameters": [{"id": "Swap.U", "name": "U"}],
        "parameters": [{"name": "x", "type": "Swap.U", "refKind": "ref"},
                       {"name": "y", "type": "System.String", "refKind": "out"}]}
     ]},
    {"id": "Named", "kind": "class", "name": "Named", "module": "m", "displayName": "Sample.Named<Custom>"}
  ]
})json";

const TypeSymbol & field_type(const SymbolLoadResult & loaded, size_t index)
{
  const NamedTypeSymbol * holder = loaded.graph.index().find_type("Sample.Holder");
  return *cast<FieldSymbol>(holder->members[index])->type;
}

}  // namespace

// ============================================================================
// metadata_name
// ============================================================================

TEST(SymbolDisplay, NestedGenericMetadataName)
{
  const auto loaded = load_symbol_json(k_dump, "display.json");
  ASSERT_TRUE(loaded.success);

  const NamedTypeSymbol * inner = loaded.graph.index().find_type("Sample.Outer`1+Inner`2");
  ASSERT_NE(inner, nullptr);
  EXPECT_EQ(metadata_name(*inner), "Sample.Outer`1+Inner`2");
  EXPECT_EQ(display_string(*inner), "Sample.Outer<T>.Inner<K, V>");
}

TEST(SymbolDisplay, ConstructedMetadataNames)
{
  const auto loaded = load_symbol_json(k_dump, "display.json");
  ASSERT_TRUE(loaded.success);
  ASSERT_NE(loaded.graph.index().find_type("Sample.Holder"), nullptr);

  // Arguments that are all type parameters collapse onto the definition
  EXPECT_EQ(metadata_name(field_type(loaded, 0)), "Sample.Outer`1");
  EXPECT_EQ(metadata_name(field_type(loaded, 1)), "Sample.Outer`1");
  EXPECT_EQ(metadata_name(field_type(loaded, 2)), "Sample.Outer`1[System.Int32]");
}

TEST(SymbolDisplay, ArrayAndPointerNames)
{
  const auto loaded = load_symbol_json(k_dump, "display.json");
  ASSERT_TRUE(loaded.success);

  EXPECT_EQ(metadata_name(field_type(loaded, 3)), "System.Int32[,]");
  EXPECT_EQ(display_string(field_type(loaded, 3)), "System.Int32[,]");
  EXPECT_EQ(metadata_name(field_type(loaded, 4)), "System.Int32*");
}

TEST(SymbolDisplay, TypeParameterNamesIncludeOwner)
{
  const auto loaded = load_symbol_json(k_dump, "display.json");
  ASSERT_TRUE(loaded.success);

  const NamedTypeSymbol * outer = loaded.graph.index().find_type("Sample.Outer`1");
  ASSERT_NE(outer, nullptr);
  EXPECT_EQ(metadata_name(*outer->type_parameters[0]), "T:Sample.Outer`1.T");
  EXPECT_EQ(display_string(*outer->type_parameters[0]), "T");

  const auto * swap = cast<MethodSymbol>(
    loaded.graph.index().find_type("Sample.Holder")->members[5]);
  EXPECT_EQ(
    metadata_name(*swap->type_parameters[0]),
    "T:Sample.Holder.Swap<U>(ref U, out System.String).U");
}

// ============================================================================
// display_string
// ============================================================================

TEST(SymbolDisplay, GenericDisplayStrings)
{
  const auto loaded = load_symbol_json(k_dump, "display.json");
  ASSERT_TRUE(loaded.success);

  EXPECT_EQ(display_string(field_type(loaded, 0)), "Sample.Outer<T>");
  EXPECT_EQ(display_string(field_type(loaded, 1)), "Sample.Outer<>");
  EXPECT_EQ(display_string(field_type(loaded, 2)), "Sample.Outer<System.Int32>");
}

TEST(SymbolDisplay, ExplicitDisplayNameWins)
{
  const auto loaded = load_symbol_json(k_dump, "display.json");
  ASSERT_TRUE(loaded.success);

  const NamedTypeSymbol * named = loaded.graph.index().find_type("Named");
  ASSERT_NE(named, nullptr);
  EXPECT_EQ(display_string(*named), "Sample.Named<Custom>");
  EXPECT_EQ(metadata_name(*named), "Named");
}

TEST(SymbolDisplay, MethodDisplayString)
{
  const auto loaded = load_symbol_json(k_dump, "display.json");
  ASSERT_TRUE(loaded.success);

  const auto * swap = cast<MethodSymbol>(
    loaded.graph.index().find_type("Sample.Holder")->members[5]);
  EXPECT_EQ(display_string(*swap), "Sample.Holder.Swap<U>(ref U, out System.String)");
}

TEST(SymbolDisplay, RefKindPrefixes)
{
  EXPECT_EQ(ref_kind_prefix(RefKind::None), "");
  EXPECT_EQ(ref_kind_prefix(RefKind::Ref), "ref ");
  EXPECT_EQ(ref_kind_prefix(RefKind::Out), "out ");
  EXPECT_EQ(ref_kind_prefix(RefKind::In), "in ");
}

// ============================================================================
// Enum Spellings
// ============================================================================

TEST(SymbolEnums, DumpSpellingParses)
{
  EXPECT_EQ(parse_accessibility("protectedOrInternal"), Accessibility::ProtectedOrInternal);
  EXPECT_EQ(parse_accessibility("notApplicable"), Accessibility::NotApplicable);
  EXPECT_EQ(parse_method_kind("staticConstructor"), MethodKind::StaticConstructor);
  EXPECT_EQ(parse_ref_kind("out"), RefKind::Out);
  EXPECT_EQ(parse_variance("in"), VarianceKind::In);

  EXPECT_FALSE(parse_accessibility("Public").has_value());
  EXPECT_FALSE(parse_method_kind("").has_value());
  EXPECT_FALSE(parse_variance("covariant").has_value());
}

TEST(SymbolEnums, FactSpellingIsPascalCase)
{
  EXPECT_EQ(to_string(Accessibility::ProtectedAndInternal), "ProtectedAndInternal");
  EXPECT_EQ(to_string(TypeKind::Delegate), "Delegate");
  EXPECT_EQ(to_string(MethodKind::UserDefinedOperator), "UserDefinedOperator");
  EXPECT_EQ(to_string(RefKind::None), "None");
  EXPECT_EQ(to_string(VarianceKind::Out), "Out");
}

// ============================================================================
// SymbolIndex
// ============================================================================

TEST(SymbolIndex, TargetModuleShadowsOtherModules)
{
  const auto loaded = load_symbol_json(R"json({
    "targetModule": "app",
    "modules": [{"id": "lib", "name": "Lib"}, {"id": "app", "name": "App"}],
    "types": [
      {"id": "LibDup", "kind": "class", "name": "Dup", "module": "lib", "namespace": "Shared"},
      {"id": "AppDup", "kind": "class", "name": "Dup", "module": "app", "namespace": "Shared"},
      {"id": "BuiltinDup", "kind": "class", "name": "Dup", "namespace": "Shared"},
      {"id": "LibOnly", "kind": "class", "name": "Only", "module": "lib"}
    ]
  })json", "index.json");
  ASSERT_TRUE(loaded.success);

  const NamedTypeSymbol * dup = loaded.graph.index().find_type("Shared.Dup");
  ASSERT_NE(dup, nullptr);
  ASSERT_NE(dup->containing_module, nullptr);
  EXPECT_EQ(dup->containing_module->name, "App");

  const NamedTypeSymbol * only = loaded.graph.index().find_type("Only");
  ASSERT_NE(only, nullptr);
  EXPECT_EQ(only->containing_module->name, "Lib");

  EXPECT_EQ(loaded.graph.index().find_type("Shared.Missing"), nullptr);
  EXPECT_EQ(loaded.graph.index().size(), 2U);
}

TEST(SymbolIndex, FindMembersKeepsDeclarationOrder)
{
  SymbolContext ctx;
  auto * type = ctx.create<NamedTypeSymbol>();
  type->name = ctx.intern("C");

  auto * first = ctx.create<MethodSymbol>();
  first->name = ctx.intern("Run");
  auto * other = ctx.create<FieldSymbol>();
  other->name = ctx.intern("run");
  auto * second = ctx.create<MethodSymbol>();
  second->name = ctx.intern("Run");

  const std::vector<const MemberSymbol *> members{first, other, second};
  type->members = ctx.copy_to_arena(members);

  const auto found = SymbolIndex::find_members(*type, "Run");
  ASSERT_EQ(found.size(), 2U);
  EXPECT_EQ(found[0], first);
  EXPECT_EQ(found[1], second);
  EXPECT_TRUE(SymbolIndex::find_members(*type, "Stop").empty());
}
