// tests/unit/model/test_iri_minter.cpp - Identifier minting tests

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "typegraph/model/iri_minter.hpp"
#include "typegraph/symbols/symbol_context.hpp"

using namespace typegraph;

namespace
{

/// A tiny hand-built symbol forest: Sample 1.0.0.0 { Acme.Tools.Widget }
class IriMinterTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    module_ = ctx_.create<ModuleSymbol>();
    module_->name = ctx_.intern("Sample");
    module_->version = ctx_.intern("1.0.0.0");

    global_ = ctx_.create<NamespaceSymbol>();
    global_->containing_module = module_;

    acme_ = make_namespace("Acme", "Acme", global_);
    tools_ = make_namespace("Tools", "Acme.Tools", acme_);

    int32_ = make_builtin("Int32");
    string_ = make_builtin("String");

    widget_ = ctx_.create<NamedTypeSymbol>();
    widget_->name = ctx_.intern("Widget");
    widget_->containing_module = module_;
    widget_->containing_namespace = tools_;
  }

  NamespaceSymbol * make_namespace(
    std::string_view name, std::string_view full_name, const NamespaceSymbol * parent)
  {
    auto * ns = ctx_.create<NamespaceSymbol>();
    ns->name = ctx_.intern(name);
    ns->full_name = ctx_.intern(full_name);
    ns->containing_module = module_;
    ns->containing_namespace = parent;
    return ns;
  }

  NamedTypeSymbol * make_builtin(std::string_view name)
  {
    auto * system = ctx_.create<NamespaceSymbol>();
    system->name = ctx_.intern("System");
    system->full_name = system->name;
    system->containing_namespace = ctx_.create<NamespaceSymbol>();

    auto * type = ctx_.create<NamedTypeSymbol>();
    type->name = ctx_.intern(name);
    type->containing_namespace = system;
    return type;
  }

  ParameterSymbol * make_parameter(
    const MemberSymbol & owner, int32_t ordinal, const TypeSymbol & type, RefKind ref_kind)
  {
    auto * param = ctx_.create<ParameterSymbol>();
    param->name = ctx_.intern("p");
    param->ordinal = ordinal;
    param->containing_symbol = &owner;
    param->type = &type;
    param->ref_kind = ref_kind;
    return param;
  }

  SymbolContext ctx_;
  IriMinter iris_;

  ModuleSymbol * module_ = nullptr;
  NamespaceSymbol * global_ = nullptr;
  NamespaceSymbol * acme_ = nullptr;
  NamespaceSymbol * tools_ = nullptr;
  NamedTypeSymbol * int32_ = nullptr;
  NamedTypeSymbol * string_ = nullptr;
  NamedTypeSymbol * widget_ = nullptr;
};

}  // namespace

// ============================================================================
// Escaping
// ============================================================================

TEST(IriEscape, PercentEncodesEverythingButUnreserved)
{
  EXPECT_EQ(IriMinter::escape("a b/\xC3\xBC"), "a%20b%2F%C3%BC");
  EXPECT_EQ(IriMinter::escape("Az09-_.~"), "Az09-_.~");
  EXPECT_EQ(IriMinter::escape("List`1[T],(x)+"), "List%601%5BT%5D%2C%28x%29%2B");
  EXPECT_EQ(IriMinter::escape(""), "");
}

TEST(IriEscape, BaseUriTrailingSlashesAreTrimmed)
{
  EXPECT_EQ(IriMinter("http://example.org//").base_uri(), "http://example.org");
  EXPECT_EQ(IriMinter().base_uri(), "http://dotnet.example");
  EXPECT_EQ(IriMinter("http://example.org").platform_ontology_iri(), "http://example.org/ontology/");
}

// ============================================================================
// Modules, Namespaces, Types
// ============================================================================

TEST_F(IriMinterTest, ModuleAndNamespaceIris)
{
  EXPECT_EQ(iris_.module_iri(*module_), "http://dotnet.example/assembly/Sample/1.0.0.0");
  EXPECT_EQ(iris_.namespace_iri(*global_), "http://dotnet.example/namespace/_global_");
  EXPECT_EQ(iris_.namespace_iri(*tools_), "http://dotnet.example/namespace/Acme.Tools");
}

TEST_F(IriMinterTest, TypeIrisSeparateModulesFromBuiltins)
{
  EXPECT_EQ(
    iris_.type_iri(*widget_), "http://dotnet.example/type/Sample/1.0.0.0/Acme.Tools.Widget");
  EXPECT_EQ(iris_.type_iri(*int32_), "http://dotnet.example/type/_builtin_/System.Int32");

  auto * jagged = ctx_.create<ArrayTypeSymbol>();
  jagged->element_type = string_;
  jagged->rank = 3;
  EXPECT_EQ(
    iris_.type_iri(*jagged), "http://dotnet.example/type/_builtin_/System.String%5B%2C%2C%5D");
}

TEST_F(IriMinterTest, ArrayRankIsPartOfTheIri)
{
  auto * vector = ctx_.create<ArrayTypeSymbol>();
  vector->element_type = int32_;

  auto * matrix = ctx_.create<ArrayTypeSymbol>();
  matrix->element_type = int32_;
  matrix->rank = 2;

  EXPECT_EQ(iris_.type_iri(*vector), "http://dotnet.example/type/_builtin_/System.Int32%5B%5D");
  EXPECT_EQ(iris_.type_iri(*matrix), "http://dotnet.example/type/_builtin_/System.Int32%5B%2C%5D");
  EXPECT_NE(iris_.type_iri(*vector), iris_.type_iri(*matrix));
}

TEST_F(IriMinterTest, NestedTypeUsesPlus)
{
  auto * inner = ctx_.create<NamedTypeSymbol>();
  inner->name = ctx_.intern("Part");
  inner->containing_module = module_;
  inner->containing_namespace = tools_;
  inner->containing_type = widget_;

  EXPECT_EQ(
    iris_.type_iri(*inner), "http://dotnet.example/type/Sample/1.0.0.0/Acme.Tools.Widget%2BPart");
}

TEST_F(IriMinterTest, MintingIsDeterministic)
{
  const IriMinter other;
  EXPECT_EQ(iris_.type_iri(*widget_), other.type_iri(*widget_));
  EXPECT_EQ(iris_.type_iri(*widget_), iris_.type_iri(*widget_));
}

// ============================================================================
// Members and Signatures
// ============================================================================

TEST_F(IriMinterTest, MethodSignatureCarriesRefKindsAndArrays)
{
  auto * strings = ctx_.create<ArrayTypeSymbol>();
  strings->element_type = string_;

  auto * method = ctx_.create<MethodSymbol>();
  method->name = ctx_.intern("Parse");
  method->containing_type = widget_;
  const std::vector<const ParameterSymbol *> params{
    make_parameter(*method, 0, *int32_, RefKind::Ref),
    make_parameter(*method, 1, *strings, RefKind::None),
  };
  method->parameters = ctx_.copy_to_arena(params);

  EXPECT_EQ(IriMinter::member_signature(*method), "(ref System.Int32,System.String[])");
  EXPECT_EQ(
    iris_.member_iri(*method),
    "http://dotnet.example/type/Sample/1.0.0.0/Acme.Tools.Widget/member/"
    "Parse%28ref%20System.Int32%2CSystem.String%5B%5D%29");
  EXPECT_EQ(iris_.parameter_iri(*params[1]), iris_.member_iri(*method) + "/param/1");
}

TEST_F(IriMinterTest, FieldsAndPlainPropertiesHaveNoSignature)
{
  auto * field = ctx_.create<FieldSymbol>();
  field->name = ctx_.intern("count");
  field->containing_type = widget_;
  EXPECT_EQ(IriMinter::member_signature(*field), "");
  EXPECT_EQ(iris_.member_iri(*field), iris_.type_iri(*widget_) + "/member/count");

  auto * indexer = ctx_.create<PropertySymbol>();
  indexer->name = ctx_.intern("Item");
  indexer->containing_type = widget_;
  const std::vector<const ParameterSymbol *> params{
    make_parameter(*indexer, 0, *int32_, RefKind::None),
    make_parameter(*indexer, 1, *string_, RefKind::None),
  };
  indexer->parameters = ctx_.copy_to_arena(params);
  EXPECT_EQ(IriMinter::member_signature(*indexer), "[System.Int32,System.String]");
}

TEST_F(IriMinterTest, MemberWithoutContainingTypeIsRejected)
{
  auto * orphan = ctx_.create<MethodSymbol>();
  orphan->name = ctx_.intern("Lost");
  EXPECT_THROW((void)iris_.member_iri(*orphan), std::invalid_argument);
}

// ============================================================================
// Type Parameters and Attributes
// ============================================================================

TEST_F(IriMinterTest, TypeParameterOwners)
{
  auto * tp = ctx_.create<TypeParameterSymbol>();
  tp->name = ctx_.intern("T");
  tp->ordinal = 1;

  EXPECT_EQ(iris_.type_parameter_iri(*widget_, *tp), iris_.type_iri(*widget_) + "/typeparam/1");

  auto * method = ctx_.create<MethodSymbol>();
  method->name = ctx_.intern("Map");
  method->containing_type = widget_;
  EXPECT_EQ(
    iris_.type_parameter_iri(*method, *tp), iris_.member_iri(*method) + "/typeparam/1");

  auto * field = ctx_.create<FieldSymbol>();
  field->name = ctx_.intern("count");
  field->containing_type = widget_;
  EXPECT_THROW((void)iris_.type_parameter_iri(*field, *tp), std::invalid_argument);
}

TEST_F(IriMinterTest, AttributeTargets)
{
  EXPECT_EQ(iris_.attribute_iri(*module_, 0), iris_.module_iri(*module_) + "/attr/0");
  EXPECT_EQ(iris_.attribute_iri(*widget_, 2), iris_.type_iri(*widget_) + "/attr/2");

  auto * method = ctx_.create<MethodSymbol>();
  method->name = ctx_.intern("Run");
  method->containing_type = widget_;
  const ParameterSymbol * param = make_parameter(*method, 0, *int32_, RefKind::None);
  EXPECT_EQ(iris_.attribute_iri(*param, 1), iris_.parameter_iri(*param) + "/attr/1");

  EXPECT_THROW((void)iris_.attribute_iri(*tools_, 0), std::invalid_argument);
}
