// tests/unit/extraction/test_inclusion_policy.cpp - Visibility filter tests

#include <gtest/gtest.h>

#include "typegraph/extraction/inclusion_policy.hpp"
#include "typegraph/symbols/symbol_context.hpp"

using namespace typegraph;

namespace
{

const FieldSymbol & make_field(SymbolContext & ctx, Accessibility accessibility, bool implicit = false)
{
  auto * field = ctx.create<FieldSymbol>();
  field->name = ctx.intern("f");
  field->accessibility = accessibility;
  field->is_implicitly_declared = implicit;
  return *field;
}

}  // namespace

TEST(InclusionPolicy, DefaultOptions)
{
  SymbolContext ctx;
  const ExtractionOptions options;

  EXPECT_TRUE(is_included(make_field(ctx, Accessibility::Public), options));
  EXPECT_TRUE(is_included(make_field(ctx, Accessibility::Protected), options));
  EXPECT_TRUE(is_included(make_field(ctx, Accessibility::ProtectedOrInternal), options));
  EXPECT_TRUE(is_included(make_field(ctx, Accessibility::Internal), options));
  EXPECT_TRUE(is_included(make_field(ctx, Accessibility::ProtectedAndInternal), options));
  EXPECT_TRUE(is_included(make_field(ctx, Accessibility::NotApplicable), options));
  EXPECT_FALSE(is_included(make_field(ctx, Accessibility::Private), options));
}

TEST(InclusionPolicy, InternalCanBeExcluded)
{
  SymbolContext ctx;
  ExtractionOptions options;
  options.include_internal = false;

  EXPECT_FALSE(is_included(make_field(ctx, Accessibility::Internal), options));
  EXPECT_FALSE(is_included(make_field(ctx, Accessibility::ProtectedAndInternal), options));
  EXPECT_TRUE(is_included(make_field(ctx, Accessibility::ProtectedOrInternal), options));
}

TEST(InclusionPolicy, PrivateOnRequest)
{
  SymbolContext ctx;
  ExtractionOptions options;
  options.include_private = true;

  EXPECT_TRUE(is_included(make_field(ctx, Accessibility::Private), options));
}

TEST(InclusionPolicy, CompilerGeneratedNeedsFlagRegardlessOfAccessibility)
{
  SymbolContext ctx;
  ExtractionOptions options;

  const auto & generated = make_field(ctx, Accessibility::Public, true);
  EXPECT_FALSE(is_included(generated, options));

  options.include_compiler_generated = true;
  EXPECT_TRUE(is_included(generated, options));

  // The flag does not lift the private filter
  EXPECT_FALSE(is_included(make_field(ctx, Accessibility::Private, true), options));
}
