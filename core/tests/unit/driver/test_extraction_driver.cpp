// tests/unit/driver/test_extraction_driver.cpp - Load/extract/write pipeline tests

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "typegraph/driver/extraction_driver.hpp"
#include "typegraph/loader/symbol_loader.hpp"

using namespace typegraph;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

constexpr const char * k_dump = R"json({
  "formatVersion": 1,
  "modules": [
    {"id": "app", "name": "Sample", "version": "1.0.0.0"},
    {"id": "lib", "name": "Sample.Core", "version": "2.0.0.0"}
  ],
  "targetModule": "app",
  "types": [
    {"id": "System.Int32", "kind": "struct", "name": "Int32", "namespace": "System"},
    {"id": "a1", "kind": "array", "elementType": "System.Int32"},
    {"id": "a2", "kind": "array", "elementType": "a1"},
    {"id": "Widget", "kind": "class", "name": "Widget", "module": "app", "namespace": "Sample",
     "members": [{"kind": "field", "name": "cells", "type": "a2"}]},
    {"id": "Engine", "kind": "class", "name": "Engine", "module": "lib", "namespace": "Sample.Core"}
  ]
})json";

std::filesystem::path write_dump(const TempDir & dir)
{
  const auto path = dir.path / "sample.json";
  std::ofstream f(path);
  f << k_dump;
  return path;
}

std::string read_file(const std::filesystem::path & path)
{
  std::ifstream f(path);
  std::stringstream buffer;
  buffer << f.rdbuf();
  return buffer.str();
}

bool has_code(const DiagnosticBag & diags, std::string_view code)
{
  for (const auto & d : diags) {
    if (d.code == code) {
      return true;
    }
  }
  return false;
}

}  // namespace

// ============================================================================
// Option Resolution
// ============================================================================

TEST(ExtractionDriverOptions, FormatFromFlagThenExtension)
{
  RunOptions options;
  options.input = "dump.json";
  EXPECT_EQ(ExtractionDriver::resolve_format(options), OutputFormat::NTriples);

  options.output = "graph.ttl";
  EXPECT_EQ(ExtractionDriver::resolve_format(options), OutputFormat::Turtle);

  options.output = "graph.unknown";
  EXPECT_EQ(ExtractionDriver::resolve_format(options), OutputFormat::NTriples);

  options.output = "graph.ttl";
  options.format = OutputFormat::NTriples;
  EXPECT_EQ(ExtractionDriver::resolve_format(options), OutputFormat::NTriples);
}

TEST(ExtractionDriverOptions, OutputPathDefaultsNextToInput)
{
  RunOptions options;
  options.input = std::filesystem::path("dumps") / "sample.json";
  EXPECT_EQ(
    ExtractionDriver::resolve_output_path(options, OutputFormat::NTriples),
    std::filesystem::path("dumps") / "sample.nt");
  EXPECT_EQ(
    ExtractionDriver::resolve_output_path(options, OutputFormat::Turtle),
    std::filesystem::path("dumps") / "sample.ttl");

  options.output = "custom.out";
  EXPECT_EQ(
    ExtractionDriver::resolve_output_path(options, OutputFormat::Turtle),
    std::filesystem::path("custom.out"));
}

// ============================================================================
// Pipeline
// ============================================================================

TEST(ExtractionDriver, WritesNTriplesNextToInput)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "typegraph_driver_nt");
  RunOptions options;
  options.input = write_dump(dir);

  const RunResult result = ExtractionDriver::run(options);
  ASSERT_TRUE(result.success);
  ASSERT_TRUE(result.output_file.has_value());
  EXPECT_EQ(*result.output_file, dir.path / "sample.nt");
  EXPECT_EQ(result.stats.types_extracted, 1U);
  EXPECT_GT(result.stats.facts_emitted, 0);

  const std::string text = read_file(*result.output_file);
  EXPECT_NE(text.find("# @prefix tg: <http://typegraph.example/ontology/> ."), std::string::npos);
  EXPECT_NE(text.find("\"Widget\""), std::string::npos);
  EXPECT_EQ(text.find("\"Engine\""), std::string::npos);
}

TEST(ExtractionDriver, WritesTurtleByExtension)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "typegraph_driver_ttl");
  RunOptions options;
  options.input = write_dump(dir);
  options.output = dir.path / "out" / "graph.ttl";

  const RunResult result = ExtractionDriver::run(options);
  ASSERT_TRUE(result.success);
  ASSERT_TRUE(std::filesystem::exists(dir.path / "out" / "graph.ttl"));

  const std::string text = read_file(dir.path / "out" / "graph.ttl");
  EXPECT_EQ(text.rfind("@prefix rdf: ", 0), 0U);
  EXPECT_NE(text.find("@prefix tg: "), std::string::npos);
}

TEST(ExtractionDriver, TargetOverrideSelectsModuleByName)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "typegraph_driver_override");
  RunOptions options;
  options.input = write_dump(dir);
  options.target_module = "Sample.Core";

  const RunResult result = ExtractionDriver::run(options);
  ASSERT_TRUE(result.success);

  const std::string text = read_file(*result.output_file);
  EXPECT_NE(text.find("\"Engine\""), std::string::npos);
  EXPECT_EQ(text.find("\"Widget\""), std::string::npos);
}

TEST(ExtractionDriver, CheckModeWritesNothing)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "typegraph_driver_check");
  RunOptions options;
  options.mode = RunMode::Check;
  options.input = write_dump(dir);

  const RunResult result = ExtractionDriver::run(options);
  EXPECT_TRUE(result.success);
  EXPECT_FALSE(result.output_file.has_value());
  EXPECT_FALSE(std::filesystem::exists(dir.path / "sample.nt"));
}

// ============================================================================
// Failures
// ============================================================================

TEST(ExtractionDriverErrors, MissingInputReportsLoaderError)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "typegraph_driver_missing");
  RunOptions options;
  options.input = dir.path / "absent.json";

  const RunResult result = ExtractionDriver::run(options);
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_code(result.diagnostics, "L001"));
  EXPECT_FALSE(std::filesystem::exists(dir.path / "absent.nt"));
}

TEST(ExtractionDriverErrors, UnknownTargetListsModules)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "typegraph_driver_target");
  RunOptions options;
  options.input = write_dump(dir);
  options.target_module = "Nope";

  const RunResult result = ExtractionDriver::run(options);
  EXPECT_FALSE(result.success);
  ASSERT_TRUE(has_code(result.diagnostics, "D002"));

  const auto & errors = result.diagnostics.all();
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0].help_message.value_or(""), "available modules: Sample, Sample.Core");
}

TEST(ExtractionDriverErrors, FailedExtractionLeavesNoFile)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "typegraph_driver_depth");
  RunOptions options;
  options.input = write_dump(dir);
  options.extraction.max_type_depth = 1;

  const RunResult result = ExtractionDriver::run(options);
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_code(result.diagnostics, "D004"));
  EXPECT_FALSE(result.output_file.has_value());
  EXPECT_FALSE(std::filesystem::exists(dir.path / "sample.nt"));
}

TEST(ExtractionDriverErrors, UnwritableOutputIsReported)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "typegraph_driver_unwritable");
  RunOptions options;
  options.input = write_dump(dir);
  options.output = dir.path;  // a directory

  const RunResult result = ExtractionDriver::run(options);
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_code(result.diagnostics, "D003"));
}

// ============================================================================
// Streams
// ============================================================================

TEST(ExtractionDriverStream, ExtractsIntoStream)
{
  const auto loaded = load_symbol_json(k_dump, "sample.json");
  ASSERT_TRUE(loaded.success);

  std::ostringstream out;
  DiagnosticBag diags;
  const auto stats = ExtractionDriver::extract_to_stream(
    loaded.graph, *loaded.graph.target_module(), ExtractionOptions{}, OutputFormat::Turtle, out,
    diags);
  ASSERT_TRUE(stats.has_value());
  EXPECT_TRUE(diags.empty());
  EXPECT_EQ(stats->types_extracted, 1U);
  EXPECT_NE(out.str().find("@prefix dotnet: <http://dotnet.example/ontology/> ."), std::string::npos);
}

TEST(ExtractionDriverStream, ExtractionErrorBecomesDiagnostic)
{
  const auto loaded = load_symbol_json(k_dump, "sample.json");
  ASSERT_TRUE(loaded.success);

  ExtractionOptions options;
  options.max_type_depth = 1;

  std::ostringstream out;
  DiagnosticBag diags;
  const auto stats = ExtractionDriver::extract_to_stream(
    loaded.graph, *loaded.graph.target_module(), options, OutputFormat::NTriples, out, diags);
  EXPECT_FALSE(stats.has_value());
  ASSERT_TRUE(diags.has_errors());
  EXPECT_EQ(diags.all()[0].code, "D004");
}
