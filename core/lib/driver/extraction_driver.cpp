// typegraph/driver/extraction_driver.cpp - Extraction driver implementation
//
#include "typegraph/driver/extraction_driver.hpp"

#include <fmt/core.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "typegraph/loader/symbol_loader.hpp"

namespace typegraph
{

namespace
{

constexpr const char * k_code_no_target = "D001";
constexpr const char * k_code_unknown_target = "D002";
constexpr const char * k_code_output = "D003";
constexpr const char * k_code_extraction = "D004";

const ModuleSymbol * select_target(
  const SymbolGraph & graph, const RunOptions & options, DiagnosticBag & diags)
{
  if (options.target_module) {
    const ModuleSymbol * module = graph.find_module(*options.target_module);
    if (module == nullptr) {
      std::vector<std::string_view> names;
      for (const ModuleSymbol * m : graph.modules()) {
        names.push_back(m->name);
      }
      diags
        .report_error(
          SymbolLocation{options.input.string(), ""},
          fmt::format("no module named '{}' in symbol dump", *options.target_module))
        .with_code(k_code_unknown_target)
        .with_help(fmt::format("available modules: {}", fmt::join(names, ", ")));
    }
    return module;
  }

  if (graph.target_module() == nullptr) {
    diags
      .report_error(SymbolLocation{options.input.string(), ""}, "no target module selected")
      .with_code(k_code_no_target)
      .with_help("pass --target <module-name>");
  }
  return graph.target_module();
}

}  // namespace

// ============================================================================
// Option Resolution
// ============================================================================

OutputFormat ExtractionDriver::resolve_format(const RunOptions & options)
{
  if (options.format) {
    return *options.format;
  }
  if (options.output && options.output->has_extension()) {
    const std::string ext = options.output->extension().string().substr(1);
    if (const auto format = parse_output_format(ext)) {
      return *format;
    }
  }
  return OutputFormat::NTriples;
}

std::filesystem::path ExtractionDriver::resolve_output_path(
  const RunOptions & options, OutputFormat format)
{
  if (options.output) {
    return *options.output;
  }
  std::filesystem::path path = options.input;
  path.replace_extension(default_extension(format));
  return path;
}

// ============================================================================
// Pipeline
// ============================================================================

std::optional<ExtractionStats> ExtractionDriver::extract_to_stream(
  const SymbolGraph & graph, const ModuleSymbol & target, const ExtractionOptions & options,
  OutputFormat format, std::ostream & out, DiagnosticBag & diagnostics)
{
  const auto sink = make_sink(format, out);
  try {
    GraphExtractor extractor(*sink, options);
    const ExtractionStats stats = extractor.extract(graph, target);
    sink->flush();
    return stats;
  } catch (const ExtractionError & e) {
    diagnostics.report_error(SymbolLocation{}, fmt::format("extraction failed: {}", e.what()))
      .with_code(k_code_extraction)
      .with_help("raise extraction.max_type_depth if the nesting is legitimate");
  } catch (const std::invalid_argument & e) {
    diagnostics.report_error(SymbolLocation{}, fmt::format("malformed symbol graph: {}", e.what()))
      .with_code(k_code_extraction);
  }
  return std::nullopt;
}

RunResult ExtractionDriver::run(const RunOptions & options)
{
  namespace fs = std::filesystem;

  RunResult result;

  // Load the symbol dump
  SymbolLoadResult loaded = load_symbol_file(options.input);
  result.diagnostics.merge(std::move(loaded.diagnostics));
  if (!loaded.success) {
    return result;
  }
  spdlog::debug(
    "[Driver] Loaded {} modules from {}", loaded.graph.modules().size(), options.input.string());

  const ModuleSymbol * target = select_target(loaded.graph, options, result.diagnostics);
  if (target == nullptr) {
    return result;
  }

  if (options.mode == RunMode::Check) {
    result.success = !result.diagnostics.has_errors();
    return result;
  }

  const OutputFormat format = resolve_format(options);
  const fs::path output_path = resolve_output_path(options, format);

  std::optional<ExtractionStats> stats;
  if (output_path == k_stdout_path) {
    stats = extract_to_stream(
      loaded.graph, *target, options.extraction, format, std::cout, result.diagnostics);
    std::cout.flush();
  } else {
    if (output_path.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(output_path.parent_path(), ec);
    }

    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      result.diagnostics
        .report_error(
          SymbolLocation{}, fmt::format("failed to open output file: {}", output_path.string()))
        .with_code(k_code_output);
      return result;
    }

    stats = extract_to_stream(
      loaded.graph, *target, options.extraction, format, out, result.diagnostics);
    out.close();

    if (stats && out.fail()) {
      result.diagnostics
        .report_error(
          SymbolLocation{}, fmt::format("failed to write output file: {}", output_path.string()))
        .with_code(k_code_output);
      stats.reset();
    }

    if (!stats) {
      // Never leave a truncated graph behind
      std::error_code ec;
      fs::remove(output_path, ec);
      return result;
    }
    result.output_file = output_path;
  }

  if (stats) {
    result.stats = *stats;
  }
  result.success = stats.has_value() && !result.diagnostics.has_errors();
  return result;
}

}  // namespace typegraph
