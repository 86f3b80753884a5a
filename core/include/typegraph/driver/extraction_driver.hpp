// typegraph/driver/extraction_driver.hpp - Extraction driver
//
// Single entry point for the load -> extract -> write pipeline.
// Used by the CLI and by tests.
//
#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

#include "typegraph/basic/diagnostic.hpp"
#include "typegraph/emit/output_format.hpp"
#include "typegraph/extraction/extraction_options.hpp"
#include "typegraph/extraction/graph_extractor.hpp"
#include "typegraph/symbols/symbol_graph.hpp"

namespace typegraph
{

// ============================================================================
// Run Mode
// ============================================================================

enum class RunMode {
  Check,    ///< Load and validate the symbol dump only
  Extract,  ///< Full run including triple output
};

// ============================================================================
// Run Options
// ============================================================================

struct RunOptions
{
  RunMode mode = RunMode::Extract;

  /// Symbol dump to read
  std::filesystem::path input;

  /// Output file; "-" writes to stdout. Default: input with the format's extension
  std::optional<std::filesystem::path> output;

  /// Output syntax. Default: from the output extension, else N-Triples
  std::optional<OutputFormat> format;

  /// Module name overriding the dump's target module
  std::optional<std::string> target_module;

  ExtractionOptions extraction;
};

// ============================================================================
// Run Result
// ============================================================================

struct RunResult
{
  /// Whether the run succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (errors, warnings, etc.)
  DiagnosticBag diagnostics;

  /// Written file (Extract mode, file output only)
  std::optional<std::filesystem::path> output_file;

  ExtractionStats stats;
};

// ============================================================================
// ExtractionDriver
// ============================================================================

class ExtractionDriver
{
public:
  /**
   * Run the pipeline described by `options`.
   *
   * @return RunResult with success status, diagnostics and statistics
   */
  [[nodiscard]] static RunResult run(const RunOptions & options);

  /**
   * Extract an already loaded graph into a stream and flush the sink.
   *
   * Extraction failures are reported to `diagnostics` instead of thrown.
   *
   * @return statistics, or std::nullopt when extraction failed
   */
  [[nodiscard]] static std::optional<ExtractionStats> extract_to_stream(
    const SymbolGraph & graph, const ModuleSymbol & target, const ExtractionOptions & options,
    OutputFormat format, std::ostream & out, DiagnosticBag & diagnostics);

  /// Format chosen for `options` (explicit, by output extension, or N-Triples)
  [[nodiscard]] static OutputFormat resolve_format(const RunOptions & options);

  /// Output file chosen for `options` and `format`
  [[nodiscard]] static std::filesystem::path resolve_output_path(
    const RunOptions & options, OutputFormat format);
};

/// Output path meaning "standard output"
inline constexpr const char * k_stdout_path = "-";

}  // namespace typegraph
