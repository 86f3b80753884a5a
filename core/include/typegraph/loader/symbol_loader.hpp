// typegraph/loader/symbol_loader.hpp - JSON symbol dump reader
//
// Reads the self-contained symbol dump written by a metadata provider
// into a SymbolGraph. The format is described at the top of
// symbol_loader.cpp.
//
#pragma once

#include <filesystem>
#include <string_view>

#include "typegraph/basic/diagnostic.hpp"
#include "typegraph/symbols/symbol_graph.hpp"

namespace typegraph
{

/// Highest dump format version this reader understands
inline constexpr int k_symbol_format_version = 1;

/**
 * Result of loading a symbol dump.
 *
 * The graph is populated as far as loading got; only use it for
 * extraction when success is true.
 */
struct SymbolLoadResult
{
  SymbolGraph graph;
  DiagnosticBag diagnostics;
  bool success = false;
};

/**
 * Load a symbol dump from disk.
 *
 * Diagnostics are labelled with the file path and the JSON pointer of
 * the offending value.
 */
[[nodiscard]] SymbolLoadResult load_symbol_file(const std::filesystem::path & path);

/**
 * Load a symbol dump from memory. `label` names the document in
 * diagnostics.
 */
[[nodiscard]] SymbolLoadResult load_symbol_json(std::string_view text, std::string_view label);

}  // namespace typegraph
