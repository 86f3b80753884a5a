// typegraph/test_support/symbol_fixtures.hpp - Symbol dumps and extraction helpers for tests
#pragma once

#include <string>
#include <string_view>

#include "typegraph/extraction/extraction_options.hpp"
#include "typegraph/extraction/graph_extractor.hpp"
#include "typegraph/loader/symbol_loader.hpp"
#include "typegraph/model/ontology.hpp"
#include "typegraph/test_support/recording_sink.hpp"

namespace typegraph::test_support
{

/// Core ontology IRI of a local name
[[nodiscard]] inline std::string tg(std::string_view local_name)
{
  return std::string(ontology::k_ontology_iri) + std::string(local_name);
}

/// Platform ontology IRI of a local name under the default base
[[nodiscard]] inline std::string dotnet(std::string_view local_name)
{
  return std::string(k_default_base_uri) + "ontology/" + std::string(local_name);
}

[[nodiscard]] inline std::string rdf_type() { return std::string(ontology::k_rdf_type); }

/// Load an inline symbol dump; callers check `success`
[[nodiscard]] inline SymbolLoadResult load(std::string_view json_text)
{
  return load_symbol_json(json_text, "<test>.json");
}

/**
 * Load a dump and extract its target module into a RecordingSink.
 */
struct TestExtraction
{
  SymbolLoadResult loaded;
  RecordingSink sink;
  ExtractionStats stats;
  bool extracted = false;

  [[nodiscard]] std::string first_error() const
  {
    if (loaded.diagnostics.empty()) {
      return {};
    }
    const Diagnostic & d = loaded.diagnostics.all().front();
    return d.code + ": " + d.message + " at " + d.location.pointer;
  }
};

[[nodiscard]] inline TestExtraction extract(
  std::string_view json_text, const ExtractionOptions & options = {})
{
  TestExtraction out;
  out.loaded = load(json_text);
  if (!out.loaded.success || out.loaded.graph.target_module() == nullptr) {
    return out;
  }

  GraphExtractor extractor(out.sink, options);
  out.stats = extractor.extract(out.loaded.graph, *out.loaded.graph.target_module());
  out.extracted = true;
  return out;
}

}  // namespace typegraph::test_support
