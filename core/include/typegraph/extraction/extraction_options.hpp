// typegraph/extraction/extraction_options.hpp - Extraction configuration
#pragma once

#include <cstddef>
#include <string>

#include "typegraph/model/iri_minter.hpp"

namespace typegraph
{

struct ExtractionOptions
{
  /// Prefix of every minted IRI (trailing '/' ignored)
  std::string base_uri = std::string(k_default_base_uri);

  bool include_private = false;
  bool include_internal = true;
  bool include_compiler_generated = false;

  /// Emit `throws` edges from <exception cref="..."/>
  bool extract_exceptions = true;
  /// Emit `relatedTo` edges from <seealso cref="..."/>
  bool extract_see_also = true;

  bool include_attributes = true;

  /// Describe referenced types declared outside the target module
  bool include_external_types = true;

  /// Nesting limit of referenced-type emission (generic arguments, array elements)
  size_t max_type_depth = 256;
};

}  // namespace typegraph
