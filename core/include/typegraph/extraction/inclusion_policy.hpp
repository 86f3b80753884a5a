// typegraph/extraction/inclusion_policy.hpp - Visibility filter
#pragma once

#include "typegraph/extraction/extraction_options.hpp"
#include "typegraph/symbols/symbol.hpp"

namespace typegraph
{

/**
 * Decide whether a type or member is extracted.
 *
 * Compiler-synthesized symbols need include_compiler_generated. Private
 * symbols need include_private; internal and private-protected symbols
 * need include_internal. Public, protected and protected-internal
 * symbols are always included.
 */
[[nodiscard]] bool is_included(const Symbol & symbol, const ExtractionOptions & options) noexcept;

}  // namespace typegraph
