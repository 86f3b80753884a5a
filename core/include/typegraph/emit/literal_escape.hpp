// typegraph/emit/literal_escape.hpp - String literal escaping shared by the syntaxes
#pragma once

#include <string>
#include <string_view>

namespace typegraph
{

/**
 * Escape a string for use inside a double-quoted literal.
 *
 * `\` `"` LF CR TAB use their short escapes; other bytes below 0x20
 * become `\uXXXX`. Everything else, including UTF-8, passes through.
 */
[[nodiscard]] std::string escape_literal(std::string_view value);

}  // namespace typegraph
