// typegraph/symbols/symbol_display.hpp - Metadata and display names
#pragma once

#include <string>

#include "typegraph/symbols/symbol.hpp"

namespace typegraph
{

/**
 * Full metadata name of a type.
 *
 * Named types: `Ns.Outer`1+Inner`2[Arg1,Arg2]`, where the namespace prefix
 * is omitted in the global namespace, every generic level carries its
 * arity, and the bracketed argument list appears only for constructed
 * generics with at least one concrete (non type-parameter) argument.
 * Arrays append `[]` (one comma per extra dimension), pointers `*`, and
 * type parameters render as `T:{owner}.{name}`.
 */
[[nodiscard]] std::string metadata_name(const TypeSymbol & type);

/**
 * Human-readable, namespace-qualified name of a type,
 * e.g. `System.Collections.Generic.List<System.String>`.
 */
[[nodiscard]] std::string display_string(const TypeSymbol & type);

/**
 * Human-readable method name with parameter types,
 * e.g. `Sample.C.Parse<T>(ref System.String, T)`.
 */
[[nodiscard]] std::string display_string(const MethodSymbol & method);

/// Keyword prefix of a ref-kind in signatures ("ref ", "out ", "in " or "")
[[nodiscard]] std::string_view ref_kind_prefix(RefKind kind) noexcept;

}  // namespace typegraph
