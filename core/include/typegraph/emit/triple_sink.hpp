// typegraph/emit/triple_sink.hpp - Consumer of emitted facts
//
// The extractor only talks to this interface; concrete syntaxes
// (N-Triples, Turtle) and test recorders implement it.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace typegraph
{

class TripleSink
{
public:
  virtual ~TripleSink() = default;

  virtual void emit_iri(std::string_view subject, std::string_view predicate,
                        std::string_view object_iri) = 0;

  virtual void emit_literal(std::string_view subject, std::string_view predicate,
                            std::string_view value) = 0;

  virtual void emit_typed_literal(std::string_view subject, std::string_view predicate,
                                  std::string_view value, std::string_view datatype_iri) = 0;

  /// xsd:boolean; rendered bare or typed depending on the syntax
  virtual void emit_bool(std::string_view subject, std::string_view predicate, bool value) = 0;

  /// xsd:integer
  virtual void emit_int(std::string_view subject, std::string_view predicate, int32_t value) = 0;

  /// xsd:long
  virtual void emit_long(std::string_view subject, std::string_view predicate, int64_t value) = 0;

  /**
   * Declare a short name for an IRI namespace. Must be called before the
   * first emit in syntaxes that support prefixes.
   */
  virtual void add_prefix(std::string_view prefix, std::string_view iri) = 0;

  virtual void flush() = 0;

  /// Running total of emit_* calls
  [[nodiscard]] virtual int64_t fact_count() const noexcept = 0;
};

}  // namespace typegraph
