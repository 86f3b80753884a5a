// typegraph/emit/ntriples_sink.hpp - Line-per-fact syntax (.nt)
#pragma once

#include <iosfwd>

#include "typegraph/emit/triple_sink.hpp"

namespace typegraph
{

/**
 * Writes one `<s> <p> <o> .` line per fact.
 *
 * Prefixes have no meaning in N-Triples and are written as
 * `# @prefix p: <iri> .` comments. Booleans, integers and longs are
 * typed literals.
 */
class NTriplesSink final : public TripleSink
{
public:
  /// The stream must outlive the sink
  explicit NTriplesSink(std::ostream & out) : out_(out) {}

  void emit_iri(std::string_view subject, std::string_view predicate,
                std::string_view object_iri) override;
  void emit_literal(std::string_view subject, std::string_view predicate,
                    std::string_view value) override;
  void emit_typed_literal(std::string_view subject, std::string_view predicate,
                          std::string_view value, std::string_view datatype_iri) override;
  void emit_bool(std::string_view subject, std::string_view predicate, bool value) override;
  void emit_int(std::string_view subject, std::string_view predicate, int32_t value) override;
  void emit_long(std::string_view subject, std::string_view predicate, int64_t value) override;
  void add_prefix(std::string_view prefix, std::string_view iri) override;
  void flush() override;

  [[nodiscard]] int64_t fact_count() const noexcept override { return fact_count_; }

private:
  std::ostream & out_;
  int64_t fact_count_ = 0;
};

}  // namespace typegraph
