// typegraph/emit/turtle_sink.hpp - Prefixed syntax (.ttl)
#pragma once

#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

#include "typegraph/emit/triple_sink.hpp"

namespace typegraph
{

/**
 * Writes Turtle. Declared prefixes are written once, in declaration
 * order, right before the first fact; subjects and predicates stay
 * full IRIs. Booleans and integers are bare tokens, longs are typed.
 */
class TurtleSink final : public TripleSink
{
public:
  /// The stream must outlive the sink
  explicit TurtleSink(std::ostream & out) : out_(out) {}

  void emit_iri(std::string_view subject, std::string_view predicate,
                std::string_view object_iri) override;
  void emit_literal(std::string_view subject, std::string_view predicate,
                    std::string_view value) override;
  void emit_typed_literal(std::string_view subject, std::string_view predicate,
                          std::string_view value, std::string_view datatype_iri) override;
  void emit_bool(std::string_view subject, std::string_view predicate, bool value) override;
  void emit_int(std::string_view subject, std::string_view predicate, int32_t value) override;
  void emit_long(std::string_view subject, std::string_view predicate, int64_t value) override;

  /// Re-declaring a prefix replaces its IRI; ignored after the first fact
  void add_prefix(std::string_view prefix, std::string_view iri) override;
  void flush() override;

  [[nodiscard]] int64_t fact_count() const noexcept override { return fact_count_; }

private:
  void ensure_prefixes_written();

  std::ostream & out_;
  std::vector<std::pair<std::string, std::string>> prefixes_;
  bool prefixes_written_ = false;
  int64_t fact_count_ = 0;
};

}  // namespace typegraph
