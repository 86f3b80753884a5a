// typegraph/test_support/recording_sink.hpp - In-memory TripleSink for tests
//
// Records every fact in emission order so tests can query the output of
// an extraction without parsing a serialization.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "typegraph/emit/triple_sink.hpp"

namespace typegraph::test_support
{

enum class ObjectKind : uint8_t {
  Iri,
  Literal,
  TypedLiteral,
};

struct RecordedTriple
{
  std::string subject;
  std::string predicate;
  std::string object;
  ObjectKind object_kind = ObjectKind::Iri;
  std::string datatype;  ///< TypedLiteral only
};

class RecordingSink final : public TripleSink
{
public:
  void emit_iri(std::string_view subject, std::string_view predicate,
                std::string_view object_iri) override
  {
    record(subject, predicate, object_iri, ObjectKind::Iri, {});
  }

  void emit_literal(std::string_view subject, std::string_view predicate,
                    std::string_view value) override
  {
    record(subject, predicate, value, ObjectKind::Literal, {});
  }

  void emit_typed_literal(std::string_view subject, std::string_view predicate,
                          std::string_view value, std::string_view datatype_iri) override
  {
    record(subject, predicate, value, ObjectKind::TypedLiteral, datatype_iri);
  }

  void emit_bool(std::string_view subject, std::string_view predicate, bool value) override
  {
    record(subject, predicate, value ? "true" : "false", ObjectKind::TypedLiteral, "boolean");
  }

  void emit_int(std::string_view subject, std::string_view predicate, int32_t value) override
  {
    record(subject, predicate, std::to_string(value), ObjectKind::TypedLiteral, "integer");
  }

  void emit_long(std::string_view subject, std::string_view predicate, int64_t value) override
  {
    record(subject, predicate, std::to_string(value), ObjectKind::TypedLiteral, "long");
  }

  void add_prefix(std::string_view prefix, std::string_view iri) override
  {
    prefixes_.emplace_back(std::string(prefix), std::string(iri));
  }

  void flush() override { ++flush_count_; }

  [[nodiscard]] int64_t fact_count() const noexcept override
  {
    return static_cast<int64_t>(triples_.size());
  }

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] const std::vector<RecordedTriple> & triples() const noexcept { return triples_; }

  [[nodiscard]] const std::vector<std::pair<std::string, std::string>> & prefixes() const noexcept
  {
    return prefixes_;
  }

  [[nodiscard]] int flush_count() const noexcept { return flush_count_; }

  /// Facts matching the pattern; an empty view matches anything
  [[nodiscard]] std::vector<RecordedTriple> find(
    std::string_view subject, std::string_view predicate = {},
    std::string_view object = {}) const
  {
    std::vector<RecordedTriple> out;
    for (const auto & t : triples_) {
      if (
        (subject.empty() || t.subject == subject) &&
        (predicate.empty() || t.predicate == predicate) && (object.empty() || t.object == object)) {
        out.push_back(t);
      }
    }
    return out;
  }

  [[nodiscard]] size_t count(
    std::string_view subject, std::string_view predicate = {},
    std::string_view object = {}) const
  {
    return find(subject, predicate, object).size();
  }

  [[nodiscard]] bool has(
    std::string_view subject, std::string_view predicate, std::string_view object) const
  {
    return count(subject, predicate, object) > 0;
  }

  /// Object of the single fact (subject, predicate); empty when absent
  [[nodiscard]] std::string value_of(std::string_view subject, std::string_view predicate) const
  {
    const auto found = find(subject, predicate);
    return found.empty() ? std::string{} : found.front().object;
  }

  /// Number of facts whose subject is `subject`
  [[nodiscard]] size_t facts_about(std::string_view subject) const { return count(subject); }

private:
  void record(
    std::string_view subject, std::string_view predicate, std::string_view object,
    ObjectKind kind, std::string_view datatype)
  {
    triples_.push_back(RecordedTriple{
      std::string(subject), std::string(predicate), std::string(object), kind,
      std::string(datatype)});
  }

  std::vector<RecordedTriple> triples_;
  std::vector<std::pair<std::string, std::string>> prefixes_;
  int flush_count_ = 0;
};

}  // namespace typegraph::test_support
