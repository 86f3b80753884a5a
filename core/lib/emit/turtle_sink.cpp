// typegraph/emit/turtle_sink.cpp
#include "typegraph/emit/turtle_sink.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <string>

#include "typegraph/emit/literal_escape.hpp"
#include "typegraph/model/ontology.hpp"

namespace typegraph
{

void TurtleSink::add_prefix(std::string_view prefix, std::string_view iri)
{
  auto it = std::find_if(prefixes_.begin(), prefixes_.end(), [&](const auto & entry) {
    return entry.first == prefix;
  });
  if (it != prefixes_.end()) {
    it->second = std::string(iri);
    return;
  }
  prefixes_.emplace_back(std::string(prefix), std::string(iri));
}

void TurtleSink::ensure_prefixes_written()
{
  if (prefixes_written_) return;
  prefixes_written_ = true;

  for (const auto & [prefix, iri] : prefixes_) {
    fmt::print(out_, "@prefix {}: <{}> .\n", prefix, iri);
  }
  if (!prefixes_.empty()) {
    fmt::print(out_, "\n");
  }
}

void TurtleSink::emit_iri(
  std::string_view subject, std::string_view predicate, std::string_view object_iri)
{
  ensure_prefixes_written();
  fmt::print(out_, "<{}> <{}> <{}> .\n", subject, predicate, object_iri);
  ++fact_count_;
}

void TurtleSink::emit_literal(
  std::string_view subject, std::string_view predicate, std::string_view value)
{
  ensure_prefixes_written();
  fmt::print(out_, "<{}> <{}> \"{}\" .\n", subject, predicate, escape_literal(value));
  ++fact_count_;
}

void TurtleSink::emit_typed_literal(
  std::string_view subject, std::string_view predicate, std::string_view value,
  std::string_view datatype_iri)
{
  ensure_prefixes_written();
  fmt::print(
    out_, "<{}> <{}> \"{}\"^^<{}> .\n", subject, predicate, escape_literal(value), datatype_iri);
  ++fact_count_;
}

void TurtleSink::emit_bool(std::string_view subject, std::string_view predicate, bool value)
{
  ensure_prefixes_written();
  fmt::print(out_, "<{}> <{}> {} .\n", subject, predicate, value ? "true" : "false");
  ++fact_count_;
}

void TurtleSink::emit_int(std::string_view subject, std::string_view predicate, int32_t value)
{
  ensure_prefixes_written();
  fmt::print(out_, "<{}> <{}> {} .\n", subject, predicate, value);
  ++fact_count_;
}

void TurtleSink::emit_long(std::string_view subject, std::string_view predicate, int64_t value)
{
  emit_typed_literal(subject, predicate, std::to_string(value), ontology::k_xsd_long);
}

void TurtleSink::flush() { out_.flush(); }

}  // namespace typegraph
