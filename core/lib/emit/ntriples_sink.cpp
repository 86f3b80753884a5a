// typegraph/emit/ntriples_sink.cpp
#include "typegraph/emit/ntriples_sink.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <string>

#include "typegraph/emit/literal_escape.hpp"
#include "typegraph/model/ontology.hpp"

namespace typegraph
{

void NTriplesSink::emit_iri(
  std::string_view subject, std::string_view predicate, std::string_view object_iri)
{
  fmt::print(out_, "<{}> <{}> <{}> .\n", subject, predicate, object_iri);
  ++fact_count_;
}

void NTriplesSink::emit_literal(
  std::string_view subject, std::string_view predicate, std::string_view value)
{
  fmt::print(out_, "<{}> <{}> \"{}\" .\n", subject, predicate, escape_literal(value));
  ++fact_count_;
}

void NTriplesSink::emit_typed_literal(
  std::string_view subject, std::string_view predicate, std::string_view value,
  std::string_view datatype_iri)
{
  fmt::print(
    out_, "<{}> <{}> \"{}\"^^<{}> .\n", subject, predicate, escape_literal(value), datatype_iri);
  ++fact_count_;
}

void NTriplesSink::emit_bool(std::string_view subject, std::string_view predicate, bool value)
{
  emit_typed_literal(subject, predicate, value ? "true" : "false", ontology::k_xsd_boolean);
}

void NTriplesSink::emit_int(std::string_view subject, std::string_view predicate, int32_t value)
{
  emit_typed_literal(subject, predicate, std::to_string(value), ontology::k_xsd_integer);
}

void NTriplesSink::emit_long(std::string_view subject, std::string_view predicate, int64_t value)
{
  emit_typed_literal(subject, predicate, std::to_string(value), ontology::k_xsd_long);
}

void NTriplesSink::add_prefix(std::string_view prefix, std::string_view iri)
{
  fmt::print(out_, "# @prefix {}: <{}> .\n", prefix, iri);
}

void NTriplesSink::flush() { out_.flush(); }

}  // namespace typegraph
