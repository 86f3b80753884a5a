// typegraph/emit/output_format.cpp
#include "typegraph/emit/output_format.hpp"

#include <algorithm>
#include <cctype>

#include "typegraph/emit/ntriples_sink.hpp"
#include "typegraph/emit/turtle_sink.hpp"

namespace typegraph
{

namespace
{

bool iequals(std::string_view a, std::string_view b) noexcept
{
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

}  // namespace

std::optional<OutputFormat> parse_output_format(std::string_view text) noexcept
{
  if (iequals(text, "ntriples") || iequals(text, "nt")) return OutputFormat::NTriples;
  if (iequals(text, "turtle") || iequals(text, "ttl")) return OutputFormat::Turtle;
  return std::nullopt;
}

std::string_view to_string(OutputFormat format) noexcept
{
  switch (format) {
    case OutputFormat::NTriples:
      return "ntriples";
    case OutputFormat::Turtle:
      return "turtle";
  }
  return "";
}

std::string_view default_extension(OutputFormat format) noexcept
{
  switch (format) {
    case OutputFormat::NTriples:
      return ".nt";
    case OutputFormat::Turtle:
      return ".ttl";
  }
  return ".nt";
}

std::unique_ptr<TripleSink> make_sink(OutputFormat format, std::ostream & out)
{
  switch (format) {
    case OutputFormat::Turtle:
      return std::make_unique<TurtleSink>(out);
    case OutputFormat::NTriples:
      break;
  }
  return std::make_unique<NTriplesSink>(out);
}

}  // namespace typegraph
