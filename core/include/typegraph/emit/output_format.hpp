// typegraph/emit/output_format.hpp - Output syntax selection
#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string_view>

#include "typegraph/emit/triple_sink.hpp"

namespace typegraph
{

enum class OutputFormat : uint8_t {
  NTriples,
  Turtle,
};

/// Accepts "ntriples", "nt", "turtle", "ttl" (case-insensitive)
[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view text) noexcept;

[[nodiscard]] std::string_view to_string(OutputFormat format) noexcept;

/// ".nt" or ".ttl"
[[nodiscard]] std::string_view default_extension(OutputFormat format) noexcept;

/// Create a sink writing to `out`; the stream must outlive the sink
[[nodiscard]] std::unique_ptr<TripleSink> make_sink(OutputFormat format, std::ostream & out);

}  // namespace typegraph
