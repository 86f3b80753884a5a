// typegraph/basic/diagnostic.hpp - Errors located by JSON pointer into a symbol dump
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace typegraph
{

// ============================================================================
// Locations
// ============================================================================

/**
 * Location inside a symbol dump.
 *
 * `pointer` is a JSON pointer (RFC 6901), e.g. "/types/3/members/1".
 * The empty pointer names the whole document; an empty file means "no location".
 */
struct SymbolLocation
{
  std::string file;
  std::string pointer;

  [[nodiscard]] bool is_valid() const noexcept { return !file.empty(); }
};

/// Appends one reference token, escaping '~' as "~0" and '/' as "~1"
[[nodiscard]] std::string pointer_child(std::string_view pointer, std::string_view token);
[[nodiscard]] std::string pointer_child(std::string_view pointer, size_t index);

// ============================================================================
// Diagnostic
// ============================================================================

/**
 * One user-facing error: a stable code ("L004", "D002"), a message, where it
 * happened and an optional hint on how to fix it.
 */
struct Diagnostic
{
  std::string code;
  std::string message;
  SymbolLocation location;
  std::optional<std::string> help_message;
};

class DiagnosticBag;

/**
 * Builds a diagnostic fluently and registers it with the bag on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

/**
 * Errors collected by the loader and the driver, in report order.
 */
class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(SymbolLocation location, std::string message);

  void add(Diagnostic && diag);
  void merge(DiagnosticBag && other);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] bool has_errors() const { return !diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace typegraph
