// typegraph/project/project_config.hpp - Project configuration (typegraph.yaml)
//
// Parses and validates typegraph.yaml project configuration files.
// Command-line flags are applied on top of the loaded values.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "typegraph/basic/logging.hpp"
#include "typegraph/emit/output_format.hpp"
#include "typegraph/extraction/extraction_options.hpp"

namespace typegraph
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Output section.
 */
struct OutputConfig
{
  /// Output syntax; unset means "derive from the output path, else N-Triples"
  std::optional<OutputFormat> format;

  /// Output file (relative to the project root); empty means "next to the input"
  std::filesystem::path path;
};

/**
 * Complete project configuration (typegraph.yaml).
 */
struct ProjectConfig
{
  ExtractionOptions extraction;
  OutputConfig output;
  LogLevel log_level = LogLevel::Info;

  /// Directory containing typegraph.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a typegraph.yaml file.
 *
 * Unknown keys are ignored; present keys must have valid values.
 *
 * @param config_path Path to typegraph.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text. `project_root` is stored as given.
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to typegraph.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Render a configuration as YAML (used by `typegraph init`).
 */
[[nodiscard]] std::string render_project_config(const ProjectConfig & config);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "typegraph.yaml";

}  // namespace typegraph
