// typegraph/project/project_config.cpp - Project configuration implementation
//
#include "typegraph/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace typegraph
{

namespace
{

/// Read an optional scalar key into `out`; false with `error` set on a bad value
template <typename T>
bool read_scalar(const YAML::Node & section, const char * key, T & out, std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) {
    return true;
  }
  try {
    out = node.as<T>();
  } catch (const YAML::Exception & e) {
    error = std::string("invalid value for '") + key + "': " + e.what();
    return false;
  }
  return true;
}

bool parse_extraction(const YAML::Node & node, ExtractionOptions & options, std::string & error)
{
  if (!node.IsMap()) {
    error = "extraction must be a map";
    return false;
  }

  const bool ok = read_scalar(node, "base_uri", options.base_uri, error) &&
                  read_scalar(node, "include_private", options.include_private, error) &&
                  read_scalar(node, "include_internal", options.include_internal, error) &&
                  read_scalar(
                    node, "include_compiler_generated", options.include_compiler_generated,
                    error) &&
                  read_scalar(node, "extract_exceptions", options.extract_exceptions, error) &&
                  read_scalar(node, "extract_see_also", options.extract_see_also, error) &&
                  read_scalar(node, "include_attributes", options.include_attributes, error) &&
                  read_scalar(
                    node, "include_external_types", options.include_external_types, error) &&
                  read_scalar(node, "max_type_depth", options.max_type_depth, error);
  if (!ok) {
    error = "extraction: " + error;
    return false;
  }

  if (options.base_uri.empty()) {
    error = "extraction.base_uri must not be empty";
    return false;
  }
  if (options.max_type_depth == 0) {
    error = "extraction.max_type_depth must be positive";
    return false;
  }
  return true;
}

bool parse_output(const YAML::Node & node, OutputConfig & output, std::string & error)
{
  if (!node.IsMap()) {
    error = "output must be a map";
    return false;
  }

  std::string format;
  std::string path;
  if (!read_scalar(node, "format", format, error) || !read_scalar(node, "path", path, error)) {
    error = "output: " + error;
    return false;
  }

  if (!format.empty()) {
    output.format = parse_output_format(format);
    if (!output.format) {
      error = "invalid output.format: '" + format + "' (must be 'ntriples' or 'turtle')";
      return false;
    }
  }
  output.path = path;
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  // An empty file is a valid, all-defaults configuration
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  std::string error;

  // Parse 'extraction' section
  if (root["extraction"] && !parse_extraction(root["extraction"], config.extraction, error)) {
    return ConfigLoadResult::fail(error);
  }

  // Parse 'output' section
  if (root["output"] && !parse_output(root["output"], config.output, error)) {
    return ConfigLoadResult::fail(error);
  }

  // Parse 'log_level'
  std::string level;
  if (!read_scalar(root, "log_level", level, error)) {
    return ConfigLoadResult::fail(error);
  }
  if (!level.empty()) {
    const auto parsed = parse_log_level(level);
    if (!parsed) {
      return ConfigLoadResult::fail(
        "invalid log_level: '" + level + "' (must be 'quiet', 'info' or 'verbose')");
    }
    config.log_level = *parsed;
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return parse_root(root, fs::absolute(config_path).parent_path());
}

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_root(root, project_root);
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::string render_project_config(const ProjectConfig & config)
{
  const ExtractionOptions & ex = config.extraction;

  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "extraction" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "base_uri" << YAML::Value << ex.base_uri;
  out << YAML::Key << "include_private" << YAML::Value << ex.include_private;
  out << YAML::Key << "include_internal" << YAML::Value << ex.include_internal;
  out << YAML::Key << "include_compiler_generated" << YAML::Value << ex.include_compiler_generated;
  out << YAML::Key << "extract_exceptions" << YAML::Value << ex.extract_exceptions;
  out << YAML::Key << "extract_see_also" << YAML::Value << ex.extract_see_also;
  out << YAML::Key << "include_attributes" << YAML::Value << ex.include_attributes;
  out << YAML::Key << "include_external_types" << YAML::Value << ex.include_external_types;
  out << YAML::Key << "max_type_depth" << YAML::Value << ex.max_type_depth;
  out << YAML::EndMap;

  out << YAML::Key << "output" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "format" << YAML::Value
      << std::string(to_string(config.output.format.value_or(OutputFormat::NTriples)));
  if (!config.output.path.empty()) {
    out << YAML::Key << "path" << YAML::Value << config.output.path.generic_string();
  }
  out << YAML::EndMap;

  out << YAML::Key << "log_level" << YAML::Value << std::string(to_string(config.log_level));
  out << YAML::EndMap;

  std::ostringstream text;
  text << out.c_str() << '\n';
  return text.str();
}

}  // namespace typegraph
