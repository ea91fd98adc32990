// hcl/project/format_config.cpp - Formatter configuration implementation
//
#include "hcl/project/format_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <system_error>

namespace hcl
{

namespace
{

/// Read a scalar into `out` when `key` is present.
template <typename T>
bool read_value(const YAML::Node & section, const char * key, T & out, std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) {
    return true;
  }
  if (!node.IsScalar()) {
    error = std::string(key) + " must be a scalar";
    return false;
  }
  try {
    out = node.as<T>();
  } catch (const YAML::Exception & e) {
    error = std::string(key) + " has an invalid value: " + e.what();
    return false;
  }
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  FormatConfig config;
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  std::string error;

  // Parse 'format' section
  if (const YAML::Node section = root["format"]) {
    if (!section.IsMap()) {
      return ConfigLoadResult::fail("format must be a map");
    }
    auto & opts = config.format;
    if (
      !read_value(section, "indent_width", opts.indent_width, error) ||
      !read_value(section, "dense", opts.dense, error) ||
      !read_value(section, "compact_arrays", opts.compact_arrays, error) ||
      !read_value(section, "compact_objects", opts.compact_objects, error) ||
      !read_value(section, "prefer_ident_keys", opts.prefer_ident_keys, error)) {
      return ConfigLoadResult::fail("format." + error);
    }
    if (opts.indent_width == 0) {
      return ConfigLoadResult::fail("format.indent_width must be greater than 0");
    }
  }

  // Parse 'parser' section
  if (const YAML::Node parser = root["parser"]) {
    if (!parser.IsMap()) {
      return ConfigLoadResult::fail("parser must be a map");
    }
    if (!read_value(parser, "max_nesting_depth", config.parser.max_nesting_depth, error)) {
      return ConfigLoadResult::fail("parser." + error);
    }
    if (config.parser.max_nesting_depth == 0) {
      return ConfigLoadResult::fail("parser.max_nesting_depth must be greater than 0");
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_format_config(std::string_view yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_root(root);
}

ConfigLoadResult load_format_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ConfigLoadResult result = parse_root(root);
  if (result.success) {
    result.config.source = config_path;
  } else {
    result.error = config_path.string() + ": " + result.error;
  }
  return result;
}

std::optional<std::filesystem::path> find_format_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path dir = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }
  if (fs::is_regular_file(dir, ec)) {
    dir = dir.parent_path();
  }

  // Unreadable or missing directories count as having no config
  for (fs::path parent = dir.parent_path();; dir = parent, parent = dir.parent_path()) {
    fs::path candidate = dir / k_format_config_file_name;
    if (fs::is_regular_file(candidate, ec)) {
      return candidate;
    }
    if (parent == dir) {
      return std::nullopt;
    }
  }
}

}  // namespace hcl
