// hcl/project/format_config.hpp - Formatter configuration (.hclfmt.yaml)
//
// Parses and validates .hclfmt.yaml files. The library itself never reads
// configuration; the hclfmt tool loads it and passes the options down.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "hcl/format/formatter.hpp"
#include "hcl/syntax/parser.hpp"

namespace hcl
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete formatter configuration (.hclfmt.yaml).
 *
 * @code
 *   format:
 *     indent_width: 2
 *     dense: false
 *     compact_arrays: true
 *     compact_objects: false
 *     prefer_ident_keys: false
 *   parser:
 *     max_nesting_depth: 128
 * @endcode
 */
struct FormatConfig
{
  FormatterOptions format;
  ParserOptions parser;

  /// File the configuration was loaded from (empty for defaults)
  std::filesystem::path source;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a formatter configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  FormatConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(FormatConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

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
 * Parse configuration from YAML text.
 *
 * Unknown keys are ignored. Values of the wrong type, a zero indent_width and
 * a zero max_nesting_depth are errors.
 */
[[nodiscard]] ConfigLoadResult parse_format_config(std::string_view yaml_text);

/**
 * Load configuration from a .hclfmt.yaml file.
 *
 * @param config_path Path to the file
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_format_config(const std::filesystem::path & config_path);

/**
 * Find a configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to .hclfmt.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_format_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the configuration file.
 */
inline constexpr const char * k_format_config_file_name = ".hclfmt.yaml";

}  // namespace hcl
