// tlc/project/project_config.hpp - Project configuration (tlc.yaml)
//
// Parses and validates tlc.yaml: base context bindings, output options and
// the selection of sample judgments to type.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "tlc/sema/types/type.hpp"

namespace tlc
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class OutputFormat {
  Text,
  Json,
};

enum class ColorMode {
  Auto,    ///< Colour when stderr is a terminal
  Always,
  Never,
};

/**
 * Output configuration section.
 */
struct OutputConfig
{
  OutputFormat format = OutputFormat::Text;
  ColorMode color = ColorMode::Auto;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * A base context binding from the `context` section.
 *
 * The type is resolved into the TypeContext passed to load_project_config.
 */
struct ContextBindingConfig
{
  std::string name;
  const Type * type = nullptr;
};

/**
 * Complete project configuration (tlc.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  OutputConfig output;

  /// Bindings every sample is typed under, in file order
  std::vector<ContextBindingConfig> context;

  /// Sample names to run (empty: all)
  std::vector<std::string> samples;

  /// Directory containing tlc.yaml
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

  static ConfigLoadResult ok(ProjectConfig cfg)
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
 * Load a project configuration from a tlc.yaml file.
 *
 * Types in the `context` section are built in `types`, which must outlive
 * the returned configuration.
 *
 * @param config_path Path to tlc.yaml
 * @param types TypeContext receiving the binding types
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(
  const std::filesystem::path & config_path, TypeContext & types);

/**
 * Same as load_project_config, reading YAML text already in memory.
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, TypeContext & types);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to tlc.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "tlc.yaml";

}  // namespace tlc
