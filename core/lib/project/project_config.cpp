// tlc/project/project_config.cpp - Project configuration implementation
//
#include "tlc/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace tlc
{

namespace
{

/// Decode a structured type description; nullptr with error set on failure
const Type * decode_type(const YAML::Node & node, TypeContext & types, std::string & error)
{
  if (node.IsScalar()) {
    const auto name = node.as<std::string>();
    if (const Type * builtin = types.lookup_builtin(name)) {
      return builtin;
    }
    error = "unknown type '" + name + "' (expected 'Int' or 'Bool')";
    return nullptr;
  }

  if (!node.IsMap()) {
    error = "type must be a name or a map";
    return nullptr;
  }

  const int forms = (node["function"] ? 1 : 0) + (node["linear"] ? 1 : 0) + (node["effect"] ? 1 : 0);
  if (forms != 1) {
    error = "type map must have exactly one of 'function', 'linear' or 'effect'";
    return nullptr;
  }

  if (node["function"]) {
    const auto & sig = node["function"];
    if (!sig.IsSequence() || sig.size() != 2) {
      error = "'function' must be a list of [input, output]";
      return nullptr;
    }
    const Type * input = decode_type(sig[0], types, error);
    if (!input) return nullptr;
    const Type * output = decode_type(sig[1], types, error);
    if (!output) return nullptr;
    return types.get_function_type(input, output);
  }

  if (node["linear"]) {
    const Type * base = decode_type(node["linear"], types, error);
    if (!base) return nullptr;
    return types.get_linear_type(base);
  }

  if (!node["effect"].IsScalar()) {
    error = "'effect' must be a label";
    return nullptr;
  }
  if (!node["type"]) {
    error = "'effect' needs a 'type'";
    return nullptr;
  }
  const Type * base = decode_type(node["type"], types, error);
  if (!base) return nullptr;
  return types.get_effectful_type(node["effect"].as<std::string>(), base);
}

ConfigLoadResult parse_root(const YAML::Node & root, TypeContext & types)
{
  ProjectConfig config;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'package' section
  if (root["package"]) {
    const auto & pkg = root["package"];
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  // Parse 'output' section
  if (root["output"]) {
    const auto & out = root["output"];

    if (out["format"]) {
      const auto format = out["format"].as<std::string>();
      if (format == "text") {
        config.output.format = OutputFormat::Text;
      } else if (format == "json") {
        config.output.format = OutputFormat::Json;
      } else {
        return ConfigLoadResult::fail(
          "invalid output.format: '" + format + "' (must be 'text' or 'json')");
      }
    }

    if (out["color"]) {
      const auto color = out["color"].as<std::string>();
      if (color == "auto") {
        config.output.color = ColorMode::Auto;
      } else if (color == "always") {
        config.output.color = ColorMode::Always;
      } else if (color == "never") {
        config.output.color = ColorMode::Never;
      } else {
        return ConfigLoadResult::fail(
          "invalid output.color: '" + color + "' (must be 'auto', 'always' or 'never')");
      }
    }
  }

  // Parse 'context' section
  if (root["context"]) {
    const auto & ctx = root["context"];
    if (!ctx.IsMap()) {
      return ConfigLoadResult::fail("context must be a map of name: type");
    }
    for (const auto & entry : ctx) {
      const auto name = entry.first.as<std::string>();
      std::string type_error;
      const Type * type = decode_type(entry.second, types, type_error);
      if (!type) {
        return ConfigLoadResult::fail("invalid type for context binding '" + name + "': " + type_error);
      }
      config.context.push_back(ContextBindingConfig{name, type});
    }
  }

  // Parse 'samples' section
  if (root["samples"]) {
    if (!root["samples"].IsSequence()) {
      return ConfigLoadResult::fail("samples must be a list");
    }
    for (const auto & s : root["samples"]) {
      config.samples.push_back(s.as<std::string>());
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(const std::string & yaml_text, TypeContext & types)
{
  try {
    return parse_root(YAML::Load(yaml_text), types);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path, TypeContext & types)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  ConfigLoadResult result;
  try {
    result = parse_root(YAML::LoadFile(config_path.string()), types);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  if (result.success) {
    result.config.project_root = fs::absolute(config_path).parent_path();
  }
  return result;
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

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace tlc
