// tlc/driver/session.hpp - Sample typing driver
//
// Single entry point for typing the built-in samples under a base context.
// Used by the CLI and by tests.
//
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tlc/ast/ast_context.hpp"
#include "tlc/basic/diagnostic.hpp"
#include "tlc/driver/samples.hpp"
#include "tlc/sema/resolution/typing_context.hpp"
#include "tlc/sema/types/type.hpp"
#include "tlc/sema/types/typing_error.hpp"

namespace tlc
{

// ============================================================================
// Run Options
// ============================================================================

struct RunOptions
{
  /// Sample names to run, in order (empty: all built-in samples)
  std::vector<std::string> samples;

  /// Base bindings every sample is typed under; names must outlive the run
  std::vector<Binding> base_bindings;

  /// Enable verbose progress output on stderr
  bool verbose = false;
};

// ============================================================================
// Run Report
// ============================================================================

struct SampleReport
{
  std::string name;

  /// Rendered expression, or the rendered type for display-only samples
  std::string subject;

  /// Typed expression, owned by the Session (null for display-only samples)
  const Expr * expr = nullptr;

  bool type_only = false;
  bool expect_failure = false;

  /// Inference outcome (judgment samples only)
  InferResult result;

  /// Failed exactly when the sample says it should
  [[nodiscard]] bool as_expected() const noexcept
  {
    return type_only || result.success != expect_failure;
  }
};

struct RunReport
{
  std::vector<SampleReport> entries;

  /// Typing errors and driver errors, in the order they occurred
  DiagnosticBag diagnostics;

  /// Requested names that matched no sample
  std::vector<std::string> unknown_samples;

  /// Every entry behaved as expected and every name was known
  [[nodiscard]] bool success() const noexcept;
};

/// Serialize a report as an array of per-sample objects
[[nodiscard]] nlohmann::json to_json(const RunReport & report);

// ============================================================================
// Session
// ============================================================================

/**
 * Builds and types samples.
 *
 * Expressions live in the session's own arena; types are created in the
 * TypeContext given at construction, which must outlive every report.
 * Each sample is built once per session and reused by later runs, so
 * repeated runs create no new nodes or types.
 */
class Session
{
public:
  explicit Session(TypeContext & types);

  /**
   * Type the selected samples.
   *
   * Each sample is inferred under the base bindings extended with the
   * sample's own bindings.
   *
   * @param options Selection, base bindings and verbosity
   * @return One entry per known sample, plus diagnostics
   */
  [[nodiscard]] RunReport run(const RunOptions & options);

private:
  SampleReport run_sample(
    const SampleSpec & spec, const TypingContext & base, DiagnosticBag & diags, bool verbose);

  const Sample & built_sample(const SampleSpec & spec);

  TypeContext & types_;
  AstContext ast_;
  std::unordered_map<std::string_view, Sample> built_;
};

}  // namespace tlc
