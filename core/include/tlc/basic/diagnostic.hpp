// tlc/basic/diagnostic.hpp - Diagnostic types for inference and configuration
//
// Terms are built in memory rather than parsed, so diagnostics point at the
// rendered form of the offending term instead of a source range.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tlc
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

enum class LabelStyle {
  Primary,    // the term that failed
  Secondary,  // enclosing or related term
};

struct Label
{
  std::string subject;  ///< Rendered term the label refers to
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g., "E002"
  std::string message;

  std::vector<Label> labels;
  std::vector<std::string> notes;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder that hands its diagnostic to the bag on destruction.
 *
 * @code
 *   bag.report_error("Unbound variable: y", "y").with_code("E001").with_help("...");
 * @endcode
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

  DiagnosticBuilder & with_label(
    std::string subject, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(std::string subject, std::string msg);

  DiagnosticBuilder & with_note(std::string note);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters. An empty subject adds no label.
  DiagnosticBuilder report_error(std::string message, std::string subject = "");
  DiagnosticBuilder report_warning(std::string message, std::string subject = "");
  DiagnosticBuilder report_info(std::string message, std::string subject = "");

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace tlc
