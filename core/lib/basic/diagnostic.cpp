// tlc/basic/diagnostic.cpp - Diagnostic implementation
#include "tlc/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace tlc
{

namespace
{

Diagnostic make_diagnostic(Severity severity, std::string message, std::string subject)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  if (!subject.empty()) {
    d.labels.push_back(Label{std::move(subject), "", LabelStyle::Primary});
  }
  return d;
}

}  // namespace

const Label * Diagnostic::primary_label() const noexcept
{
  for (const auto & l : labels) {
    if (l.style == LabelStyle::Primary) {
      return &l;
    }
  }
  if (!labels.empty()) {
    return &labels.front();
  }
  return nullptr;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_label(
  std::string subject, std::string msg, LabelStyle style)
{
  diagnostic_.labels.push_back(Label{std::move(subject), std::move(msg), style});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(std::string subject, std::string msg)
{
  return with_label(std::move(subject), std::move(msg), LabelStyle::Secondary);
}

DiagnosticBuilder & DiagnosticBuilder::with_note(std::string note)
{
  diagnostic_.notes.push_back(std::move(note));
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(std::string message, std::string subject)
{
  return {*this, make_diagnostic(Severity::Error, std::move(message), std::move(subject))};
}

DiagnosticBuilder DiagnosticBag::report_warning(std::string message, std::string subject)
{
  return {*this, make_diagnostic(Severity::Warning, std::move(message), std::move(subject))};
}

DiagnosticBuilder DiagnosticBag::report_info(std::string message, std::string subject)
{
  return {*this, make_diagnostic(Severity::Info, std::move(message), std::move(subject))};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Warning; });
  return result;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

bool DiagnosticBag::has_warnings() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Warning;
  });
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

}  // namespace tlc
