// tlc/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "tlc/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>
#include <string>

namespace tlc
{

namespace
{

const char * severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  } else {
    rang::setControlMode(rang::control::Force);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  print_severity_header(diag);

  // === Location line: --> subject ===
  if (const Label * primary = diag.primary_label()) {
    fmt::print(os_, "{} {}\n", gutter_arrow(), primary->subject);
  }

  for (const auto & label : diag.labels) {
    if (&label == diag.primary_label() && label.message.empty()) {
      continue;
    }
    print_label(label);
  }

  for (const auto & note : diag.notes) {
    print_note(note);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  for (const auto & d : diags) {
    print(d);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const char * severity_str = severity_name(diag.severity);

  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
      case Severity::Hint:
        os_ << rang::fg::green;
        break;
    }
    os_ << severity_str;
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_str, diag.message);
  }
}

void DiagnosticPrinter::print_label(const Label & label)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  const char marker = (label.style == LabelStyle::Primary) ? '^' : '-';
  const std::string text = label.message.empty()
                             ? label.subject
                             : fmt::format("{} {}", label.message, label.subject);

  fmt::print(os_, "{} ", gutter_pipe());
  if (use_color_) {
    if (label.style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
    fmt::print(os_, "{} {}", marker, text);
    os_ << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "{} {}", marker, text);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "      = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}  -->{}", "\033[1;36m", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace tlc
