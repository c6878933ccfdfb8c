// flow_lint/report/finding_printer.cpp - Terminal output for findings
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "flow_lint/report/finding_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>

namespace flow_lint
{

namespace
{

std::string plural(size_t n, std::string_view word)
{
  return fmt::format("{} {}{}", n, word, n == 1 ? "" : "s");
}

}  // namespace

std::string sanitize_display_text(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    const auto u = static_cast<unsigned char>(c);
    if (c == '\n' || c == '\r' || c == '\t') {
      out.push_back(' ');
    } else if (u < 0x20 || u == 0x7f) {
      continue;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

FindingPrinter::FindingPrinter(std::ostream & os, bool use_color) : os_(os), use_color_(use_color)
{
  // Configure rang based on use_color setting
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void FindingPrinter::print(const Finding & finding)
{
  // === Header line: warning[FL100]: message ===
  print_severity_header(finding);

  // === Location line: --> flow 'X', page 'Y' ===
  if (finding.page == k_no_page) {
    fmt::print(os_, "{} flow '{}'\n", gutter_arrow(), sanitize_display_text(finding.flow));
  } else {
    fmt::print(
      os_, "{} flow '{}', page '{}'\n", gutter_arrow(), sanitize_display_text(finding.flow),
      sanitize_display_text(finding.page));
  }

  if (finding.help_message) {
    print_help(*finding.help_message);
  }

  fmt::print(os_, "\n");
}

void FindingPrinter::print_all(const FindingBag & findings)
{
  for (const auto & f : findings) {
    print(f);
  }
  print_summary(findings);
}

void FindingPrinter::print_summary(const FindingBag & findings)
{
  const std::string summary = fmt::format(
    "{}, {}, {}", plural(findings.count(Severity::Error), "error"),
    plural(findings.count(Severity::Warning), "warning"),
    plural(findings.count(Severity::Info), "info"));

  if (findings.empty()) {
    if (use_color_) {
      os_ << rang::fg::green << rang::style::bold << "No graph issues found" << rang::style::reset
          << rang::fg::reset << "\n";
    } else {
      fmt::print(os_, "No graph issues found\n");
    }
    return;
  }

  if (use_color_) {
    os_ << rang::style::bold << summary << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}\n", summary);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void FindingPrinter::print_severity_header(const Finding & finding)
{
  const std::string message = sanitize_display_text(finding.message);

  if (use_color_) {
    os_ << rang::style::bold;
    switch (finding.severity) {
      case Severity::Error:
        os_ << rang::fg::red << "error";
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow << "warning";
        break;
      case Severity::Info:
        os_ << rang::fg::cyan << "info";
        break;
    }
    if (!finding.code.empty()) {
      os_ << "[" << finding.code << "]";
    }
    os_ << rang::fg::reset << ": " << message << rang::style::reset << "\n";
    return;
  }

  std::string severity_str;
  switch (finding.severity) {
    case Severity::Error:
      severity_str = "error";
      break;
    case Severity::Warning:
      severity_str = "warning";
      break;
    case Severity::Info:
      severity_str = "info";
      break;
  }
  if (!finding.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_str, finding.code, message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_str, message);
  }
}

void FindingPrinter::print_help(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

std::string FindingPrinter::gutter_arrow() const
{
  if (use_color_) {
    return "\033[1;36m  -->\033[0m";
  }
  return "  -->";
}

}  // namespace flow_lint
