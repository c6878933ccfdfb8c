// flow_lint/report/finding_printer.hpp
//
// Prints findings with their flow/page location in a compiler-like format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "flow_lint/basic/finding.hpp"

namespace flow_lint
{

/**
 * Make agent-authored text safe to print on a terminal.
 *
 * Line breaks and tabs become spaces; every other control character
 * (including ESC, so no escape sequence survives) is removed.
 */
[[nodiscard]] std::string sanitize_display_text(std::string_view text);

/**
 * Prints findings in a compiler-like format.
 *
 * Produces output like:
 *   error[FL300]: Potential Stuck Page (No Input, No True Route)
 *     --> flow 'Default Start Flow', page 'Confirm'
 *      = help: add a route with condition "true" and a target
 */
class FindingPrinter
{
public:
  /**
   * Create a finding printer.
   *
   * @param os Output stream (typically std::cout)
   * @param use_color Whether to use terminal colors
   */
  explicit FindingPrinter(std::ostream & os, bool use_color = true);

  void print(const Finding & finding);

  /// Print every finding followed by the summary line.
  void print_all(const FindingBag & findings);

  /// "2 errors, 1 warning, 0 infos"
  void print_summary(const FindingBag & findings);

private:
  void print_severity_header(const Finding & finding);
  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace flow_lint
