// flow_lint/basic/finding.hpp - Finding types produced by analysis passes
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flow_lint
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for findings.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
};

/**
 * Which analysis pass produced a finding.
 */
enum class FindingCategory : uint8_t {
  UnreachablePage,
  MissingEventHandler,
  StuckPage,
  UnusedRouteGroup,
  InfiniteLoop,
  PossibleInfiniteLoop,
};

/// Page column value for findings that are not about a single page.
inline constexpr const char * k_no_page = "N/A";

struct Finding
{
  Severity severity = Severity::Warning;
  FindingCategory category = FindingCategory::UnreachablePage;
  std::string code;  // e.g., "FL100"

  std::string flow;  // flow display name
  std::string page;  // page display name or k_no_page
  std::string message;

  std::optional<std::string> help_message;

  friend bool operator==(const Finding & a, const Finding & b)
  {
    return a.severity == b.severity && a.category == b.category && a.code == b.code &&
           a.flow == b.flow && a.page == b.page && a.message == b.message &&
           a.help_message == b.help_message;
  }
  friend bool operator!=(const Finding & a, const Finding & b) { return !(a == b); }
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;
[[nodiscard]] std::string_view to_string(FindingCategory category) noexcept;

/// Stable short code for a category ("FL100", ...).
[[nodiscard]] std::string_view default_code(FindingCategory category) noexcept;

/// Parse "info" / "warning" / "error" (case-insensitive).
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view text) noexcept;

/// True if `s` is at least as severe as `threshold`.
[[nodiscard]] constexpr bool is_at_least(Severity s, Severity threshold) noexcept
{
  return static_cast<uint8_t>(s) <= static_cast<uint8_t>(threshold);
}

// ============================================================================
// Forward Declarations
// ============================================================================

class FindingBag;

// ============================================================================
// FindingBuilder
// ============================================================================

/**
 * Builds a finding fluently and registers it into the bag on destruction (RAII).
 */
class FindingBuilder
{
public:
  FindingBuilder(FindingBag & bag, Finding finding);

  FindingBuilder(const FindingBuilder &) = delete;
  FindingBuilder & operator=(const FindingBuilder &) = delete;

  FindingBuilder(FindingBuilder && other) noexcept;

  ~FindingBuilder();

  FindingBuilder & with_code(std::string code);

  FindingBuilder & with_help(std::string help_msg);

private:
  FindingBag & bag_;
  Finding finding_;
  bool active_ = true;
};

// ============================================================================
// FindingBag
// ============================================================================

class FindingBag
{
public:
  FindingBag() = default;

  FindingBag(const FindingBag &) = default;
  FindingBag & operator=(const FindingBag &) = default;
  FindingBag(FindingBag &&) = default;
  FindingBag & operator=(FindingBag &&) = default;

  // Builder Starters
  FindingBuilder report_error(
    FindingCategory category, std::string flow, std::string page, std::string message);
  FindingBuilder report_warning(
    FindingCategory category, std::string flow, std::string page, std::string message);
  FindingBuilder report_info(
    FindingCategory category, std::string flow, std::string page, std::string message);

  // Add
  void add(Finding && finding);
  void add(const Finding & finding);

  // Accessors
  [[nodiscard]] const std::vector<Finding> & all() const { return findings_; }
  [[nodiscard]] bool empty() const { return findings_.empty(); }
  [[nodiscard]] size_t size() const { return findings_.size(); }

  [[nodiscard]] std::vector<Finding> errors() const;
  [[nodiscard]] std::vector<Finding> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;
  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] size_t count(FindingCategory category) const;

  /// Findings at least as severe as `threshold`, in order.
  [[nodiscard]] FindingBag filtered(Severity threshold) const;

  // Utilities
  void merge(FindingBag && other);
  void merge(const FindingBag & other);

  [[nodiscard]] auto begin() const { return findings_.begin(); }
  [[nodiscard]] auto end() const { return findings_.end(); }

private:
  FindingBuilder make(
    Severity severity, FindingCategory category, std::string flow, std::string page,
    std::string message);

  std::vector<Finding> findings_;
};

}  // namespace flow_lint
