// dml/basic/diagnostic.hpp - Diagnostic types for model resolution
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "dml/basic/source_location.hpp"

namespace dml
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

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

enum class LabelStyle : uint8_t {
  Primary,    // direct cause
  Secondary,  // related location
};

struct Label
{
  SourceLocation location;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

/// Substitution argument of a message template, e.g. {"art", "ns.Books"}.
using MessageArg = std::pair<std::string, std::string>;
using MessageArgs = std::vector<MessageArg>;

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // message id, e.g. "ref-undefined-art"
  std::string message;  // formatted text
  std::string message_template;
  MessageArgs args;
  std::string home;  // display name of the artifact or member the message is about

  std::vector<Label> labels;
  std::optional<std::string> help_message;
  std::vector<std::string> valid_names;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceLocation primary_location() const noexcept;

  /// Value of a substitution argument, empty if absent.
  [[nodiscard]] std::string_view arg(std::string_view name) const noexcept;
};

/**
 * Thrown for internal invariant violations (a defect of an earlier phase or
 * of the resolver itself), never for user modeling mistakes.
 */
class InternalError : public std::logic_error
{
public:
  explicit InternalError(const std::string & what) : std::logic_error(what) {}
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic with a fluent interface and adds it to the bag in its
 * destructor (RAII).
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
    SourceLocation location, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceLocation location, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

  DiagnosticBuilder & with_home(std::string home);

  DiagnosticBuilder & with_valid_names(std::vector<std::string> names);

  /// Drop the diagnostic instead of adding it (used for repeated reports).
  void discard() noexcept { active_ = false; }

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

  // Builder Starters
  DiagnosticBuilder report_error(
    SourceLocation location, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceLocation location, std::string message, std::string label_message = "");
  DiagnosticBuilder report_info(
    SourceLocation location, std::string message, std::string label_message = "");
  DiagnosticBuilder report_hint(
    SourceLocation location, std::string message, std::string label_message = "");

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  /// All diagnostics with the given message id.
  [[nodiscard]] std::vector<Diagnostic> with_code(std::string_view code) const;
  [[nodiscard]] size_t count(std::string_view code) const;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace dml
