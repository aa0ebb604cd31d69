// dml/basic/message_reporter.hpp - Registry-backed diagnostic reporting
#pragma once

#include <map>
#include <string>
#include <string_view>
#include <unordered_set>

#include "dml/basic/diagnostic.hpp"
#include "dml/basic/message_registry.hpp"

namespace dml
{

/**
 * Reports diagnostics by message id.
 *
 * Looks up default severity and text in the MessageRegistry, applies
 * configured severity overrides (only for configurable ids) and drops
 * repeated reports of the same message at the same source position.
 */
class MessageReporter
{
public:
  explicit MessageReporter(
    DiagnosticBag & bag, std::map<std::string, Severity> severity_overrides = {},
    bool attach_valid_names = false);

  /**
   * Start a diagnostic for a registered message id.
   *
   * @param id Registered message id (throws InternalError if unknown)
   * @param location Primary location
   * @param home Display name of the artifact or member the message is about
   * @param args Substitution arguments for the message text
   * @param variant Text variant, "std" by default
   */
  DiagnosticBuilder report(
    std::string_view id, SourceLocation location, std::string home, MessageArgs args = {},
    std::string_view variant = "std");

  [[nodiscard]] bool attach_valid_names() const noexcept { return attach_valid_names_; }
  [[nodiscard]] size_t error_count() const noexcept;
  [[nodiscard]] bool has_errors() const noexcept { return error_count() > 0; }

  [[nodiscard]] DiagnosticBag & bag() noexcept { return bag_; }

private:
  DiagnosticBag & bag_;
  std::map<std::string, Severity> overrides_;
  bool attach_valid_names_;
  std::unordered_set<std::string> reported_;
};

}  // namespace dml
