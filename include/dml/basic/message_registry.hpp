// dml/basic/message_registry.hpp - Message ids, default severities and texts
//
// Every diagnostic the resolver emits has a message id registered here.
// Texts use $(NAME) placeholders which are substituted from MessageArgs
// (argument keys are matched case-insensitively against the placeholder).
//
#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "dml/basic/diagnostic.hpp"

namespace dml
{

/**
 * Registry entry for one message id.
 */
struct MessageSpec
{
  Severity severity = Severity::Error;
  /// Severity may be changed by configuration
  bool configurable = false;
  /// Text variants; "std" is the default variant
  std::vector<std::pair<std::string_view, std::string_view>> texts;

  [[nodiscard]] std::string_view text(std::string_view variant) const noexcept;
};

class MessageRegistry
{
public:
  /// The registry of all resolver messages.
  [[nodiscard]] static const MessageRegistry & instance();

  [[nodiscard]] const MessageSpec * find(std::string_view id) const noexcept;
  [[nodiscard]] bool contains(std::string_view id) const noexcept { return find(id) != nullptr; }

private:
  MessageRegistry();

  std::unordered_map<std::string_view, MessageSpec> specs_;
};

/**
 * Substitute $(NAME) placeholders of a message template.
 *
 * Values are quoted; the NAMES placeholder expects a comma separated list
 * and quotes each entry. Unknown placeholders are kept verbatim.
 */
[[nodiscard]] std::string format_message(std::string_view text, const MessageArgs & args);

}  // namespace dml
