// dml/basic/message_reporter.cpp - Registry-backed diagnostic reporting
#include "dml/basic/message_reporter.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <utility>

namespace dml
{

MessageReporter::MessageReporter(
  DiagnosticBag & bag, std::map<std::string, Severity> severity_overrides,
  bool attach_valid_names)
: bag_(bag), overrides_(std::move(severity_overrides)), attach_valid_names_(attach_valid_names)
{
}

DiagnosticBuilder MessageReporter::report(
  std::string_view id, SourceLocation location, std::string home, MessageArgs args,
  std::string_view variant)
{
  const MessageSpec * spec = MessageRegistry::instance().find(id);
  if (spec == nullptr) {
    throw InternalError(fmt::format("message id '{}' is not registered", id));
  }

  Severity severity = spec->severity;
  if (spec->configurable) {
    auto it = overrides_.find(std::string(id));
    if (it != overrides_.end()) {
      severity = it->second;
    }
  }

  Diagnostic d;
  d.severity = severity;
  d.code = std::string(id);
  d.message_template = std::string(spec->text(variant));
  d.message = format_message(d.message_template, args);
  d.args = std::move(args);
  d.home = std::move(home);
  d.labels.push_back(Label{location, "", LabelStyle::Primary});

  // Only positioned reports identify a site; without a line two sites may
  // share file, home and text.
  const bool positioned = location.has_position();
  const std::string key = positioned ? fmt::format(
                                         "{}|{}:{}:{}|{}|{}", d.code, location.file.value,
                                         location.line, location.column, d.home, d.message)
                                     : std::string();
  DiagnosticBuilder builder(bag_, std::move(d));
  if (positioned && !reported_.insert(key).second) {
    builder.discard();
  }
  return builder;
}

size_t MessageReporter::error_count() const noexcept
{
  return static_cast<size_t>(std::count_if(bag_.begin(), bag_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  }));
}

}  // namespace dml
