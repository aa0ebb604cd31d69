// dml/basic/diagnostic_printer.cpp - Compiler-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "dml/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace dml
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceLocation loc = diag.primary_location();

  // Relative path for cleaner output
  std::string filename = "<unknown>";
  if (loc.file.is_valid()) {
    const auto abs_path = sources.get_path(loc.file);
    std::error_code ec;
    auto rel_path = std::filesystem::relative(abs_path, std::filesystem::current_path(), ec);
    filename = (ec || rel_path.empty()) ? abs_path.string() : rel_path.string();
  }

  print_severity_header(diag);

  if (loc.has_position()) {
    fmt::print(os_, "{} {}:{}:{}\n", gutter_arrow(), filename, loc.line, loc.column);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  for (const auto & label : diag.labels) {
    print_label_context(label, sources);
  }

  if (!diag.home.empty()) {
    print_note(fmt::format("in {}", diag.home));
  }
  if (!diag.valid_names.empty()) {
    std::string names;
    for (const auto & n : diag.valid_names) {
      if (!names.empty()) names += ", ";
      names += n;
    }
    print_help(fmt::format("valid names: {}", names));
  }
  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<const Diagnostic *> sorted_diags;
  sorted_diags.reserve(diags.size());
  for (const auto & d : diags) {
    sorted_diags.push_back(&d);
  }

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic * a, const Diagnostic * b) {
      return a->primary_location() < b->primary_location();
    });

  for (const Diagnostic * d : sorted_diags) {
    print(*d, sources);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view severity_str = to_string(diag.severity);
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

void DiagnosticPrinter::print_label_context(const Label & label, const SourceRegistry & sources)
{
  const SourceFile * source =
    label.location.is_valid() ? sources.get_file(label.location.file) : nullptr;
  if (
    source == nullptr || source->content().empty() || !label.location.has_position() ||
    label.location.line > source->line_count()) {
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }
  print_source_line(
    *source, label.location.line - 1, label.location.column, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t column, LabelStyle style,
  std::string_view label_message)
{
  const std::string_view line = source.get_line(line_index);
  if (line.empty()) {
    return;
  }

  // Tabs -> spaces, keeping the marker column in step
  std::string cleaned_line;
  std::string marker_prefix;
  for (size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (c == '\r' || c == '\n') continue;
    const bool before_marker = i + 1 < column;
    if (c == '\t') {
      cleaned_line += "    ";
      if (before_marker) marker_prefix += "    ";
    } else {
      cleaned_line += c;
      if (before_marker) marker_prefix += ' ';
    }
  }

  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_index + 1);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_index + 1);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  fmt::print(os_, "{} {}", gutter_pipe(), marker_prefix);
  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';
  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", marker_char);
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
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

}  // namespace dml
