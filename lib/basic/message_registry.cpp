// dml/basic/message_registry.cpp - Central register of resolver messages
#include "dml/basic/message_registry.hpp"

#include <fmt/core.h>

#include <cctype>

namespace dml
{

std::string_view MessageSpec::text(std::string_view variant) const noexcept
{
  for (const auto & [name, text] : texts) {
    if (name == variant) {
      return text;
    }
  }
  return texts.empty() ? std::string_view{} : texts.front().second;
}

const MessageRegistry & MessageRegistry::instance()
{
  static const MessageRegistry registry;
  return registry;
}

const MessageSpec * MessageRegistry::find(std::string_view id) const noexcept
{
  auto it = specs_.find(id);
  return it == specs_.end() ? nullptr : &it->second;
}

MessageRegistry::MessageRegistry()
{
  constexpr Severity E = Severity::Error;
  constexpr Severity W = Severity::Warning;
  constexpr Severity I = Severity::Info;

  auto add = [this](std::string_view id, Severity s, bool configurable,
                    std::vector<std::pair<std::string_view, std::string_view>> texts) {
    specs_.emplace(id, MessageSpec{s, configurable, std::move(texts)});
  };

  // --- References -----------------------------------------------------------
  add("ref-undefined-art", E, false, {{"std", "No artifact has been found with name $(NAME)"}});
  add(
    "ref-undefined-def", E, false,
    {{"std", "Artifact $(ART) has not been found"},
     {"element", "Artifact $(ART) has no element $(MEMBER)"}});
  add(
    "ref-undefined-element", E, false,
    {{"std", "Element $(ID) has not been found"},
     {"element", "Artifact $(ART) has no element $(MEMBER)"},
     {"query", "Element $(ID) has not been found in the sources of the query"}});
  add("ref-undefined-var", E, false, {{"std", "Variable $(ID) has not been found"}});
  add(
    "ref-undefined-param", E, false,
    {{"std", "Entity $(ART) has no parameter $(ID)"},
     {"none", "Parameter $(ID) can't be used here"}});
  add("ref-ambiguous", E, false, {{"std", "Ambiguous $(ID), replace by $(NAMES)"}});
  add(
    "ref-cyclic", E, false,
    {{"std", "Illegal circular reference to $(ART)"},
     {"element", "Illegal circular reference to element $(MEMBER) of $(ART)"}});
  add(
    "ref-invalid-typeof", E, true,
    {{"std", "Only elements can be referred to with $(KEYWORD)"},
     {"self", "An element can't refer to its own type with $(KEYWORD)"}});
  add(
    "ref-unexpected-navigation", E, false,
    {{"std", "Can't follow association $(ID) here; only its foreign keys can be referred to"},
     {"unmanaged", "Can't follow the unmanaged association $(ID) here"},
     {"key", "Path step $(ID) leaves the target element of foreign key $(NAME)"}});
  add("ref-unexpected-self", E, false, {{"std", "Variable $(ID) can't be used here"}});
  add(
    "ref-rejected-on", E, false,
    {{"std", "Do not refer to an artifact like $(ID) in the explicit ON of a redirection"},
     {"mixin", "Do not refer to a mixin like $(ID) in the explicit ON of a redirection"},
     {"alias",
      "Do not refer to a source element (via table alias $(ID)) in the explicit ON of a "
      "redirection"}});
  add("ref-undefined-excluding", I, false, {{"std", "Element $(ID) has not been found in the sources, nothing is excluded"}});

  // --- Kind checks ----------------------------------------------------------
  add("expected-type", E, false, {{"std", "A type or an element is expected here"}});
  add("expected-struct", E, false, {{"std", "A type, entity, aspect or event with elements is expected here"}});
  add("expected-entity", E, false, {{"std", "An entity is expected here"}});
  add("expected-source", E, false, {{"std", "A query source must be an entity or an association"}});
  add("expected-target", E, false, {{"std", "An entity or an aspect is expected here"}});
  add("ref-sloppy-target", W, true, {{"std", "An entity or an aspect (not a type) is expected here"}});

  // --- Arguments and filters ------------------------------------------------
  add("args-no-params", E, true, {{"std", "Unexpected arguments: $(ART) has no parameters"}});
  add("args-expected-named", E, true, {{"std", "Named arguments must be provided for $(ART)"}});
  add("args-undefined-param", E, true, {{"std", "Entity $(ART) has no parameter $(ID)"}});
  add(
    "expr-no-filter", E, true,
    {{"std", "A filter can only be provided when navigating along associations"}});

  // --- Types and associations -----------------------------------------------
  add("type-missing-target", E, false, {{"std", "Type $(ART) can only be used with a target"}});
  add(
    "assoc-as-type-of", E, false,
    {{"std", "An association can't be used as type of a non-element with $(KEYWORD)"},
     {"composition", "A composition can't be used as type of a non-element with $(KEYWORD)"}});
  add("unmanaged-as-key", E, true, {{"std", "Unmanaged associations can't be used as primary key"}});
  add(
    "duplicate-definition", E, false,
    {{"std", "Duplicate definition of $(NAME)"},
     {"element", "Duplicate definition of element $(NAME)"},
     {"alias", "Duplicate definition of table alias $(NAME)"}});

  // --- Queries --------------------------------------------------------------
  add("query-req-name", E, false, {{"std", "Alias name is required for this select item"}});
  add(
    "query-missing-element", I, false,
    {{"std", "Element $(ID) is missing in the specified elements"}});
  add(
    "query-unspecified-element", E, false,
    {{"std", "Element $(ID) does not result from the query"}});
  add(
    "query-undefined-element", E, false,
    {{"std", "Element $(ID) has not been found in the elements of the query"},
     {"target", "Element $(ID) of the original target has not been found in $(ART)"}});
  add(
    "query-unexpected-structure", E, false,
    {{"std", "Unexpected $(PROP) for element $(ID) which is neither a structure nor an association"}});
  add(
    "wildcard-ambiguous", E, false,
    {{"std", "Ambiguous wildcard, select $(ID) explicitly with $(NAMES)"}});
  add(
    "wildcard-excluding-one", I, false,
    {{"std", "This select item replaces $(ID) from table alias $(ALIAS)"}});
  add(
    "wildcard-excluding-many", I, false,
    {{"std", "This select item replaces $(ID) from two or more table aliases"}});
  add(
    "query-from-many", I, false,
    {{"std",
      "Key properties are not propagated because a to-many association $(ART) is navigated "
      "in the FROM clause"}});
  add(
    "query-navigate-many", I, false,
    {{"std", "Key properties are not propagated because a to-many association $(ART) is navigated"}});
  add(
    "query-missing-keys", I, false,
    {{"std", "Key properties are not propagated because not all keys are projected: $(NAMES)"}});

  // --- Redirection ----------------------------------------------------------
  add(
    "redirected-implicitly-ambiguous", E, true,
    {{"std",
      "Target $(ART) is exposed in service $(SERVICE) by multiple projections $(NAMES); no "
      "implicit redirection"}});
  add("redirected-no-assoc", E, false, {{"std", "Only an association can be redirected"}});
  add("redirected-to-same", I, false, {{"std", "The redirected target is the original $(ART)"}});
  add(
    "redirected-to-unrelated", E, false,
    {{"std", "The redirected target does not originate from $(ART)"}});
  add(
    "redirected-to-ambiguous", E, false,
    {{"std", "The redirected target originates more than once from $(ART)"}});
  add(
    "redirected-to-complex", W, false,
    {{"std", "Redirection involves the complex view $(ART); the ON-condition might be wrong"}});
  add(
    "duplicate-autoexposed", E, false,
    {{"std", "Name $(ART) of the autoexposed entity collides with another definition"}});
  add(
    "assoc-outside-service", I, false,
    {{"std", "Association target $(TARGET) is outside any service"}});
  add(
    "assoc-target-not-in-service", W, false,
    {{"std", "Target $(TARGET) of association is not exposed by service $(SERVICE)"}});

  // --- Rewriting ------------------------------------------------------------
  add(
    "rewrite-key-not-covered-implicit", E, true,
    {{"std", "The new target $(TARGET) does not provide the foreign keys $(NAMES) of the original"},
     {"extra", "Key $(NAMES) of the new target $(TARGET) is not a foreign key of the original"}});
  add(
    "rewrite-key-not-covered-explicit", E, true,
    {{"std", "Specify foreign keys $(NAMES) of association $(ART)"},
     {"target", "The new target $(TARGET) does not provide the foreign keys $(NAMES) of the original"}});
  add(
    "rewrite-key-not-matched-implicit", E, true,
    {{"std", "No key $(NAME) is defined in original target $(TARGET)"}});
  add(
    "rewrite-key-not-matched-explicit", E, true,
    {{"std", "No foreign key $(NAME) is specified in association $(ART)"}});
  add(
    "rewrite-key-for-unmanaged", E, true,
    {{"std", "Do not specify foreign keys when redirecting the unmanaged association $(ART)"}});
  add(
    "rewrite-on-for-managed", E, true,
    {{"std", "Do not specify an ON-condition when redirecting the managed association $(ART)"}});
  add(
    "rewrite-not-supported", E, false,
    {{"std", "The ON-condition is not rewritten here; provide an explicit ON-condition"},
     {"self", "A path after $(ID) with more than one element can't be rewritten"}});
  add(
    "rewrite-not-projected", E, false,
    {{"std", "Projected association $(NAME) uses non-projected element $(ID)"}});

  // --- Annotations ----------------------------------------------------------
  add("anno-duplicate", E, true, {{"std", "Duplicate assignment with $(ANNO)"}});
  add("anno-duplicate-unrelated-layer", E, true, {{"std", "Duplicate assignment with $(ANNO)"}});
  add("anno-unexpected-ellipsis", E, false, {{"std", "Unexpected $(CODE) in annotation assignment"}});
  add(
    "anno-mismatched-ellipsis", E, false,
    {{"std",
      "An array with $(CODE) can only be used if there is an assignment below with an array "
      "value"}});
  add("anno-undefined-art", I, false, {{"std", "No artifact has been found with name $(NAME)"}});
  add("anno-undefined-element", I, false, {{"std", "Element $(NAME) has not been found in $(ART)"}});
  add("anno-undefined-param", I, false, {{"std", "Parameter $(NAME) has not been found in $(ART)"}});
  add("anno-undefined-action", I, false, {{"std", "Action $(NAME) has not been found in $(ART)"}});

  // --- Model input ----------------------------------------------------------
  add("syntax-csn-expected-object", E, false, {{"std", "Expected object for property $(PROP)"}});
  add(
    "syntax-csn-expected-reference", E, false,
    {{"std", "Expected non-empty string or object for property $(PROP)"}});
  add(
    "syntax-csn-required-subproperty", E, false,
    {{"std", "Object in $(PROP) must have the property $(SUB)"}});
  add("syntax-csn-unknown-kind", E, false, {{"std", "Unknown kind $(NAME)"}});
}

// ============================================================================
// Formatting
// ============================================================================

namespace
{

std::string upper(std::string_view s)
{
  std::string out(s);
  for (auto & c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string quote_list(std::string_view list)
{
  std::string out;
  size_t pos = 0;
  while (pos <= list.size()) {
    const size_t comma = list.find(',', pos);
    const std::string_view item =
      list.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos);
    if (!out.empty()) out += ", ";
    out += fmt::format("“{}”", item);
    if (comma == std::string_view::npos) break;
    pos = comma + 1;
  }
  return out;
}

}  // namespace

std::string format_message(std::string_view text, const MessageArgs & args)
{
  std::string out;
  out.reserve(text.size() + 32);
  size_t pos = 0;
  while (pos < text.size()) {
    const size_t open = text.find("$(", pos);
    if (open == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }
    const size_t close = text.find(')', open);
    if (close == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }
    out.append(text.substr(pos, open - pos));
    const std::string_view placeholder = text.substr(open + 2, close - open - 2);

    bool replaced = false;
    for (const auto & [key, value] : args) {
      if (upper(key) == placeholder) {
        out += (placeholder == "NAMES") ? quote_list(value) : fmt::format("“{}”", value);
        replaced = true;
        break;
      }
    }
    if (!replaced) {
      out.append(text.substr(open, close - open + 1));
    }
    pos = close + 1;
  }
  return out;
}

}  // namespace dml
