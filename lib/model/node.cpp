// dml/model/node.cpp - Node helpers
#include "dml/model/node.hpp"

#include <fmt/core.h>

#include "dml/basic/diagnostic.hpp"

namespace dml
{

std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
    case NodeKind::Source:
      return "source";
    case NodeKind::Using:
      return "using";
    case NodeKind::Namespace:
      return "namespace";
    case NodeKind::Context:
      return "context";
    case NodeKind::Service:
      return "service";
    case NodeKind::Entity:
      return "entity";
    case NodeKind::Aspect:
      return "aspect";
    case NodeKind::Type:
      return "type";
    case NodeKind::Event:
      return "event";
    case NodeKind::AnnotationDef:
      return "annotation";
    case NodeKind::Action:
      return "action";
    case NodeKind::Function:
      return "function";
    case NodeKind::Element:
      return "element";
    case NodeKind::EnumValue:
      return "enum";
    case NodeKind::Param:
      return "param";
    case NodeKind::Key:
      return "key";
    case NodeKind::Mixin:
      return "mixin";
    case NodeKind::Query:
      return "query";
    case NodeKind::TableAlias:
      return "$tableAlias";
    case NodeKind::Builtin:
      return "builtin";
    case NodeKind::MagicVar:
      return "$magicVariable";
  }
  return "unknown";
}

QueryData & Node::query_info()
{
  if (!query_data) {
    throw InternalError(fmt::format("node '{}' ({}) carries no query", name, to_string(kind)));
  }
  return *query_data;
}

const QueryData & Node::query_info() const
{
  if (!query_data) {
    throw InternalError(fmt::format("node '{}' ({}) carries no query", name, to_string(kind)));
  }
  return *query_data;
}

SourceData & Node::source_info()
{
  if (!source_data) {
    throw InternalError(fmt::format("node '{}' ({}) is not a source", name, to_string(kind)));
  }
  return *source_data;
}

const SourceData & Node::source_info() const
{
  if (!source_data) {
    throw InternalError(fmt::format("node '{}' ({}) is not a source", name, to_string(kind)));
  }
  return *source_data;
}

const Annotation * Node::annotation(std::string_view anno) const noexcept
{
  for (const auto & a : annotations) {
    if (a.name == anno) return &a;
  }
  // Before merging, the last assignment is the best guess.
  const Annotation * found = nullptr;
  for (const auto & a : assignments) {
    if (a.name == anno) found = &a;
  }
  return found;
}

std::optional<bool> Node::annotation_flag(std::string_view anno) const noexcept
{
  const Annotation * a = annotation(anno);
  if (!a) return std::nullopt;
  if (!a->value) return true;  // `@anno` without value
  const auto * lit = dyn_cast<LiteralExpr>(a->value);
  if (!lit || lit->literal != LiteralKind::Boolean) return std::nullopt;
  return lit->text == "true";
}

}  // namespace dml
