// dml/model/node.hpp - Definitions and members of the model
//
// A Node is an artifact (entity, type, service, ...) or one of its members
// (element, parameter, foreign key, enum value, ...). Nodes own their
// members through the member dictionaries; all other relations are NodeId
// links or side tables in LinkTable.
//
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "dml/basic/source_location.hpp"
#include "dml/model/dict.hpp"
#include "dml/model/expr.hpp"
#include "dml/model/node_id.hpp"

namespace dml
{

// ============================================================================
// Kinds
// ============================================================================

enum class NodeKind : uint8_t {
  // Blocks
  Source,
  Using,
  // Main artifacts
  Namespace,
  Context,
  Service,
  Entity,
  Aspect,
  Type,
  Event,
  AnnotationDef,
  Action,
  Function,
  // Members
  Element,
  EnumValue,
  Param,
  Key,
  Mixin,
  // Query structure
  Query,
  TableAlias,
  // Builtin environment
  Builtin,
  MagicVar,
};

[[nodiscard]] std::string_view to_string(NodeKind kind) noexcept;

[[nodiscard]] constexpr bool is_main_kind(NodeKind k) noexcept
{
  return k >= NodeKind::Namespace && k <= NodeKind::Function;
}

[[nodiscard]] constexpr bool is_member_kind(NodeKind k) noexcept
{
  return k >= NodeKind::Element && k <= NodeKind::Mixin;
}

enum class QueryOp : uint8_t {
  Select,
  Union,
};

enum class JoinKind : uint8_t {
  None,
  Inner,
  Left,
  Right,
  Full,
  Cross,
};

enum class ColumnNesting : uint8_t {
  None,
  Expand,  ///< `assoc { a, b }`: structured result element
  Inline,  ///< `assoc.{ a, b }`: flattened into the parent as `assoc_a`
};

// ============================================================================
// Payload structures
// ============================================================================

/// One annotation assignment, `@name: value`.
struct Annotation
{
  std::string name;  ///< without the leading '@'
  Expr * value = nullptr;
  SourceLocation location;
  NodeId source;  ///< source whose layer the assignment belongs to
  bool from_extension = false;  ///< assigned by an `annotate` extension
};

/// Explicit foreign key of a managed association (`{ id as bId }`).
struct ForeignKeySpec
{
  RefExpr * ref = nullptr;
  std::string alias;
  SourceLocation location;
};

/// A select item as written; turned into an element during inference.
struct Column
{
  SourceLocation location;
  bool wildcard = false;
  Expr * value = nullptr;
  std::string alias;
  bool key = false;
  bool virtual_ = false;
  RefExpr * cast_type = nullptr;
  RefExpr * redirected = nullptr;  ///< explicit redirection target
  Expr * on = nullptr;             ///< explicit ON of a redirection
  std::vector<ForeignKeySpec> keys;
  bool has_keys = false;
  ColumnNesting nesting = ColumnNesting::None;
  std::vector<Column> nested;
  std::vector<Annotation> annotations;
};

/// FROM clause: leaves are table aliases, inner nodes are joins.
struct FromItem
{
  JoinKind join = JoinKind::None;
  NodeId alias;
  std::vector<FromItem> args;
  Expr * on = nullptr;
  SourceLocation location;
};

struct QueryData
{
  QueryOp op = QueryOp::Select;
  std::vector<NodeId> set_args;
  FromItem from;
  std::vector<Column> columns;
  bool has_columns = false;
  Dict table_aliases;
  Dict mixins;
  /// All source elements visible to wildcards and unqualified references
  Dict combined;
  /// Table alias of each `combined` node, entry by entry in the same order
  Dict combined_aliases;
  std::vector<std::pair<std::string, SourceLocation>> excluding;
  Expr * where = nullptr;
  Expr * having = nullptr;
  std::vector<Expr *> group_by;
  std::vector<Expr *> order_by;
  /// Node whose `elements` receive the output columns
  NodeId elements_owner;
};

/// `annotate X with @a { elem @b; }` and its nested member extensions.
struct Extension
{
  std::string name;
  RefExpr * ref = nullptr;  ///< top-level extensions only
  SourceLocation location;
  NodeId source;
  std::vector<Annotation> annotations;
  std::vector<Extension> elements;
  std::vector<Extension> params;
  std::vector<Extension> actions;
  /// `extend X with { ... }`: elements added to the artifact
  bool extend = false;
  std::vector<NodeId> new_elements;
};

struct SourceData
{
  std::string file;
  std::string namespace_name;
  std::vector<std::string> dependencies;
  Dict usings;
  std::vector<NodeId> definitions;
  std::vector<Extension> extensions;
};

// ============================================================================
// Node
// ============================================================================

struct Node
{
  NodeId id;
  NodeKind kind = NodeKind::Element;
  /// Local name: element name, alias, or the full name of a main artifact
  std::string name;
  /// Absolute name of the main artifact this node belongs to
  std::string absolute;
  SourceLocation location;

  NodeId parent;
  NodeId main;
  NodeId block;    ///< source file the node was defined in
  NodeId service;  ///< innermost enclosing service of a main artifact

  RefExpr * type = nullptr;
  RefExpr * target = nullptr;
  Expr * on = nullptr;
  Expr * value = nullptr;  ///< column expression, foreign key reference
  Expr * default_value = nullptr;
  RefExpr * from_ref = nullptr;  ///< table alias source

  bool to_many = false;
  bool composition = false;
  bool key = false;
  bool virtual_ = false;
  bool masked = false;
  bool structured = false;  ///< declared with an element list
  bool inferred = false;    ///< created by the resolver
  bool implicit_keys = false;
  bool has_keys = false;  ///< explicit foreign keys were given
  bool explicit_on = false;  ///< ON given with an explicit redirection

  Dict elements;
  Dict enum_values;
  Dict actions;
  Dict params;
  Dict foreign_keys;
  Dict specified_elements;
  NodeId items;
  NodeId returns;

  std::vector<RefExpr *> includes;
  std::vector<Annotation> assignments;
  std::vector<Annotation> annotations;

  NodeId query;
  std::unique_ptr<QueryData> query_data;
  std::unique_ptr<SourceData> source_data;

  /// Query payload; throws InternalError if this node is not a query.
  [[nodiscard]] QueryData & query_info();
  [[nodiscard]] const QueryData & query_info() const;

  /// Source payload; throws InternalError if this node is not a source.
  [[nodiscard]] SourceData & source_info();
  [[nodiscard]] const SourceData & source_info() const;

  /// Chosen annotation value, or the last assignment before merging.
  [[nodiscard]] const Annotation * annotation(std::string_view name) const noexcept;

  /// true/false for boolean annotation values, nullopt if absent or not boolean.
  [[nodiscard]] std::optional<bool> annotation_flag(std::string_view name) const noexcept;

  [[nodiscard]] bool is_association() const noexcept { return target != nullptr; }
  [[nodiscard]] bool has_query() const noexcept { return query.is_valid(); }
};

}  // namespace dml
