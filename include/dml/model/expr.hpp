// dml/model/expr.hpp - Expression and reference nodes
//
// Expressions (ON-conditions, column values, filters, defaults, annotation
// values) form a closed sum type. All nodes live in an ExprContext arena and
// are trivially destructible.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string>
#include <string_view>

#include "dml/basic/casting.hpp"
#include "dml/basic/source_location.hpp"
#include "dml/model/node_id.hpp"

namespace dml
{

enum class ExprKind : uint8_t {
#define DML_EXPR(Class, Kind, Snake) Kind,
#include "dml/model/expr_nodes.def"
};

[[nodiscard]] std::string_view to_string(ExprKind kind) noexcept;

// ============================================================================
// Base Classes
// ============================================================================

class Expr
{
public:
  const ExprKind kind;
  SourceLocation location;

  Expr(const Expr &) = delete;
  Expr & operator=(const Expr &) = delete;
  Expr(Expr &&) = delete;
  Expr & operator=(Expr &&) = delete;

  [[nodiscard]] ExprKind get_kind() const noexcept { return kind; }

protected:
  explicit Expr(ExprKind k, SourceLocation loc = {}) : kind(k), location(loc) {}
  ~Expr() = default;
};

template <typename Derived, ExprKind K>
class ExprBase : public Expr
{
public:
  static constexpr ExprKind k_kind = K;

  static bool classof(const Expr * e) { return e->get_kind() == K; }

protected:
  explicit ExprBase(SourceLocation loc = {}) : Expr(K, loc) {}
};

// ============================================================================
// References
// ============================================================================

/// Outcome stored in a reference's write-once resolution cell.
enum class ResolutionState : uint8_t {
  Unresolved,
  NotFound,
  Ambiguous,
  Cyclic,
  Bound,
};

struct Resolution
{
  ResolutionState state = ResolutionState::Unresolved;
  NodeId node;

  [[nodiscard]] static Resolution bound(NodeId n) noexcept { return {ResolutionState::Bound, n}; }
  [[nodiscard]] static Resolution not_found() noexcept { return {ResolutionState::NotFound, {}}; }
  [[nodiscard]] static Resolution ambiguous() noexcept { return {ResolutionState::Ambiguous, {}}; }
  [[nodiscard]] static Resolution cyclic() noexcept { return {ResolutionState::Cyclic, {}}; }

  [[nodiscard]] bool is_set() const noexcept { return state != ResolutionState::Unresolved; }
  [[nodiscard]] bool is_bound() const noexcept { return state == ResolutionState::Bound; }

  friend bool operator==(const Resolution & a, const Resolution & b) noexcept
  {
    return a.state == b.state && a.node == b.node;
  }
};

/// How the first path step of a reference is looked up.
enum class RefScope : uint8_t {
  Default,
  Param,   ///< `:p` parameter reference
  TypeOf,  ///< `type of E:elem`
};

/// Named argument of a path step (`E(p: 1)`) or field of a struct value.
struct NamedArg
{
  std::string_view name;  ///< empty for positional arguments
  SourceLocation location;
  Expr * value = nullptr;
};

struct PathStep
{
  std::string_view id;
  SourceLocation location;
  gsl::span<NamedArg> args;
  bool has_args = false;
  Expr * where = nullptr;
  /// Node this step resolved to (element, artifact, alias, ...)
  NodeId node;
};

/**
 * Qualified reference. The first step of an artifact reference may be a
 * dotted name (`ns.Books`); further steps are element names.
 */
class RefExpr : public ExprBase<RefExpr, ExprKind::Ref>
{
public:
  gsl::span<PathStep> path;
  RefScope scope = RefScope::Default;

  /// Set while the reference is being resolved (re-entry means a cycle).
  bool in_progress = false;

  explicit RefExpr(gsl::span<PathStep> p, SourceLocation loc = {}) : ExprBase(loc), path(p) {}

  [[nodiscard]] const Resolution & resolution() const noexcept { return resolution_; }

  /**
   * Store the resolution result. The cell is write-once: binding again to
   * the same result is a no-op, binding to a different one throws
   * InternalError.
   */
  void bind(Resolution r);

  /// Dotted path text, e.g. "toB.id".
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] NodeId target() const noexcept
  {
    return resolution_.is_bound() ? resolution_.node : NodeId::invalid();
  }

private:
  Resolution resolution_;
};

// ============================================================================
// Other Expressions
// ============================================================================

enum class LiteralKind : uint8_t {
  Number,
  String,
  Boolean,
  Null,
  Token,  ///< keyword/operator token kept verbatim, also `...`
  Enum,   ///< `#symbol`
};

class LiteralExpr : public ExprBase<LiteralExpr, ExprKind::Literal>
{
public:
  LiteralKind literal;
  std::string_view text;

  LiteralExpr(LiteralKind k, std::string_view t, SourceLocation loc = {})
  : ExprBase(loc), literal(k), text(t)
  {
  }

  [[nodiscard]] bool is_ellipsis() const noexcept
  {
    return literal == LiteralKind::Token && text == "...";
  }
};

/// Operator application: `=`, `and`, `not`, `in`, `exists`, ... and `xpr`
/// for token sequences that are kept unstructured.
class OpExpr : public ExprBase<OpExpr, ExprKind::Op>
{
public:
  std::string_view op;
  gsl::span<Expr *> args;

  OpExpr(std::string_view o, gsl::span<Expr *> a, SourceLocation loc = {})
  : ExprBase(loc), op(o), args(a)
  {
  }
};

class FuncExpr : public ExprBase<FuncExpr, ExprKind::Func>
{
public:
  std::string_view name;
  gsl::span<Expr *> args;

  FuncExpr(std::string_view n, gsl::span<Expr *> a, SourceLocation loc = {})
  : ExprBase(loc), name(n), args(a)
  {
  }
};

class CastExpr : public ExprBase<CastExpr, ExprKind::Cast>
{
public:
  Expr * arg;
  RefExpr * type;

  CastExpr(Expr * a, RefExpr * t, SourceLocation loc = {}) : ExprBase(loc), arg(a), type(t) {}
};

/// Sub-query in an expression; the query itself is a model node.
class SubQueryExpr : public ExprBase<SubQueryExpr, ExprKind::SubQuery>
{
public:
  NodeId query;

  explicit SubQueryExpr(NodeId q, SourceLocation loc = {}) : ExprBase(loc), query(q) {}
};

class ArrayExpr : public ExprBase<ArrayExpr, ExprKind::Array>
{
public:
  gsl::span<Expr *> items;

  explicit ArrayExpr(gsl::span<Expr *> i, SourceLocation loc = {}) : ExprBase(loc), items(i) {}
};

/// Structured annotation value `{ a: 1, b: 2 }`.
class StructExpr : public ExprBase<StructExpr, ExprKind::Struct>
{
public:
  gsl::span<NamedArg> fields;

  explicit StructExpr(gsl::span<NamedArg> f, SourceLocation loc = {}) : ExprBase(loc), fields(f) {}
};

}  // namespace dml
