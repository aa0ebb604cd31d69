// dml/model/expr.cpp - Expression helpers, builders and deep copy
#include "dml/model/expr.hpp"

#include <fmt/core.h>

#include <vector>

#include "dml/basic/diagnostic.hpp"
#include "dml/model/expr_context.hpp"
#include "dml/model/expr_visitor.hpp"

namespace dml
{

std::string_view to_string(ExprKind kind) noexcept
{
  switch (kind) {
#define DML_EXPR(Class, Kind, Snake) \
  case ExprKind::Kind:               \
    return #Snake;
#include "dml/model/expr_nodes.def"
  }
  return "expr";
}

void RefExpr::bind(Resolution r)
{
  if (r.state == ResolutionState::Unresolved) {
    throw InternalError(fmt::format("reference '{}' bound to the unresolved state", to_string()));
  }
  if (resolution_.is_set()) {
    if (resolution_ == r) {
      return;
    }
    throw InternalError(fmt::format("reference '{}' resolved twice with different results", to_string()));
  }
  resolution_ = r;
}

std::string RefExpr::to_string() const
{
  std::string out;
  if (scope == RefScope::Param) out += ':';
  for (size_t i = 0; i < path.size(); ++i) {
    if (i != 0) out += '.';
    out.append(path[i].id.data(), path[i].id.size());
  }
  return out;
}

// ============================================================================
// ExprContext builders
// ============================================================================

RefExpr * ExprContext::make_ref(const std::vector<std::string_view> & ids, SourceLocation loc)
{
  auto steps = allocate_array<PathStep>(ids.size());
  for (size_t i = 0; i < ids.size(); ++i) {
    steps[i].id = intern(ids[i]);
    steps[i].location = loc;
  }
  return create<RefExpr>(steps, loc);
}

RefExpr * ExprContext::make_bound_ref(
  const std::vector<std::string_view> & ids, NodeId target, SourceLocation loc)
{
  RefExpr * ref = make_ref(ids, loc);
  if (!ref->path.empty()) {
    ref->path[ref->path.size() - 1].node = target;
  }
  ref->bind(Resolution::bound(target));
  return ref;
}

LiteralExpr * ExprContext::make_literal(LiteralKind kind, std::string_view text, SourceLocation loc)
{
  return create<LiteralExpr>(kind, intern(text), loc);
}

// ============================================================================
// Deep copy
// ============================================================================

namespace
{

class ExprCloner : public ConstExprVisitor<ExprCloner, Expr *>
{
public:
  ExprCloner(ExprContext & ctx, RefRewriter * rewriter) : ctx_(ctx), rewriter_(rewriter) {}

  Expr * visit_ref(const RefExpr * ref)
  {
    if (rewriter_ != nullptr) {
      if (RefExpr * replaced = rewriter_->rewrite(*ref)) {
        return replaced;
      }
    }
    auto steps = ctx_.allocate_array<PathStep>(ref->path.size());
    for (size_t i = 0; i < ref->path.size(); ++i) {
      const PathStep & src = ref->path[i];
      steps[i] = src;
      steps[i].args = clone_args(src.args);
      steps[i].where = visit(src.where);
    }
    auto * copy = ctx_.create<RefExpr>(steps, ref->location);
    copy->scope = ref->scope;
    if (ref->resolution().is_set()) {
      copy->bind(ref->resolution());
    }
    return copy;
  }

  Expr * visit_literal(const LiteralExpr * lit)
  {
    return ctx_.create<LiteralExpr>(lit->literal, lit->text, lit->location);
  }

  Expr * visit_op(const OpExpr * op)
  {
    return ctx_.create<OpExpr>(op->op, clone_list(op->args), op->location);
  }

  Expr * visit_func(const FuncExpr * fn)
  {
    return ctx_.create<FuncExpr>(fn->name, clone_list(fn->args), fn->location);
  }

  Expr * visit_cast(const CastExpr * c)
  {
    auto * type = c->type ? static_cast<RefExpr *>(visit(c->type)) : nullptr;
    return ctx_.create<CastExpr>(visit(c->arg), type, c->location);
  }

  Expr * visit_sub_query(const SubQueryExpr * q)
  {
    return ctx_.create<SubQueryExpr>(q->query, q->location);
  }

  Expr * visit_array(const ArrayExpr * a)
  {
    return ctx_.create<ArrayExpr>(clone_list(a->items), a->location);
  }

  Expr * visit_struct(const StructExpr * s)
  {
    return ctx_.create<StructExpr>(clone_args(s->fields), s->location);
  }

private:
  gsl::span<Expr *> clone_list(gsl::span<Expr *> list)
  {
    auto out = ctx_.allocate_array<Expr *>(list.size());
    for (size_t i = 0; i < list.size(); ++i) {
      out[i] = visit(list[i]);
    }
    return out;
  }

  gsl::span<NamedArg> clone_args(gsl::span<NamedArg> args)
  {
    auto out = ctx_.allocate_array<NamedArg>(args.size());
    for (size_t i = 0; i < args.size(); ++i) {
      out[i] = args[i];
      out[i].value = visit(args[i].value);
    }
    return out;
  }

  ExprContext & ctx_;
  RefRewriter * rewriter_;
};

}  // namespace

Expr * clone_expr(ExprContext & ctx, const Expr * expr, RefRewriter * rewriter)
{
  ExprCloner cloner(ctx, rewriter);
  return cloner.visit(expr);
}

}  // namespace dml
