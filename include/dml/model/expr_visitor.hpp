// dml/model/expr_visitor.hpp - CRTP visitors over expressions
#pragma once

#include <type_traits>

#include "dml/basic/casting.hpp"
#include "dml/model/expr.hpp"

namespace dml
{

namespace detail
{

template <typename ExprPtrT, typename DerivedExpr>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<ExprPtrT>>, const DerivedExpr *, DerivedExpr *>;

}  // namespace detail

// ============================================================================
// ExprVisitor - CRTP dispatch
// ============================================================================

/**
 * CRTP visitor dispatching on ExprKind.
 *
 * Derived classes implement `visit_<snake>` for the kinds they care about;
 * the defaults forward to `visit_expr`.
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType Result of the visit methods
 * @tparam ExprPtrT `Expr *` or `const Expr *`
 */
template <typename Derived, typename ReturnType = void, typename ExprPtrT = Expr *>
class ExprVisitor
{
public:
  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(ExprPtrT expr)
  {
    if (!expr) {
      return ReturnType();
    }
    switch (expr->kind) {
#define DML_EXPR(Class, Kind, Snake) \
  case ExprKind::Kind:               \
    return get_derived().visit_##Snake(cast<Class>(expr));
#include "dml/model/expr_nodes.def"
    }
    return ReturnType();
  }

#define DML_EXPR(Class, Kind, Snake)                                        \
  ReturnType visit_##Snake(detail::propagate_const_t<ExprPtrT, Class> expr) \
  {                                                                         \
    return get_derived().visit_expr(expr);                                  \
  }
#include "dml/model/expr_nodes.def"

  ReturnType visit_expr(ExprPtrT /*expr*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstExprVisitor = ExprVisitor<Derived, ReturnType, const Expr *>;

// ============================================================================
// RecursiveExprVisitor - Traverses children automatically
// ============================================================================

/**
 * Visits every sub-expression, including arguments and filters attached to
 * reference path steps. Return false from a visit method to stop.
 */
template <typename Derived, typename ExprPtrT = Expr *>
class RecursiveExprVisitor : public ExprVisitor<Derived, bool, ExprPtrT>
{
  using Base = ExprVisitor<Derived, bool, ExprPtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using Ptr = detail::propagate_const_t<ExprPtrT, T>;

  bool visit_ref(Ptr<RefExpr> ref)
  {
    for (auto & step : ref->path) {
      for (auto & arg : step.args) {
        if (!get_derived().visit(arg.value)) return false;
      }
      if (step.where && !get_derived().visit(step.where)) return false;
    }
    return true;
  }

  bool visit_op(Ptr<OpExpr> op)
  {
    for (auto * arg : op->args) {
      if (!get_derived().visit(arg)) return false;
    }
    return true;
  }

  bool visit_func(Ptr<FuncExpr> fn)
  {
    for (auto * arg : fn->args) {
      if (!get_derived().visit(arg)) return false;
    }
    return true;
  }

  bool visit_cast(Ptr<CastExpr> c)
  {
    if (!get_derived().visit(c->arg)) return false;
    return get_derived().visit(c->type);
  }

  bool visit_array(Ptr<ArrayExpr> a)
  {
    for (auto * item : a->items) {
      if (!get_derived().visit(item)) return false;
    }
    return true;
  }

  bool visit_struct(Ptr<StructExpr> s)
  {
    for (auto & field : s->fields) {
      if (!get_derived().visit(field.value)) return false;
    }
    return true;
  }

  bool visit_expr(ExprPtrT /*expr*/) { return true; }
};

}  // namespace dml
