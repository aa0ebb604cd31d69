// dml/sema/resolution/path_resolver.hpp - Resolution of qualified references
#pragma once

#include "dml/basic/diagnostic.hpp"
#include "dml/model/expr.hpp"
#include "dml/sema/resolution/environment.hpp"
#include "dml/sema/resolution/resolve_policy.hpp"

namespace dml
{

class SemaContext;

/**
 * Resolves references path step by path step.
 *
 * The first step is looked up as an artifact or in the value environment
 * selected by the context's policy; every later step is a member lookup in
 * the node reached so far. The first failing step reports one diagnostic
 * and stores NotFound/Ambiguous in the reference, so that resolving the
 * same reference again is free and silent.
 */
class PathResolver
{
public:
  explicit PathResolver(SemaContext & sema) : sema_(sema) {}

  /**
   * Resolve a reference.
   *
   * @param ref Reference; its resolution cell is written once
   * @param ctx Reference context selecting the policy
   * @param user Node the reference belongs to (dependency source)
   * @param env Value environment
   * @return The stored resolution
   */
  [[nodiscard]] Resolution resolve(
    RefExpr & ref, RefContext ctx, NodeId user, const ResolveEnv & env);

  /// Resolve every reference in an expression.
  void resolve_expr(Expr * expr, RefContext ctx, NodeId user, const ResolveEnv & env);

  /// Source entity a FROM reference denotes (the target for `E:assoc`).
  [[nodiscard]] NodeId source_of(const RefExpr & from_ref);

private:
  Resolution resolve_artifact_path(
    RefExpr & ref, const ResolvePolicy & policy, NodeId user, const ResolveEnv & env);
  Resolution resolve_value_path(
    RefExpr & ref, const ResolvePolicy & policy, NodeId user, const ResolveEnv & env);

  /// Lookup of the first step of a value reference in the query/structure environment.
  Resolution lookup_value_root(
    RefExpr & ref, const ResolvePolicy & policy, NodeId user, const ResolveEnv & env);
  Resolution lookup_in_query(
    PathStep & step, const ResolvePolicy & policy, NodeId user, const ResolveEnv & env,
    bool & found);

  /// Member steps from index `first` on.
  Resolution resolve_steps(
    RefExpr & ref, size_t first, const ResolvePolicy & policy, NodeId user, const ResolveEnv & env);

  void resolve_step_extras(
    PathStep & step, NodeId node, const ResolvePolicy & policy, NodeId user,
    const ResolveEnv & env);

  void report_not_found(
    std::string_view id, const PathStep & step, NodeId user, std::string_view variant,
    MessageArgs args, const Dict * valid);

  SemaContext & sema_;
};

}  // namespace dml
