// dml/sema/associations/redirector.hpp - Redirection of association targets
#pragma once

#include <string>
#include <vector>

#include "dml/model/model.hpp"

namespace dml
{

class SemaContext;

/**
 * Redirects associations of service entities to projections of their
 * targets that the same service exposes.
 *
 * Candidates are the views registered as (transitive) descendants of the
 * original target. An explicit `@cds.redirection.target: true` wins over
 * the others, `false` removes a view from the candidates. Among the rest,
 * the one all others derive from wins; otherwise the redirection is
 * ambiguous. Without candidate the target may be autoexposed.
 */
class Redirector
{
public:
  explicit Redirector(SemaContext & sema) : sema_(sema) {}

  /// Redirect the association `elem` of a service entity (once per element).
  void redirect_implicitly(NodeId elem);

  /**
   * Redirect the query element `elem` to the target written in its column
   * (`assoc : redirected to Target`).
   */
  void redirect_explicitly(NodeId elem, RefExpr & target);

  /// Views from `view` down to (excluding) `base` along the query sources.
  [[nodiscard]] std::vector<std::vector<NodeId>> chains(NodeId view, NodeId base);

  /// Entities and views a view directly selects from.
  [[nodiscard]] std::vector<NodeId> direct_sources(NodeId view);

  /// A view with a join, a union or a sub-query in FROM.
  [[nodiscard]] bool is_complex(NodeId view) const;

private:
  [[nodiscard]] std::vector<NodeId> candidates(NodeId elem, NodeId target, NodeId service);
  [[nodiscard]] NodeId autoexpose(NodeId elem, NodeId target, NodeId service);
  [[nodiscard]] bool may_autoexpose(NodeId elem, NodeId target) const;
  [[nodiscard]] std::string autoexposed_name(NodeId target, NodeId service) const;

  void collect_chains(
    NodeId view, NodeId base, std::vector<NodeId> & path,
    std::vector<std::vector<NodeId>> & out);
  void collect_query_sources(NodeId query, std::vector<NodeId> & out);

  void apply(NodeId elem, NodeId original, NodeId target, std::vector<NodeId> chain, bool implicit);

  SemaContext & sema_;
};

}  // namespace dml
