// dml/sema/associations/association_rewriter.hpp - Foreign keys and ON of derived associations
#pragma once

#include <vector>

#include "dml/model/model.hpp"

namespace dml
{

class SemaContext;

/**
 * Rewrites the join information of query elements that project an
 * association.
 *
 * Managed associations get their foreign keys re-derived against the
 * (possibly redirected) target; unmanaged associations get a copy of the
 * original ON-condition whose references point to the view's elements and
 * through the new target.
 */
class AssociationRewriter
{
public:
  explicit AssociationRewriter(SemaContext & sema) : sema_(sema) {}

  /// Rewrite all association elements of a definition.
  void rewrite_artifact(NodeId art);

  /// Rewrite one element; its origin association is rewritten first.
  void rewrite(NodeId elem);

  /**
   * Element of the new target that projects `elem` of the original target,
   * following the views of a redirection chain; invalid if not projected.
   */
  [[nodiscard]] NodeId map_through(NodeId elem, const std::vector<NodeId> & chain) const;

private:
  void rewrite_members(NodeId owner);
  void derive_keys(NodeId elem, NodeId assoc, const RedirectionRecord * record);
  void check_explicit_keys(NodeId elem, NodeId assoc);

  SemaContext & sema_;
};

}  // namespace dml
