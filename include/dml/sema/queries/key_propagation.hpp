// dml/sema/queries/key_propagation.hpp - Primary keys of simple views
#pragma once

#include "dml/model/model.hpp"

namespace dml
{

class SemaContext;

/**
 * Marks the columns of a simple view as primary key where they project
 * the keys of its single source.
 *
 * Keys are only propagated if the view has no explicit key column, all
 * source keys are projected, and no to-many association is followed in
 * FROM or in a column. The source view is handled first.
 */
class KeyPropagation
{
public:
  explicit KeyPropagation(SemaContext & sema) : sema_(sema) {}

  void propagate(NodeId art);

private:
  [[nodiscard]] bool navigates_many(const RefExpr & ref, size_t first, NodeId art);

  SemaContext & sema_;
};

}  // namespace dml
