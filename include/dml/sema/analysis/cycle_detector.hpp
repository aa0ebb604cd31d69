// dml/sema/analysis/cycle_detector.hpp - Illegal reference cycles
#pragma once

#include "dml/model/model.hpp"

namespace dml
{

class SemaContext;

/**
 * Reports `ref-cyclic` for the dependency edges recorded during resolution
 * that lie on a cycle.
 *
 * Nodes are the users and targets of recorded references; a member is also
 * reached silently from its main artifact. Strongly connected components
 * with more than one node, or with a self edge, are cycles. Each non-silent
 * edge inside such a component is reported at its own location.
 */
class CycleDetector
{
public:
  explicit CycleDetector(SemaContext & sema) : sema_(sema) {}

  /// @return number of reported edges
  size_t run();

private:
  SemaContext & sema_;
};

}  // namespace dml
