// dml/sema/types/effective_type.hpp - Effective types of nodes
#pragma once

#include "dml/model/links.hpp"
#include "dml/model/model.hpp"

namespace dml
{

class SemaContext;

/**
 * Computes the effective type of a node: the first node of its type chain
 * (`type`, `type of`, origin links of inferred nodes) that carries elements,
 * an enum, a target or items, or is a builtin or an entity-like artifact.
 *
 * Results are memoized per node in the LinkTable. Every node of a chain is
 * marked InProgress while the chain is walked; reaching such a node again
 * makes the whole chain Cyclic. Cycles are not reported here.
 */
class EffectiveTypeEngine
{
public:
  explicit EffectiveTypeEngine(SemaContext & sema) : sema_(sema) {}

  TypeResult effective(NodeId n);

  /// Node carrying the `target` of an association typed node, or invalid.
  [[nodiscard]] NodeId association_of(NodeId n);

  /// Target artifact of an association node; resolves the target on demand.
  [[nodiscard]] NodeId target_of(NodeId n);

  [[nodiscard]] bool is_to_many(NodeId n);

  /// Elements visible below `n`; nullptr for scalar nodes.
  [[nodiscard]] const Dict * elements_of(NodeId n);

private:
  [[nodiscard]] bool is_terminal(const Node & n) const;
  /// Next node of the chain; `stop` receives the final result if there is none.
  NodeId next_in_chain(NodeId n, TypeResult & stop);
  void expand(NodeId n, NodeId terminal);

  SemaContext & sema_;
};

}  // namespace dml
