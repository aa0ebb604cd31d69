// dml/sema/resolution/ref_resolver.hpp - Resolution of all references of a definition
#pragma once

#include "dml/model/model.hpp"
#include "dml/sema/resolution/environment.hpp"

namespace dml
{

class SemaContext;

/**
 * Walks definitions and resolves every reference not yet resolved on
 * demand: types, targets, foreign keys, ON-conditions, defaults, query
 * clauses and parameters. Also attaches `using`s, includes and
 * extensions, which must happen before elements are inferred.
 */
class RefResolver
{
public:
  explicit RefResolver(SemaContext & sema) : sema_(sema) {}

  /// Check the `using` declarations of a source.
  void check_usings(NodeId source);

  /// Copy the elements of included artifacts in front of the own elements.
  void apply_includes(NodeId art);

  /**
   * Attach the `annotate`/`extend` statements of a source.
   *
   * @param source Source node
   * @param members false: artifact annotations and new elements;
   *                true: annotations of elements, parameters and actions
   */
  void apply_extensions(NodeId source, bool members);

  /// Resolve all references of a main artifact and its members.
  void resolve_definition(NodeId art);

  /// Resolve the clauses of a query; `outer` is the enclosing query environment.
  void resolve_query(NodeId query, const ResolveEnv * outer);

private:
  void resolve_member(NodeId member);
  void resolve_association(NodeId elem, const ResolveEnv & env);
  void resolve_columns(const std::vector<Column> & columns, NodeId view, const ResolveEnv & env);
  void resolve_from(const FromItem & item, NodeId view, const ResolveEnv & env, const ResolveEnv * outer);

  NodeId clone_member(const Node & src, NodeId parent);
  void annotate_members(const Extension & ext, NodeId target);

  SemaContext & sema_;
};

}  // namespace dml
