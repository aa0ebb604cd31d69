// dml/sema/queries/query_inference.hpp - Elements of queries
#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "dml/model/model.hpp"
#include "dml/sema/resolution/environment.hpp"

namespace dml
{

class SemaContext;

/**
 * Populates the `elements` of views and queries.
 *
 * Explicit columns become elements in their order; a wildcard inserts the
 * combined source elements at its position, where an explicit column of the
 * same name takes the place of the wildcard element. Elements that are
 * plain references to source elements record a projection link.
 */
class QueryInference
{
public:
  explicit QueryInference(SemaContext & sema) : sema_(sema) {}

  /// Populate the elements of a main artifact with a query (on demand, once).
  void populate(NodeId art);

  /**
   * Register `art` as descendant of the entities it selects from by plain
   * name, so that redirection sees every projection before any view is
   * populated.
   */
  void register_sources(NodeId art);

  /// Populate one query node (leading query, set argument or sub-query).
  void populate_query(NodeId query);

  /// Environment for references in the columns and clauses of `query`.
  [[nodiscard]] ResolveEnv query_env(NodeId query, const ResolveEnv * outer = nullptr) const;

  /// Create the artifact `name` as projection on `target` in `service`.
  NodeId create_projection(const std::string & name, NodeId target, NodeId service);

private:
  void init_sources(NodeId query);
  void add_source_alias(NodeId query, NodeId alias);
  void collect_aliases(const FromItem & item, std::vector<NodeId> & out) const;

  void infer_columns(
    NodeId query, NodeId owner, const std::vector<Column> & columns, const Dict & candidates,
    const Dict * candidate_aliases, const ResolveEnv & env, const std::string & prefix);

  /// Element name of an explicit column, empty if none can be derived.
  [[nodiscard]] std::string column_name(const Column & col) const;

  NodeId create_column_element(
    NodeId owner, const Column & col, const std::string & name, const ResolveEnv & env);
  NodeId create_wildcard_element(NodeId owner, NodeId source, const std::string & name);

  void copy_association(NodeId elem, NodeId source);
  void check_specified_elements(NodeId art);

  SemaContext & sema_;
};

}  // namespace dml
