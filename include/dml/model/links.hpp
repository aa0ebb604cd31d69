// dml/model/links.hpp - Side tables for non-owning links between nodes
//
// Resolution results that point across the ownership tree (origins,
// effective types, projections, redirections, dependency edges) live here,
// keyed by NodeId, so that the node tree itself stays a tree.
//
#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include "dml/basic/source_location.hpp"
#include "dml/model/node_id.hpp"

namespace dml
{

/// Per-node marker of an on-demand computation.
enum class Progress : uint8_t {
  Unvisited,
  InProgress,
  Done,
};

enum class TypeResultKind : uint8_t {
  Null,    ///< no terminal type (unresolved or untyped)
  Node,    ///< terminal node
  Cyclic,  ///< type chain is cyclic
};

struct TypeResult
{
  TypeResultKind kind = TypeResultKind::Null;
  NodeId node;

  [[nodiscard]] static TypeResult of(NodeId n) noexcept { return {TypeResultKind::Node, n}; }
  [[nodiscard]] static TypeResult null() noexcept { return {TypeResultKind::Null, {}}; }
  [[nodiscard]] static TypeResult cyclic() noexcept { return {TypeResultKind::Cyclic, {}}; }

  [[nodiscard]] bool is_node() const noexcept { return kind == TypeResultKind::Node; }
};

struct TypeStatus
{
  Progress progress = Progress::Unvisited;
  TypeResult result;
};

/// Phase markers of one node.
struct NodeStatus
{
  Progress includes = Progress::Unvisited;
  Progress elements = Progress::Unvisited;
  Progress keys = Progress::Unvisited;
  Progress resolved = Progress::Unvisited;
  Progress redirected = Progress::Unvisited;
  Progress rewritten = Progress::Unvisited;
};

/// Dependency edge recorded while resolving a reference.
struct Dependency
{
  NodeId art;
  SourceLocation location;
  /// Structural edge: traversed for SCCs, never reported
  bool silent = false;
};

/// Redirection of an association to a projection of its original target.
struct RedirectionRecord
{
  NodeId original_target;
  NodeId new_target;
  /// Views from the new target down to the original target
  std::vector<NodeId> chain;
  bool implicit = false;
};

class LinkTable
{
public:
  [[nodiscard]] NodeId origin(NodeId n) const;
  void set_origin(NodeId n, NodeId origin);

  [[nodiscard]] TypeStatus & type_status(NodeId n) { return type_status_[n]; }

  [[nodiscard]] NodeStatus & status(NodeId n) { return status_[n]; }

  void add_projection(NodeId source_elem, NodeId query_elem);
  [[nodiscard]] const std::vector<NodeId> & projections(NodeId source_elem) const;

  void add_descendant(NodeId base, NodeId view);
  [[nodiscard]] const std::vector<NodeId> & descendants(NodeId base) const;

  void set_redirected(NodeId assoc, RedirectionRecord record);
  [[nodiscard]] const RedirectionRecord * redirected(NodeId assoc) const;

  void add_dependency(NodeId user, Dependency dep);
  [[nodiscard]] const std::vector<Dependency> & dependencies(NodeId user) const;
  [[nodiscard]] const std::unordered_map<NodeId, std::vector<Dependency>> & all_dependencies() const
  {
    return deps_;
  }

private:
  std::unordered_map<NodeId, NodeId> origin_;
  std::unordered_map<NodeId, TypeStatus> type_status_;
  std::unordered_map<NodeId, NodeStatus> status_;
  std::unordered_map<NodeId, std::vector<NodeId>> projections_;
  std::unordered_map<NodeId, std::vector<NodeId>> descendants_;
  std::unordered_map<NodeId, RedirectionRecord> redirected_;
  std::unordered_map<NodeId, std::vector<Dependency>> deps_;
};

}  // namespace dml
