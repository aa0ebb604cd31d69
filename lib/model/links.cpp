// dml/model/links.cpp - Link side tables
#include "dml/model/links.hpp"

#include <utility>

namespace dml
{

namespace
{
const std::vector<NodeId> k_no_nodes;
const std::vector<Dependency> k_no_deps;
}  // namespace

NodeId LinkTable::origin(NodeId n) const
{
  auto it = origin_.find(n);
  return it == origin_.end() ? NodeId::invalid() : it->second;
}

void LinkTable::set_origin(NodeId n, NodeId origin) { origin_[n] = origin; }

void LinkTable::add_projection(NodeId source_elem, NodeId query_elem)
{
  auto & list = projections_[source_elem];
  for (NodeId p : list) {
    if (p == query_elem) return;
  }
  list.push_back(query_elem);
}

const std::vector<NodeId> & LinkTable::projections(NodeId source_elem) const
{
  auto it = projections_.find(source_elem);
  return it == projections_.end() ? k_no_nodes : it->second;
}

void LinkTable::add_descendant(NodeId base, NodeId view)
{
  auto & list = descendants_[base];
  for (NodeId d : list) {
    if (d == view) return;
  }
  list.push_back(view);
}

const std::vector<NodeId> & LinkTable::descendants(NodeId base) const
{
  auto it = descendants_.find(base);
  return it == descendants_.end() ? k_no_nodes : it->second;
}

void LinkTable::set_redirected(NodeId assoc, RedirectionRecord record)
{
  redirected_[assoc] = std::move(record);
}

const RedirectionRecord * LinkTable::redirected(NodeId assoc) const
{
  auto it = redirected_.find(assoc);
  return it == redirected_.end() ? nullptr : &it->second;
}

void LinkTable::add_dependency(NodeId user, Dependency dep) { deps_[user].push_back(dep); }

const std::vector<Dependency> & LinkTable::dependencies(NodeId user) const
{
  auto it = deps_.find(user);
  return it == deps_.end() ? k_no_deps : it->second;
}

}  // namespace dml
