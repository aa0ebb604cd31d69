// dml/sema/analysis/layers.cpp - Source layers for annotation precedence

#include "dml/sema/analysis/layers.hpp"

#include <algorithm>
#include <functional>
#include <string>
#include <unordered_map>

namespace dml
{

LayerGraph::LayerGraph(const Model & model)
{
  std::unordered_map<std::string, NodeId> by_file;
  for (NodeId s : model.sources()) {
    by_file.emplace(model.node(s).source_info().file, s);
  }

  std::unordered_map<NodeId, std::vector<NodeId>> adj;
  for (NodeId s : model.sources()) {
    std::vector<NodeId> & out = adj[s];
    for (const auto & dep : model.node(s).source_info().dependencies) {
      auto it = by_file.find(dep);
      // Dependencies outside the model do not form layers.
      if (it != by_file.end()) out.push_back(it->second);
    }
  }

  // Tarjan: a component is completed after every component reachable from
  // it, which numbers the layers dependencies first.
  std::unordered_map<NodeId, size_t> index;
  std::unordered_map<NodeId, size_t> low;
  std::vector<NodeId> stack;
  std::unordered_map<NodeId, bool> on_stack;
  size_t next_index = 0;

  std::function<void(NodeId)> connect;
  connect = [&](NodeId v) {
    index[v] = next_index;
    low[v] = next_index;
    ++next_index;
    stack.push_back(v);
    on_stack[v] = true;

    for (NodeId w : adj[v]) {
      if (index.find(w) == index.end()) {
        connect(w);
        low[v] = std::min(low[v], low[w]);
      } else if (on_stack[w]) {
        low[v] = std::min(low[v], index[w]);
      }
    }

    if (low[v] == index[v]) {
      const size_t layer = members_.size();
      members_.emplace_back();
      NodeId w;
      do {
        w = stack.back();
        stack.pop_back();
        on_stack[w] = false;
        layer_[w] = layer;
        members_.back().push_back(w);
      } while (w != v);
    }
  };

  for (NodeId s : model.sources()) {
    if (index.find(s) == index.end()) connect(s);
  }

  reach_.assign(members_.size(), std::vector<bool>(members_.size(), false));
  for (size_t l = 0; l < members_.size(); ++l) {
    for (NodeId s : members_[l]) {
      for (NodeId dep : adj[s]) {
        const size_t m = layer_.at(dep);
        if (m == l) continue;
        reach_[l][m] = true;
        for (size_t k = 0; k < m; ++k) {
          if (reach_[m][k]) reach_[l][k] = true;
        }
      }
    }
  }
}

size_t LayerGraph::layer_of(NodeId source) const
{
  auto it = layer_.find(source);
  return it != layer_.end() ? it->second : 0;
}

bool LayerGraph::extends(size_t upper, size_t lower) const
{
  if (upper >= reach_.size() || lower >= reach_.size()) return false;
  return reach_[upper][lower];
}

}  // namespace dml
