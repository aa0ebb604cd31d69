// dml/sema/analysis/cycle_detector.cpp - Tarjan SCC over recorded dependencies

#include "dml/sema/analysis/cycle_detector.hpp"

#include <algorithm>
#include <functional>
#include <unordered_map>
#include <vector>

#include "dml/sema/sema_context.hpp"

namespace dml
{

namespace
{

struct Edge
{
  NodeId to;
  const Dependency * dep = nullptr;  ///< null for structural member edges
};

}  // namespace

size_t CycleDetector::run()
{
  Model & model = sema_.model();
  const auto & deps = model.links().all_dependencies();

  // Build adjacency list; vertices sorted for a stable report order.
  std::unordered_map<NodeId, std::vector<Edge>> adj;
  std::vector<NodeId> vertices;
  auto add_vertex = [&](NodeId n) {
    if (adj.emplace(n, std::vector<Edge>{}).second) vertices.push_back(n);
  };
  for (const auto & [user, list] : deps) {
    add_vertex(user);
    for (const auto & d : list) {
      add_vertex(d.art);
      adj[user].push_back(Edge{d.art, &d});
    }
  }
  for (size_t i = 0; i < vertices.size(); ++i) {
    const NodeId v = vertices[i];
    const NodeId main = model.main_of(v);
    if (main && main != v) {
      add_vertex(main);
      adj[main].push_back(Edge{v, nullptr});
    }
  }
  std::sort(vertices.begin(), vertices.end());
  for (auto & [_, edges] : adj) {
    std::stable_sort(edges.begin(), edges.end(), [](const Edge & a, const Edge & b) {
      return a.to < b.to;
    });
  }

  std::unordered_map<NodeId, size_t> index;
  std::unordered_map<NodeId, size_t> low;
  std::unordered_map<NodeId, size_t> component;
  std::unordered_map<NodeId, bool> on_stack;
  std::vector<NodeId> stack;
  std::vector<size_t> component_size;
  size_t next_index = 0;

  std::function<void(NodeId)> connect;
  connect = [&](NodeId v) {
    index[v] = next_index;
    low[v] = next_index;
    ++next_index;
    stack.push_back(v);
    on_stack[v] = true;

    for (const auto & e : adj[v]) {
      if (index.find(e.to) == index.end()) {
        connect(e.to);
        low[v] = std::min(low[v], low[e.to]);
      } else if (on_stack[e.to]) {
        low[v] = std::min(low[v], index[e.to]);
      }
    }

    if (low[v] == index[v]) {
      const size_t c = component_size.size();
      component_size.push_back(0);
      NodeId w;
      do {
        w = stack.back();
        stack.pop_back();
        on_stack[w] = false;
        component[w] = c;
        ++component_size[c];
      } while (w != v);
    }
  };

  for (NodeId v : vertices) {
    if (index.find(v) == index.end()) connect(v);
  }

  size_t reported = 0;
  for (NodeId user : vertices) {
    const size_t c = component[user];
    for (const auto & e : adj[user]) {
      if (e.dep == nullptr || e.dep->silent || component[e.to] != c) continue;
      if (component_size[c] == 1 && e.to != user) continue;

      const Node & target = model.node(e.to);
      if (is_member_kind(target.kind)) {
        sema_.report(
          "ref-cyclic", e.dep->location, user,
          {{"member", target.name}, {"art", model.display_name(model.main_of(e.to))}}, "element");
      } else {
        sema_.report("ref-cyclic", e.dep->location, user, {{"art", model.display_name(e.to)}});
      }
      ++reported;
    }
  }
  return reported;
}

}  // namespace dml
