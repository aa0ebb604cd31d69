// dml/sema/analysis/annotation_merger.cpp - Layered merge of annotation assignments

#include "dml/sema/analysis/annotation_merger.hpp"

#include <algorithm>
#include <map>
#include <unordered_map>

#include "dml/sema/sema_context.hpp"

namespace dml
{

namespace
{

/// Assignments of one layer to one annotation.
struct LayerAssignments
{
  std::vector<const Annotation *> defines;
  std::vector<const Annotation *> extensions;

  /// Assignments competing for the layer's value: `annotate` wins over the definition.
  [[nodiscard]] const std::vector<const Annotation *> & top() const
  {
    return extensions.empty() ? defines : extensions;
  }
};

bool is_ellipsis(const Expr * e)
{
  const auto * lit = dyn_cast<LiteralExpr>(e);
  return lit != nullptr && lit->is_ellipsis();
}

}  // namespace

AnnotationMerger::AnnotationMerger(SemaContext & sema) : sema_(sema) {}

AnnotationMerger::~AnnotationMerger() = default;

void AnnotationMerger::compute_layers()
{
  layers_ = std::make_unique<LayerGraph>(sema_.model());
}

const LayerGraph & AnnotationMerger::layers()
{
  if (!layers_) compute_layers();
  return *layers_;
}

void AnnotationMerger::merge_definition(NodeId art)
{
  Model & model = sema_.model();
  merge_node(art);

  const Node & n = model.node(art);
  for (const Dict * members : {&n.elements, &n.params, &n.actions, &n.enum_values}) {
    for (NodeId m : members->nodes()) {
      merge_definition(m);
    }
  }
  if (n.items) merge_definition(n.items);
  if (n.returns) merge_definition(n.returns);
}

void AnnotationMerger::merge_node(NodeId id)
{
  if (!merged_.insert(id).second) return;
  Model & model = sema_.model();
  const Node & node = model.node(id);
  if (node.assignments.empty()) return;

  std::vector<std::string> order;
  std::unordered_map<std::string, std::vector<const Annotation *>> groups;
  for (const auto & a : node.assignments) {
    auto & group = groups[a.name];
    if (group.empty()) order.push_back(a.name);
    group.push_back(&a);
  }

  std::vector<Annotation> merged;
  merged.reserve(order.size());
  for (const auto & name : order) {
    merged.push_back(merge_group(id, groups[name]));
  }
  model.node(id).annotations = std::move(merged);
}

Annotation AnnotationMerger::merge_group(
  NodeId home, const std::vector<const Annotation *> & group)
{
  const Model & model = sema_.model();
  const LayerGraph & graph = layers();

  std::map<size_t, LayerAssignments> by_layer;
  for (const Annotation * a : group) {
    const NodeId source = a->source ? a->source : model.node(home).block;
    LayerAssignments & la = by_layer[graph.layer_of(source)];
    (a->from_extension ? la.extensions : la.defines).push_back(a);
  }

  // Layers not overridden by another assigning layer.
  std::vector<size_t> candidates;
  for (const auto & entry : by_layer) {
    const size_t layer = entry.first;
    const bool overridden = std::any_of(by_layer.begin(), by_layer.end(), [&](const auto & other) {
      return other.first != layer && graph.extends(other.first, layer);
    });
    if (!overridden) candidates.push_back(layer);
  }
  if (candidates.empty()) {
    throw InternalError("annotation layers without a topmost layer");
  }

  const std::string anno = "@" + group.front()->name;
  if (candidates.size() > 1) {
    for (size_t layer : candidates) {
      for (const Annotation * a : by_layer[layer].top()) {
        sema_.report("anno-duplicate-unrelated-layer", a->location, home, {{"anno", anno}});
      }
    }
  }

  const size_t chosen = candidates.back();
  const LayerAssignments & top_layer = by_layer[chosen];
  const auto & top = top_layer.top();
  if (top.size() > 1) {
    for (const Annotation * a : top) {
      sema_.report("anno-duplicate", a->location, home, {{"anno", anno}});
    }
  }

  // Values `...` may refer to, nearest first.
  std::vector<const Annotation *> lower;
  if (!top_layer.extensions.empty() && !top_layer.defines.empty()) {
    lower.push_back(top_layer.defines.back());
  }
  for (auto it = by_layer.rbegin(); it != by_layer.rend(); ++it) {
    if (it->first == chosen || !graph.extends(chosen, it->first)) continue;
    lower.push_back(it->second.top().back());
  }

  Annotation result = *top.back();
  result.value = splice(home, result, lower);
  return result;
}

Expr * AnnotationMerger::splice(
  NodeId home, const Annotation & top, const std::vector<const Annotation *> & lower)
{
  auto * array = dyn_cast<ArrayExpr>(top.value);
  if (array == nullptr) return top.value;
  std::vector<Expr *> items(array->items.begin(), array->items.end());
  if (std::none_of(items.begin(), items.end(), is_ellipsis)) return top.value;

  size_t next = 0;
  for (auto pos = std::find_if(items.begin(), items.end(), is_ellipsis); pos != items.end();
       pos = std::find_if(items.begin(), items.end(), is_ellipsis)) {
    const ArrayExpr * below = nullptr;
    if (next >= lower.size()) {
      sema_.report("anno-unexpected-ellipsis", (*pos)->location, home, {{"code", "..."}});
    } else {
      below = dyn_cast<ArrayExpr>(lower[next]->value);
      if (below == nullptr) {
        sema_.report("anno-mismatched-ellipsis", (*pos)->location, home, {{"code", "..."}});
      }
    }
    if (below == nullptr) {
      items.erase(std::remove_if(items.begin(), items.end(), is_ellipsis), items.end());
      break;
    }
    ++next;
    const auto at = pos - items.begin();
    items.erase(pos);
    items.insert(items.begin() + at, below->items.begin(), below->items.end());
  }

  ExprContext & exprs = sema_.model().exprs();
  return exprs.create<ArrayExpr>(exprs.copy_to_arena(items), array->location);
}

}  // namespace dml
