// dml/sema/associations/association_rewriter.cpp - Foreign keys and ON of derived associations
#include "dml/sema/associations/association_rewriter.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

#include "dml/sema/sema_context.hpp"
#include "dml/sema/types/effective_type.hpp"

namespace dml
{

namespace
{

/// Reference with every step bound to the given nodes.
RefExpr * make_path(
  ExprContext & exprs, const std::vector<std::string_view> & ids, const std::vector<NodeId> & nodes,
  SourceLocation loc)
{
  RefExpr * ref = exprs.make_ref(ids, loc);
  for (size_t i = 0; i < nodes.size() && i < ref->path.size(); ++i) {
    ref->path[i].node = nodes[i];
  }
  const NodeId last = ref->path[ref->path.size() - 1].node;
  ref->bind(last ? Resolution::bound(last) : Resolution::not_found());
  return ref;
}

/**
 * Copies the ON-condition of `assoc` into the query element `elem`.
 *
 * References starting with the association continue in the new target,
 * references to siblings of the association must be projected by the view.
 */
class OnRewriter : public RefRewriter
{
public:
  OnRewriter(
    SemaContext & sema, AssociationRewriter & rewriter, NodeId elem, NodeId assoc,
    const RedirectionRecord * record)
  : sema_(sema), rewriter_(rewriter), elem_(elem), assoc_(assoc), record_(record)
  {
  }

  RefExpr * rewrite(const RefExpr & ref) override
  {
    if (!ref.resolution().is_bound()) return nullptr;
    Model & model = sema_.model();
    const PathStep & head = ref.path[0];
    if (!head.node) return nullptr;
    const Node & head_node = model.node(head.node);

    if (head.id == "$self" || head.id == "$projection") {
      if (ref.path.size() > 2) {
        sema_.report(
          "rewrite-not-supported", ref.location, elem_, {{"id", std::string(head.id)}}, "self");
        return nullptr;
      }
      if (ref.path.size() == 1) return nullptr;
      return rewrite_sibling(ref, 1);
    }
    if (head_node.kind == NodeKind::MagicVar || head_node.kind == NodeKind::Param ||
        ref.scope == RefScope::Param) {
      return nullptr;
    }
    if (head.node == assoc_) {
      return rewrite_target_path(ref);
    }
    return rewrite_sibling(ref, 0);
  }

private:
  /// `assoc.elem...` becomes `viewElem.projectedElem...`.
  RefExpr * rewrite_target_path(const RefExpr & ref)
  {
    Model & model = sema_.model();
    const Node & elem = model.node(elem_);
    std::vector<std::string_view> ids{elem.name};
    std::vector<NodeId> nodes{elem_};

    if (ref.path.size() > 1) {
      const PathStep & step = ref.path[1];
      NodeId mapped = step.node;
      if (record_ != nullptr && step.node) {
        mapped = rewriter_.map_through(step.node, record_->chain);
      }
      if (!mapped) {
        const NodeId target = sema_.types().target_of(elem_);
        sema_.report(
          "query-undefined-element", step.location, elem_,
          {{"id", std::string(step.id)},
           {"art", target ? model.display_name(target) : std::string()}},
          "target");
        return nullptr;
      }
      ids.push_back(model.node(mapped).name);
      nodes.push_back(mapped);
      // Backlink `$self = assoc.back`: the condition of `back` is read from
      // the other side, so it must be rewritten for the new target first.
      if (ref.path.size() == 2 && model.node(mapped).target != nullptr) {
        rewriter_.rewrite(mapped);
      }
      for (size_t i = 2; i < ref.path.size(); ++i) {
        ids.push_back(ref.path[i].id);
        nodes.push_back(ref.path[i].node);
      }
    }
    return make_path(model.exprs(), ids, nodes, ref.location);
  }

  /// Element of the association's parent: replaced by its projection in the view.
  RefExpr * rewrite_sibling(const RefExpr & ref, size_t index)
  {
    Model & model = sema_.model();
    const PathStep & step = ref.path[index];
    const NodeId owner = model.node(elem_).parent;

    NodeId projected;
    for (NodeId p : model.links().projections(step.node)) {
      if (model.node(p).parent == owner) {
        projected = p;
        break;
      }
    }
    if (!projected) {
      sema_.report(
        "rewrite-not-projected", ref.location, elem_,
        {{"name", model.node(elem_).name}, {"id", std::string(step.id)}});
      return nullptr;
    }

    std::vector<std::string_view> ids;
    std::vector<NodeId> nodes;
    for (size_t i = 0; i < index; ++i) {
      ids.push_back(ref.path[i].id);
      nodes.push_back(i == 0 ? model.main_of(elem_) : ref.path[i].node);
    }
    ids.push_back(model.node(projected).name);
    nodes.push_back(projected);
    for (size_t i = index + 1; i < ref.path.size(); ++i) {
      ids.push_back(ref.path[i].id);
      nodes.push_back(ref.path[i].node);
    }
    return make_path(model.exprs(), ids, nodes, ref.location);
  }

  SemaContext & sema_;
  AssociationRewriter & rewriter_;
  NodeId elem_;
  NodeId assoc_;
  const RedirectionRecord * record_;
};

}  // namespace

void AssociationRewriter::rewrite_artifact(NodeId art) { rewrite_members(art); }

void AssociationRewriter::rewrite_members(NodeId owner)
{
  for (NodeId elem : sema_.model().node(owner).elements.nodes()) {
    rewrite(elem);
    rewrite_members(elem);
  }
}

void AssociationRewriter::rewrite(NodeId elem)
{
  Model & model = sema_.model();
  NodeStatus & status = model.links().status(elem);
  if (status.rewritten != Progress::Unvisited) return;
  status.rewritten = Progress::InProgress;

  const Node & e = model.node(elem);
  const NodeId origin = model.links().origin(elem);
  if (e.target == nullptr || !e.inferred || !origin || e.structured) {
    model.links().status(elem).rewritten = Progress::Done;
    return;
  }
  const NodeId assoc = sema_.types().association_of(origin);
  if (!assoc) {
    model.links().status(elem).rewritten = Progress::Done;
    return;
  }
  rewrite(assoc);

  const RedirectionRecord * record = model.links().redirected(elem);
  const Node & a = model.node(assoc);
  const bool managed = a.on == nullptr;

  if (managed) {
    if (model.node(elem).explicit_on) {
      sema_.report(
        "rewrite-on-for-managed", model.node(elem).on->location, elem,
        {{"art", model.display_name(elem)}});
    }
    if (model.node(elem).has_keys) {
      check_explicit_keys(elem, assoc);
    } else {
      derive_keys(elem, assoc, record);
    }
  } else {
    if (model.node(elem).has_keys) {
      sema_.report(
        "rewrite-key-for-unmanaged", model.node(elem).location, elem,
        {{"art", model.display_name(elem)}});
    }
    if (!model.node(elem).explicit_on) {
      OnRewriter on_rewriter(sema_, *this, elem, assoc, record);
      Expr * on = clone_expr(model.exprs(), a.on, &on_rewriter);
      model.node(elem).on = on;
    }
  }
  model.links().status(elem).rewritten = Progress::Done;
}

NodeId AssociationRewriter::map_through(NodeId elem, const std::vector<NodeId> & chain) const
{
  const Model & model = sema_.model();
  NodeId cur = elem;
  for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
    NodeId next;
    for (NodeId p : model.links().projections(cur)) {
      if (model.node(p).parent == *it) {
        next = p;
        break;
      }
    }
    if (!next) return NodeId::invalid();
    cur = next;
  }
  return cur;
}

void AssociationRewriter::derive_keys(NodeId elem, NodeId assoc, const RedirectionRecord * record)
{
  Model & model = sema_.model();
  const std::vector<NodeId> no_chain;
  const std::vector<NodeId> & chain = record != nullptr ? record->chain : no_chain;

  std::vector<std::string> missing;
  std::vector<NodeId> covered;
  for (NodeId fk : model.node(assoc).foreign_keys.nodes()) {
    const Node & fkn = model.node(fk);
    const auto * ref = dyn_cast<RefExpr>(fkn.value);
    const NodeId key = model.create_member(NodeKind::Key, fkn.name, elem, fkn.location);
    model.links().set_origin(key, fk);
    model.node(elem).foreign_keys.add(fkn.name, key);
    if (ref == nullptr || !ref->path[0].node) continue;

    const NodeId mapped = map_through(ref->path[0].node, chain);
    std::vector<std::string_view> ids;
    std::vector<NodeId> nodes;
    for (size_t i = 0; i < ref->path.size(); ++i) {
      ids.push_back(i == 0 && mapped ? std::string_view(model.node(mapped).name) : ref->path[i].id);
      nodes.push_back(i == 0 ? mapped : ref->path[i].node);
    }
    if (!mapped) {
      missing.push_back(fkn.name);
      RefExpr * unbound = model.exprs().make_ref(ids, fkn.location);
      unbound->bind(Resolution::not_found());
      model.node(key).value = unbound;
      continue;
    }
    covered.push_back(mapped);
    model.node(key).value = make_path(model.exprs(), ids, nodes, fkn.location);
  }

  const NodeId new_target = sema_.types().target_of(elem);
  const std::string target_name = new_target ? model.display_name(new_target) : std::string();
  if (!missing.empty()) {
    const bool explicit_redirection = record != nullptr && !record->implicit;
    sema_.report(
      explicit_redirection ? "rewrite-key-not-covered-explicit" : "rewrite-key-not-covered-implicit",
      model.node(elem).location, elem,
      {{"target", target_name}, {"names", join_names(missing)}},
      explicit_redirection ? "target" : "std");
  }

  // Implicit foreign keys are the target keys; the new target must not add keys.
  if (record == nullptr || model.node(assoc).has_keys || !new_target) return;
  const Dict * target_elements = sema_.types().elements_of(new_target);
  if (target_elements == nullptr) return;
  std::vector<std::string> extra;
  for (NodeId k : target_elements->nodes()) {
    if (!model.node(k).key) continue;
    if (std::find(covered.begin(), covered.end(), k) == covered.end()) {
      extra.push_back(model.node(k).name);
    }
  }
  if (!extra.empty()) {
    sema_.report(
      "rewrite-key-not-covered-implicit", model.node(elem).location, elem,
      {{"target", target_name}, {"names", join_names(extra)}}, "extra");
  }
}

void AssociationRewriter::check_explicit_keys(NodeId elem, NodeId assoc)
{
  Model & model = sema_.model();
  const Node & a = model.node(assoc);
  const Dict & original = a.foreign_keys;
  // Keys of the original are implicit when they were taken from its target.
  const bool implicit = !a.has_keys;
  const NodeId original_target = sema_.types().target_of(assoc);
  const std::string target_name =
    original_target ? model.display_name(original_target) : std::string();

  for (NodeId key : model.node(elem).foreign_keys.nodes()) {
    const Node & k = model.node(key);
    if (original.contains(k.name)) continue;
    if (implicit) {
      sema_.report(
        "rewrite-key-not-matched-implicit", k.location, elem,
        {{"name", k.name}, {"target", target_name}});
    } else {
      sema_.report(
        "rewrite-key-not-matched-explicit", k.location, elem,
        {{"name", k.name}, {"art", model.display_name(assoc)}});
    }
  }

  std::vector<std::string> missing;
  for (const std::string & name : original.names()) {
    if (!model.node(elem).foreign_keys.contains(name)) missing.push_back(name);
  }
  if (!missing.empty()) {
    sema_.report(
      implicit ? "rewrite-key-not-covered-implicit" : "rewrite-key-not-covered-explicit",
      model.node(elem).location, elem,
      {{"target", target_name}, {"names", join_names(missing)}, {"art", model.display_name(assoc)}});
  }
}

}  // namespace dml
