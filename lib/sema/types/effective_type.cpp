// dml/sema/types/effective_type.cpp - Type chain walking and structural expansion
#include "dml/sema/types/effective_type.hpp"

#include <vector>

#include "dml/sema/associations/redirector.hpp"
#include "dml/sema/queries/query_inference.hpp"
#include "dml/sema/resolution/path_resolver.hpp"
#include "dml/sema/sema_context.hpp"

namespace dml
{

bool EffectiveTypeEngine::is_terminal(const Node & n) const
{
  if (n.target != nullptr || n.structured || !n.enum_values.empty() || n.items) return true;
  switch (n.kind) {
    case NodeKind::Builtin:
    case NodeKind::MagicVar:
    case NodeKind::Entity:
    case NodeKind::Aspect:
    case NodeKind::Event:
    case NodeKind::Service:
    case NodeKind::Context:
    case NodeKind::Namespace:
    case NodeKind::Action:
    case NodeKind::Function:
      return true;
    case NodeKind::AnnotationDef:
      return n.type == nullptr;
    default:
      return false;
  }
}

NodeId EffectiveTypeEngine::next_in_chain(NodeId id, TypeResult & stop)
{
  Model & model = sema_.model();
  Node & n = model.node(id);

  if (is_terminal(n)) {
    stop = TypeResult::of(id);
    return NodeId::invalid();
  }

  if (n.type != nullptr) {
    const RefContext ctx = n.type->scope == RefScope::TypeOf ? RefContext::TypeOf : RefContext::Type;
    const Resolution r = sema_.paths().resolve(*n.type, ctx, id, definition_env(model, id));
    switch (r.state) {
      case ResolutionState::Bound:
        break;
      case ResolutionState::Cyclic:
        stop = TypeResult::cyclic();
        return NodeId::invalid();
      default:
        stop = TypeResult::null();
        return NodeId::invalid();
    }
    if (n.type->scope == RefScope::TypeOf && n.kind != NodeKind::Element) {
      if (const NodeId assoc = association_of(r.node)) {
        sema_.report(
          "assoc-as-type-of", n.type->location, id, {{"keyword", "type of"}},
          model.node(assoc).composition ? "composition" : "std");
      }
    }
    return r.node;
  }

  if (n.kind == NodeKind::Key) {
    if (const auto * ref = dyn_cast<RefExpr>(n.value)) {
      if (ref->resolution().is_bound()) return ref->target();
    }
  }

  if (const NodeId origin = model.links().origin(id)) {
    return origin;
  }

  stop = TypeResult::null();
  return NodeId::invalid();
}

TypeResult EffectiveTypeEngine::effective(NodeId id)
{
  LinkTable & links = sema_.model().links();
  {
    const TypeStatus & st = links.type_status(id);
    if (st.progress == Progress::Done) return st.result;
    if (st.progress == Progress::InProgress) return TypeResult::cyclic();
  }

  std::vector<NodeId> chain;
  TypeResult result;
  NodeId cur = id;
  while (cur) {
    TypeStatus & st = links.type_status(cur);
    if (st.progress == Progress::Done) {
      result = st.result;
      break;
    }
    if (st.progress == Progress::InProgress) {
      result = TypeResult::cyclic();
      break;
    }
    st.progress = Progress::InProgress;
    chain.push_back(cur);
    cur = next_in_chain(cur, result);
  }

  for (NodeId c : chain) {
    links.type_status(c) = TypeStatus{Progress::Done, result};
  }

  if (result.is_node()) {
    for (NodeId c : chain) {
      if (c != result.node) expand(c, result.node);
    }
    Node & n = sema_.model().node(id);
    if (result.node == id && n.target != nullptr && n.kind == NodeKind::Element) {
      NodeStatus & status = links.status(id);
      if (status.redirected == Progress::Unvisited) {
        status.redirected = Progress::InProgress;
        sema_.redirector().redirect_implicitly(id);
        status.redirected = Progress::Done;
      }
    }
  }
  return result;
}

void EffectiveTypeEngine::expand(NodeId id, NodeId terminal)
{
  Model & model = sema_.model();
  {
    const Node & n = model.node(id);
    if (n.kind != NodeKind::Element && n.kind != NodeKind::Param && n.kind != NodeKind::Type) return;
    if (!n.elements.empty() || n.structured) return;
  }
  const Node & t = model.node(terminal);
  if (t.kind == NodeKind::Builtin || t.target != nullptr) return;

  if (t.items && !model.node(id).items) {
    const NodeId items = model.create_member(NodeKind::Element, "items", id, model.node(id).location);
    model.node(items).inferred = true;
    model.links().set_origin(items, t.items);
    model.node(id).items = items;
  }

  // Entity-typed elements see the entity's elements; views populate on demand.
  const Dict * source = elements_of(terminal);
  if (source == nullptr) return;
  const std::vector<NodeId> members = source->nodes();
  for (NodeId m : members) {
    const Node & src = model.node(m);
    const NodeId clone = model.create_member(NodeKind::Element, src.name, id, model.node(id).location);
    Node & c = model.node(clone);
    c.inferred = true;
    c.virtual_ = src.virtual_;
    model.links().set_origin(clone, m);
    model.node(id).elements.add(c.name, clone);
  }
}

NodeId EffectiveTypeEngine::association_of(NodeId id)
{
  const Node & n = sema_.model().node(id);
  if (n.target != nullptr) return id;
  if (n.kind == NodeKind::TableAlias || is_main_kind(n.kind)) return NodeId::invalid();
  const TypeResult t = effective(id);
  if (!t.is_node()) return NodeId::invalid();
  return sema_.model().node(t.node).target != nullptr ? t.node : NodeId::invalid();
}

NodeId EffectiveTypeEngine::target_of(NodeId id)
{
  const NodeId assoc = association_of(id);
  if (!assoc) return NodeId::invalid();
  Model & model = sema_.model();
  Node & a = model.node(assoc);
  const RefContext ctx = a.composition ? RefContext::CompositionTarget : RefContext::Target;
  const Resolution r = sema_.paths().resolve(*a.target, ctx, assoc, definition_env(model, assoc));
  return r.is_bound() ? r.node : NodeId::invalid();
}

bool EffectiveTypeEngine::is_to_many(NodeId id)
{
  const NodeId assoc = association_of(id);
  return assoc && sema_.model().node(assoc).to_many;
}

const Dict * EffectiveTypeEngine::elements_of(NodeId id)
{
  Model & model = sema_.model();
  const Node & n = model.node(id);

  if (n.kind == NodeKind::TableAlias) {
    if (n.from_ref != nullptr) {
      const NodeId src = sema_.paths().source_of(*n.from_ref);
      return src ? elements_of(src) : nullptr;
    }
    if (n.query) {
      sema_.queries().populate_query(n.query);
      const NodeId owner = model.node(n.query).query_info().elements_owner;
      return owner ? &model.node(owner).elements : nullptr;
    }
    return nullptr;
  }
  if (is_main_kind(n.kind) && (n.query || n.kind != NodeKind::Type)) {
    if (n.query) sema_.queries().populate(id);
    return &model.node(id).elements;
  }
  if (n.kind == NodeKind::MagicVar || n.structured || !n.elements.empty()) {
    return &n.elements;
  }

  const TypeResult t = effective(id);
  if (!t.is_node()) return nullptr;
  if (t.node == id) return n.elements.empty() ? nullptr : &n.elements;
  // `effective` expanded the elements into this node when possible.
  const Node & refreshed = model.node(id);
  if (!refreshed.elements.empty()) return &refreshed.elements;
  const Node & term = model.node(t.node);
  if (term.target != nullptr) return nullptr;
  return elements_of(t.node);
}

}  // namespace dml
