// dml/sema/resolution/ref_resolver.cpp - Resolution of all references of a definition
#include "dml/sema/resolution/ref_resolver.hpp"

#include <string>
#include <utility>
#include <vector>

#include "dml/sema/analysis/annotation_merger.hpp"
#include "dml/sema/queries/query_inference.hpp"
#include "dml/sema/resolution/path_resolver.hpp"
#include "dml/sema/sema_context.hpp"
#include "dml/sema/types/effective_type.hpp"

namespace dml
{

namespace
{

/// Some definition or source namespace lives below `prefix`.
bool is_namespace_prefix(const Model & model, const std::string & prefix)
{
  const std::string dotted = prefix + ".";
  for (const auto & entry : model.definitions()) {
    if (entry.name.compare(0, dotted.size(), dotted) == 0) return true;
  }
  for (NodeId source : model.sources()) {
    const std::string & ns = model.node(source).source_info().namespace_name;
    if (ns == prefix || ns.compare(0, dotted.size(), dotted) == 0) return true;
  }
  return false;
}

RefExpr * clone_ref(ExprContext & exprs, const RefExpr * ref)
{
  return ref != nullptr ? cast<RefExpr>(clone_expr(exprs, ref)) : nullptr;
}

}  // namespace

// ============================================================================
// Usings, includes and extensions
// ============================================================================

void RefResolver::check_usings(NodeId source)
{
  Model & model = sema_.model();
  const std::vector<NodeId> usings = model.node(source).source_info().usings.nodes();
  for (NodeId u : usings) {
    RefExpr * ref = model.node(u).target;
    if (ref == nullptr) continue;

    const std::string full = using_target_name(model, u);
    if (!model.definition(full) && is_namespace_prefix(model, full)) {
      // `using ns;` of a pure namespace: make the namespace a definition.
      const NodeId ns = model.create_node(NodeKind::Namespace, full, model.node(u).location);
      model.node(ns).absolute = full;
      model.node(ns).block = source;
      model.add_definition(ns);
    }
    ResolveEnv env;
    (void)sema_.paths().resolve(*ref, RefContext::Using, u, env);
  }
}

NodeId RefResolver::clone_member(const Node & src, NodeId parent)
{
  Model & model = sema_.model();
  ExprContext & exprs = model.exprs();

  const NodeId id = model.create_member(src.kind, src.name, parent, src.location);
  {
    Node & c = model.node(id);
    // References in the copy are looked up where the original was written.
    c.block = src.block;
    c.type = clone_ref(exprs, src.type);
    c.target = clone_ref(exprs, src.target);
    c.on = src.on != nullptr ? clone_expr(exprs, src.on) : nullptr;
    c.default_value = src.default_value != nullptr ? clone_expr(exprs, src.default_value) : nullptr;
    c.to_many = src.to_many;
    c.composition = src.composition;
    c.key = src.key;
    c.virtual_ = src.virtual_;
    c.masked = src.masked;
    c.structured = src.structured;
    c.has_keys = src.has_keys;
    c.assignments = src.assignments;
  }
  for (NodeId k : src.foreign_keys.nodes()) {
    const Node & sk = model.node(k);
    const NodeId key = model.create_member(NodeKind::Key, sk.name, id, sk.location);
    model.node(key).value = sk.value != nullptr ? clone_expr(exprs, sk.value) : nullptr;
    model.node(id).foreign_keys.add(sk.name, key);
  }
  for (NodeId e : src.elements.nodes()) {
    const NodeId nested = clone_member(model.node(e), id);
    model.node(id).elements.add(model.node(nested).name, nested);
  }
  for (NodeId v : src.enum_values.nodes()) {
    const NodeId value = clone_member(model.node(v), id);
    model.node(value).value =
      model.node(v).value != nullptr ? clone_expr(exprs, model.node(v).value) : nullptr;
    model.node(id).enum_values.add(model.node(value).name, value);
  }
  if (src.items) {
    model.node(id).items = clone_member(model.node(src.items), id);
  }
  return id;
}

void RefResolver::apply_includes(NodeId art)
{
  Model & model = sema_.model();
  NodeStatus & status = model.links().status(art);
  if (status.includes != Progress::Unvisited) return;
  status.includes = Progress::InProgress;

  const ResolveEnv env = definition_env(model, art);
  std::vector<std::pair<std::string, NodeId>> front;
  const std::vector<RefExpr *> includes = model.node(art).includes;
  for (RefExpr * ref : includes) {
    const Resolution r = sema_.paths().resolve(*ref, RefContext::Include, art, env);
    if (!r.is_bound()) continue;
    apply_includes(r.node);

    for (NodeId member : model.node(r.node).elements.nodes()) {
      const std::string & name = model.node(member).name;
      if (model.node(art).elements.contains(name)) continue;
      bool seen = false;
      for (const auto & f : front) {
        seen = seen || f.first == name;
      }
      if (seen) continue;
      front.emplace_back(name, clone_member(model.node(member), art));
    }
  }
  model.node(art).elements.prepend(front);
  model.links().status(art).includes = Progress::Done;
}

void RefResolver::apply_extensions(NodeId source, bool members)
{
  Model & model = sema_.model();
  ResolveEnv env;
  env.block = source;

  for (const Extension & ext : model.node(source).source_info().extensions) {
    if (ext.ref == nullptr) continue;
    const RefContext ctx = ext.extend ? RefContext::Extend : RefContext::Annotate;
    const Resolution r = sema_.paths().resolve(*ext.ref, ctx, NodeId::invalid(), env);
    if (!r.is_bound()) continue;
    const NodeId art = r.node;

    if (members) {
      annotate_members(ext, art);
      continue;
    }
    for (const Annotation & anno : ext.annotations) {
      model.node(art).assignments.push_back(anno);
    }
    for (NodeId added : ext.new_elements) {
      Node & e = model.node(added);
      e.parent = art;
      e.main = model.main_of(art);
      e.absolute = model.node(e.main).absolute;
      if (!model.node(art).elements.add(e.name, added)) {
        sema_.report("duplicate-definition", e.location, added, {{"name", e.name}}, "element");
      }
    }
  }
}

void RefResolver::annotate_members(const Extension & ext, NodeId target)
{
  Model & model = sema_.model();
  const std::string art_name = model.display_name(target);

  if (!ext.elements.empty()) {
    const Dict * elements = sema_.types().elements_of(target);
    for (const Extension & sub : ext.elements) {
      const NodeId m = elements != nullptr ? elements->get(sub.name) : NodeId::invalid();
      if (!m) {
        sema_.report(
          "anno-undefined-element", sub.location, target, {{"name", sub.name}, {"art", art_name}});
        continue;
      }
      for (const Annotation & anno : sub.annotations) {
        model.node(m).assignments.push_back(anno);
      }
      annotate_members(sub, m);
    }
  }
  for (const Extension & sub : ext.params) {
    const NodeId p = model.node(target).params.get(sub.name);
    if (!p) {
      sema_.report(
        "anno-undefined-param", sub.location, target, {{"name", sub.name}, {"art", art_name}});
      continue;
    }
    for (const Annotation & anno : sub.annotations) {
      model.node(p).assignments.push_back(anno);
    }
  }
  for (const Extension & sub : ext.actions) {
    const NodeId a = model.node(target).actions.get(sub.name);
    if (!a) {
      sema_.report(
        "anno-undefined-action", sub.location, target, {{"name", sub.name}, {"art", art_name}});
      continue;
    }
    for (const Annotation & anno : sub.annotations) {
      model.node(a).assignments.push_back(anno);
    }
    annotate_members(sub, a);
  }
}

// ============================================================================
// Definitions
// ============================================================================

void RefResolver::resolve_definition(NodeId art)
{
  Model & model = sema_.model();
  NodeStatus & status = model.links().status(art);
  if (status.resolved != Progress::Unvisited) return;
  status.resolved = Progress::InProgress;

  resolve_member(art);
  if (const NodeId query = model.node(art).query) {
    resolve_query(query, nullptr);
  }
  sema_.annotations().merge_definition(art);
  model.links().status(art).resolved = Progress::Done;
}

void RefResolver::resolve_member(NodeId member)
{
  Model & model = sema_.model();
  const ResolveEnv env = definition_env(model, member);
  const NodeKind kind = model.node(member).kind;

  if (model.node(member).type != nullptr ||
      kind == NodeKind::Element || kind == NodeKind::Param || kind == NodeKind::Type) {
    (void)sema_.types().effective(member);
  }
  if (const RefExpr * type = model.node(member).type) {
    const NodeId t = type->target();
    if (t && model.node(member).target == nullptr &&
        (model.is_builtin(t, "cds.Association") || model.is_builtin(t, "cds.Composition"))) {
      sema_.report("type-missing-target", type->location, member, {{"art", type->to_string()}});
    }
  }
  if (model.node(member).target != nullptr) {
    resolve_association(member, env);
  }
  if (Expr * def = model.node(member).default_value) {
    sema_.paths().resolve_expr(def, RefContext::Default, member, env);
  }
  if (const NodeId items = model.node(member).items) {
    resolve_member(items);
  }
  for (NodeId e : model.node(member).elements.nodes()) {
    resolve_member(e);
  }
  for (NodeId p : model.node(member).params.nodes()) {
    resolve_member(p);
  }
  if (const NodeId returns = model.node(member).returns) {
    resolve_member(returns);
  }
  for (NodeId a : model.node(member).actions.nodes()) {
    resolve_member(a);
  }
}

void RefResolver::resolve_association(NodeId elem, const ResolveEnv & env)
{
  Model & model = sema_.model();
  const NodeId target = sema_.types().target_of(elem);
  const Node & n = model.node(elem);

  if (n.on != nullptr) {
    if (n.key && !n.inferred) {
      sema_.report("unmanaged-as-key", n.location, elem);
    }
    // Query elements get their condition from the association rewriter.
    if (!n.inferred) {
      sema_.paths().resolve_expr(n.on, RefContext::On, elem, env);
    }
    return;
  }
  if (!target) return;

  if (!n.foreign_keys.empty()) {
    ResolveEnv key_env;
    key_env.block = env.block;
    key_env.elements_of = target;
    for (NodeId k : n.foreign_keys.nodes()) {
      if (auto * ref = dyn_cast<RefExpr>(model.node(k).value)) {
        (void)sema_.paths().resolve(*ref, RefContext::ForeignKey, k, key_env);
      }
    }
    return;
  }
  if (n.inferred || n.to_many) return;

  const Dict * target_elements = sema_.types().elements_of(target);
  if (target_elements == nullptr) return;
  for (NodeId t : target_elements->nodes()) {
    const Node & tn = model.node(t);
    if (!tn.key) continue;
    const NodeId key = model.create_member(NodeKind::Key, tn.name, elem, model.node(elem).location);
    model.node(key).value = model.exprs().make_bound_ref({tn.name}, t, model.node(elem).location);
    model.node(elem).foreign_keys.add(tn.name, key);
  }
  model.node(elem).implicit_keys = true;
}

// ============================================================================
// Queries
// ============================================================================

void RefResolver::resolve_query(NodeId query, const ResolveEnv * outer)
{
  Model & model = sema_.model();
  NodeStatus & status = model.links().status(query);
  if (status.resolved != Progress::Unvisited) return;
  status.resolved = Progress::InProgress;

  const NodeId view = model.main_of(query);
  const QueryData & q = model.node(query).query_info();
  const ResolveEnv env = sema_.queries().query_env(query, outer);

  if (q.op == QueryOp::Union) {
    for (NodeId arg : q.set_args) {
      resolve_query(arg, outer);
    }
  } else {
    sema_.queries().populate_query(query);
    resolve_from(q.from, view, env, outer);

    for (NodeId m : q.mixins.nodes()) {
      (void)sema_.types().target_of(m);
      sema_.paths().resolve_expr(model.node(m).on, RefContext::MixinOn, m, env);
    }
    resolve_columns(q.columns, view, env);
    sema_.paths().resolve_expr(q.where, RefContext::Expr, view, env);
    sema_.paths().resolve_expr(q.having, RefContext::Expr, view, env);
    for (Expr * e : q.group_by) {
      sema_.paths().resolve_expr(e, RefContext::Expr, view, env);
    }
  }
  for (Expr * e : q.order_by) {
    sema_.paths().resolve_expr(e, RefContext::OrderBy, view, env);
  }
  model.links().status(query).resolved = Progress::Done;
}

void RefResolver::resolve_from(
  const FromItem & item, NodeId view, const ResolveEnv & env, const ResolveEnv * outer)
{
  if (item.alias) {
    const NodeId sub = sema_.model().node(item.alias).query;
    if (sub) resolve_query(sub, outer);
    return;
  }
  for (const FromItem & arg : item.args) {
    resolve_from(arg, view, env, outer);
  }
  sema_.paths().resolve_expr(item.on, RefContext::JoinOn, view, env);
}

void RefResolver::resolve_columns(
  const std::vector<Column> & columns, NodeId view, const ResolveEnv & env)
{
  for (const Column & col : columns) {
    if (col.wildcard) continue;
    if (col.nesting != ColumnNesting::None) {
      resolve_columns(col.nested, view, env);
      continue;
    }
    sema_.paths().resolve_expr(col.value, RefContext::Expr, view, env);
    if (col.redirected != nullptr && col.on != nullptr) {
      ResolveEnv on_env = env;
      on_env.elements_of = view;
      on_env.redirection_on = true;
      sema_.paths().resolve_expr(col.on, RefContext::MixinOn, view, on_env);
    }
  }
}

}  // namespace dml
