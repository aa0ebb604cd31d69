// dml/sema/associations/redirector.cpp - Implicit and explicit redirection
#include "dml/sema/associations/redirector.hpp"

#include <algorithm>
#include <deque>
#include <unordered_set>
#include <utility>

#include "dml/sema/queries/query_inference.hpp"
#include "dml/sema/resolution/path_resolver.hpp"
#include "dml/sema/sema_context.hpp"
#include "dml/sema/types/effective_type.hpp"

namespace dml
{

namespace
{

bool contains(const std::vector<NodeId> & list, NodeId id)
{
  return std::find(list.begin(), list.end(), id) != list.end();
}

}  // namespace

// ============================================================================
// Implicit redirection
// ============================================================================

void Redirector::redirect_implicitly(NodeId elem)
{
  Model & model = sema_.model();
  EffectiveTypeEngine & types = sema_.types();

  if (model.links().redirected(elem) != nullptr) return;
  const NodeId view = model.main_of(elem);
  const NodeId service = model.node(view).service;
  if (!service) return;

  const NodeId target = types.target_of(elem);
  if (!target) return;
  if (model.node(target).service == service) return;

  const std::vector<NodeId> found = candidates(elem, target, service);
  if (found.size() > 1) {
    std::vector<std::string> names;
    for (NodeId c : found) {
      names.push_back(model.node(c).absolute);
    }
    sema_.report(
      "redirected-implicitly-ambiguous", model.node(elem).location, elem,
      {{"art", model.display_name(target)},
       {"service", model.node(service).absolute},
       {"names", join_names(names)}});
    return;
  }

  NodeId new_target = found.empty() ? NodeId::invalid() : found.front();
  if (!new_target && may_autoexpose(elem, target)) {
    new_target = autoexpose(elem, target, service);
  }
  if (!new_target) {
    const NodeId target_service = model.node(target).service;
    if (target_service) {
      sema_.report(
        "assoc-target-not-in-service", model.node(elem).location, elem,
        {{"target", model.display_name(target)}, {"service", model.node(service).absolute}});
    } else {
      sema_.report(
        "assoc-outside-service", model.node(elem).location, elem,
        {{"target", model.display_name(target)}});
    }
    return;
  }

  std::vector<std::vector<NodeId>> paths = chains(new_target, target);
  if (paths.empty()) {
    throw InternalError("redirection candidate does not derive from the original target");
  }
  apply(elem, target, new_target, std::move(paths.front()), true);
}

std::vector<NodeId> Redirector::candidates(NodeId elem, NodeId target, NodeId service)
{
  Model & model = sema_.model();
  const LinkTable & links = model.links();

  // All views deriving from the target, in registration order.
  std::vector<NodeId> derived;
  std::unordered_set<NodeId> seen{target};
  std::deque<NodeId> queue{target};
  while (!queue.empty()) {
    const NodeId cur = queue.front();
    queue.pop_front();
    for (NodeId d : links.descendants(cur)) {
      if (seen.insert(d).second) {
        derived.push_back(d);
        queue.push_back(d);
      }
    }
  }

  std::vector<NodeId> in_service;
  std::vector<NodeId> preferred;
  for (NodeId d : derived) {
    const Node & n = model.node(d);
    if (n.service != service) continue;
    const std::optional<bool> flag = n.annotation_flag("cds.redirection.target");
    if (flag.has_value() && !*flag) continue;
    in_service.push_back(d);
    if (flag.has_value() && *flag) preferred.push_back(d);
  }
  std::vector<NodeId> pool = preferred.empty() ? in_service : preferred;

  if (sema_.options().scoped_redirections && pool.size() > 1) {
    const NodeId scope = model.node(model.main_of(elem)).parent;
    std::vector<NodeId> scoped;
    for (NodeId c : pool) {
      if (model.node(c).parent == scope) scoped.push_back(c);
    }
    if (!scoped.empty()) pool = std::move(scoped);
  }

  // Keep the most general candidates: those not derived from another one.
  std::vector<NodeId> general;
  for (NodeId c : pool) {
    bool derived_from_other = false;
    for (NodeId other : pool) {
      if (other != c && !chains(c, other).empty()) {
        derived_from_other = true;
        break;
      }
    }
    if (!derived_from_other) general.push_back(c);
  }
  return general;
}

// ============================================================================
// Autoexposure
// ============================================================================

bool Redirector::may_autoexpose(NodeId elem, NodeId target) const
{
  const Model & model = sema_.model();
  const Node & t = model.node(target);
  if (t.kind != NodeKind::Entity) return false;
  const std::optional<bool> flag = t.annotation_flag("cds.autoexpose");
  if (flag.has_value()) return *flag;

  const NodeId origin = model.links().origin(elem);
  const bool composition =
    model.node(elem).composition || (origin && model.node(origin).composition);
  return composition && sema_.options().autoexpose_compositions;
}

std::string Redirector::autoexposed_name(NodeId target, NodeId service) const
{
  const Model & model = sema_.model();
  const Node & t = model.node(target);
  std::string relative = t.absolute;
  if (sema_.options().scoped_redirections) {
    const Node & block = model.node(t.block);
    const std::string & ns = block.kind == NodeKind::Source ? block.source_info().namespace_name
                                                            : std::string();
    if (!ns.empty() && relative.compare(0, ns.size() + 1, ns + ".") == 0) {
      relative = relative.substr(ns.size() + 1);
    }
  } else {
    relative = relative.substr(relative.rfind('.') + 1);
  }
  return model.node(service).absolute + "." + relative;
}

NodeId Redirector::autoexpose(NodeId elem, NodeId target, NodeId service)
{
  Model & model = sema_.model();
  const std::string name = autoexposed_name(target, service);

  if (const NodeId existing = model.definition(name)) {
    // A second association to the same target reuses the projection.
    const Node & e = model.node(existing);
    if (e.inferred && e.query) {
      const Node & q = model.node(e.query);
      const NodeId alias = q.query_info().from.alias;
      if (alias && model.node(alias).from_ref && model.node(alias).from_ref->target() == target) {
        return existing;
      }
    }
    sema_.report("duplicate-autoexposed", model.node(elem).location, elem, {{"art", name}});
    return NodeId::invalid();
  }

  const NodeId created = sema_.queries().create_projection(name, target, service);
  sema_.queries().populate(created);
  return created;
}

// ============================================================================
// Explicit redirection
// ============================================================================

void Redirector::redirect_explicitly(NodeId elem, RefExpr & target)
{
  Model & model = sema_.model();
  EffectiveTypeEngine & types = sema_.types();
  model.links().status(elem).redirected = Progress::Done;

  const NodeId origin = model.links().origin(elem);
  const NodeId assoc = origin ? types.association_of(origin) : NodeId::invalid();
  if (!assoc) {
    sema_.report("redirected-no-assoc", target.location, elem);
    return;
  }

  const Resolution r =
    sema_.paths().resolve(target, RefContext::Target, elem, definition_env(model, elem));
  if (!r.is_bound()) return;
  const NodeId original = types.target_of(assoc);
  if (!original) return;

  {
    const Node & a = model.node(assoc);
    Node & e = model.node(elem);
    e.target = &target;
    e.to_many = a.to_many;
    e.composition = a.composition;
    if (!e.explicit_on) e.on = a.on;
  }

  if (r.node == original) {
    sema_.report(
      "redirected-to-same", target.location, elem, {{"art", model.display_name(original)}});
    return;
  }

  std::vector<std::vector<NodeId>> paths = chains(r.node, original);
  if (paths.empty()) {
    sema_.report(
      "redirected-to-unrelated", target.location, elem, {{"art", model.display_name(original)}});
    return;
  }
  if (paths.size() > 1) {
    sema_.report(
      "redirected-to-ambiguous", target.location, elem, {{"art", model.display_name(original)}});
    return;
  }
  apply(elem, original, r.node, std::move(paths.front()), false);
}

void Redirector::apply(
  NodeId elem, NodeId original, NodeId target, std::vector<NodeId> chain, bool implicit)
{
  Model & model = sema_.model();
  for (NodeId view : chain) {
    if (is_complex(view)) {
      sema_.report(
        "redirected-to-complex", model.node(elem).location, elem,
        {{"art", model.display_name(view)}});
      break;
    }
  }

  if (implicit) {
    Node & e = model.node(elem);
    e.target = model.exprs().make_bound_ref({model.node(target).absolute}, target, e.location);
  }
  RedirectionRecord record;
  record.original_target = original;
  record.new_target = target;
  record.chain = std::move(chain);
  record.implicit = implicit;
  model.links().set_redirected(elem, std::move(record));
}

// ============================================================================
// Projection lineage
// ============================================================================

std::vector<std::vector<NodeId>> Redirector::chains(NodeId view, NodeId base)
{
  std::vector<std::vector<NodeId>> out;
  if (view == base) return out;
  std::vector<NodeId> path;
  collect_chains(view, base, path, out);
  return out;
}

void Redirector::collect_chains(
  NodeId view, NodeId base, std::vector<NodeId> & path, std::vector<std::vector<NodeId>> & out)
{
  if (view == base) {
    out.push_back(path);
    return;
  }
  if (contains(path, view) || out.size() > 1) return;
  if (!sema_.model().node(view).query) return;

  path.push_back(view);
  for (NodeId source : direct_sources(view)) {
    collect_chains(source, base, path, out);
  }
  path.pop_back();
}

std::vector<NodeId> Redirector::direct_sources(NodeId view)
{
  std::vector<NodeId> out;
  const NodeId query = sema_.model().node(view).query;
  if (query) collect_query_sources(query, out);
  return out;
}

void Redirector::collect_query_sources(NodeId query, std::vector<NodeId> & out)
{
  Model & model = sema_.model();
  const QueryData & q = model.node(query).query_info();
  if (q.op == QueryOp::Union) {
    for (NodeId arg : q.set_args) {
      collect_query_sources(arg, out);
    }
    return;
  }

  std::vector<const FromItem *> pending{&q.from};
  while (!pending.empty()) {
    const FromItem * item = pending.back();
    pending.pop_back();
    if (!item->alias) {
      for (auto it = item->args.rbegin(); it != item->args.rend(); ++it) {
        pending.push_back(&*it);
      }
      continue;
    }
    Node & alias = model.node(item->alias);
    if (alias.query) {
      collect_query_sources(alias.query, out);
      continue;
    }
    if (alias.from_ref == nullptr) continue;
    const NodeId view = model.main_of(query);
    const Resolution r =
      sema_.paths().resolve(*alias.from_ref, RefContext::From, view, definition_env(model, view));
    if (!r.is_bound()) continue;
    const NodeId source = sema_.paths().source_of(*alias.from_ref);
    if (source && !contains(out, source)) out.push_back(source);
  }
}

bool Redirector::is_complex(NodeId view) const
{
  const Model & model = sema_.model();
  const NodeId query = model.node(view).query;
  if (!query) return false;
  const QueryData & q = model.node(query).query_info();
  if (q.op == QueryOp::Union || !q.from.alias) return true;
  return model.node(q.from.alias).query.is_valid();
}

}  // namespace dml
