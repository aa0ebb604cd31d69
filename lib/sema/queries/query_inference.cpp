// dml/sema/queries/query_inference.cpp - Column and wildcard expansion
#include "dml/sema/queries/query_inference.hpp"

#include <unordered_map>
#include <utility>

#include "dml/sema/associations/redirector.hpp"
#include "dml/sema/resolution/path_resolver.hpp"
#include "dml/sema/sema_context.hpp"
#include "dml/sema/types/effective_type.hpp"

namespace dml
{

namespace
{

/// The column is `name` or `alias.name` and denotes `source`.
bool is_plain_ref_to(const Column & col, NodeId source)
{
  const auto * ref = dyn_cast<RefExpr>(col.value);
  if (!ref || ref->path.size() > 2) return false;
  return ref->target() == source;
}

/// `elem` or `alias.elem`: the reference projects the element unchanged.
bool is_projection_path(const Model & model, const RefExpr & ref)
{
  if (ref.path.size() == 1) return true;
  if (ref.path.size() != 2) return false;
  const NodeId head = ref.path[0].node;
  return head && model.node(head).kind == NodeKind::TableAlias;
}

}  // namespace

// ============================================================================
// Entry points
// ============================================================================

void QueryInference::populate(NodeId art)
{
  Model & model = sema_.model();
  if (!model.node(art).query) return;

  NodeStatus & status = model.links().status(art);
  if (status.elements != Progress::Unvisited) return;
  status.elements = Progress::InProgress;

  populate_query(model.node(art).query);
  check_specified_elements(art);
  status.elements = Progress::Done;

  if (model.node(art).service) {
    // Computing the types of association elements triggers implicit redirection.
    for (NodeId elem : model.node(art).elements.nodes()) {
      (void)sema_.types().effective(elem);
    }
  }
}

void QueryInference::populate_query(NodeId query)
{
  Model & model = sema_.model();
  NodeStatus & status = model.links().status(query);
  if (status.elements != Progress::Unvisited) return;
  status.elements = Progress::InProgress;

  QueryData & q = model.node(query).query_info();
  if (q.op == QueryOp::Union) {
    for (NodeId arg : q.set_args) {
      populate_query(arg);
    }
    status.elements = Progress::Done;
    return;
  }

  init_sources(query);
  if (!q.elements_owner) {
    throw InternalError("query without element owner");
  }

  const ResolveEnv env = query_env(query);
  if (q.has_columns) {
    infer_columns(query, q.elements_owner, q.columns, q.combined, &q.combined_aliases, env, "");
  } else {
    Column wildcard;
    wildcard.wildcard = true;
    wildcard.location = model.node(query).location;
    infer_columns(query, q.elements_owner, {wildcard}, q.combined, &q.combined_aliases, env, "");
  }

  for (const auto & [name, loc] : q.excluding) {
    if (!q.combined.contains(name)) {
      sema_.report("ref-undefined-excluding", loc, q.elements_owner, {{"id", name}});
    }
  }
  status.elements = Progress::Done;
}

void QueryInference::register_sources(NodeId art)
{
  Model & model = sema_.model();
  std::vector<NodeId> queries;
  if (model.node(art).query) queries.push_back(model.node(art).query);
  while (!queries.empty()) {
    const NodeId query = queries.back();
    queries.pop_back();
    const QueryData & q = model.node(query).query_info();
    if (q.op == QueryOp::Union) {
      queries.insert(queries.end(), q.set_args.begin(), q.set_args.end());
      continue;
    }
    std::vector<NodeId> aliases;
    collect_aliases(q.from, aliases);
    for (NodeId alias : aliases) {
      RefExpr * ref = model.node(alias).from_ref;
      if (ref == nullptr || ref->path.size() != 1) continue;
      const Resolution r =
        sema_.paths().resolve(*ref, RefContext::From, art, definition_env(model, art));
      if (r.is_bound() && is_main_kind(model.node(r.node).kind)) {
        model.links().add_descendant(r.node, art);
      }
    }
  }
}

ResolveEnv QueryInference::query_env(NodeId query, const ResolveEnv * outer) const
{
  const Model & model = sema_.model();
  ResolveEnv env;
  env.block = model.node(query).block;
  env.query = query;
  env.self = model.main_of(query);
  env.params_of = env.self;
  env.outer = outer;
  return env;
}

// ============================================================================
// Sources
// ============================================================================

void QueryInference::collect_aliases(const FromItem & item, std::vector<NodeId> & out) const
{
  if (item.alias) {
    out.push_back(item.alias);
    return;
  }
  for (const auto & arg : item.args) {
    collect_aliases(arg, out);
  }
}

void QueryInference::init_sources(NodeId query)
{
  std::vector<NodeId> aliases;
  collect_aliases(sema_.model().node(query).query_info().from, aliases);
  for (NodeId alias : aliases) {
    add_source_alias(query, alias);
  }
}

void QueryInference::add_source_alias(NodeId query, NodeId alias)
{
  Model & model = sema_.model();
  const NodeId view = model.main_of(query);
  Node & al = model.node(alias);

  if (al.from_ref != nullptr) {
    const Resolution r =
      sema_.paths().resolve(*al.from_ref, RefContext::From, view, definition_env(model, view));
    if (!r.is_bound()) return;
    const NodeId source = sema_.paths().source_of(*al.from_ref);
    if (!source) return;
    if (model.node(query).query_info().elements_owner == view) {
      model.links().add_descendant(source, view);
    }
  } else if (al.query) {
    populate_query(al.query);
  }

  const Dict * elements = sema_.types().elements_of(alias);
  if (elements == nullptr) return;
  QueryData & q = model.node(query).query_info();
  for (const auto & entry : *elements) {
    q.combined.add(entry.name, entry.first());
    q.combined_aliases.add(entry.name, alias);
  }
}

// ============================================================================
// Columns
// ============================================================================

std::string QueryInference::column_name(const Column & col) const
{
  if (!col.alias.empty()) return col.alias;
  if (const auto * ref = dyn_cast<RefExpr>(col.value)) {
    return std::string(ref->path[ref->path.size() - 1].id);
  }
  return {};
}

void QueryInference::infer_columns(
  NodeId query, NodeId owner, const std::vector<Column> & columns, const Dict & candidates,
  const Dict * candidate_aliases, const ResolveEnv & env, const std::string & prefix)
{
  Model & model = sema_.model();
  const QueryData & q = model.node(query).query_info();
  const bool top_level = prefix.empty() && owner == q.elements_owner;

  std::unordered_map<std::string, size_t> explicit_index;
  for (size_t i = 0; i < columns.size(); ++i) {
    const Column & col = columns[i];
    if (col.wildcard || col.nesting == ColumnNesting::Inline) continue;
    const std::string name = column_name(col);
    if (!name.empty()) explicit_index.emplace(prefix + name, i);
  }

  auto excluded = [&](const std::string & name) {
    if (!top_level) return false;
    for (const auto & ex : q.excluding) {
      if (ex.first == name) return true;
    }
    return false;
  };

  std::vector<bool> created(columns.size(), false);

  for (size_t i = 0; i < columns.size(); ++i) {
    const Column & col = columns[i];

    if (col.wildcard) {
      for (const auto & entry : candidates) {
        const std::string name = prefix + entry.name;
        if (excluded(entry.name)) continue;

        auto it = explicit_index.find(name);
        if (it != explicit_index.end()) {
          const size_t j = it->second;
          if (!created[j]) {
            create_column_element(owner, columns[j], name, env);
            created[j] = true;
          }
          if (!is_plain_ref_to(columns[j], entry.first()) && candidate_aliases != nullptr) {
            if (entry.is_ambiguous()) {
              sema_.report(
                "wildcard-excluding-many", columns[j].location, owner, {{"id", entry.name}});
            } else {
              const NodeId alias = candidate_aliases->get(entry.name);
              sema_.report(
                "wildcard-excluding-one", columns[j].location, owner,
                {{"id", entry.name}, {"alias", alias ? model.node(alias).name : std::string()}});
            }
          }
          continue;
        }

        if (entry.is_ambiguous()) {
          std::vector<std::string> names;
          if (const Dict::Entry * aliases =
                candidate_aliases ? candidate_aliases->find(entry.name) : nullptr) {
            for (NodeId a : aliases->nodes) {
              names.push_back(model.node(a).name + "." + entry.name);
            }
          }
          sema_.report(
            "wildcard-ambiguous", col.location, owner,
            {{"id", entry.name}, {"names", join_names(names)}});
          continue;
        }
        if (model.node(owner).elements.contains(name)) continue;
        (void)create_wildcard_element(owner, entry.first(), name);
        model.node(model.node(owner).elements.get(name)).location = col.location;
      }
      continue;
    }

    if (col.nesting == ColumnNesting::Inline) {
      auto * ref = dyn_cast<RefExpr>(col.value);
      if (!ref) continue;
      const Resolution r = sema_.paths().resolve(*ref, RefContext::Column, owner, env);
      if (!r.is_bound()) continue;
      const NodeId target = sema_.types().target_of(r.node);
      const NodeId base = target ? target : r.node;
      const Dict * nested = sema_.types().elements_of(base);
      const std::string name = column_name(col);
      if (nested == nullptr || nested->empty()) {
        sema_.report(
          "query-unexpected-structure", col.location, owner, {{"prop", "inline"}, {"id", name}});
        continue;
      }
      ResolveEnv nested_env;
      nested_env.block = env.block;
      nested_env.elements_of = base;
      nested_env.self = env.self;
      nested_env.params_of = env.params_of;
      infer_columns(query, owner, col.nested, *nested, nullptr, nested_env, prefix + name + "_");
      continue;
    }

    if (created[i]) continue;
    const std::string name = column_name(col);
    if (name.empty()) {
      sema_.report("query-req-name", col.location, owner);
      continue;
    }
    create_column_element(owner, col, prefix + name, env);
    created[i] = true;
  }
}

NodeId QueryInference::create_column_element(
  NodeId owner, const Column & col, const std::string & name, const ResolveEnv & env)
{
  Model & model = sema_.model();
  EffectiveTypeEngine & types = sema_.types();

  const NodeId elem = model.create_member(NodeKind::Element, name, owner, col.location);
  {
    Node & e = model.node(elem);
    e.inferred = true;
    e.key = col.key;
    e.virtual_ = col.virtual_;
    e.value = col.value;
    e.type = col.cast_type;
    e.assignments = col.annotations;
  }
  if (!model.node(owner).elements.add(name, elem)) {
    sema_.report("duplicate-definition", col.location, elem, {{"name", name}}, "element");
  }

  auto * ref = dyn_cast<RefExpr>(col.value);
  NodeId source;
  if (ref != nullptr && !col.virtual_) {
    const Resolution r = sema_.paths().resolve(*ref, RefContext::Column, elem, env);
    if (r.is_bound()) {
      const NodeKind k = model.node(r.node).kind;
      if (k == NodeKind::Element || k == NodeKind::Mixin || k == NodeKind::Key || k == NodeKind::Param) {
        source = r.node;
        model.links().set_origin(elem, source);
        if (k == NodeKind::Element && is_projection_path(model, *ref)) {
          model.links().add_projection(source, elem);
        }
      }
    }
  }

  if (col.nesting == ColumnNesting::Expand) {
    if (!source) return elem;
    const NodeId target = types.target_of(source);
    const NodeId base = target ? target : source;
    const Dict * nested = types.elements_of(base);
    if (nested == nullptr || nested->empty()) {
      sema_.report("query-unexpected-structure", col.location, elem, {{"prop", "expand"}, {"id", name}});
      return elem;
    }
    model.links().set_origin(elem, NodeId::invalid());
    model.node(elem).structured = true;
    ResolveEnv nested_env;
    nested_env.block = env.block;
    nested_env.elements_of = base;
    nested_env.self = env.self;
    nested_env.params_of = env.params_of;
    const NodeId query = env.query;
    infer_columns(query, elem, col.nested, *nested, nullptr, nested_env, "");
    return elem;
  }

  if (source && types.association_of(source) && !col.cast_type) {
    copy_association(elem, source);
  }

  if (col.on != nullptr) {
    Node & e = model.node(elem);
    e.on = col.on;
    e.explicit_on = true;
  }
  if (col.has_keys) {
    for (const ForeignKeySpec & spec : col.keys) {
      std::string key_name = spec.alias;
      if (key_name.empty() && spec.ref != nullptr) {
        key_name = std::string(spec.ref->path[spec.ref->path.size() - 1].id);
      }
      const NodeId key = model.create_member(NodeKind::Key, key_name, elem, spec.location);
      model.node(key).value = spec.ref;
      model.node(elem).foreign_keys.add(key_name, key);
    }
    model.node(elem).has_keys = true;
  }
  if (col.redirected != nullptr) {
    sema_.redirector().redirect_explicitly(elem, *col.redirected);
  }
  return elem;
}

NodeId QueryInference::create_wildcard_element(NodeId owner, NodeId source, const std::string & name)
{
  Model & model = sema_.model();
  const Node & src = model.node(source);
  const NodeId elem = model.create_member(NodeKind::Element, name, owner);
  Node & e = model.node(elem);
  e.inferred = true;
  e.virtual_ = src.virtual_;
  e.value = model.exprs().make_bound_ref({src.name}, source, e.location);
  model.node(owner).elements.add(name, elem);
  model.links().set_origin(elem, source);
  model.links().add_projection(source, elem);
  if (sema_.types().association_of(source)) {
    copy_association(elem, source);
  }
  return elem;
}

void QueryInference::copy_association(NodeId elem, NodeId source)
{
  Model & model = sema_.model();
  EffectiveTypeEngine & types = sema_.types();
  const NodeId assoc = types.association_of(source);
  const NodeId target = types.target_of(assoc);
  if (!target) return;

  const Node & a = model.node(assoc);
  Node & e = model.node(elem);
  e.target = model.exprs().make_bound_ref({model.node(target).absolute}, target, e.location);
  e.to_many = a.to_many;
  e.composition = a.composition;
  // Replaced by the rewritten condition once associations are rewritten.
  e.on = a.on;
}

void QueryInference::check_specified_elements(NodeId art)
{
  Model & model = sema_.model();
  const Node & a = model.node(art);
  if (a.specified_elements.empty()) return;

  for (NodeId elem : a.elements.nodes()) {
    Node & e = model.node(elem);
    const NodeId spec = a.specified_elements.get(e.name);
    if (!spec) {
      sema_.report("query-missing-element", e.location, elem, {{"id", e.name}});
      continue;
    }
    const Node & s = model.node(spec);
    for (const Annotation & anno : s.assignments) {
      e.assignments.push_back(anno);
    }
    if (e.type == nullptr && s.type != nullptr && e.value != nullptr && !isa<RefExpr>(e.value)) {
      e.type = s.type;
    }
  }
  for (const auto & entry : a.specified_elements) {
    if (!a.elements.contains(entry.name)) {
      sema_.report(
        "query-unspecified-element", model.node(entry.first()).location, entry.first(),
        {{"id", entry.name}});
    }
  }
}

NodeId QueryInference::create_projection(const std::string & name, NodeId target, NodeId service)
{
  Model & model = sema_.model();
  const Node & svc = model.node(service);
  const NodeId id = model.create_node(NodeKind::Entity, name, svc.location);
  {
    Node & n = model.node(id);
    n.absolute = name;
    n.parent = service;
    n.service = service;
    n.block = svc.block;
    n.inferred = true;
    Annotation anno;
    anno.name = "cds.autoexposed";
    anno.value = model.exprs().make_literal(LiteralKind::Boolean, "true", svc.location);
    anno.location = svc.location;
    anno.source = svc.block;
    n.assignments.push_back(anno);
  }

  const std::string & target_name = model.node(target).absolute;
  const std::string alias_name = target_name.substr(target_name.rfind('.') + 1);

  const NodeId query = model.create_member(NodeKind::Query, name, id);
  const NodeId alias = model.create_member(NodeKind::TableAlias, alias_name, query);
  model.node(alias).from_ref = model.exprs().make_bound_ref({target_name}, target, svc.location);

  Node & qn = model.node(query);
  qn.query_data = std::make_unique<QueryData>();
  qn.query_data->from.alias = alias;
  qn.query_data->from.location = svc.location;
  qn.query_data->table_aliases.add(alias_name, alias);
  qn.query_data->elements_owner = id;
  model.node(id).query = query;

  model.add_definition(id);
  return id;
}

}  // namespace dml
