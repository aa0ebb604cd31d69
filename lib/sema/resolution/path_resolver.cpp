// dml/sema/resolution/path_resolver.cpp - Path resolution
#include "dml/sema/resolution/path_resolver.hpp"

#include <fmt/core.h>

#include <string>
#include <vector>

#include "dml/model/expr_visitor.hpp"
#include "dml/sema/queries/query_inference.hpp"
#include "dml/sema/resolution/ref_resolver.hpp"
#include "dml/sema/sema_context.hpp"
#include "dml/sema/types/effective_type.hpp"

namespace dml
{

namespace
{

/// Marks a reference as being resolved for the lifetime of the guard.
class InProgressGuard
{
public:
  explicit InProgressGuard(RefExpr & ref) : ref_(ref) { ref_.in_progress = true; }
  ~InProgressGuard() { ref_.in_progress = false; }

  InProgressGuard(const InProgressGuard &) = delete;
  InProgressGuard & operator=(const InProgressGuard &) = delete;

private:
  RefExpr & ref_;
};

MessageArgs name_args(std::string_view name)
{
  const std::string s(name);
  return {{"name", s}, {"art", s}, {"id", s}};
}

class ExprResolver : public RecursiveExprVisitor<ExprResolver>
{
public:
  ExprResolver(
    SemaContext & sema, PathResolver & paths, RefContext ctx, NodeId user, const ResolveEnv & env)
  : sema_(sema), paths_(paths), ctx_(ctx), user_(user), env_(env)
  {
  }

  bool visit_ref(RefExpr * ref)
  {
    // Step arguments and filters are resolved together with their step.
    (void)paths_.resolve(*ref, ctx_, user_, env_);
    return true;
  }

  bool visit_cast(CastExpr * c)
  {
    visit(c->arg);
    if (c->type) {
      (void)paths_.resolve(*c->type, RefContext::Cast, user_, env_);
    }
    return true;
  }

  bool visit_sub_query(SubQueryExpr * q)
  {
    sema_.queries().populate_query(q->query);
    sema_.refs().resolve_query(q->query, &env_);
    return true;
  }

private:
  SemaContext & sema_;
  PathResolver & paths_;
  RefContext ctx_;
  NodeId user_;
  const ResolveEnv & env_;
};

}  // namespace

// ============================================================================
// Entry points
// ============================================================================

Resolution PathResolver::resolve(
  RefExpr & ref, RefContext ctx, NodeId user, const ResolveEnv & env)
{
  if (ref.resolution().is_set()) {
    return ref.resolution();
  }
  if (ref.in_progress) {
    // Re-entered through a cyclic definition; the outer call binds the cell.
    return Resolution::cyclic();
  }
  if (ref.path.empty()) {
    throw InternalError("reference without path steps");
  }

  const ResolvePolicy & policy = policy_for(ctx);
  Resolution result;
  {
    InProgressGuard guard(ref);
    result = policy.artifact_root() && ref.scope != RefScope::Param
               ? resolve_artifact_path(ref, policy, user, env)
               : resolve_value_path(ref, policy, user, env);
  }
  if (ref.resolution().is_set()) {
    return ref.resolution();
  }
  ref.bind(result);

  if (result.is_bound() && policy.deps != DependencyMode::None && user.is_valid()) {
    sema_.model().links().add_dependency(
      user, Dependency{result.node, ref.location, policy.deps == DependencyMode::Silent});
  }
  return result;
}

void PathResolver::resolve_expr(Expr * expr, RefContext ctx, NodeId user, const ResolveEnv & env)
{
  if (!expr) return;
  ExprResolver resolver(sema_, *this, ctx, user, env);
  resolver.visit(expr);
}

NodeId PathResolver::source_of(const RefExpr & from_ref)
{
  const NodeId n = from_ref.target();
  if (!n) return NodeId::invalid();
  const Node & node = sema_.model().node(n);
  if (is_main_kind(node.kind)) return n;
  return sema_.types().target_of(n);
}

// ============================================================================
// Artifact references
// ============================================================================

Resolution PathResolver::resolve_artifact_path(
  RefExpr & ref, const ResolvePolicy & policy, NodeId user, const ResolveEnv & env)
{
  Model & model = sema_.model();
  PathStep & head = ref.path[0];

  const NodeId art = lookup_artifact(model, env.block, head.id);
  if (!art) {
    report_not_found(policy.undefined_id, head, user, "std", name_args(head.id), nullptr);
    return Resolution::not_found();
  }
  head.node = art;
  resolve_step_extras(head, art, policy, user, env);

  Resolution result = Resolution::bound(art);
  if (ref.path.size() > 1) {
    result = resolve_steps(ref, 1, policy, user, env);
    if (!result.is_bound()) return result;
  }

  const NodeId final_node = result.node;
  const Node & fin = model.node(final_node);

  if (ref.scope == RefScope::TypeOf || policy.context == RefContext::TypeOf) {
    if (is_main_kind(fin.kind) || fin.kind == NodeKind::Builtin) {
      sema_.report(
        "ref-invalid-typeof", ref.location, user, {{"keyword", "type of"}});
      return Resolution::not_found();
    }
    if (final_node == user) {
      sema_.report("ref-invalid-typeof", ref.location, user, {{"keyword", "type of"}}, "self");
      return Resolution::not_found();
    }
  }

  if (policy.check) {
    const CheckResult check = policy.check(model, final_node);
    if (check.outcome == CheckOutcome::Fail) {
      sema_.report(check.message_id, ref.location, user, name_args(ref.to_string()));
      return Resolution::not_found();
    }
    if (check.outcome == CheckOutcome::Sloppy) {
      sema_.report(check.message_id, ref.location, user, name_args(ref.to_string()));
    }
  }
  return result;
}

// ============================================================================
// Value references
// ============================================================================

Resolution PathResolver::resolve_value_path(
  RefExpr & ref, const ResolvePolicy & policy, NodeId user, const ResolveEnv & env)
{
  Resolution root = lookup_value_root(ref, policy, user, env);
  if (!root.is_bound()) return root;

  const Node & root_node = sema_.model().node(root.node);
  if (root_node.kind == NodeKind::MagicVar && sema_.model().is_open_variable(root.node)) {
    // Elements of open variables are not checked.
    return root;
  }

  size_t first = 1;
  if (ref.scope != RefScope::Param && ref.path[0].id == "$parameters") {
    first = 2;  // `$parameters.p`: the parameter was the root
  }
  if (ref.path.size() <= first) return root;
  return resolve_steps(ref, first, policy, user, env);
}

Resolution PathResolver::lookup_value_root(
  RefExpr & ref, const ResolvePolicy & policy, NodeId user, const ResolveEnv & env)
{
  Model & model = sema_.model();
  PathStep & head = ref.path[0];
  const std::string_view id = head.id;

  // Parameters: `:p` and `$parameters.p`
  const bool dollar_params = ref.scope != RefScope::Param && id == "$parameters";
  if (ref.scope == RefScope::Param || dollar_params) {
    if (dollar_params && ref.path.size() < 2) {
      sema_.report("ref-unexpected-self", head.location, user, {{"id", std::string(id)}});
      return Resolution::not_found();
    }
    PathStep & pstep = dollar_params ? ref.path[1] : head;
    if (!policy.allow_params || !env.params_of) {
      sema_.report(
        "ref-undefined-param", pstep.location, user, {{"id", std::string(pstep.id)}}, "none");
      return Resolution::not_found();
    }
    const Node & owner = model.node(env.params_of);
    const NodeId param = owner.params.get(pstep.id);
    if (!param) {
      report_not_found(
        "ref-undefined-param", pstep, user, "std",
        {{"art", model.display_name(env.params_of)}, {"id", std::string(pstep.id)}},
        &owner.params);
      return Resolution::not_found();
    }
    if (dollar_params) head.node = env.params_of;
    pstep.node = param;
    return Resolution::bound(param);
  }

  // $self / $projection
  if (id == "$self" || id == "$projection") {
    if (!policy.allow_self || !env.self) {
      sema_.report("ref-unexpected-self", head.location, user, {{"id", std::string(id)}});
      return Resolution::not_found();
    }
    head.node = env.self;
    return Resolution::bound(env.self);
  }

  const Dict * valid = nullptr;
  switch (policy.env) {
    case EnvSelector::QueryElements:
    case EnvSelector::QuerySources: {
      bool found = false;
      Resolution r = lookup_in_query(head, policy, user, env, found);
      if (found) return r;
      if (env.query) {
        valid = &model.node(env.query).query_info().combined;
      }
      // Nested columns of an expand or inline see the expanded structure.
      if (!env.elements_of) break;
      [[fallthrough]];
    }
    case EnvSelector::Siblings:
    case EnvSelector::Target: {
      if (env.elements_of) {
        if (const Dict * members = sema_.types().elements_of(env.elements_of)) {
          valid = members;
          if (const Dict::Entry * e = members->find(id)) {
            if (e->is_ambiguous()) {
              sema_.report("ref-ambiguous", head.location, user, {{"id", std::string(id)}});
              return Resolution::ambiguous();
            }
            head.node = e->first();
            resolve_step_extras(head, head.node, policy, user, env);
            return Resolution::bound(head.node);
          }
        }
      }
      break;
    }
    case EnvSelector::Artifacts:
    case EnvSelector::None:
      break;
  }

  if (!id.empty() && id.front() == '$') {
    if (policy.allow_magic) {
      if (NodeId var = model.magic_variable(id)) {
        head.node = var;
        return Resolution::bound(var);
      }
    }
    sema_.report("ref-undefined-var", head.location, user, {{"id", std::string(id)}});
    return Resolution::not_found();
  }

  const bool in_query = policy.env == EnvSelector::QuerySources ||
                        policy.env == EnvSelector::QueryElements;
  report_not_found(
    policy.undefined_id, head, user, in_query ? "query" : "std", {{"id", std::string(id)}}, valid);
  return Resolution::not_found();
}

Resolution PathResolver::lookup_in_query(
  PathStep & step, const ResolvePolicy & policy, NodeId user, const ResolveEnv & env,
  bool & found)
{
  Model & model = sema_.model();
  found = false;
  for (const ResolveEnv * e = &env; e != nullptr; e = e->outer) {
    if (!e->query) continue;
    Node & qnode = model.node(e->query);
    const QueryData & q = qnode.query_info();
    PathStep & head = step;

    if (policy.env == EnvSelector::QueryElements && e == &env && q.elements_owner) {
      if (NodeId elem = model.node(q.elements_owner).elements.get(step.id)) {
        found = true;
        head.node = elem;
        return Resolution::bound(elem);
      }
    }
    if (NodeId alias = q.table_aliases.get(step.id)) {
      found = true;
      if (env.redirection_on) {
        sema_.report("ref-rejected-on", step.location, user, {{"id", std::string(step.id)}}, "alias");
        return Resolution::not_found();
      }
      head.node = alias;
      return Resolution::bound(alias);
    }
    if (NodeId mixin = q.mixins.get(step.id)) {
      found = true;
      if (env.redirection_on) {
        sema_.report("ref-rejected-on", step.location, user, {{"id", std::string(step.id)}}, "mixin");
        return Resolution::not_found();
      }
      head.node = mixin;
      return Resolution::bound(mixin);
    }
    // The explicit ON of a redirection sees the query elements, not the sources.
    if (env.redirection_on) return Resolution::not_found();
    if (const Dict::Entry * entry = q.combined.find(step.id)) {
      found = true;
      if (entry->is_ambiguous()) {
        std::vector<std::string> names;
        const Dict::Entry * aliases = q.combined_aliases.find(step.id);
        if (aliases) {
          for (NodeId a : aliases->nodes) {
            names.push_back(model.node(a).name + "." + std::string(step.id));
          }
        }
        sema_.report(
          "ref-ambiguous", step.location, user,
          {{"id", std::string(step.id)}, {"names", join_names(names)}});
        return Resolution::ambiguous();
      }
      head.node = entry->first();
      return Resolution::bound(head.node);
    }
  }
  return Resolution::not_found();
}

// ============================================================================
// Member steps
// ============================================================================

Resolution PathResolver::resolve_steps(
  RefExpr & ref, size_t first, const ResolvePolicy & policy, NodeId user, const ResolveEnv & env)
{
  Model & model = sema_.model();
  EffectiveTypeEngine & types = sema_.types();

  for (size_t i = first; i < ref.path.size(); ++i) {
    PathStep & step = ref.path[i];
    PathStep & prev = ref.path[i - 1];
    const NodeId prev_node = prev.node;
    if (!prev_node) {
      throw InternalError(fmt::format("path step '{}' of '{}' is unbound", prev.id, ref.to_string()));
    }
    const Node & pn = model.node(prev_node);

    if (pn.kind == NodeKind::MagicVar && model.is_open_variable(prev_node)) {
      return Resolution::bound(prev_node);
    }

    const TypeResult type = types.effective(prev_node);
    if (type.kind == TypeResultKind::Cyclic) {
      return Resolution::cyclic();
    }

    const NodeId assoc = types.association_of(prev_node);
    const Dict * members = nullptr;
    NodeId owner = prev_node;

    if (assoc && pn.kind != NodeKind::TableAlias && !is_main_kind(pn.kind)) {
      const Node & an = model.node(assoc);
      if (policy.navigation == Navigation::None) {
        sema_.report("ref-unexpected-navigation", step.location, user, {{"id", std::string(prev.id)}});
        return Resolution::not_found();
      }
      const NodeId target = types.target_of(assoc);
      if (!target) return Resolution::not_found();
      owner = target;
      members = types.elements_of(target);

      if (policy.navigation == Navigation::ForeignKeysOnly) {
        if (an.on != nullptr) {
          sema_.report(
            "ref-unexpected-navigation", step.location, user, {{"id", std::string(prev.id)}},
            "unmanaged");
          return Resolution::not_found();
        }
        bool is_key = false;
        for (NodeId fk : an.foreign_keys.nodes()) {
          const auto * kref = dyn_cast<RefExpr>(model.node(fk).value);
          if (kref && !kref->path.empty() && kref->path[0].id == step.id) {
            is_key = true;
            break;
          }
        }
        if (!is_key && !an.foreign_keys.empty()) {
          sema_.report(
            "ref-unexpected-navigation", step.location, user,
            {{"id", std::string(step.id)}, {"name", std::string(prev.id)}}, "key");
          return Resolution::not_found();
        }
      }
    } else {
      members = types.elements_of(prev_node);
    }

    const Dict::Entry * entry = members ? members->find(step.id) : nullptr;
    if (!entry) {
      // Steps of an artifact path (`type of E:a.b`, `from E:assoc`) name members of a definition.
      report_not_found(
        policy.artifact_root() ? "ref-undefined-def" : "ref-undefined-element", step, user,
        "element",
        {{"art", model.display_name(owner)}, {"member", std::string(step.id)},
         {"id", std::string(step.id)}},
        members);
      return Resolution::not_found();
    }
    if (entry->is_ambiguous()) {
      sema_.report("ref-ambiguous", step.location, user, {{"id", std::string(step.id)}});
      return Resolution::ambiguous();
    }
    step.node = entry->first();
    resolve_step_extras(step, step.node, policy, user, env);
  }
  return Resolution::bound(ref.path[ref.path.size() - 1].node);
}

void PathResolver::resolve_step_extras(
  PathStep & step, NodeId node, const ResolvePolicy & policy, NodeId user, const ResolveEnv & env)
{
  if (!step.has_args && step.where == nullptr) return;

  Model & model = sema_.model();
  const Node & n = model.node(node);
  const NodeId entity = is_main_kind(n.kind) ? node : sema_.types().target_of(node);
  const RefContext value_ctx = policy.artifact_root() ? RefContext::Param : policy.context;

  if (step.has_args) {
    if (!entity || model.node(entity).params.empty()) {
      sema_.report(
        "args-no-params", step.location, user,
        {{"art", entity ? model.display_name(entity) : std::string(step.id)}});
    } else {
      const Node & en = model.node(entity);
      for (NamedArg & arg : step.args) {
        if (arg.name.empty()) {
          sema_.report("args-expected-named", arg.location, user, {{"art", model.display_name(entity)}});
        } else if (!en.params.contains(arg.name)) {
          sema_.report(
            "args-undefined-param", arg.location, user,
            {{"art", model.display_name(entity)}, {"id", std::string(arg.name)}});
        }
      }
    }
    for (NamedArg & arg : step.args) {
      resolve_expr(arg.value, value_ctx, user, env);
    }
  }

  if (step.where != nullptr) {
    if (!entity) {
      sema_.report("expr-no-filter", step.where->location, user);
      return;
    }
    ResolveEnv filter_env;
    filter_env.block = env.block;
    filter_env.elements_of = entity;
    filter_env.params_of = env.params_of;
    resolve_expr(step.where, RefContext::Filter, user, filter_env);
  }
}

void PathResolver::report_not_found(
  std::string_view id, const PathStep & step, NodeId user, std::string_view variant,
  MessageArgs args, const Dict * valid)
{
  DiagnosticBuilder builder = sema_.report(id, step.location, user, std::move(args), variant);
  if (valid != nullptr && sema_.options().attach_valid_names) {
    builder.with_valid_names(sorted_names(*valid));
  }
}

}  // namespace dml
