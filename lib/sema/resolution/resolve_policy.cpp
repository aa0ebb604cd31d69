// dml/sema/resolution/resolve_policy.cpp - Policy table of reference contexts
#include "dml/sema/resolution/resolve_policy.hpp"

#include "dml/basic/diagnostic.hpp"
#include "dml/model/model.hpp"

namespace dml
{

namespace
{

// ============================================================================
// Kind checks
// ============================================================================

CheckResult check_type(const Model & model, NodeId art)
{
  switch (model.node(art).kind) {
    case NodeKind::Type:
    case NodeKind::Builtin:
    case NodeKind::Element:
    case NodeKind::Entity:
    case NodeKind::Aspect:
    case NodeKind::Event:
      return {};
    default:
      return {CheckOutcome::Fail, "expected-type"};
  }
}

CheckResult check_struct(const Model & model, NodeId art)
{
  const Node & n = model.node(art);
  switch (n.kind) {
    case NodeKind::Entity:
    case NodeKind::Aspect:
    case NodeKind::Event:
      return {};
    case NodeKind::Type:
      if (n.structured) return {};
      return {CheckOutcome::Fail, "expected-struct"};
    default:
      return {CheckOutcome::Fail, "expected-struct"};
  }
}

CheckResult check_target(const Model & model, NodeId art)
{
  switch (model.node(art).kind) {
    case NodeKind::Entity:
      return {};
    case NodeKind::Aspect:
      return {CheckOutcome::Sloppy, "ref-sloppy-target"};
    case NodeKind::Type:
      return {CheckOutcome::Sloppy, "ref-sloppy-target"};
    default:
      return {CheckOutcome::Fail, "expected-target"};
  }
}

CheckResult check_composition_target(const Model & model, NodeId art)
{
  switch (model.node(art).kind) {
    case NodeKind::Entity:
    case NodeKind::Aspect:
      return {};
    case NodeKind::Type:
      return {CheckOutcome::Sloppy, "ref-sloppy-target"};
    default:
      return {CheckOutcome::Fail, "expected-target"};
  }
}

CheckResult check_source(const Model & model, NodeId art)
{
  const Node & n = model.node(art);
  if (n.kind == NodeKind::Entity) return {};
  if (n.kind == NodeKind::Element && n.target != nullptr) return {};
  return {CheckOutcome::Fail, "expected-source"};
}

CheckResult check_main(const Model & model, NodeId art)
{
  const NodeKind k = model.node(art).kind;
  if (is_main_kind(k)) return {};
  return {CheckOutcome::Fail, "expected-entity"};
}

// ============================================================================
// Policies
// ============================================================================

using D = DependencyMode;
using E = EnvSelector;
using N = Navigation;

//                                   context                env                 navigation   self   params magic  check                     not found                 deps
const ResolvePolicy k_type{RefContext::Type, E::Artifacts, N::None, false, false, false, check_type, "ref-undefined-art", D::Normal};
const ResolvePolicy k_type_of{RefContext::TypeOf, E::Artifacts, N::None, false, false, false, nullptr, "ref-undefined-art", D::Normal};
const ResolvePolicy k_include{RefContext::Include, E::Artifacts, N::None, false, false, false, check_struct, "ref-undefined-art", D::Normal};
const ResolvePolicy k_target{RefContext::Target, E::Artifacts, N::None, false, false, false, check_target, "ref-undefined-art", D::None};
const ResolvePolicy k_comp_target{RefContext::CompositionTarget, E::Artifacts, N::None, false, false, false, check_composition_target, "ref-undefined-art", D::None};
const ResolvePolicy k_from{RefContext::From, E::Artifacts, N::Follow, false, false, false, check_source, "ref-undefined-art", D::Normal};
const ResolvePolicy k_extend{RefContext::Extend, E::Artifacts, N::None, false, false, false, check_main, "ref-undefined-art", D::None};
const ResolvePolicy k_annotate{RefContext::Annotate, E::Artifacts, N::None, false, false, false, nullptr, "anno-undefined-art", D::None};
const ResolvePolicy k_using{RefContext::Using, E::Artifacts, N::None, false, false, false, nullptr, "ref-undefined-art", D::None};
const ResolvePolicy k_column{RefContext::Column, E::QuerySources, N::Follow, true, true, true, nullptr, "ref-undefined-element", D::None};
const ResolvePolicy k_expr{RefContext::Expr, E::QuerySources, N::Follow, true, true, true, nullptr, "ref-undefined-element", D::None};
const ResolvePolicy k_default{RefContext::Default, E::None, N::None, false, true, true, nullptr, "ref-undefined-element", D::None};
const ResolvePolicy k_filter{RefContext::Filter, E::Target, N::ForeignKeysOnly, false, true, true, nullptr, "ref-undefined-element", D::None};
const ResolvePolicy k_on{RefContext::On, E::Siblings, N::Follow, true, false, true, nullptr, "ref-undefined-element", D::None};
const ResolvePolicy k_join_on{RefContext::JoinOn, E::QuerySources, N::Follow, false, true, true, nullptr, "ref-undefined-element", D::None};
const ResolvePolicy k_mixin_on{RefContext::MixinOn, E::QuerySources, N::Follow, true, true, true, nullptr, "ref-undefined-element", D::None};
const ResolvePolicy k_order_by{RefContext::OrderBy, E::QueryElements, N::Follow, true, true, true, nullptr, "ref-undefined-element", D::None};
const ResolvePolicy k_foreign_key{RefContext::ForeignKey, E::Target, N::ForeignKeysOnly, false, false, false, nullptr, "ref-undefined-element", D::None};
const ResolvePolicy k_param{RefContext::Param, E::None, N::None, false, true, true, nullptr, "ref-undefined-param", D::None};
const ResolvePolicy k_cast{RefContext::Cast, E::Artifacts, N::None, false, false, false, check_type, "ref-undefined-art", D::Normal};

}  // namespace

std::string_view to_string(RefContext ctx) noexcept
{
  switch (ctx) {
    case RefContext::Type:
      return "type";
    case RefContext::TypeOf:
      return "typeOf";
    case RefContext::Include:
      return "include";
    case RefContext::Target:
      return "target";
    case RefContext::CompositionTarget:
      return "compositionTarget";
    case RefContext::From:
      return "from";
    case RefContext::Extend:
      return "extend";
    case RefContext::Annotate:
      return "annotate";
    case RefContext::Using:
      return "using";
    case RefContext::Column:
      return "column";
    case RefContext::Expr:
      return "expr";
    case RefContext::Default:
      return "default";
    case RefContext::Filter:
      return "filter";
    case RefContext::On:
      return "on";
    case RefContext::JoinOn:
      return "joinOn";
    case RefContext::MixinOn:
      return "mixinOn";
    case RefContext::OrderBy:
      return "orderBy";
    case RefContext::ForeignKey:
      return "foreignKey";
    case RefContext::Param:
      return "param";
    case RefContext::Cast:
      return "cast";
  }
  return "unknown";
}

const ResolvePolicy & policy_for(RefContext ctx)
{
  switch (ctx) {
    case RefContext::Type:
      return k_type;
    case RefContext::TypeOf:
      return k_type_of;
    case RefContext::Include:
      return k_include;
    case RefContext::Target:
      return k_target;
    case RefContext::CompositionTarget:
      return k_comp_target;
    case RefContext::From:
      return k_from;
    case RefContext::Extend:
      return k_extend;
    case RefContext::Annotate:
      return k_annotate;
    case RefContext::Using:
      return k_using;
    case RefContext::Column:
      return k_column;
    case RefContext::Expr:
      return k_expr;
    case RefContext::Default:
      return k_default;
    case RefContext::Filter:
      return k_filter;
    case RefContext::On:
      return k_on;
    case RefContext::JoinOn:
      return k_join_on;
    case RefContext::MixinOn:
      return k_mixin_on;
    case RefContext::OrderBy:
      return k_order_by;
    case RefContext::ForeignKey:
      return k_foreign_key;
    case RefContext::Param:
      return k_param;
    case RefContext::Cast:
      return k_cast;
  }
  throw InternalError("unknown reference context");
}

}  // namespace dml
