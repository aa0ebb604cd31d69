// dml/sema/queries/key_propagation.cpp - Primary keys of simple views
#include "dml/sema/queries/key_propagation.hpp"

#include <string>
#include <vector>

#include "dml/model/expr_visitor.hpp"
#include "dml/sema/queries/query_inference.hpp"
#include "dml/sema/resolution/path_resolver.hpp"
#include "dml/sema/sema_context.hpp"
#include "dml/sema/types/effective_type.hpp"

namespace dml
{

namespace
{

/// References anywhere in a column expression, in source order.
class RefCollector : public RecursiveExprVisitor<RefCollector, const Expr *>
{
public:
  bool visit_ref(const RefExpr * ref)
  {
    refs.push_back(ref);
    return RecursiveExprVisitor::visit_ref(ref);
  }

  std::vector<const RefExpr *> refs;
};

}  // namespace

void KeyPropagation::propagate(NodeId art)
{
  Model & model = sema_.model();
  if (!model.node(art).query) return;

  NodeStatus & status = model.links().status(art);
  if (status.keys != Progress::Unvisited) return;
  status.keys = Progress::InProgress;

  auto done = [&]() { model.links().status(art).keys = Progress::Done; };

  const QueryData & q = model.node(model.node(art).query).query_info();
  if (q.op == QueryOp::Union || !q.from.alias) return done();
  const Node & alias = model.node(q.from.alias);
  if (alias.from_ref == nullptr) return done();
  for (const Column & col : q.columns) {
    if (col.key) return done();
  }

  const RefExpr & from = *alias.from_ref;
  const NodeId source = sema_.paths().source_of(from);
  if (!source) return done();
  if (model.node(source).query) propagate(source);

  // A to-many step in FROM multiplies the rows of the source.
  for (size_t i = 1; i < from.path.size(); ++i) {
    const NodeId step = from.path[i].node;
    if (step && sema_.types().is_to_many(step)) {
      sema_.report(
        "query-from-many", from.location, art, {{"art", model.display_name(step)}});
      return done();
    }
  }

  // Column expressions are resolved here already, with the query environment
  // the reference pass would use.
  const ResolveEnv env = sema_.queries().query_env(model.node(art).query);
  for (NodeId elem : model.node(art).elements.nodes()) {
    Expr * value = model.node(elem).value;
    if (value == nullptr) continue;
    if (!isa<RefExpr>(value)) {
      sema_.paths().resolve_expr(value, RefContext::Expr, art, env);
    }
    RefCollector collector;
    collector.visit(value);
    for (const RefExpr * ref : collector.refs) {
      if (ref->resolution().is_bound() && navigates_many(*ref, 0, art)) return done();
    }
  }

  const Dict * source_elements = sema_.types().elements_of(source);
  if (source_elements == nullptr) return done();

  std::vector<std::string> missing;
  std::vector<NodeId> projected;
  for (NodeId k : source_elements->nodes()) {
    if (!model.node(k).key) continue;
    NodeId found;
    for (NodeId p : model.links().projections(k)) {
      if (model.node(p).parent == art) {
        found = p;
        break;
      }
    }
    if (found) {
      projected.push_back(found);
    } else {
      missing.push_back(model.node(k).name);
    }
  }
  if (!missing.empty()) {
    sema_.report(
      "query-missing-keys", model.node(art).location, art, {{"names", join_names(missing)}});
    return done();
  }
  for (NodeId p : projected) {
    model.node(p).key = true;
  }
  done();
}

bool KeyPropagation::navigates_many(const RefExpr & ref, size_t first, NodeId art)
{
  Model & model = sema_.model();
  // The last step may itself be a to-many association; only navigation counts.
  for (size_t i = first; i + 1 < ref.path.size(); ++i) {
    const NodeId step = ref.path[i].node;
    if (!step) return false;
    const NodeKind kind = model.node(step).kind;
    if (kind == NodeKind::TableAlias || kind == NodeKind::MagicVar || is_main_kind(kind)) continue;
    if (sema_.types().is_to_many(step)) {
      sema_.report(
        "query-navigate-many", ref.location, art, {{"art", model.display_name(step)}});
      return true;
    }
  }
  return false;
}

}  // namespace dml
