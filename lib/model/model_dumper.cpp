// dml/model/model_dumper.cpp - JSON serialization implementation
//
#include "dml/model/model_dumper.hpp"

#include <string>
#include <string_view>
#include <unordered_set>

#include "dml/basic/casting.hpp"
#include "dml/model/expr_visitor.hpp"

namespace dml
{
namespace
{

using json = nlohmann::ordered_json;

json j_query(const Model & model, NodeId query);
json j_node(const Model & model, NodeId id);

json j_number(std::string_view text)
{
  json n = json::parse(text.begin(), text.end(), nullptr, false);
  if (n.is_discarded() || !n.is_number()) return std::string(text);
  return n;
}

std::string_view join_name(JoinKind kind)
{
  switch (kind) {
    case JoinKind::None:
      return "";
    case JoinKind::Inner:
      return "inner";
    case JoinKind::Left:
      return "left";
    case JoinKind::Right:
      return "right";
    case JoinKind::Full:
      return "full";
    case JoinKind::Cross:
      return "cross";
  }
  return "inner";
}

/// Name of the artifact a reference resolved to, or its text.
std::string bound_name(const Model & model, const RefExpr * ref)
{
  if (ref == nullptr) return {};
  const NodeId target = ref->target();
  return target ? model.display_name(target) : ref->to_string();
}

// ============================================================================
// Expressions
// ============================================================================

class ExprDumper : public ConstExprVisitor<ExprDumper, json>
{
public:
  explicit ExprDumper(const Model & model) : model_(model) {}

  json visit_ref(const RefExpr * ref)
  {
    json path = json::array();
    for (const auto & step : ref->path) {
      if (!step.has_args && step.where == nullptr) {
        path.push_back(std::string(step.id));
        continue;
      }
      json s{{"id", std::string(step.id)}};
      if (step.has_args) s["args"] = args(step.args);
      if (step.where) s["where"] = visit(step.where);
      path.push_back(std::move(s));
    }
    json j{{"ref", std::move(path)}};
    if (ref->scope == RefScope::Param) j["param"] = true;
    return j;
  }

  json visit_literal(const LiteralExpr * lit)
  {
    switch (lit->literal) {
      case LiteralKind::Number:
        return json{{"val", j_number(lit->text)}};
      case LiteralKind::String:
        return json{{"val", std::string(lit->text)}};
      case LiteralKind::Boolean:
        return json{{"val", lit->text == "true"}};
      case LiteralKind::Null:
        return json{{"val", nullptr}};
      case LiteralKind::Enum:
        return json{{"#", std::string(lit->text)}};
      case LiteralKind::Token:
        break;
    }
    return std::string(lit->text);
  }

  json visit_op(const OpExpr * op)
  {
    json xpr = json::array();
    if (op->op == "xpr") {
      for (const Expr * a : op->args) xpr.push_back(visit(a));
    } else if (op->args.size() == 2) {
      xpr.push_back(visit(op->args[0]));
      xpr.push_back(std::string(op->op));
      xpr.push_back(visit(op->args[1]));
    } else {
      xpr.push_back(std::string(op->op));
      for (const Expr * a : op->args) xpr.push_back(visit(a));
    }
    return json{{"xpr", std::move(xpr)}};
  }

  json visit_func(const FuncExpr * fn)
  {
    json list = json::array();
    for (const Expr * a : fn->args) list.push_back(visit(a));
    return json{{"func", std::string(fn->name)}, {"args", std::move(list)}};
  }

  json visit_cast(const CastExpr * c)
  {
    json j = visit(c->arg);
    if (!j.is_object()) j = json{{"xpr", json::array({std::move(j)})}};
    j["cast"] = json{{"type", bound_name(model_, c->type)}};
    return j;
  }

  json visit_sub_query(const SubQueryExpr * q) { return j_query(model_, q->query); }

  json visit_array(const ArrayExpr * a)
  {
    json list = json::array();
    for (const Expr * item : a->items) list.push_back(visit(item));
    return json{{"list", std::move(list)}};
  }

  json visit_struct(const StructExpr * s) { return args(s->fields); }

private:
  json args(gsl::span<NamedArg> list)
  {
    const bool positional = !list.empty() && list[0].name.empty();
    json out = positional ? json::array() : json::object();
    for (const auto & arg : list) {
      if (positional) {
        out.push_back(visit(arg.value));
      } else {
        out[std::string(arg.name)] = visit(arg.value);
      }
    }
    return out;
  }

  const Model & model_;
};

// Annotation values use the plain JSON forms of the loader.
json j_value(const Model & model, const Expr * e)
{
  if (e == nullptr) return true;
  if (const auto * lit = dyn_cast<LiteralExpr>(e)) {
    switch (lit->literal) {
      case LiteralKind::Number:
        return j_number(lit->text);
      case LiteralKind::Boolean:
        return lit->text == "true";
      case LiteralKind::Null:
        return nullptr;
      case LiteralKind::Enum:
        return json{{"#", std::string(lit->text)}};
      case LiteralKind::String:
      case LiteralKind::Token:
        break;
    }
    return std::string(lit->text);
  }
  if (const auto * arr = dyn_cast<ArrayExpr>(e)) {
    json list = json::array();
    for (const Expr * item : arr->items) list.push_back(j_value(model, item));
    return list;
  }
  if (const auto * st = dyn_cast<StructExpr>(e)) {
    json obj = json::object();
    for (const auto & f : st->fields) obj[std::string(f.name)] = j_value(model, f.value);
    return obj;
  }
  if (const auto * ref = dyn_cast<RefExpr>(e)) {
    return json{{"=", ref->to_string()}};
  }
  return ExprDumper(model).visit(e);
}

/// Type of an inferred element: the declared type of its nearest origin.
const RefExpr * origin_type(const Model & model, NodeId id)
{
  std::unordered_set<NodeId> seen{id};
  for (NodeId cur = model.links().origin(id); cur && seen.insert(cur).second;
       cur = model.links().origin(cur)) {
    const Node & o = model.node(cur);
    if (o.type) return o.type;
    if (o.target || o.structured) return nullptr;
  }
  return nullptr;
}

void add_annotations(const Model & model, const Node & n, json & j)
{
  // Before the merge, the last assignment of a name wins.
  const auto & list = n.annotations.empty() ? n.assignments : n.annotations;
  for (const auto & a : list) {
    j["@" + a.name] = j_value(model, a.value);
  }
}

json j_members(const Model & model, const Dict & dict)
{
  json out = json::object();
  for (const auto & entry : dict) {
    out[entry.name] = j_node(model, entry.first());
  }
  return out;
}

// ============================================================================
// Queries
// ============================================================================

json j_from(const Model & model, const FromItem & item)
{
  if (item.join == JoinKind::None) {
    if (!item.alias) return nullptr;
    const Node & alias = model.node(item.alias);
    json j = alias.query ? j_query(model, alias.query) : ExprDumper(model).visit(alias.from_ref);
    j["as"] = alias.name;
    return j;
  }
  json args = json::array();
  for (const auto & a : item.args) args.push_back(j_from(model, a));
  json j{{"join", std::string(join_name(item.join))}, {"args", std::move(args)}};
  if (item.on) j["on"] = ExprDumper(model).visit(item.on);
  return j;
}

json j_column(const Model & model, const Column & col)
{
  if (col.wildcard) return "*";
  json j = col.value ? ExprDumper(model).visit(col.value) : json::object();
  if (!j.is_object()) j = json{{"val", std::move(j)}};
  if (col.key) j["key"] = true;
  if (col.virtual_) j["virtual"] = true;
  if (!col.alias.empty()) j["as"] = col.alias;
  if (col.nesting != ColumnNesting::None) {
    json nested = json::array();
    for (const Column & n : col.nested) nested.push_back(j_column(model, n));
    j[col.nesting == ColumnNesting::Expand ? "expand" : "inline"] = std::move(nested);
  }
  json cast = json::object();
  if (col.cast_type) cast["type"] = bound_name(model, col.cast_type);
  if (col.redirected) cast["target"] = bound_name(model, col.redirected);
  if (col.on) cast["on"] = ExprDumper(model).visit(col.on);
  if (col.has_keys) {
    json keys = json::array();
    for (const ForeignKeySpec & k : col.keys) {
      json kj = ExprDumper(model).visit(k.ref);
      if (!k.alias.empty()) kj["as"] = k.alias;
      keys.push_back(std::move(kj));
    }
    cast["keys"] = std::move(keys);
  }
  if (!cast.empty()) j["cast"] = std::move(cast);
  for (const Annotation & a : col.annotations) {
    j["@" + a.name] = j_value(model, a.value);
  }
  return j;
}

json j_exprs(const Model & model, const std::vector<Expr *> & list)
{
  json out = json::array();
  for (const Expr * e : list) out.push_back(ExprDumper(model).visit(e));
  return out;
}

json j_query(const Model & model, NodeId query)
{
  if (!query) return nullptr;
  const QueryData & q = model.node(query).query_info();
  if (q.op == QueryOp::Union) {
    json args = json::array();
    for (NodeId arg : q.set_args) args.push_back(j_query(model, arg));
    json set{{"op", "union"}, {"args", std::move(args)}};
    if (!q.order_by.empty()) set["orderBy"] = j_exprs(model, q.order_by);
    return json{{"SET", std::move(set)}};
  }
  json select{{"from", j_from(model, q.from)}};
  if (!q.mixins.empty()) select["mixin"] = j_members(model, q.mixins);
  if (q.has_columns) {
    json columns = json::array();
    for (const Column & col : q.columns) columns.push_back(j_column(model, col));
    select["columns"] = std::move(columns);
  }
  if (!q.excluding.empty()) {
    json excluding = json::array();
    for (const auto & ex : q.excluding) excluding.push_back(ex.first);
    select["excluding"] = std::move(excluding);
  }
  if (q.where) select["where"] = ExprDumper(model).visit(q.where);
  if (!q.group_by.empty()) select["groupBy"] = j_exprs(model, q.group_by);
  if (q.having) select["having"] = ExprDumper(model).visit(q.having);
  if (!q.order_by.empty()) select["orderBy"] = j_exprs(model, q.order_by);
  return json{{"SELECT", std::move(select)}};
}

// ============================================================================
// Definitions and members
// ============================================================================

json j_node(const Model & model, NodeId id)
{
  const Node & n = model.node(id);
  json j = json::object();
  if (is_main_kind(n.kind)) {
    j["kind"] = std::string(to_string(n.kind));
  }
  if (n.query) j["query"] = j_query(model, n.query);
  if (!n.includes.empty()) {
    json list = json::array();
    for (const RefExpr * inc : n.includes) list.push_back(bound_name(model, inc));
    j["includes"] = std::move(list);
  }

  if (n.key) j["key"] = true;
  if (n.virtual_) j["virtual"] = true;
  if (n.masked) j["masked"] = true;
  if (n.type) {
    j["type"] = bound_name(model, n.type);
  } else if (const RefExpr * inherited = n.inferred ? origin_type(model, id) : nullptr) {
    j["type"] = bound_name(model, inherited);
  } else if (n.target) {
    j["type"] = n.composition ? "cds.Composition" : "cds.Association";
  }
  if (n.target) {
    j["target"] = bound_name(model, n.target);
    if (n.to_many) j["cardinality"] = json{{"max", "*"}};
    if (!n.foreign_keys.empty()) {
      json keys = json::array();
      for (const auto & entry : n.foreign_keys) {
        const Node & fk = model.node(entry.first());
        json k = ExprDumper(model).visit(fk.value);
        if (!k.is_object()) k = json::object();
        k["as"] = entry.name;
        keys.push_back(std::move(k));
      }
      j["keys"] = std::move(keys);
    }
    if (n.on) j["on"] = ExprDumper(model).visit(n.on);
  }
  if (n.kind == NodeKind::EnumValue && n.value) {
    j["val"] = j_value(model, n.value);
  }
  if (n.default_value) j["default"] = ExprDumper(model).visit(n.default_value);

  add_annotations(model, n, j);

  if (!n.elements.empty() || n.structured) j["elements"] = j_members(model, n.elements);
  if (!n.enum_values.empty()) j["enum"] = j_members(model, n.enum_values);
  if (n.items) j["items"] = j_node(model, n.items);
  if (!n.params.empty()) j["params"] = j_members(model, n.params);
  if (n.returns) j["returns"] = j_node(model, n.returns);
  if (!n.actions.empty()) j["actions"] = j_members(model, n.actions);
  return j;
}

}  // namespace

nlohmann::ordered_json to_json(const Model & model)
{
  json defs = json::object();
  json autoexposed = json::array();
  for (const auto & entry : model.definitions()) {
    const Node & n = model.node(entry.first());
    defs[entry.name] = j_node(model, entry.first());
    if (n.inferred && n.annotation_flag("cds.autoexposed").value_or(false)) {
      autoexposed.push_back(entry.name);
    }
  }
  json out{{"definitions", std::move(defs)}};
  if (!autoexposed.empty()) out["$autoexposed"] = std::move(autoexposed);
  return out;
}

nlohmann::ordered_json to_json(const Model & model, NodeId id) { return j_node(model, id); }

nlohmann::ordered_json to_json(const Model & model, const Expr * expr)
{
  if (expr == nullptr) return nullptr;
  return ExprDumper(model).visit(expr);
}

}  // namespace dml
