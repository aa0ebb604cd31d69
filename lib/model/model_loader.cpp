// dml/model/model_loader.cpp - Model sources in JSON notation
//
#include "dml/model/model_loader.hpp"

#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace dml
{

namespace
{

using json = nlohmann::ordered_json;

std::optional<NodeKind> main_kind(std::string_view kind)
{
  if (kind == "namespace") return NodeKind::Namespace;
  if (kind == "context") return NodeKind::Context;
  if (kind == "service") return NodeKind::Service;
  if (kind == "entity") return NodeKind::Entity;
  if (kind == "aspect") return NodeKind::Aspect;
  if (kind == "type") return NodeKind::Type;
  if (kind == "event") return NodeKind::Event;
  if (kind == "annotation") return NodeKind::AnnotationDef;
  if (kind == "action") return NodeKind::Action;
  if (kind == "function") return NodeKind::Function;
  return std::nullopt;
}

JoinKind join_kind(std::string_view join)
{
  if (join == "left") return JoinKind::Left;
  if (join == "right") return JoinKind::Right;
  if (join == "full") return JoinKind::Full;
  if (join == "cross") return JoinKind::Cross;
  return JoinKind::Inner;
}

std::string last_segment(std::string_view name)
{
  const size_t dot = name.rfind('.');
  return std::string(dot == std::string_view::npos ? name : name.substr(dot + 1));
}

bool is_expression(const json & j)
{
  return j.contains("ref") || j.contains("val") || j.contains("#") || j.contains("func") ||
         j.contains("xpr") || j.contains("list") || j.contains("SELECT") || j.contains("SET");
}

}  // namespace

ModelLoader::ModelLoader(Model & model, DiagnosticBag & diagnostics)
: model_(model), messages_(diagnostics)
{
}

DiagnosticBuilder ModelLoader::report(
  std::string_view id, SourceLocation loc, MessageArgs args, std::string_view variant)
{
  return messages_.report(id, loc, std::string(), std::move(args), variant);
}

SourceLocation ModelLoader::location_of(const json & j) const
{
  SourceLocation loc = source_ ? model_.node(source_).location : SourceLocation{};
  if (!j.is_object()) return loc;
  auto it = j.find("$location");
  if (it != j.end() && it->is_object()) {
    loc.line = it->value("line", 0U);
    loc.column = it->value("col", 0U);
  }
  return loc;
}

// ============================================================================
// Documents and sources
// ============================================================================

ModelLoadResult ModelLoader::add_text(std::string_view text, const std::string & origin)
{
  json doc;
  try {
    doc = json::parse(text.begin(), text.end());
  } catch (const json::parse_error & e) {
    return ModelLoadResult::fail("failed to parse JSON in " + origin + ": " + e.what());
  }
  return add_document(doc);
}

ModelLoadResult ModelLoader::add_file(const std::filesystem::path & path)
{
  std::ifstream in(path);
  if (!in) {
    return ModelLoadResult::fail("cannot read file: " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return add_text(buffer.str(), path.string());
}

ModelLoadResult ModelLoader::add_document(const json & doc)
{
  if (!doc.is_object()) {
    return ModelLoadResult::fail("model document must be a JSON object");
  }
  auto it = doc.find("sources");
  if (it == doc.end()) {
    load_source(doc);
    return ModelLoadResult::ok();
  }
  if (!it->is_array()) {
    return ModelLoadResult::fail("'sources' must be an array");
  }
  for (const auto & src : *it) {
    load_source(src);
  }
  return ModelLoadResult::ok();
}

void ModelLoader::load_source(const json & j)
{
  if (!j.is_object()) {
    report("syntax-csn-expected-object", {}, {{"prop", "sources"}});
    return;
  }
  const std::string file =
    j.value("file", "<source " + std::to_string(model_.sources().size() + 1) + ">");
  source_ = model_.add_source(file, j.value("namespace", ""));
  SourceData & src = model_.node(source_).source_info();

  if (auto deps = j.find("dependencies"); deps != j.end() && deps->is_array()) {
    for (const auto & d : *deps) {
      if (d.is_string()) src.dependencies.push_back(d.get<std::string>());
    }
  }

  if (auto usings = j.find("usings"); usings != j.end() && usings->is_array()) {
    for (const auto & u : *usings) {
      const SourceLocation loc = location_of(u);
      if (!u.is_object() || !u.contains("ref") || !u["ref"].is_string()) {
        report("syntax-csn-required-subproperty", loc, {{"prop", "usings"}, {"sub", "ref"}});
        continue;
      }
      const std::string ref = u["ref"].get<std::string>();
      const std::string alias = u.value("as", last_segment(ref));
      const NodeId id = model_.create_node(NodeKind::Using, alias, loc);
      Node & n = model_.node(id);
      n.block = source_;
      n.parent = source_;
      n.target = model_.exprs().make_ref({ref}, loc);
      if (!src.usings.add(alias, id)) {
        report("duplicate-definition", loc, {{"name", alias}});
      }
    }
  }

  if (auto defs = j.find("definitions"); defs != j.end()) {
    if (!defs->is_object()) {
      report("syntax-csn-expected-object", location_of(j), {{"prop", "definitions"}});
    } else {
      for (auto it = defs->begin(); it != defs->end(); ++it) {
        load_definition(it.key(), it.value(), source_);
      }
    }
  }

  if (auto exts = j.find("extensions"); exts != j.end() && exts->is_array()) {
    for (const auto & e : *exts) {
      Extension ext;
      load_extension(e, ext, source_, true);
      if (ext.ref != nullptr) src.extensions.push_back(std::move(ext));
    }
  }
}

// ============================================================================
// Definitions and members
// ============================================================================

void ModelLoader::load_definition(const std::string & key, const json & j, NodeId source)
{
  const SourceLocation loc = location_of(j);
  if (!j.is_object()) {
    report("syntax-csn-expected-object", loc, {{"prop", key}});
    return;
  }
  auto kind_it = j.find("kind");
  if (kind_it == j.end() || !kind_it->is_string()) {
    report("syntax-csn-required-subproperty", loc, {{"prop", key}, {"sub", "kind"}});
    return;
  }
  const std::string kind_name = kind_it->get<std::string>();
  const std::optional<NodeKind> kind = main_kind(kind_name);
  if (!kind) {
    report("syntax-csn-unknown-kind", loc, {{"name", kind_name}});
    return;
  }

  const std::string & ns = model_.node(source).source_info().namespace_name;
  const std::string absolute = ns.empty() ? key : ns + "." + key;
  const NodeId id = model_.create_node(*kind, absolute, loc);
  {
    Node & n = model_.node(id);
    n.absolute = absolute;
    n.block = source;
    n.parent = source;
  }

  if (auto it = j.find("query"); it != j.end()) {
    model_.node(id).query = load_query(*it, id, id);
  } else if (auto proj = j.find("projection"); proj != j.end()) {
    model_.node(id).query = load_query(json{{"SELECT", *proj}}, id, id);
  }

  if (model_.node(id).query) {
    // Elements written with a query only specify the inferred ones.
    if (auto elems = j.find("elements"); elems != j.end() && elems->is_object()) {
      for (auto it = elems->begin(); it != elems->end(); ++it) {
        const NodeId spec = load_member(it.key(), it.value(), id, NodeKind::Element);
        if (spec) model_.node(id).specified_elements.add(it.key(), spec);
      }
    }
    json rest = j;
    rest.erase("elements");
    load_member_props(rest, id);
  } else {
    load_member_props(j, id);
  }

  if (auto inc = j.find("includes"); inc != j.end() && inc->is_array()) {
    for (const auto & i : *inc) {
      if (RefExpr * ref = load_artifact_ref(i, "includes")) {
        model_.node(id).includes.push_back(ref);
      }
    }
  }

  if (!model_.add_definition(id)) {
    report("duplicate-definition", loc, {{"name", absolute}});
  }
  model_.node(source).source_info().definitions.push_back(id);
}

void ModelLoader::load_member_props(const json & j, NodeId node)
{
  ExprContext & exprs = model_.exprs();
  const SourceLocation loc = location_of(j);

  if (auto it = j.find("type"); it != j.end()) {
    RefExpr * type = nullptr;
    if (it->is_string()) {
      const std::string name = it->get<std::string>();
      type = exprs.make_ref({name}, loc);
      if (name == "cds.Composition" || name == "Composition") {
        model_.node(node).composition = true;
      }
    } else if (it->is_object() && it->contains("ref")) {
      type = load_ref((*it)["ref"], loc, node);
    } else if (it->is_object() && it->contains("typeof")) {
      type = load_ref((*it)["typeof"], loc, node);
      if (type != nullptr) type->scope = RefScope::TypeOf;
    } else {
      report("syntax-csn-expected-reference", loc, {{"prop", "type"}});
    }
    model_.node(node).type = type;
  }

  if (auto it = j.find("target"); it != j.end()) {
    model_.node(node).target = load_artifact_ref(*it, "target");
  }
  if (auto it = j.find("cardinality"); it != j.end() && it->is_object()) {
    if (auto max = it->find("max"); max != it->end()) {
      model_.node(node).to_many =
        (max->is_string() && max->get<std::string>() == "*") ||
        (max->is_number_integer() && max->get<int64_t>() > 1);
    }
  }
  if (auto it = j.find("keys"); it != j.end()) {
    if (!it->is_array()) {
      report("syntax-csn-expected-object", loc, {{"prop", "keys"}});
    } else {
      for (const auto & k : *it) {
        const SourceLocation kloc = location_of(k);
        if (!k.is_object() || !k.contains("ref")) {
          report("syntax-csn-required-subproperty", kloc, {{"prop", "keys"}, {"sub", "ref"}});
          continue;
        }
        RefExpr * ref = load_ref(k["ref"], kloc, node);
        if (ref == nullptr) continue;
        const std::string name = k.value("as", std::string(ref->path[ref->path.size() - 1].id));
        const NodeId key = model_.create_member(NodeKind::Key, name, node, kloc);
        model_.node(key).value = ref;
        if (!model_.node(node).foreign_keys.add(name, key)) {
          report("duplicate-definition", kloc, {{"name", name}});
        }
      }
      model_.node(node).has_keys = true;
    }
  }
  if (auto it = j.find("on"); it != j.end()) {
    model_.node(node).on = load_xpr(*it, node);
  }
  if (auto it = j.find("default"); it != j.end()) {
    model_.node(node).default_value = load_expr(*it, node);
  }
  {
    Node & n = model_.node(node);
    n.key = j.value("key", false);
    n.virtual_ = j.value("virtual", false);
    n.masked = j.value("masked", false);
  }

  if (auto it = j.find("elements"); it != j.end()) {
    load_members(*it, node, NodeKind::Element, "elements");
    model_.node(node).structured = true;
  }
  if (auto it = j.find("enum"); it != j.end()) {
    load_members(*it, node, NodeKind::EnumValue, "enum");
  }
  if (auto it = j.find("items"); it != j.end()) {
    model_.node(node).items = load_member("items", *it, node, NodeKind::Element);
  }
  if (auto it = j.find("params"); it != j.end()) {
    load_members(*it, node, NodeKind::Param, "params");
  }
  if (auto it = j.find("returns"); it != j.end()) {
    model_.node(node).returns = load_member("returns", *it, node, NodeKind::Param);
  }
  if (auto it = j.find("actions"); it != j.end()) {
    load_actions(*it, node);
  }
  load_annotations(j, model_.node(node).assignments, source_, false);
}

NodeId ModelLoader::load_member(
  const std::string & name, const json & j, NodeId parent, NodeKind kind)
{
  const SourceLocation loc = location_of(j);
  if (!j.is_object()) {
    report("syntax-csn-expected-object", loc, {{"prop", name}});
    return NodeId::invalid();
  }
  const NodeId id = model_.create_member(kind, name, parent, loc);
  if (kind == NodeKind::EnumValue) {
    if (j.contains("val") || j.contains("#")) model_.node(id).value = load_expr(j, id);
    load_annotations(j, model_.node(id).assignments, source_, false);
    return id;
  }
  load_member_props(j, id);
  return id;
}

void ModelLoader::load_members(const json & j, NodeId owner, NodeKind kind, const char * prop)
{
  if (!j.is_object()) {
    report("syntax-csn-expected-object", location_of(j), {{"prop", prop}});
    return;
  }
  for (auto it = j.begin(); it != j.end(); ++it) {
    const NodeId m = load_member(it.key(), it.value(), owner, kind);
    if (!m) continue;
    Node & o = model_.node(owner);
    Dict & dict = kind == NodeKind::Param       ? o.params
                  : kind == NodeKind::EnumValue ? o.enum_values
                                                : o.elements;
    if (!dict.add(it.key(), m)) {
      report("duplicate-definition", model_.node(m).location, {{"name", it.key()}}, "element");
    }
  }
}

void ModelLoader::load_actions(const json & j, NodeId owner)
{
  if (!j.is_object()) {
    report("syntax-csn-expected-object", location_of(j), {{"prop", "actions"}});
    return;
  }
  for (auto it = j.begin(); it != j.end(); ++it) {
    const json & a = it.value();
    const SourceLocation loc = location_of(a);
    if (!a.is_object()) {
      report("syntax-csn-expected-object", loc, {{"prop", it.key()}});
      continue;
    }
    const NodeKind kind = a.value("kind", "action") == "function" ? NodeKind::Function
                                                                  : NodeKind::Action;
    const NodeId id = model_.create_member(kind, it.key(), owner, loc);
    model_.node(id).absolute = model_.node(owner).absolute + "." + it.key();
    load_member_props(a, id);
    if (!model_.node(owner).actions.add(it.key(), id)) {
      report("duplicate-definition", loc, {{"name", it.key()}});
    }
  }
}

void ModelLoader::load_annotations(
  const json & j, std::vector<Annotation> & out, NodeId source, bool from_extension)
{
  if (!j.is_object()) return;
  const SourceLocation loc = location_of(j);
  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string & key = it.key();
    if (key.empty() || key[0] != '@') continue;
    Annotation anno;
    anno.name = key.substr(1);
    anno.value = load_value(it.value());
    anno.location = loc;
    anno.source = source;
    anno.from_extension = from_extension;
    out.push_back(std::move(anno));
  }
}

void ModelLoader::load_extension(const json & j, Extension & ext, NodeId source, bool top_level)
{
  ext.location = location_of(j);
  ext.source = source;
  if (!j.is_object()) {
    report("syntax-csn-expected-object", ext.location, {{"prop", "extensions"}});
    return;
  }
  if (top_level) {
    if (auto it = j.find("annotate"); it != j.end() && it->is_string()) {
      ext.name = it->get<std::string>();
    } else if (auto ex = j.find("extend"); ex != j.end() && ex->is_string()) {
      ext.name = ex->get<std::string>();
      ext.extend = true;
    } else {
      report(
        "syntax-csn-required-subproperty", ext.location, {{"prop", "extensions"}, {"sub", "annotate"}});
      return;
    }
    ext.ref = model_.exprs().make_ref({ext.name}, ext.location);
  }
  load_annotations(j, ext.annotations, source, true);

  auto nested = [&](const char * prop, std::vector<Extension> & out) {
    auto it = j.find(prop);
    if (it == j.end()) return;
    if (!it->is_object()) {
      report("syntax-csn-expected-object", ext.location, {{"prop", prop}});
      return;
    }
    for (auto m = it->begin(); m != it->end(); ++m) {
      Extension sub;
      sub.name = m.key();
      load_extension(m.value(), sub, source, false);
      out.push_back(std::move(sub));
    }
  };

  if (ext.extend && top_level) {
    // `extend ... with { elements }` adds new elements.
    if (auto it = j.find("elements"); it != j.end() && it->is_object()) {
      for (auto m = it->begin(); m != it->end(); ++m) {
        const SourceLocation loc = location_of(m.value());
        if (!m.value().is_object()) {
          report("syntax-csn-expected-object", loc, {{"prop", m.key()}});
          continue;
        }
        const NodeId id = model_.create_node(NodeKind::Element, m.key(), loc);
        model_.node(id).block = source;
        load_member_props(m.value(), id);
        ext.new_elements.push_back(id);
      }
    }
  } else {
    nested("elements", ext.elements);
  }
  nested("params", ext.params);
  nested("actions", ext.actions);
}

// ============================================================================
// Queries
// ============================================================================

NodeId ModelLoader::load_query(const json & j, NodeId parent, NodeId owner)
{
  const SourceLocation loc = location_of(j);
  const NodeId query = model_.create_member(NodeKind::Query, "", parent, loc);
  model_.node(query).query_data = std::make_unique<QueryData>();
  const NodeId elements_owner = owner ? owner : query;
  model_.node(query).query_info().elements_owner = elements_owner;

  if (!j.is_object()) {
    report("syntax-csn-expected-object", loc, {{"prop", "query"}});
    return query;
  }
  if (auto set = j.find("SET"); set != j.end()) {
    QueryData & q = model_.node(query).query_info();
    q.op = QueryOp::Union;
    auto args = set->is_object() ? set->find("args") : set->end();
    if (!set->is_object() || args == set->end() || !args->is_array() || args->empty()) {
      report("syntax-csn-required-subproperty", loc, {{"prop", "SET"}, {"sub", "args"}});
      return query;
    }
    for (size_t i = 0; i < args->size(); ++i) {
      // The leading query provides the elements of the union.
      const NodeId arg = load_query((*args)[i], query, i == 0 ? elements_owner : NodeId::invalid());
      q.set_args.push_back(arg);
    }
    if (auto order = set->find("orderBy"); order != set->end() && order->is_array()) {
      for (const auto & o : *order) {
        if (Expr * e = load_expr(o, query)) q.order_by.push_back(e);
      }
    }
    return query;
  }
  if (auto select = j.find("SELECT"); select != j.end()) {
    load_select(*select, query);
    return query;
  }
  report("syntax-csn-required-subproperty", loc, {{"prop", "query"}, {"sub", "SELECT"}});
  return query;
}

void ModelLoader::load_select(const json & j, NodeId query)
{
  const SourceLocation loc = location_of(j);
  if (!j.is_object()) {
    report("syntax-csn-expected-object", loc, {{"prop", "SELECT"}});
    return;
  }
  if (auto from = j.find("from"); from != j.end()) {
    FromItem item = load_from(*from, query);
    model_.node(query).query_info().from = std::move(item);
  } else {
    report("syntax-csn-required-subproperty", loc, {{"prop", "SELECT"}, {"sub", "from"}});
  }

  if (auto mixin = j.find("mixin"); mixin != j.end() && mixin->is_object()) {
    for (auto it = mixin->begin(); it != mixin->end(); ++it) {
      const NodeId m = load_member(it.key(), it.value(), query, NodeKind::Mixin);
      if (!m) continue;
      if (!model_.node(query).query_info().mixins.add(it.key(), m)) {
        report("duplicate-definition", model_.node(m).location, {{"name", it.key()}});
      }
    }
  }

  if (auto cols = j.find("columns"); cols != j.end()) {
    if (!cols->is_array()) {
      report("syntax-csn-expected-object", loc, {{"prop", "columns"}});
    } else {
      std::vector<Column> columns;
      for (const auto & c : *cols) {
        columns.push_back(load_column(c, query));
      }
      QueryData & q = model_.node(query).query_info();
      q.columns = std::move(columns);
      q.has_columns = true;
    }
  }

  QueryData & q = model_.node(query).query_info();
  if (auto ex = j.find("excluding"); ex != j.end() && ex->is_array()) {
    for (const auto & e : *ex) {
      if (e.is_string()) q.excluding.emplace_back(e.get<std::string>(), loc);
    }
  }
  if (auto it = j.find("where"); it != j.end()) q.where = load_xpr(*it, query);
  if (auto it = j.find("having"); it != j.end()) q.having = load_xpr(*it, query);
  if (auto it = j.find("groupBy"); it != j.end() && it->is_array()) {
    for (const auto & g : *it) {
      if (Expr * e = load_expr(g, query)) q.group_by.push_back(e);
    }
  }
  if (auto it = j.find("orderBy"); it != j.end() && it->is_array()) {
    for (const auto & o : *it) {
      if (Expr * e = load_expr(o, query)) q.order_by.push_back(e);
    }
  }
}

NodeId ModelLoader::add_table_alias(const std::string & name, NodeId query, SourceLocation loc)
{
  const NodeId alias = model_.create_member(NodeKind::TableAlias, name, query, loc);
  if (!model_.node(query).query_info().table_aliases.add(name, alias)) {
    report("duplicate-definition", loc, {{"name", name}}, "alias");
  }
  return alias;
}

FromItem ModelLoader::load_from(const json & j, NodeId query)
{
  FromItem item;
  item.location = location_of(j);

  if (j.is_string()) {
    const std::string name = j.get<std::string>();
    item.alias = add_table_alias(last_segment(name), query, item.location);
    model_.node(item.alias).from_ref = model_.exprs().make_ref({name}, item.location);
    return item;
  }
  if (!j.is_object()) {
    report("syntax-csn-expected-reference", item.location, {{"prop", "from"}});
    return item;
  }
  if (auto ref = j.find("ref"); ref != j.end()) {
    RefExpr * from_ref = load_ref(*ref, item.location, query);
    if (from_ref == nullptr) return item;
    const std::string name =
      j.value("as", last_segment(from_ref->path[from_ref->path.size() - 1].id));
    item.alias = add_table_alias(name, query, item.location);
    model_.node(item.alias).from_ref = from_ref;
    return item;
  }
  if (auto join = j.find("join"); join != j.end()) {
    item.join = join_kind(join->is_string() ? join->get<std::string>() : std::string());
    if (auto args = j.find("args"); args != j.end() && args->is_array()) {
      for (const auto & a : *args) {
        item.args.push_back(load_from(a, query));
      }
    } else {
      report("syntax-csn-required-subproperty", item.location, {{"prop", "from"}, {"sub", "args"}});
    }
    if (auto on = j.find("on"); on != j.end()) item.on = load_xpr(*on, query);
    return item;
  }
  if (j.contains("SELECT") || j.contains("SET")) {
    auto as = j.find("as");
    if (as == j.end() || !as->is_string()) {
      report("syntax-csn-required-subproperty", item.location, {{"prop", "from"}, {"sub", "as"}});
      return item;
    }
    item.alias = add_table_alias(as->get<std::string>(), query, item.location);
    const NodeId sub = load_query(j, item.alias, item.alias);
    model_.node(item.alias).query = sub;
    return item;
  }
  report("syntax-csn-expected-reference", item.location, {{"prop", "from"}});
  return item;
}

Column ModelLoader::load_column(const json & j, NodeId query)
{
  Column col;
  col.location = location_of(j);
  if (j.is_string() && j.get<std::string>() == "*") {
    col.wildcard = true;
    return col;
  }
  if (!j.is_object()) {
    report("syntax-csn-expected-object", col.location, {{"prop", "columns"}});
    return col;
  }

  col.alias = j.value("as", "");
  col.key = j.value("key", false);
  col.virtual_ = j.value("virtual", false);
  if (is_expression(j)) col.value = load_expr_base(j, query);

  auto nested = j.find("expand");
  col.nesting = ColumnNesting::Expand;
  if (nested == j.end()) {
    nested = j.find("inline");
    col.nesting = nested != j.end() ? ColumnNesting::Inline : ColumnNesting::None;
  }
  if (nested != j.end() && nested->is_array()) {
    for (const auto & n : *nested) {
      col.nested.push_back(load_column(n, query));
    }
  }

  if (auto cast = j.find("cast"); cast != j.end() && cast->is_object()) {
    if (auto type = cast->find("type"); type != cast->end()) {
      col.cast_type = load_artifact_ref(*type, "type");
    }
    if (auto target = cast->find("target"); target != cast->end()) {
      col.redirected = load_artifact_ref(*target, "target");
    }
    if (auto on = cast->find("on"); on != cast->end()) {
      col.on = load_xpr(*on, query);
    }
    if (auto keys = cast->find("keys"); keys != cast->end() && keys->is_array()) {
      for (const auto & k : *keys) {
        ForeignKeySpec spec;
        spec.location = location_of(k);
        if (!k.is_object() || !k.contains("ref")) {
          report("syntax-csn-required-subproperty", spec.location, {{"prop", "keys"}, {"sub", "ref"}});
          continue;
        }
        spec.ref = load_ref(k["ref"], spec.location, query);
        spec.alias = k.value("as", "");
        if (spec.ref != nullptr) col.keys.push_back(std::move(spec));
      }
      col.has_keys = true;
    }
  }
  load_annotations(j, col.annotations, source_, false);
  return col;
}

// ============================================================================
// Expressions
// ============================================================================

Expr * ModelLoader::load_xpr(const json & j, NodeId parent)
{
  if (!j.is_array()) return load_expr(j, parent);
  std::vector<Expr *> items;
  for (const auto & t : j) {
    if (Expr * e = load_expr(t, parent)) items.push_back(e);
  }
  if (items.size() == 1) return items.front();
  ExprContext & exprs = model_.exprs();
  const SourceLocation loc = items.empty() ? location_of(j) : items.front()->location;
  return exprs.create<OpExpr>(exprs.intern("xpr"), exprs.copy_to_arena(items), loc);
}

Expr * ModelLoader::load_expr(const json & j, NodeId parent)
{
  Expr * base = load_expr_base(j, parent);
  if (base == nullptr || !j.is_object()) return base;
  auto cast = j.find("cast");
  if (cast == j.end() || !cast->is_object() || !cast->contains("type")) return base;
  RefExpr * type = load_artifact_ref((*cast)["type"], "type");
  return model_.exprs().create<CastExpr>(base, type, base->location);
}

Expr * ModelLoader::load_expr_base(const json & j, NodeId parent)
{
  ExprContext & exprs = model_.exprs();
  const SourceLocation loc = location_of(j);

  if (j.is_string()) {
    return exprs.make_literal(LiteralKind::Token, j.get<std::string>(), loc);
  }
  if (j.is_array()) return load_xpr(j, parent);
  if (!j.is_object()) return load_value(j);

  if (auto ref = j.find("ref"); ref != j.end()) {
    RefExpr * r = load_ref(*ref, loc, parent);
    if (r != nullptr && j.value("param", false)) r->scope = RefScope::Param;
    return r;
  }
  if (auto val = j.find("val"); val != j.end()) {
    // A string value is data, never a token.
    Expr * v = val->is_string()
                 ? exprs.make_literal(LiteralKind::String, val->get<std::string>(), loc)
                 : load_value(*val);
    v->location = loc;
    return v;
  }
  if (auto sym = j.find("#"); sym != j.end() && sym->is_string()) {
    return exprs.make_literal(LiteralKind::Enum, sym->get<std::string>(), loc);
  }
  if (auto func = j.find("func"); func != j.end() && func->is_string()) {
    std::vector<Expr *> args;
    if (auto a = j.find("args"); a != j.end() && a->is_array()) {
      for (const auto & arg : *a) {
        if (Expr * e = load_expr(arg, parent)) args.push_back(e);
      }
    }
    return exprs.create<FuncExpr>(
      exprs.intern(func->get<std::string>()), exprs.copy_to_arena(args), loc);
  }
  if (auto xpr = j.find("xpr"); xpr != j.end() && xpr->is_array()) {
    std::vector<Expr *> items;
    for (const auto & t : *xpr) {
      if (Expr * e = load_expr(t, parent)) items.push_back(e);
    }
    return exprs.create<OpExpr>(exprs.intern("xpr"), exprs.copy_to_arena(items), loc);
  }
  if (auto list = j.find("list"); list != j.end() && list->is_array()) {
    std::vector<Expr *> items;
    for (const auto & t : *list) {
      if (Expr * e = load_expr(t, parent)) items.push_back(e);
    }
    return exprs.create<ArrayExpr>(exprs.copy_to_arena(items), loc);
  }
  if (j.contains("SELECT") || j.contains("SET")) {
    return exprs.create<SubQueryExpr>(load_query(j, parent, NodeId::invalid()), loc);
  }
  report("syntax-csn-expected-reference", loc, {{"prop", "expression"}});
  return nullptr;
}

Expr * ModelLoader::load_value(const json & j)
{
  ExprContext & exprs = model_.exprs();
  const SourceLocation loc = source_ ? model_.node(source_).location : SourceLocation{};

  if (j.is_null()) return exprs.make_literal(LiteralKind::Null, "null", loc);
  if (j.is_boolean()) {
    return exprs.make_literal(LiteralKind::Boolean, j.get<bool>() ? "true" : "false", loc);
  }
  if (j.is_number()) return exprs.make_literal(LiteralKind::Number, j.dump(), loc);
  if (j.is_string()) {
    const std::string s = j.get<std::string>();
    return exprs.make_literal(s == "..." ? LiteralKind::Token : LiteralKind::String, s, loc);
  }
  if (j.is_array()) {
    std::vector<Expr *> items;
    for (const auto & v : j) {
      items.push_back(load_value(v));
    }
    return exprs.create<ArrayExpr>(exprs.copy_to_arena(items), loc);
  }

  if (j.contains("...")) return exprs.make_literal(LiteralKind::Token, "...", loc);
  if (auto sym = j.find("#"); sym != j.end() && sym->is_string()) {
    return exprs.make_literal(LiteralKind::Enum, sym->get<std::string>(), loc);
  }
  if (auto path = j.find("="); path != j.end() && path->is_string()) {
    std::vector<std::string> parts;
    std::string text = path->get<std::string>();
    size_t start = 0;
    for (size_t dot = text.find('.'); dot != std::string::npos; dot = text.find('.', start)) {
      parts.push_back(text.substr(start, dot - start));
      start = dot + 1;
    }
    parts.push_back(text.substr(start));
    std::vector<std::string_view> ids(parts.begin(), parts.end());
    return exprs.make_ref(ids, loc);
  }
  std::vector<NamedArg> fields;
  for (auto it = j.begin(); it != j.end(); ++it) {
    fields.push_back(NamedArg{exprs.intern(it.key()), loc, load_value(it.value())});
  }
  return exprs.create<StructExpr>(exprs.copy_to_arena(fields), loc);
}

RefExpr * ModelLoader::load_ref(const json & steps, SourceLocation loc, NodeId parent)
{
  ExprContext & exprs = model_.exprs();
  if (steps.is_string()) {
    return exprs.make_ref({steps.get<std::string>()}, loc);
  }
  if (!steps.is_array() || steps.empty()) {
    report("syntax-csn-expected-reference", loc, {{"prop", "ref"}});
    return nullptr;
  }

  gsl::span<PathStep> path = exprs.allocate_array<PathStep>(steps.size());
  for (size_t i = 0; i < steps.size(); ++i) {
    const json & s = steps[i];
    PathStep & step = path[i];
    step.location = loc;
    if (s.is_string()) {
      step.id = exprs.intern(s.get<std::string>());
      continue;
    }
    if (!s.is_object() || !s.contains("id") || !s["id"].is_string()) {
      report("syntax-csn-required-subproperty", loc, {{"prop", "ref"}, {"sub", "id"}});
      return nullptr;
    }
    step.id = exprs.intern(s["id"].get<std::string>());
    if (auto args = s.find("args"); args != s.end()) {
      std::vector<NamedArg> list;
      if (args->is_object()) {
        for (auto a = args->begin(); a != args->end(); ++a) {
          list.push_back(NamedArg{exprs.intern(a.key()), loc, load_expr(a.value(), parent)});
        }
      } else if (args->is_array()) {
        for (const auto & a : *args) {
          list.push_back(NamedArg{{}, loc, load_expr(a, parent)});
        }
      }
      step.args = exprs.copy_to_arena(list);
      step.has_args = true;
    }
    if (auto where = s.find("where"); where != s.end()) {
      step.where = load_xpr(*where, parent);
    }
  }
  return exprs.create<RefExpr>(path, loc);
}

RefExpr * ModelLoader::load_artifact_ref(const json & j, const char * prop)
{
  const SourceLocation loc = location_of(j);
  if (j.is_string() && !j.get<std::string>().empty()) {
    return model_.exprs().make_ref({j.get<std::string>()}, loc);
  }
  if (j.is_object() && j.contains("ref")) {
    return load_ref(j["ref"], loc, NodeId::invalid());
  }
  report("syntax-csn-expected-reference", loc, {{"prop", prop}});
  return nullptr;
}

// ============================================================================
// Linking
// ============================================================================

void ModelLoader::finish()
{
  for (const auto & entry : model_.definitions()) {
    for (NodeId id : entry.nodes) {
      const std::string name = model_.node(id).absolute;
      NodeId parent;
      NodeId service;
      // Enclosing contexts and services, innermost first.
      for (size_t end = name.rfind('.'); end != std::string::npos && end > 0;
           end = name.rfind('.', end - 1)) {
        const NodeId scope = model_.definition(name.substr(0, end));
        if (!scope) continue;
        const NodeKind kind = model_.node(scope).kind;
        if (kind != NodeKind::Context && kind != NodeKind::Service && kind != NodeKind::Namespace) {
          continue;
        }
        if (!parent) parent = scope;
        if (!service && kind == NodeKind::Service) service = scope;
      }
      Node & n = model_.node(id);
      if (parent) n.parent = parent;
      n.service = service;
    }
  }
}

}  // namespace dml
