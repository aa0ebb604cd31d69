// dml/model/builtins.cpp - Core types and magic variables
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "dml/model/model.hpp"

namespace dml
{

namespace
{

struct BuiltinSpec
{
  const char * name;
  BuiltinCategory category;
};

constexpr BuiltinSpec k_core_types[] = {
  {"String", BuiltinCategory::String},     {"LargeString", BuiltinCategory::String},
  {"Binary", BuiltinCategory::Binary},     {"LargeBinary", BuiltinCategory::Binary},
  {"Decimal", BuiltinCategory::Numeric},   {"Integer64", BuiltinCategory::Numeric},
  {"Integer", BuiltinCategory::Numeric},   {"Int32", BuiltinCategory::Numeric},
  {"Double", BuiltinCategory::Numeric},    {"Date", BuiltinCategory::DateTime},
  {"Time", BuiltinCategory::DateTime},     {"DateTime", BuiltinCategory::DateTime},
  {"Timestamp", BuiltinCategory::DateTime}, {"Boolean", BuiltinCategory::Boolean},
  {"UUID", BuiltinCategory::Uuid},         {"Association", BuiltinCategory::Relation},
  {"Composition", BuiltinCategory::Relation},
};

}  // namespace

void install_builtins(Model & model)
{
  for (const auto & spec : k_core_types) {
    const std::string full = std::string("cds.") + spec.name;
    const NodeId id = model.create_node(NodeKind::Builtin, full);
    model.node(id).absolute = full;
    model.builtins_.add(full, id);
    model.builtins_.add(spec.name, id);
    model.categories_.emplace(id, spec.category);
  }

  auto make_var = [&model](const char * name, std::vector<const char *> members) {
    const NodeId var = model.create_node(NodeKind::MagicVar, name);
    model.node(var).absolute = name;
    for (const char * m : members) {
      const NodeId elem = model.create_node(NodeKind::Element, m);
      Node & e = model.node(elem);
      e.parent = var;
      e.main = var;
      e.type = model.exprs().make_bound_ref({"cds.String"}, model.builtin("cds.String"));
      model.node(var).elements.add(m, elem);
    }
    model.node(var).structured = !members.empty();
    return var;
  };

  const std::pair<const char *, std::vector<const char *>> vars[] = {
    {"$user", {"id", "locale"}}, {"$at", {"from", "to"}}, {"$valid", {"from", "to"}},
    {"$now", {}},                {"$tenant", {}},         {"$session", {}},
  };
  for (const auto & [name, members] : vars) {
    const NodeId var = make_var(name, members);
    model.magic_vars_.add(name, var);
    if (std::string_view(name) == "$session") {
      model.open_vars_.push_back(var);
    }
  }
}

}  // namespace dml
