// dml/model/model.cpp - Node arena and name bookkeeping
#include "dml/model/model.hpp"

#include <fmt/core.h>

#include <algorithm>

#include "dml/basic/diagnostic.hpp"

namespace dml
{

Model::Model() { install_builtins(*this); }

NodeId Model::create_node(NodeKind kind, std::string name, SourceLocation loc)
{
  const NodeId id{static_cast<uint32_t>(nodes_.size())};
  Node & n = nodes_.emplace_back();
  n.id = id;
  n.kind = kind;
  n.name = std::move(name);
  n.location = loc;
  return id;
}

NodeId Model::create_member(NodeKind kind, std::string name, NodeId parent, SourceLocation loc)
{
  const NodeId id = create_node(kind, std::move(name), loc);
  const Node & p = node(parent);
  Node & n = node(id);
  n.parent = parent;
  n.main = is_main_kind(p.kind) ? parent : p.main;
  n.block = p.block;
  n.absolute = n.main.is_valid() ? node(n.main).absolute : p.absolute;
  if (!n.location.is_valid()) n.location = p.location;
  return id;
}

Node & Model::node(NodeId id)
{
  if (!id.is_valid() || id.value >= nodes_.size()) {
    throw InternalError(fmt::format("invalid node id {}", id.value));
  }
  return nodes_[id.value];
}

const Node & Model::node(NodeId id) const
{
  if (!id.is_valid() || id.value >= nodes_.size()) {
    throw InternalError(fmt::format("invalid node id {}", id.value));
  }
  return nodes_[id.value];
}

bool Model::add_definition(NodeId id)
{
  Node & n = node(id);
  if (n.absolute.empty()) {
    throw InternalError(fmt::format("definition '{}' without absolute name", n.name));
  }
  return definitions_.add(n.absolute, id);
}

NodeId Model::add_source(const std::string & file, const std::string & namespace_name)
{
  const FileId fid = files_.add_file(file);
  const NodeId id = create_node(NodeKind::Source, file, SourceLocation{fid, 0, 0});
  Node & n = node(id);
  n.block = id;
  n.source_data = std::make_unique<SourceData>();
  n.source_data->file = file;
  n.source_data->namespace_name = namespace_name;
  sources_.push_back(id);
  return id;
}

bool Model::is_builtin(NodeId id, std::string_view full_name) const
{
  return id.is_valid() && id == builtins_.get(full_name);
}

std::optional<BuiltinCategory> Model::builtin_category(NodeId id) const
{
  auto it = categories_.find(id);
  if (it == categories_.end()) return std::nullopt;
  return it->second;
}

bool Model::is_open_variable(NodeId id) const
{
  return std::find(open_vars_.begin(), open_vars_.end(), id) != open_vars_.end();
}

NodeId Model::main_of(NodeId id) const
{
  NodeId cur = id;
  while (cur.is_valid()) {
    const Node & n = node(cur);
    if (is_main_kind(n.kind) || n.kind == NodeKind::Builtin || n.kind == NodeKind::Source) {
      return cur;
    }
    cur = n.parent;
  }
  return NodeId::invalid();
}

std::string Model::display_name(NodeId id) const
{
  if (!id.is_valid()) return "<none>";
  const Node & n = node(id);
  if (is_main_kind(n.kind) || n.kind == NodeKind::Builtin || n.kind == NodeKind::MagicVar) {
    return n.absolute.empty() ? n.name : n.absolute;
  }
  if (n.kind == NodeKind::Source) return n.name;

  std::vector<std::string_view> path;
  NodeId cur = id;
  while (cur.is_valid()) {
    const Node & c = node(cur);
    if (is_main_kind(c.kind) || c.kind == NodeKind::MagicVar) break;
    if (is_member_kind(c.kind) || c.kind == NodeKind::TableAlias) {
      path.push_back(c.name);
    }
    cur = c.parent;
  }
  std::string out = cur.is_valid() ? node(cur).absolute : std::string();
  out += ':';
  for (auto it = path.rbegin(); it != path.rend(); ++it) {
    if (it != path.rbegin()) out += '.';
    out.append(it->data(), it->size());
  }
  return out;
}

}  // namespace dml
