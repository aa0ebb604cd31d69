// dml/sema/resolution/environment.cpp - Artifact lookup along the scope chain
#include "dml/sema/resolution/environment.hpp"

#include <algorithm>

namespace dml
{

ResolveEnv definition_env(const Model & model, NodeId user)
{
  ResolveEnv env;
  const Node & n = model.node(user);
  env.block = n.block;
  env.self = model.main_of(user);
  env.params_of = env.self;
  env.elements_of = is_main_kind(n.kind) ? user : n.parent;
  return env;
}

std::string using_target_name(const Model & model, NodeId using_node)
{
  const Node & u = model.node(using_node);
  if (u.target == nullptr || u.target->path.empty()) return {};
  return std::string(u.target->path[0].id);
}

NodeId lookup_artifact(const Model & model, NodeId block, std::string_view name)
{
  if (block.is_valid()) {
    const Node & b = model.node(block);
    if (b.source_data) {
      const SourceData & src = *b.source_data;
      const std::string_view head = name.substr(0, name.find('.'));
      if (NodeId alias = src.usings.get(head)) {
        std::string full = using_target_name(model, alias);
        full.append(name.substr(head.size()));
        return model.definition(full);
      }
      if (!src.namespace_name.empty()) {
        std::string candidate = src.namespace_name + "." + std::string(name);
        if (NodeId found = model.definition(candidate)) return found;
      }
    }
  }

  if (NodeId found = model.definition(name)) return found;
  return model.builtin(name);
}

std::vector<std::string> sorted_names(const Dict & dict)
{
  std::vector<std::string> names = dict.names();
  std::sort(names.begin(), names.end());
  return names;
}

}  // namespace dml
