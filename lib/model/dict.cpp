// dml/model/dict.cpp - Ordered dictionary implementation
#include "dml/model/dict.hpp"

#include <utility>

namespace dml
{

bool Dict::add(std::string_view name, NodeId node)
{
  auto it = index_.find(std::string(name));
  if (it != index_.end()) {
    entries_[it->second].nodes.push_back(node);
    return false;
  }
  index_.emplace(std::string(name), entries_.size());
  entries_.push_back(Entry{std::string(name), {node}});
  return true;
}

void Dict::set(std::string_view name, NodeId node)
{
  auto it = index_.find(std::string(name));
  if (it != index_.end()) {
    entries_[it->second].nodes = {node};
    return;
  }
  add(name, node);
}

void Dict::prepend(const std::vector<std::pair<std::string, NodeId>> & front)
{
  std::vector<Entry> merged;
  merged.reserve(front.size() + entries_.size());
  for (const auto & [name, node] : front) {
    if (index_.find(name) != index_.end()) {
      continue;
    }
    bool seen = false;
    for (auto & e : merged) {
      if (e.name == name) {
        e.nodes.push_back(node);
        seen = true;
        break;
      }
    }
    if (!seen) {
      merged.push_back(Entry{name, {node}});
    }
  }
  for (auto & e : entries_) {
    merged.push_back(std::move(e));
  }
  entries_ = std::move(merged);
  index_.clear();
  for (size_t i = 0; i < entries_.size(); ++i) {
    index_.emplace(entries_[i].name, i);
  }
}

const Dict::Entry * Dict::find(std::string_view name) const
{
  auto it = index_.find(std::string(name));
  return it == index_.end() ? nullptr : &entries_[it->second];
}

NodeId Dict::get(std::string_view name) const
{
  const Entry * e = find(name);
  return e ? e->first() : NodeId::invalid();
}

std::vector<std::string> Dict::names() const
{
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto & e : entries_) {
    out.push_back(e.name);
  }
  return out;
}

std::vector<NodeId> Dict::nodes() const
{
  std::vector<NodeId> out;
  out.reserve(entries_.size());
  for (const auto & e : entries_) {
    out.push_back(e.first());
  }
  return out;
}

}  // namespace dml
