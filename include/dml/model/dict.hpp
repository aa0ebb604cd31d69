// dml/model/dict.hpp - Insertion-ordered name to node mapping
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "dml/model/node_id.hpp"

namespace dml
{

/**
 * Ordered dictionary of named nodes.
 *
 * Iteration follows insertion order. An entry may hold more than one node:
 * for member dictionaries this records a duplicate definition, for the
 * `$combined` multiset of a query it means "ambiguous until disambiguated".
 */
class Dict
{
public:
  struct Entry
  {
    std::string name;
    std::vector<NodeId> nodes;

    [[nodiscard]] NodeId first() const noexcept
    {
      return nodes.empty() ? NodeId::invalid() : nodes.front();
    }
    [[nodiscard]] bool is_ambiguous() const noexcept { return nodes.size() > 1; }
  };

  /**
   * Add a node under `name`.
   *
   * @return false if the name already existed (the node is appended to the
   *         existing entry)
   */
  bool add(std::string_view name, NodeId node);

  /// Replace all nodes of `name` (or add it at the end).
  void set(std::string_view name, NodeId node);

  /// Insert entries of `front` before the current ones, skipping names already present.
  void prepend(const std::vector<std::pair<std::string, NodeId>> & front);

  [[nodiscard]] const Entry * find(std::string_view name) const;

  /// First node of `name`, or an invalid id.
  [[nodiscard]] NodeId get(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

  [[nodiscard]] std::vector<std::string> names() const;

  /// First node of every entry, in order.
  [[nodiscard]] std::vector<NodeId> nodes() const;

  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

  [[nodiscard]] auto begin() const { return entries_.begin(); }
  [[nodiscard]] auto end() const { return entries_.end(); }

  void clear() noexcept
  {
    entries_.clear();
    index_.clear();
  }

private:
  std::vector<Entry> entries_;
  std::unordered_map<std::string, size_t> index_;
};

}  // namespace dml
