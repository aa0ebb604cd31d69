// dml/model/node_id.hpp - Stable index of a node in the model arena
#pragma once

#include <cstdint>
#include <functional>

namespace dml
{

/**
 * Strong index into Model's node arena. Ids are never reused; a node once
 * created stays addressable for the lifetime of the model.
 */
struct NodeId
{
  uint32_t value = UINT32_MAX;

  [[nodiscard]] static constexpr NodeId invalid() noexcept { return NodeId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != UINT32_MAX; }
  constexpr explicit operator bool() const noexcept { return is_valid(); }

  friend constexpr bool operator==(NodeId a, NodeId b) noexcept { return a.value == b.value; }
  friend constexpr bool operator!=(NodeId a, NodeId b) noexcept { return a.value != b.value; }
  friend constexpr bool operator<(NodeId a, NodeId b) noexcept { return a.value < b.value; }
};

}  // namespace dml

namespace std
{
template <>
struct hash<dml::NodeId>
{
  size_t operator()(dml::NodeId id) const noexcept { return hash<uint32_t>{}(id.value); }
};
}  // namespace std
