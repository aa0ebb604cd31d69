// dml/sema/analysis/layers.hpp - Source layers for annotation precedence
#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "dml/model/model.hpp"

namespace dml
{

/**
 * Layers of a model: the strongly connected components of the source
 * dependency graph. A layer extends every layer reachable from it.
 *
 * Layer numbers follow a topological order, dependencies first: a layer
 * never extends a layer with a higher number.
 */
class LayerGraph
{
public:
  explicit LayerGraph(const Model & model);

  /// Layer of a source node; sources unknown to the graph get layer 0.
  [[nodiscard]] size_t layer_of(NodeId source) const;

  /// true if `upper` extends `lower` (directly or transitively, upper != lower).
  [[nodiscard]] bool extends(size_t upper, size_t lower) const;

  [[nodiscard]] size_t size() const noexcept { return members_.size(); }

  /// Sources of a layer.
  [[nodiscard]] const std::vector<NodeId> & sources(size_t layer) const { return members_.at(layer); }

private:
  std::unordered_map<NodeId, size_t> layer_;
  std::vector<std::vector<NodeId>> members_;
  /// reach_[a][b]: layer a extends layer b
  std::vector<std::vector<bool>> reach_;
};

}  // namespace dml
