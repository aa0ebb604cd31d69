// dml/sema/analysis/annotation_merger.hpp - Layered merge of annotation assignments
#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "dml/model/model.hpp"
#include "dml/sema/analysis/layers.hpp"

namespace dml
{

class SemaContext;

/**
 * Chooses one value per annotation and node from the assignments of all
 * layers, and stores the result in `Node::annotations`.
 *
 * Assignments of a layer that is extended by another assigning layer are
 * overridden silently. Assignments of unrelated layers conflict. An array
 * value containing `...` includes the value of the next lower assignment.
 */
class AnnotationMerger
{
public:
  explicit AnnotationMerger(SemaContext & sema);
  ~AnnotationMerger();

  AnnotationMerger(const AnnotationMerger &) = delete;
  AnnotationMerger & operator=(const AnnotationMerger &) = delete;

  /// (Re)compute the source layers; call once all sources are known.
  void compute_layers();

  [[nodiscard]] const LayerGraph & layers();

  /// Merge the assignments of a main artifact and all its members.
  void merge_definition(NodeId art);

private:
  void merge_node(NodeId id);
  Annotation merge_group(NodeId home, const std::vector<const Annotation *> & group);
  Expr * splice(NodeId home, const Annotation & top, const std::vector<const Annotation *> & lower);

  SemaContext & sema_;
  std::unique_ptr<LayerGraph> layers_;
  std::unordered_set<NodeId> merged_;
};

}  // namespace dml
