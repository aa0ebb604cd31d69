// dml/sema/sema_context.hpp - Shared state of one resolver run
//
// The resolver components call each other on demand (resolving a view pulls
// in its sources, computing a type may trigger a redirection, ...). The
// context owns all of them and hands out references.
//
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "dml/basic/message_reporter.hpp"
#include "dml/model/model.hpp"
#include "dml/sema/resolver_options.hpp"

namespace dml
{

class PathResolver;
class EffectiveTypeEngine;
class QueryInference;
class KeyPropagation;
class Redirector;
class AssociationRewriter;
class RefResolver;
class AnnotationMerger;

class SemaContext
{
public:
  SemaContext(Model & model, MessageReporter & messages, const ResolverOptions & options);
  ~SemaContext();

  SemaContext(const SemaContext &) = delete;
  SemaContext & operator=(const SemaContext &) = delete;

  [[nodiscard]] Model & model() noexcept { return model_; }
  [[nodiscard]] const ResolverOptions & options() const noexcept { return options_; }
  [[nodiscard]] MessageReporter & messages() noexcept { return messages_; }

  [[nodiscard]] PathResolver & paths() noexcept { return *paths_; }
  [[nodiscard]] EffectiveTypeEngine & types() noexcept { return *types_; }
  [[nodiscard]] QueryInference & queries() noexcept { return *queries_; }
  [[nodiscard]] KeyPropagation & keys() noexcept { return *keys_; }
  [[nodiscard]] Redirector & redirector() noexcept { return *redirector_; }
  [[nodiscard]] AssociationRewriter & rewriter() noexcept { return *rewriter_; }
  [[nodiscard]] RefResolver & refs() noexcept { return *refs_; }
  [[nodiscard]] AnnotationMerger & annotations() noexcept { return *annotations_; }

  /**
   * Report a registered message about `home`.
   *
   * @param id Message id
   * @param loc Primary location
   * @param home Node the message is about (its display name is attached)
   * @param args Substitution arguments
   * @param variant Text variant
   */
  DiagnosticBuilder report(
    std::string_view id, SourceLocation loc, NodeId home, MessageArgs args = {},
    std::string_view variant = "std");

private:
  Model & model_;
  MessageReporter & messages_;
  const ResolverOptions & options_;

  std::unique_ptr<PathResolver> paths_;
  std::unique_ptr<EffectiveTypeEngine> types_;
  std::unique_ptr<QueryInference> queries_;
  std::unique_ptr<KeyPropagation> keys_;
  std::unique_ptr<Redirector> redirector_;
  std::unique_ptr<AssociationRewriter> rewriter_;
  std::unique_ptr<RefResolver> refs_;
  std::unique_ptr<AnnotationMerger> annotations_;
};

/// Comma separated list for $(NAMES) arguments.
[[nodiscard]] std::string join_names(const std::vector<std::string> & names);

}  // namespace dml
