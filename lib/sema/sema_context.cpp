// dml/sema/sema_context.cpp - Shared state of one resolver run
#include "dml/sema/sema_context.hpp"

#include <utility>

#include "dml/sema/analysis/annotation_merger.hpp"
#include "dml/sema/associations/association_rewriter.hpp"
#include "dml/sema/associations/redirector.hpp"
#include "dml/sema/queries/key_propagation.hpp"
#include "dml/sema/queries/query_inference.hpp"
#include "dml/sema/resolution/path_resolver.hpp"
#include "dml/sema/resolution/ref_resolver.hpp"
#include "dml/sema/types/effective_type.hpp"

namespace dml
{

SemaContext::SemaContext(Model & model, MessageReporter & messages, const ResolverOptions & options)
: model_(model),
  messages_(messages),
  options_(options),
  paths_(std::make_unique<PathResolver>(*this)),
  types_(std::make_unique<EffectiveTypeEngine>(*this)),
  queries_(std::make_unique<QueryInference>(*this)),
  keys_(std::make_unique<KeyPropagation>(*this)),
  redirector_(std::make_unique<Redirector>(*this)),
  rewriter_(std::make_unique<AssociationRewriter>(*this)),
  refs_(std::make_unique<RefResolver>(*this)),
  annotations_(std::make_unique<AnnotationMerger>(*this))
{
}

SemaContext::~SemaContext() = default;

DiagnosticBuilder SemaContext::report(
  std::string_view id, SourceLocation loc, NodeId home, MessageArgs args, std::string_view variant)
{
  std::string home_name = home ? model_.display_name(home) : std::string();
  return messages_.report(id, loc, std::move(home_name), std::move(args), variant);
}

std::string join_names(const std::vector<std::string> & names)
{
  std::string out;
  for (const auto & n : names) {
    if (!out.empty()) out += ',';
    out += n;
  }
  return out;
}

}  // namespace dml
