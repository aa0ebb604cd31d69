// dml/driver/resolver.cpp - Resolver driver implementation
//
#include "dml/driver/resolver.hpp"

#include <chrono>
#include <utility>

#include "dml/sema/analysis/annotation_merger.hpp"
#include "dml/sema/analysis/cycle_detector.hpp"
#include "dml/sema/associations/association_rewriter.hpp"
#include "dml/sema/queries/key_propagation.hpp"
#include "dml/sema/queries/query_inference.hpp"
#include "dml/sema/resolution/ref_resolver.hpp"
#include "dml/sema/types/effective_type.hpp"

namespace dml
{

Resolver::Resolver(Model & model, DiagnosticBag & diagnostics, ResolverOptions options)
: model_(model),
  diagnostics_(diagnostics),
  options_(std::move(options)),
  messages_(diagnostics_, options_.severities, options_.attach_valid_names),
  sema_(model_, messages_, options_)
{
}

bool Resolver::run()
{
  using Clock = std::chrono::steady_clock;
  using Phase = void (Resolver::*)();
  const std::array<Phase, ResolveStats::k_phase_count> phases{
    &Resolver::check_usings,       &Resolver::populate_queries,
    &Resolver::propagate_keys,     &Resolver::resolve_references,
    &Resolver::rewrite_associations, &Resolver::report_cycles,
  };

  for (size_t i = 0; i < phases.size(); ++i) {
    const auto start = Clock::now();
    (this->*phases[i])();
    stats_.phase_ms[i] =
      std::chrono::duration<double, std::milli>(Clock::now() - start).count();
  }

  stats_.definitions = model_.definitions().size();
  for (size_t i = 0; i < model_.definitions().size(); ++i) {
    const Node & n = model_.node(definition_at(i));
    if (n.inferred && n.annotation_flag("cds.autoexposed").value_or(false)) {
      ++stats_.autoexposed;
    }
  }
  return !messages_.has_errors();
}

ResolveResult Resolver::resolve(Model & model, const ResolverOptions & options)
{
  ResolveResult result;
  Resolver resolver(model, result.diagnostics, options);
  result.success = resolver.run();
  result.stats = resolver.stats();
  return result;
}

NodeId Resolver::definition_at(size_t index) const
{
  return (model_.definitions().begin() + static_cast<std::ptrdiff_t>(index))->first();
}

// ============================================================================
// Phases
// ============================================================================

void Resolver::check_usings()
{
  for (NodeId source : model_.sources()) {
    sema_.refs().check_usings(source);
  }
}

void Resolver::populate_queries()
{
  sema_.annotations().compute_layers();

  for (size_t i = 0; i < model_.definitions().size(); ++i) {
    sema_.refs().apply_includes(definition_at(i));
  }
  for (NodeId source : model_.sources()) {
    sema_.refs().apply_extensions(source, false);
  }
  // Register every view with its sources first: implicit redirection
  // searches the views deriving from an entity.
  for (size_t i = 0; i < model_.definitions().size(); ++i) {
    sema_.queries().register_sources(definition_at(i));
  }

  // Autoexposed entities are appended while the list is drained.
  for (size_t i = 0; i < model_.definitions().size(); ++i) {
    const NodeId art = definition_at(i);
    const Node & n = model_.node(art);
    if (n.query) {
      sema_.queries().populate(art);
    } else if (n.service && n.kind == NodeKind::Entity) {
      for (NodeId elem : n.elements.nodes()) {
        (void)sema_.types().effective(elem);
      }
    }
  }
}

void Resolver::propagate_keys()
{
  for (NodeId source : model_.sources()) {
    sema_.refs().apply_extensions(source, true);
  }
  for (size_t i = 0; i < model_.definitions().size(); ++i) {
    sema_.keys().propagate(definition_at(i));
  }
}

void Resolver::resolve_references()
{
  for (size_t i = 0; i < model_.definitions().size(); ++i) {
    sema_.refs().resolve_definition(definition_at(i));
  }
}

void Resolver::rewrite_associations()
{
  for (size_t i = 0; i < model_.definitions().size(); ++i) {
    sema_.rewriter().rewrite_artifact(definition_at(i));
  }
}

void Resolver::report_cycles()
{
  CycleDetector detector(sema_);
  stats_.cyclic_references = detector.run();
}

}  // namespace dml
