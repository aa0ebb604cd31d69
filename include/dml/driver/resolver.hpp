// dml/driver/resolver.hpp - Resolver driver
//
// Single entry point for the resolve pipeline.
// Used by the CLI and by tests.
//
#pragma once

#include <array>
#include <cstddef>

#include "dml/basic/diagnostic.hpp"
#include "dml/basic/message_reporter.hpp"
#include "dml/model/model.hpp"
#include "dml/sema/resolver_options.hpp"
#include "dml/sema/sema_context.hpp"

namespace dml
{

// ============================================================================
// Resolve Result
// ============================================================================

/// Counters and timings of one run (for `--verbose`).
struct ResolveStats
{
  static constexpr size_t k_phase_count = 6;

  size_t definitions = 0;
  size_t autoexposed = 0;
  size_t cyclic_references = 0;
  /// Wall time of phases 1 to 6 in milliseconds
  std::array<double, k_phase_count> phase_ms{};
};

struct ResolveResult
{
  /// No error diagnostics were reported
  bool success = false;

  DiagnosticBag diagnostics;

  ResolveStats stats;
};

// ============================================================================
// Resolver
// ============================================================================

/**
 * Runs the resolver phases over a loaded model.
 *
 * The pipeline consists of:
 * 1. `using` validation
 * 2. includes, extensions and query element inference (creates
 *    autoexposed entities on demand)
 * 3. member extensions and key propagation
 * 4. reference resolution and annotation merge
 * 5. association rewriting
 * 6. cycle reporting
 *
 * Internal invariant violations escape as InternalError.
 */
class Resolver
{
public:
  Resolver(Model & model, DiagnosticBag & diagnostics, ResolverOptions options);

  Resolver(const Resolver &) = delete;
  Resolver & operator=(const Resolver &) = delete;

  /**
   * Run all phases.
   *
   * @return true if no errors were reported
   */
  bool run();

  [[nodiscard]] const ResolveStats & stats() const noexcept { return stats_; }

  /**
   * Resolve a model with a fresh diagnostic bag.
   *
   * @param model Loaded model (mutated in place)
   * @param options Resolver options
   * @return ResolveResult with success status, diagnostics and stats
   */
  [[nodiscard]] static ResolveResult resolve(Model & model, const ResolverOptions & options);

private:
  void check_usings();
  void populate_queries();
  void propagate_keys();
  void resolve_references();
  void rewrite_associations();
  void report_cycles();

  /// Main artifacts in definition order, including ones added so far.
  [[nodiscard]] NodeId definition_at(size_t index) const;

  Model & model_;
  DiagnosticBag & diagnostics_;
  ResolverOptions options_;
  MessageReporter messages_;
  SemaContext sema_;
  ResolveStats stats_;
};

}  // namespace dml
