// dml/model/model_loader.hpp - Model sources in JSON notation
//
// Reads the compact JSON notation of model sources (definitions, usings,
// extensions) into a Model. Structural problems of a document that can be
// skipped are reported as `syntax-csn-*` diagnostics; unreadable input
// fails the load.
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "dml/basic/diagnostic.hpp"
#include "dml/basic/message_reporter.hpp"
#include "dml/model/model.hpp"

namespace dml
{

// ============================================================================
// Load Result
// ============================================================================

struct ModelLoadResult
{
  /// Whether the document could be read
  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ModelLoadResult ok()
  {
    ModelLoadResult r;
    r.success = true;
    return r;
  }

  static ModelLoadResult fail(std::string msg)
  {
    ModelLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// ModelLoader
// ============================================================================

/**
 * Adds JSON documents to a model.
 *
 * A document is `{ "sources": [ ... ] }` or a single source object; object
 * member order is kept (element and column order). All documents must be
 * added before `finish()` links main artifacts to their enclosing services
 * and contexts.
 */
class ModelLoader
{
public:
  ModelLoader(Model & model, DiagnosticBag & diagnostics);

  ModelLoadResult add_document(const nlohmann::ordered_json & doc);

  /// Parse and add a document; `origin` names the input in error messages.
  ModelLoadResult add_text(std::string_view text, const std::string & origin);

  ModelLoadResult add_file(const std::filesystem::path & path);

  /// Link definitions to enclosing contexts and services.
  void finish();

private:
  void load_source(const nlohmann::ordered_json & j);
  void load_definition(const std::string & key, const nlohmann::ordered_json & j, NodeId source);
  void load_member_props(const nlohmann::ordered_json & j, NodeId node);
  void load_members(const nlohmann::ordered_json & j, NodeId owner, NodeKind kind, const char * prop);
  NodeId load_member(
    const std::string & name, const nlohmann::ordered_json & j, NodeId parent, NodeKind kind);
  void load_actions(const nlohmann::ordered_json & j, NodeId owner);
  void load_annotations(
    const nlohmann::ordered_json & j, std::vector<Annotation> & out, NodeId source, bool from_extension);
  void load_extension(const nlohmann::ordered_json & j, Extension & ext, NodeId source, bool top_level);

  NodeId load_query(const nlohmann::ordered_json & j, NodeId parent, NodeId owner);
  void load_select(const nlohmann::ordered_json & j, NodeId query);
  FromItem load_from(const nlohmann::ordered_json & j, NodeId query);
  NodeId add_table_alias(const std::string & name, NodeId query, SourceLocation loc);
  Column load_column(const nlohmann::ordered_json & j, NodeId query);

  Expr * load_expr(const nlohmann::ordered_json & j, NodeId parent);
  Expr * load_expr_base(const nlohmann::ordered_json & j, NodeId parent);
  Expr * load_xpr(const nlohmann::ordered_json & j, NodeId parent);
  Expr * load_value(const nlohmann::ordered_json & j);
  RefExpr * load_ref(const nlohmann::ordered_json & steps, SourceLocation loc, NodeId parent);
  RefExpr * load_artifact_ref(const nlohmann::ordered_json & j, const char * prop);

  [[nodiscard]] SourceLocation location_of(const nlohmann::ordered_json & j) const;

  DiagnosticBuilder report(
    std::string_view id, SourceLocation loc, MessageArgs args, std::string_view variant = "std");

  Model & model_;
  MessageReporter messages_;
  NodeId source_;
};

}  // namespace dml
