// dml/model/model.hpp - The whole program: node arena, definitions, builtins
#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "dml/basic/source_location.hpp"
#include "dml/model/dict.hpp"
#include "dml/model/expr_context.hpp"
#include "dml/model/links.hpp"
#include "dml/model/node.hpp"

namespace dml
{

/// Category of a builtin type, used by key and redirection checks.
enum class BuiltinCategory : uint8_t {
  String,
  Binary,
  Numeric,
  DateTime,
  Boolean,
  Uuid,
  Relation,
};

/**
 * Owns every node of a program.
 *
 * Nodes live in a deque so that references to them stay valid while the
 * resolver creates new nodes (inferred elements, autoexposed entities).
 * Expressions live in the ExprContext arena; cross links in the LinkTable.
 */
class Model
{
public:
  Model();

  Model(const Model &) = delete;
  Model & operator=(const Model &) = delete;

  // ===========================================================================
  // Nodes
  // ===========================================================================

  NodeId create_node(NodeKind kind, std::string name, SourceLocation loc = {});

  /// Create a node owned by `parent`; main artifact and source are inherited.
  NodeId create_member(NodeKind kind, std::string name, NodeId parent, SourceLocation loc = {});

  /// Node by id; throws InternalError for invalid ids.
  [[nodiscard]] Node & node(NodeId id);
  [[nodiscard]] const Node & node(NodeId id) const;

  [[nodiscard]] size_t node_count() const noexcept { return nodes_.size(); }

  // ===========================================================================
  // Definitions and sources
  // ===========================================================================

  /**
   * Register a main artifact under its absolute name.
   *
   * @return false if the name was already defined (the node is still
   *         recorded as a duplicate)
   */
  bool add_definition(NodeId id);

  [[nodiscard]] NodeId definition(std::string_view absolute) const { return definitions_.get(absolute); }
  [[nodiscard]] const Dict & definitions() const noexcept { return definitions_; }

  /// Create a source node for `file`.
  NodeId add_source(const std::string & file, const std::string & namespace_name);
  [[nodiscard]] const std::vector<NodeId> & sources() const noexcept { return sources_; }

  // ===========================================================================
  // Builtin environment
  // ===========================================================================

  /// Builtin type by full (`cds.String`) or short (`String`) name.
  [[nodiscard]] NodeId builtin(std::string_view name) const { return builtins_.get(name); }
  [[nodiscard]] const Dict & builtins() const noexcept { return builtins_; }
  [[nodiscard]] bool is_builtin(NodeId id, std::string_view full_name) const;
  [[nodiscard]] std::optional<BuiltinCategory> builtin_category(NodeId id) const;

  [[nodiscard]] NodeId magic_variable(std::string_view name) const { return magic_vars_.get(name); }
  [[nodiscard]] const Dict & magic_variables() const noexcept { return magic_vars_; }

  /// Magic variables whose elements are not checked (`$session`).
  [[nodiscard]] bool is_open_variable(NodeId id) const;

  // ===========================================================================
  // Side structures
  // ===========================================================================

  [[nodiscard]] ExprContext & exprs() noexcept { return exprs_; }
  [[nodiscard]] LinkTable & links() noexcept { return links_; }
  [[nodiscard]] const LinkTable & links() const noexcept { return links_; }
  [[nodiscard]] SourceRegistry & files() noexcept { return files_; }
  [[nodiscard]] const SourceRegistry & files() const noexcept { return files_; }

  /**
   * Name used in messages: the absolute name for main artifacts,
   * `Main:elem.sub` for members.
   */
  [[nodiscard]] std::string display_name(NodeId id) const;

  /// Main artifact a node belongs to (the node itself for main artifacts).
  [[nodiscard]] NodeId main_of(NodeId id) const;

private:
  friend void install_builtins(Model & model);

  std::deque<Node> nodes_;
  Dict definitions_;
  std::vector<NodeId> sources_;
  Dict builtins_;
  Dict magic_vars_;
  std::unordered_map<NodeId, BuiltinCategory> categories_;
  std::vector<NodeId> open_vars_;
  ExprContext exprs_;
  LinkTable links_;
  SourceRegistry files_;
};

/// Create the `cds.*` builtin types and the magic variables.
void install_builtins(Model & model);

}  // namespace dml
