// dml/sema/resolution/resolve_policy.hpp - Reference contexts and their policies
//
// Every reference is resolved in one RefContext. The context selects a
// ResolvePolicy record which describes, as plain data, where the first path
// step is looked up, how later steps may navigate, which result kinds are
// acceptable and whether a dependency edge is recorded.
//
#pragma once

#include <cstdint>
#include <string_view>

#include "dml/model/node_id.hpp"

namespace dml
{

class Model;

enum class RefContext : uint8_t {
  Type,
  TypeOf,
  Include,
  Target,
  CompositionTarget,
  From,
  Extend,
  Annotate,
  Using,
  Column,
  Expr,
  Default,
  Filter,
  On,
  JoinOn,
  MixinOn,
  OrderBy,
  ForeignKey,
  Param,
  Cast,
};

[[nodiscard]] std::string_view to_string(RefContext ctx) noexcept;

/// Where the first step of a value reference is looked up.
enum class EnvSelector : uint8_t {
  Artifacts,      ///< artifact names (first step is a dotted artifact name)
  QuerySources,   ///< table aliases, mixins, combined source elements
  QueryElements,  ///< query output elements, then the sources
  Siblings,       ///< elements of the enclosing structure
  Target,         ///< elements of an association target
  None,           ///< only magic variables and parameters
};

enum class Navigation : uint8_t {
  Follow,           ///< associations may be followed
  ForeignKeysOnly,  ///< managed associations: only into their foreign keys
  None,             ///< only structured elements
};

enum class DependencyMode : uint8_t {
  None,
  Normal,
  Silent,
};

enum class CheckOutcome : uint8_t {
  Ok,
  Sloppy,  ///< accepted with a (configurable) message
  Fail,
};

struct CheckResult
{
  CheckOutcome outcome = CheckOutcome::Ok;
  std::string_view message_id;
};

using KindCheck = CheckResult (*)(const Model & model, NodeId art);

struct ResolvePolicy
{
  RefContext context;
  EnvSelector env;
  Navigation navigation;
  bool allow_self = false;
  bool allow_params = false;
  bool allow_magic = false;
  /// Check on the final node of an artifact reference, nullptr for none
  KindCheck check = nullptr;
  /// Message for a missing first step
  std::string_view undefined_id;
  DependencyMode deps = DependencyMode::None;

  [[nodiscard]] bool artifact_root() const noexcept { return env == EnvSelector::Artifacts; }
};

/// Policy of a context; every context has exactly one.
[[nodiscard]] const ResolvePolicy & policy_for(RefContext ctx);

}  // namespace dml
