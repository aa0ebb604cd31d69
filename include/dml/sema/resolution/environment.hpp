// dml/sema/resolution/environment.hpp - Search environments of name lookups
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "dml/model/model.hpp"

namespace dml
{

/**
 * What a value reference can see besides artifacts.
 *
 * Environments nest: a sub-query in an expression sees its own sources
 * first and then those of the enclosing query (`outer`).
 */
struct ResolveEnv
{
  NodeId block;        ///< source whose `using`s and namespace apply
  NodeId query;        ///< query whose sources are visible
  NodeId self;         ///< node denoted by `$self` / `$projection`
  NodeId elements_of;  ///< structure for sibling or target lookups
  NodeId params_of;    ///< artifact whose parameters are visible
  const ResolveEnv * outer = nullptr;
  /// Explicit ON of a redirected query element: mixins and aliases are rejected
  bool redirection_on = false;
};

/// Environment for references written in the definition of `user`.
[[nodiscard]] ResolveEnv definition_env(const Model & model, NodeId user);

/**
 * Look up an artifact name as seen from source `block`.
 *
 * Search order: `using` aliases of the block (an alias that matches never
 * falls through), the block namespace, absolute names, builtins. Names are
 * never relative to an enclosing service or context: `Cat.Books` projecting
 * `Books` refers to the entity outside the service.
 *
 * @return the artifact, or an invalid id
 */
[[nodiscard]] NodeId lookup_artifact(const Model & model, NodeId block, std::string_view name);

/// Absolute name a `using` alias stands for (the text of its reference).
[[nodiscard]] std::string using_target_name(const Model & model, NodeId using_node);

/// Sorted entry names of a dictionary, for valid-name lists.
[[nodiscard]] std::vector<std::string> sorted_names(const Dict & dict);

}  // namespace dml
