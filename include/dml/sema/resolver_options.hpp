// dml/sema/resolver_options.hpp - Options of the resolver pass
#pragma once

#include <map>
#include <string>

#include "dml/basic/diagnostic.hpp"

namespace dml
{

struct ResolverOptions
{
  /// Deterministic output for tests (sorted name lists in messages)
  bool test_mode = false;
  /// Attach the names valid at a failing path step to not-found messages
  bool attach_valid_names = false;
  /// Autoexpose composition targets without `@cds.autoexpose`
  bool autoexpose_compositions = true;
  /// Prefer redirection targets in the scope of the referencing view
  bool scoped_redirections = true;
  /// Severity overrides for configurable message ids
  std::map<std::string, Severity> severities;
};

}  // namespace dml
