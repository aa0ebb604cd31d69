// dml/test_support/model_helpers.hpp - helpers for unit tests
//
// Build a model from JSON text, run the resolver, and look up nodes by
// dotted names.
//
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "dml/basic/diagnostic.hpp"
#include "dml/basic/message_reporter.hpp"
#include "dml/driver/resolver.hpp"
#include "dml/model/model.hpp"
#include "dml/model/model_loader.hpp"
#include "dml/sema/resolver_options.hpp"
#include "dml/sema/sema_context.hpp"

namespace dml::test_support
{

struct TestModel
{
  std::unique_ptr<Model> model = std::make_unique<Model>();
  DiagnosticBag diags;
  ModelLoadResult load;
  bool success = false;
  ResolveStats stats;

  /// Definition by absolute name (invalid if absent).
  [[nodiscard]] NodeId def(std::string_view name) const { return model->definition(name); }

  /// `"ns.E:a.b"`: element `b` of element `a` of definition `ns.E`.
  [[nodiscard]] NodeId element(std::string_view path) const
  {
    const size_t colon = path.find(':');
    NodeId cur = model->definition(path.substr(0, colon));
    if (colon == std::string_view::npos) return cur;
    std::string_view rest = path.substr(colon + 1);
    while (cur && !rest.empty()) {
      const size_t dot = rest.find('.');
      cur = model->node(cur).elements.get(rest.substr(0, dot));
      rest = dot == std::string_view::npos ? std::string_view{} : rest.substr(dot + 1);
    }
    return cur;
  }

  [[nodiscard]] const Node & node(std::string_view path) const { return model->node(element(path)); }

  /// Element names of a definition or element, in order.
  [[nodiscard]] std::vector<std::string> element_names(std::string_view path) const
  {
    return model->node(element(path)).elements.names();
  }

  [[nodiscard]] size_t count(std::string_view code) const { return diags.count(code); }
};

/// Options used by tests unless a test passes its own.
[[nodiscard]] inline ResolverOptions test_options()
{
  ResolverOptions opts;
  opts.test_mode = true;
  return opts;
}

/// Load a JSON document without resolving it.
[[nodiscard]] inline TestModel load(std::string_view json_text)
{
  TestModel out;
  ModelLoader loader(*out.model, out.diags);
  out.load = loader.add_text(json_text, "<test>");
  loader.finish();
  return out;
}

/// Load a JSON document and run all resolver phases.
[[nodiscard]] inline TestModel resolve(
  std::string_view json_text, const ResolverOptions & options = test_options())
{
  TestModel out = load(json_text);
  if (!out.load.success) return out;
  Resolver resolver(*out.model, out.diags, options);
  out.success = resolver.run();
  out.stats = resolver.stats();
  return out;
}

/// Resolver components over a loaded model, for calling them one by one.
struct SemaHarness
{
  explicit SemaHarness(TestModel & m, ResolverOptions opts = test_options())
  : options(std::move(opts)),
    messages(m.diags, options.severities, options.attach_valid_names),
    sema(*m.model, messages, options)
  {
  }

  ResolverOptions options;
  MessageReporter messages;
  SemaContext sema;
};

}  // namespace dml::test_support
