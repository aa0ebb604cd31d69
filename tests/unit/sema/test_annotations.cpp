// tests/sema/test_annotations.cpp - Layered annotation merge
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "dml/basic/casting.hpp"
#include "dml/test_support/model_helpers.hpp"

using namespace dml;
using dml::test_support::resolve;

namespace
{

std::vector<std::string> array_texts(const Annotation * anno)
{
  std::vector<std::string> out;
  if (anno == nullptr) return out;
  const auto * list = dyn_cast<ArrayExpr>(anno->value);
  if (list == nullptr) return out;
  for (const Expr * item : list->items) {
    if (const auto * lit = dyn_cast<LiteralExpr>(item)) out.emplace_back(lit->text);
  }
  return out;
}

std::string number_text(const Annotation * anno)
{
  if (anno == nullptr) return {};
  const auto * lit = dyn_cast<LiteralExpr>(anno->value);
  return lit != nullptr ? std::string(lit->text) : std::string();
}

}  // namespace

// ============================================================================
// Layers
// ============================================================================

TEST(Annotations, UnrelatedLayersConflict)
{
  auto m = resolve(R"({ "sources": [
    { "file": "base.cds", "definitions": { "E": { "kind": "entity", "elements": { "x": { "type": "cds.String" } } } } },
    { "file": "a.cds", "dependencies": ["base.cds"],
      "extensions": [ { "annotate": "E", "elements": { "x": { "@Foo": 1 } } } ] },
    { "file": "b.cds", "dependencies": ["base.cds"],
      "extensions": [ { "annotate": "E", "elements": { "x": { "@Foo": 2 } } } ] }
  ] })");
  EXPECT_FALSE(m.success);
  EXPECT_EQ(m.count("anno-duplicate-unrelated-layer"), 2U);
  EXPECT_NE(m.node("E:x").annotation("Foo"), nullptr);
}

TEST(Annotations, ExtendingLayerWins)
{
  auto m = resolve(R"({ "sources": [
    { "file": "base.cds", "definitions": { "E": { "kind": "entity", "elements": { "x": { "type": "cds.String" } } } } },
    { "file": "a.cds", "dependencies": ["base.cds"],
      "extensions": [ { "annotate": "E", "elements": { "x": { "@Foo": 1 } } } ] },
    { "file": "b.cds", "dependencies": ["base.cds", "a.cds"],
      "extensions": [ { "annotate": "E", "elements": { "x": { "@Foo": 2 } } } ] }
  ] })");
  EXPECT_TRUE(m.success);
  EXPECT_EQ(m.count("anno-duplicate-unrelated-layer"), 0U);
  EXPECT_EQ(number_text(m.node("E:x").annotation("Foo")), "2");
}

TEST(Annotations, ExtensionWinsOverTheDefinitionOfItsLayer)
{
  auto m = resolve(R"({
    "file": "base.cds",
    "definitions": { "E": { "kind": "entity", "@Foo": 1 } },
    "extensions": [ { "annotate": "E", "@Foo": 2 } ]
  })");
  EXPECT_TRUE(m.success);
  EXPECT_EQ(number_text(m.model->node(m.def("E")).annotation("Foo")), "2");
}

TEST(Annotations, DuplicateInOneLayer)
{
  auto m = resolve(R"({
    "file": "base.cds",
    "definitions": { "E": { "kind": "entity" } },
    "extensions": [ { "annotate": "E", "@Foo": 1 }, { "annotate": "E", "@Foo": 2 } ]
  })");
  EXPECT_EQ(m.count("anno-duplicate"), 2U);

  ResolverOptions lenient = dml::test_support::test_options();
  lenient.severities["anno-duplicate"] = Severity::Info;
  auto l = resolve(R"({
    "file": "base.cds",
    "definitions": { "E": { "kind": "entity" } },
    "extensions": [ { "annotate": "E", "@Foo": 1 }, { "annotate": "E", "@Foo": 2 } ]
  })", lenient);
  EXPECT_TRUE(l.success);
}

// ============================================================================
// Ellipsis
// ============================================================================

TEST(Annotations, EllipsisSplicesTheLowerLayer)
{
  auto m = resolve(R"({ "sources": [
    { "file": "base.cds", "definitions": { "E": { "kind": "entity", "@list": [1, 2] } } },
    { "file": "ext.cds", "dependencies": ["base.cds"],
      "extensions": [ { "annotate": "E", "@list": [0, "...", 3] } ] }
  ] })");
  EXPECT_TRUE(m.success);
  EXPECT_EQ(
    array_texts(m.model->node(m.def("E")).annotation("list")),
    (std::vector<std::string>{"0", "1", "2", "3"}));
}

TEST(Annotations, EllipsisWithinOneLayer)
{
  auto m = resolve(R"({
    "file": "base.cds",
    "definitions": { "E": { "kind": "entity", "@list": [1] } },
    "extensions": [ { "annotate": "E", "@list": ["...", 2] } ]
  })");
  EXPECT_TRUE(m.success);
  EXPECT_EQ(
    array_texts(m.model->node(m.def("E")).annotation("list")),
    (std::vector<std::string>{"1", "2"}));
}

TEST(Annotations, EllipsisWithoutABase)
{
  auto m = resolve(R"({
    "file": "base.cds",
    "definitions": { "E": { "kind": "entity", "@list": ["...", 1] } }
  })");
  EXPECT_FALSE(m.success);
  EXPECT_EQ(m.count("anno-unexpected-ellipsis"), 1U);
  EXPECT_EQ(array_texts(m.model->node(m.def("E")).annotation("list")), (std::vector<std::string>{"1"}));
}

TEST(Annotations, EllipsisOverAScalar)
{
  auto m = resolve(R"({ "sources": [
    { "file": "base.cds", "definitions": { "E": { "kind": "entity", "@list": 1 } } },
    { "file": "ext.cds", "dependencies": ["base.cds"],
      "extensions": [ { "annotate": "E", "@list": ["...", 2] } ] }
  ] })");
  EXPECT_EQ(m.count("anno-mismatched-ellipsis"), 1U);
}

// ============================================================================
// Targets of annotate
// ============================================================================

TEST(Annotations, UnknownTargets)
{
  auto m = resolve(R"({
    "file": "base.cds",
    "definitions": { "E": { "kind": "entity", "elements": { "x": { "type": "cds.String" } },
                            "actions": { "go": { "kind": "action" } } } },
    "extensions": [
      { "annotate": "Nope", "@A": 1 },
      { "annotate": "E", "elements": { "y": { "@A": 1 } }, "actions": { "stop": { "@A": 1 } } }
    ]
  })");
  EXPECT_TRUE(m.success);
  EXPECT_EQ(m.count("anno-undefined-art"), 1U);
  EXPECT_EQ(m.count("anno-undefined-element"), 1U);
  EXPECT_EQ(m.count("anno-undefined-action"), 1U);
}

TEST(Annotations, QueryColumnAnnotations)
{
  auto m = resolve(R"({ "definitions": {
    "E": { "kind": "entity", "elements": { "a": { "key": true, "type": "cds.Integer" } } },
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["E"] }, "columns": [ { "ref": ["a"], "@title": "A" } ]
    } } }
  } })");
  EXPECT_TRUE(m.success);
  ASSERT_EQ(m.node("V:a").annotations.size(), 1U);
  EXPECT_EQ(m.node("V:a").annotations[0].name, "title");
}
