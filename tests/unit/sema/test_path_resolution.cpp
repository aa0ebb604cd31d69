// tests/sema/test_path_resolution.cpp - Artifact and element references
//
#include <gtest/gtest.h>

#include "dml/sema/resolution/environment.hpp"
#include "dml/sema/resolution/path_resolver.hpp"
#include "dml/test_support/model_helpers.hpp"

using namespace dml;
using dml::test_support::load;
using dml::test_support::resolve;
using dml::test_support::SemaHarness;

// ============================================================================
// Idempotence
// ============================================================================

TEST(PathResolution, ResolvingTwiceGivesTheSameResult)
{
  auto m = load(R"({ "definitions": {
    "E": { "kind": "entity", "elements": {
      "a": { "type": "cds.String" },
      "b": { "type": "Undefined" }
    } }
  } })");
  ASSERT_TRUE(m.load.success);
  SemaHarness h(m);

  for (const char * path : {"E:a", "E:b"}) {
    const NodeId elem = m.element(path);
    RefExpr & ref = *m.model->node(elem).type;
    const ResolveEnv env = definition_env(*m.model, elem);
    const Resolution first = h.sema.paths().resolve(ref, RefContext::Type, elem, env);
    const Resolution second = h.sema.paths().resolve(ref, RefContext::Type, elem, env);
    EXPECT_TRUE(first == second) << path;
  }

  EXPECT_TRUE(m.model->node(m.element("E:a")).type->resolution().is_bound());
  EXPECT_EQ(m.model->node(m.element("E:a")).type->target(), m.model->builtin("cds.String"));
  EXPECT_EQ(m.model->node(m.element("E:b")).type->resolution().state, ResolutionState::NotFound);
  EXPECT_EQ(m.count("ref-undefined-art"), 1U);
}

TEST(PathResolution, FullResolveReportsAnUndefinedTypeOnce)
{
  auto m = resolve(R"({ "definitions": {
    "E": { "kind": "entity", "elements": { "b": { "type": "Undefined" } } },
    "V": { "kind": "entity", "projection": { "from": { "ref": ["E"] } } }
  } })");
  EXPECT_FALSE(m.success);
  EXPECT_EQ(m.count("ref-undefined-art"), 1U);
}

// ============================================================================
// Lookup
// ============================================================================

TEST(PathResolution, NamespaceAndUsingAliases)
{
  auto m = resolve(R"({ "sources": [
    { "file": "base.cds", "namespace": "base",
      "definitions": { "Name": { "kind": "type", "type": "cds.String" } } },
    { "file": "app.cds", "namespace": "app", "dependencies": ["base.cds"],
      "usings": [ { "ref": "base.Name", "as": "N" } ],
      "definitions": {
        "Local": { "kind": "type", "type": "cds.Integer" },
        "E": { "kind": "entity", "elements": {
          "a": { "type": "N" },
          "b": { "type": "Local" },
          "c": { "type": "base.Name" }
        } }
      } }
  ] })");
  EXPECT_TRUE(m.success);
  EXPECT_TRUE(m.diags.empty());
  EXPECT_EQ(m.node("app.E:a").type->target(), m.def("base.Name"));
  EXPECT_EQ(m.node("app.E:b").type->target(), m.def("app.Local"));
  EXPECT_EQ(m.node("app.E:c").type->target(), m.def("base.Name"));
}

TEST(PathResolution, ServiceMembersDoNotShadowOuterNames)
{
  auto m = resolve(R"({ "definitions": {
    "Books": { "kind": "entity", "elements": { "ID": { "key": true, "type": "cds.Integer" } } },
    "Cat": { "kind": "service" },
    "Cat.Books": { "kind": "entity", "projection": { "from": { "ref": ["Books"] } } }
  } })");
  EXPECT_TRUE(m.success);
  EXPECT_EQ(m.count("ref-cyclic"), 0U);

  const Node & view = m.model->node(m.def("Cat.Books"));
  const Node & query = m.model->node(view.query);
  const NodeId alias = query.query_info().from.alias;
  ASSERT_TRUE(alias);
  EXPECT_EQ(m.model->node(alias).from_ref->target(), m.def("Books"));
  EXPECT_EQ(m.model->links().origin(m.element("Cat.Books:ID")), m.element("Books:ID"));
}

TEST(PathResolution, StepArgumentsMustNameParameters)
{
  auto m = resolve(R"({ "definitions": {
    "Sales": { "kind": "entity",
      "params": { "year": { "type": "cds.Integer" } },
      "elements": { "id": { "key": true, "type": "cds.Integer" } } },
    "Plain": { "kind": "entity", "elements": { "id": { "key": true, "type": "cds.Integer" } } },
    "V": { "kind": "entity", "projection": {
      "from": { "ref": [ { "id": "Sales", "args": { "year": { "val": 2020 }, "month": { "val": 1 } } } ] } } },
    "W": { "kind": "entity", "projection": {
      "from": { "ref": [ { "id": "Plain", "args": { "year": { "val": 2020 } } } ] } } }
  } })");
  EXPECT_FALSE(m.success);
  EXPECT_EQ(m.count("args-undefined-param"), 1U);
  EXPECT_EQ(m.count("args-no-params"), 1U);
  EXPECT_EQ(m.model->links().origin(m.element("V:id")), m.element("Sales:id"));
}

TEST(PathResolution, UsingOfAnUnknownArtifact)
{
  auto m = resolve(R"({
    "file": "a.cds",
    "usings": [ { "ref": "nowhere.Thing" } ],
    "definitions": { "E": { "kind": "entity" } }
  })");
  EXPECT_FALSE(m.success);
  EXPECT_EQ(m.count("ref-undefined-art"), 1U);
}

TEST(PathResolution, ElementPathsInColumns)
{
  auto m = resolve(R"({ "definitions": {
    "E": { "kind": "entity", "elements": {
      "id": { "key": true, "type": "cds.Integer" },
      "addr": { "elements": { "city": { "type": "cds.String" } } }
    } },
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["E"], "as": "e" },
      "columns": [ { "ref": ["e", "id"] }, { "ref": ["addr", "city"] }, { "ref": ["addr", "zip"] } ]
    } } }
  } })");
  EXPECT_FALSE(m.success);
  EXPECT_EQ(m.count("ref-undefined-element"), 1U);
  EXPECT_EQ(m.model->links().origin(m.element("V:id")), m.element("E:id"));
  EXPECT_EQ(m.model->links().origin(m.element("V:city")), m.element("E:addr.city"));
}

TEST(PathResolution, TypeOfElements)
{
  auto m = resolve(R"({ "definitions": {
    "E": { "kind": "entity", "elements": {
      "a": { "type": "cds.Integer" },
      "b": { "type": { "typeof": ["E", "a"] } },
      "c": { "type": { "typeof": ["E", "nope"] } }
    } }
  } })");
  EXPECT_EQ(m.count("ref-undefined-def"), 1U);
  EXPECT_EQ(m.count("ref-undefined-element"), 0U);
  EXPECT_EQ(m.node("E:b").type->target(), m.element("E:a"));
}

// ============================================================================
// Kind checks
// ============================================================================

TEST(PathResolution, AssociationTypeWithoutTarget)
{
  auto m = resolve(R"({ "definitions": {
    "E": { "kind": "entity", "elements": { "a": { "type": "cds.Association" } } }
  } })");
  EXPECT_FALSE(m.success);
  EXPECT_EQ(m.count("type-missing-target"), 1U);
}

TEST(PathResolution, TypeAsTargetIsSloppy)
{
  auto m = resolve(R"({ "definitions": {
    "T": { "kind": "type", "elements": { "x": { "type": "cds.String" } } },
    "E": { "kind": "entity", "elements": {
      "toT": { "type": "cds.Association", "target": "T" }
    } }
  } })");
  EXPECT_TRUE(m.success);
  EXPECT_EQ(m.count("ref-sloppy-target"), 1U);

  ResolverOptions strict = dml::test_support::test_options();
  strict.severities["ref-sloppy-target"] = Severity::Error;
  auto s = resolve(R"({ "definitions": {
    "T": { "kind": "type", "elements": { "x": { "type": "cds.String" } } },
    "E": { "kind": "entity", "elements": {
      "toT": { "type": "cds.Association", "target": "T" }
    } }
  } })", strict);
  EXPECT_FALSE(s.success);
}
