// tests/sema/test_query_inference.cpp - Query elements from columns and wildcards
//
#include <gtest/gtest.h>

#include "dml/test_support/model_helpers.hpp"

using namespace dml;
using dml::test_support::resolve;

namespace
{

constexpr const char * k_entity_abc = R"(
    "A": { "kind": "entity", "elements": {
      "a": { "key": true, "type": "cds.Integer" },
      "b": { "type": "cds.String" },
      "c": { "type": "cds.String" }
    } })";

std::string with_views(const std::string & views)
{
  return std::string(R"({ "definitions": {)") + k_entity_abc + "," + views + "} }";
}

}  // namespace

// ============================================================================
// Wildcards
// ============================================================================

TEST(QueryInference, ExplicitColumnTakesTheWildcardPosition)
{
  auto m = resolve(with_views(R"(
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["A"] },
      "columns": [ "*", { "ref": ["b"], "@title": "B" } ]
    } } })"));
  EXPECT_TRUE(m.success);
  EXPECT_EQ(m.element_names("V"), (std::vector<std::string>{"a", "b", "c"}));
  // The explicit column wins: it carries the annotation.
  EXPECT_EQ(m.node("V:b").assignments.size(), 1U);
  EXPECT_EQ(m.count("wildcard-excluding-one"), 0U);
}

TEST(QueryInference, ReplacingAWildcardElement)
{
  auto m = resolve(with_views(R"(
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["A"] },
      "columns": [ "*", { "ref": ["c"], "as": "b" } ]
    } } })"));
  EXPECT_TRUE(m.success);
  EXPECT_EQ(m.element_names("V"), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(m.model->links().origin(m.element("V:b")), m.element("A:c"));
  EXPECT_EQ(m.count("wildcard-excluding-one"), 1U);
}

TEST(QueryInference, ColumnsBeforeTheWildcard)
{
  auto m = resolve(with_views(R"(
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["A"] },
      "columns": [ { "ref": ["c"], "as": "first" }, "*" ]
    } } })"));
  EXPECT_TRUE(m.success);
  EXPECT_EQ(m.element_names("V"), (std::vector<std::string>{"first", "a", "b", "c"}));
}

TEST(QueryInference, AmbiguousWildcardElement)
{
  auto m = resolve(R"({ "definitions": {
    "L": { "kind": "entity", "elements": { "id": { "key": true, "type": "cds.Integer" }, "x": { "type": "cds.String" } } },
    "R": { "kind": "entity", "elements": { "rid": { "key": true, "type": "cds.Integer" }, "x": { "type": "cds.String" } } },
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "join": "inner", "args": [ { "ref": ["L"], "as": "l" }, { "ref": ["R"], "as": "r" } ],
                "on": [ { "ref": ["l", "id"] }, "=", { "ref": ["r", "rid"] } ] },
      "columns": [ "*" ]
    } } }
  } })");
  EXPECT_FALSE(m.success);
  EXPECT_EQ(m.count("wildcard-ambiguous"), 1U);
  EXPECT_EQ(m.element_names("V"), (std::vector<std::string>{"id", "rid"}));

  bool names_listed = false;
  for (const auto & d : m.diags) {
    if (d.code == "wildcard-ambiguous") {
      names_listed = d.message.find("l.x") != std::string::npos &&
                     d.message.find("r.x") != std::string::npos;
    }
  }
  EXPECT_TRUE(names_listed);
}

TEST(QueryInference, SelectingTheAmbiguousElementExplicitly)
{
  auto m = resolve(R"({ "definitions": {
    "L": { "kind": "entity", "elements": { "x": { "type": "cds.String" } } },
    "R": { "kind": "entity", "elements": { "x": { "type": "cds.String" } } },
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "join": "cross", "args": [ { "ref": ["L"], "as": "l" }, { "ref": ["R"], "as": "r" } ] },
      "columns": [ "*", { "ref": ["r", "x"] } ]
    } } }
  } })");
  EXPECT_EQ(m.count("wildcard-ambiguous"), 0U);
  EXPECT_EQ(m.count("wildcard-excluding-many"), 1U);
  EXPECT_EQ(m.model->links().origin(m.element("V:x")), m.element("R:x"));
}

TEST(QueryInference, Excluding)
{
  auto m = resolve(with_views(R"(
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["A"] },
      "columns": [ "*" ],
      "excluding": [ "b", "nope" ]
    } } })"));
  EXPECT_EQ(m.element_names("V"), (std::vector<std::string>{"a", "c"}));
  EXPECT_EQ(m.count("ref-undefined-excluding"), 1U);
  EXPECT_TRUE(m.success);
}

TEST(QueryInference, ProjectionWithoutColumns)
{
  auto m = resolve(with_views(R"(
    "P": { "kind": "entity", "projection": { "from": { "ref": ["A"] } } },
    "PP": { "kind": "entity", "projection": { "from": { "ref": ["P"] } } })"));
  EXPECT_TRUE(m.success);
  EXPECT_EQ(m.element_names("PP"), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(m.model->links().origin(m.element("PP:a")), m.element("P:a"));
  EXPECT_TRUE(m.node("PP:a").inferred);
}

// ============================================================================
// Nested columns
// ============================================================================

TEST(QueryInference, ExpandAndInline)
{
  auto m = resolve(R"({ "definitions": {
    "Authors": { "kind": "entity", "elements": {
      "ID": { "key": true, "type": "cds.Integer" },
      "name": { "type": "cds.String" }
    } },
    "Books": { "kind": "entity", "elements": {
      "ID": { "key": true, "type": "cds.Integer" },
      "author": { "type": "cds.Association", "target": "Authors" }
    } },
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["Books"] },
      "columns": [
        { "ref": ["ID"] },
        { "ref": ["author"], "as": "writer", "expand": [ { "ref": ["name"] } ] },
        { "ref": ["author"], "inline": [ { "ref": ["ID"] }, { "ref": ["name"] } ] }
      ]
    } } }
  } })");
  EXPECT_TRUE(m.success);
  EXPECT_EQ(m.element_names("V"), (std::vector<std::string>{"ID", "writer", "author_ID", "author_name"}));
  EXPECT_TRUE(m.node("V:writer").structured);
  EXPECT_EQ(m.element_names("V:writer"), (std::vector<std::string>{"name"}));
  EXPECT_EQ(m.model->links().origin(m.element("V:author_name")), m.element("Authors:name"));
}

TEST(QueryInference, ExpandOnScalarElement)
{
  auto m = resolve(with_views(R"(
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["A"] },
      "columns": [ { "ref": ["a"] }, { "ref": ["b"], "expand": [ { "ref": ["x"] } ] } ]
    } } })"));
  EXPECT_EQ(m.count("query-unexpected-structure"), 1U);
}

TEST(QueryInference, ExpressionColumnNeedsAnAlias)
{
  auto m = resolve(with_views(R"(
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["A"] },
      "columns": [ { "ref": ["a"] }, { "val": 1 }, { "val": 2, "as": "two" } ]
    } } })"));
  EXPECT_EQ(m.count("query-req-name"), 1U);
  EXPECT_EQ(m.element_names("V"), (std::vector<std::string>{"a", "two"}));
}

// ============================================================================
// Specified elements
// ============================================================================

TEST(QueryInference, SpecifiedElements)
{
  auto m = resolve(with_views(R"(
    "V": { "kind": "entity",
      "query": { "SELECT": { "from": { "ref": ["A"] }, "columns": [ { "ref": ["a"] }, { "ref": ["b"] } ] } },
      "elements": {
        "a": { "@title": "A" },
        "z": { "type": "cds.String" }
      } })"));
  EXPECT_EQ(m.count("query-missing-element"), 1U);
  EXPECT_EQ(m.count("query-unspecified-element"), 1U);
  ASSERT_NE(m.node("V:a").annotation("title"), nullptr);
}

// ============================================================================
// Sub-queries and unions
// ============================================================================

TEST(QueryInference, SubQueryInFrom)
{
  auto m = resolve(with_views(R"(
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "SELECT": { "from": { "ref": ["A"] }, "columns": [ { "ref": ["a"] }, { "ref": ["c"] } ] }, "as": "s" },
      "columns": [ "*" ]
    } } })"));
  EXPECT_TRUE(m.success);
  EXPECT_EQ(m.element_names("V"), (std::vector<std::string>{"a", "c"}));
}

TEST(QueryInference, UnionTakesTheElementsOfItsFirstBranch)
{
  auto m = resolve(with_views(R"(
    "U": { "kind": "entity", "query": { "SET": { "op": "union", "args": [
      { "SELECT": { "from": { "ref": ["A"] }, "columns": [ { "ref": ["a"] }, { "ref": ["b"] } ] } },
      { "SELECT": { "from": { "ref": ["A"] }, "columns": [ { "ref": ["a"] }, { "ref": ["c"], "as": "b" } ] } }
    ] } } })"));
  EXPECT_TRUE(m.success);
  EXPECT_EQ(m.element_names("U"), (std::vector<std::string>{"a", "b"}));
}
