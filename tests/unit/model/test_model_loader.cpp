// tests/model/test_model_loader.cpp - JSON notation reader
//
#include <gtest/gtest.h>

#include <string>

#include "dml/basic/casting.hpp"
#include "dml/model/dict.hpp"
#include "dml/test_support/model_helpers.hpp"

using namespace dml;
using dml::test_support::load;

// ============================================================================
// Dict
// ============================================================================

TEST(ModelDict, KeepsInsertionOrderAndDuplicates)
{
  Dict dict;
  EXPECT_TRUE(dict.add("b", NodeId{1}));
  EXPECT_TRUE(dict.add("a", NodeId{2}));
  EXPECT_FALSE(dict.add("b", NodeId{3}));

  EXPECT_EQ(dict.names(), (std::vector<std::string>{"b", "a"}));
  ASSERT_NE(dict.find("b"), nullptr);
  EXPECT_TRUE(dict.find("b")->is_ambiguous());
  EXPECT_EQ(dict.get("b"), NodeId{1});
  EXPECT_FALSE(dict.contains("c"));
}

// ============================================================================
// Definitions
// ============================================================================

TEST(ModelLoader, DefinitionsAreRelativeToTheNamespace)
{
  auto m = load(R"({
    "namespace": "shop",
    "definitions": {
      "Books": { "kind": "entity", "elements": {
        "ID": { "key": true, "type": "cds.Integer" },
        "title": { "type": "cds.String" }
      } },
      "Cat": { "kind": "service" },
      "Cat.Books": { "kind": "entity", "projection": { "from": { "ref": ["shop.Books"] } } }
    }
  })");
  ASSERT_TRUE(m.load.success) << m.load.error;
  EXPECT_TRUE(m.diags.empty());

  const NodeId books = m.def("shop.Books");
  ASSERT_TRUE(books);
  EXPECT_EQ(m.model->node(books).kind, NodeKind::Entity);
  EXPECT_EQ(m.element_names("shop.Books"), (std::vector<std::string>{"ID", "title"}));
  EXPECT_TRUE(m.node("shop.Books:ID").key);

  const Node & proj = m.model->node(m.def("shop.Cat.Books"));
  EXPECT_TRUE(proj.has_query());
  EXPECT_EQ(proj.service, m.def("shop.Cat"));
  EXPECT_EQ(proj.parent, m.def("shop.Cat"));
}

TEST(ModelLoader, AssociationProperties)
{
  auto m = load(R"({ "definitions": {
    "A": { "kind": "entity", "elements": {
      "toB": { "type": "cds.Association", "target": "B", "keys": [ { "ref": ["id"], "as": "bId" } ] },
      "bs": { "type": "cds.Composition", "target": "B", "cardinality": { "max": "*" },
              "on": [ { "ref": ["bs", "parent"] }, "=", { "ref": ["$self"] } ] }
    } },
    "B": { "kind": "entity" }
  } })");
  ASSERT_TRUE(m.load.success);

  const Node & to_b = m.node("A:toB");
  ASSERT_NE(to_b.target, nullptr);
  EXPECT_TRUE(to_b.has_keys);
  ASSERT_TRUE(to_b.foreign_keys.contains("bId"));
  EXPECT_FALSE(to_b.to_many);

  const Node & bs = m.node("A:bs");
  EXPECT_TRUE(bs.composition);
  EXPECT_TRUE(bs.to_many);
  ASSERT_NE(bs.on, nullptr);
  const auto * xpr = dyn_cast<OpExpr>(bs.on);
  ASSERT_NE(xpr, nullptr);
  EXPECT_EQ(xpr->op, "xpr");
  EXPECT_EQ(xpr->args.size(), 3U);
}

TEST(ModelLoader, QueryColumnsAndAliases)
{
  auto m = load(R"({ "definitions": {
    "E": { "kind": "entity", "elements": { "a": { "type": "cds.String" } } },
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["E"], "as": "e" },
      "columns": [ "*", { "ref": ["e", "a"], "as": "b", "@title": "B" } ],
      "excluding": ["a"]
    } } }
  } })");
  ASSERT_TRUE(m.load.success);

  const Node & v = m.model->node(m.def("V"));
  ASSERT_TRUE(v.query);
  const QueryData & q = m.model->node(v.query).query_info();
  EXPECT_EQ(q.elements_owner, m.def("V"));
  ASSERT_EQ(q.columns.size(), 2U);
  EXPECT_TRUE(q.columns[0].wildcard);
  EXPECT_EQ(q.columns[1].alias, "b");
  ASSERT_EQ(q.columns[1].annotations.size(), 1U);
  EXPECT_EQ(q.columns[1].annotations[0].name, "title");
  EXPECT_TRUE(q.table_aliases.contains("e"));
  ASSERT_EQ(q.excluding.size(), 1U);
}

TEST(ModelLoader, AnnotationValues)
{
  auto m = load(R"({ "definitions": {
    "E": { "kind": "entity",
           "@flag": true, "@num": 42, "@list": [1, "..."], "@sym": { "#": "asc" },
           "@path": { "=": "a.b" }, "@rec": { "x": 1 } }
  } })");
  ASSERT_TRUE(m.load.success);

  const Node & e = m.model->node(m.def("E"));
  ASSERT_EQ(e.assignments.size(), 6U);
  EXPECT_TRUE(e.annotation_flag("flag").value_or(false));

  const auto * list = dyn_cast<ArrayExpr>(e.annotation("list")->value);
  ASSERT_NE(list, nullptr);
  ASSERT_EQ(list->items.size(), 2U);
  EXPECT_TRUE(cast<LiteralExpr>(list->items[1])->is_ellipsis());

  EXPECT_EQ(cast<LiteralExpr>(e.annotation("sym")->value)->literal, LiteralKind::Enum);
  EXPECT_EQ(cast<RefExpr>(e.annotation("path")->value)->path.size(), 2U);
  EXPECT_TRUE(isa<StructExpr>(e.annotation("rec")->value));
}

TEST(ModelLoader, ExtensionsAreRecordedPerSource)
{
  auto m = load(R"({ "sources": [
    { "file": "base.cds", "definitions": { "E": { "kind": "entity", "elements": { "x": {} } } } },
    { "file": "ext.cds", "dependencies": ["base.cds"], "extensions": [
      { "annotate": "E", "@A": 1, "elements": { "x": { "@B": 2 } } },
      { "extend": "E", "elements": { "y": { "type": "cds.String" } } }
    ] }
  ] })");
  ASSERT_TRUE(m.load.success);
  ASSERT_EQ(m.model->sources().size(), 2U);

  const SourceData & ext = m.model->node(m.model->sources()[1]).source_info();
  EXPECT_EQ(ext.dependencies, (std::vector<std::string>{"base.cds"}));
  ASSERT_EQ(ext.extensions.size(), 2U);
  EXPECT_FALSE(ext.extensions[0].extend);
  ASSERT_EQ(ext.extensions[0].elements.size(), 1U);
  EXPECT_EQ(ext.extensions[0].elements[0].name, "x");
  EXPECT_TRUE(ext.extensions[1].extend);
  EXPECT_EQ(ext.extensions[1].new_elements.size(), 1U);
}

// ============================================================================
// Problems
// ============================================================================

TEST(ModelLoader, MalformedJsonFailsTheLoad)
{
  auto m = load("{ \"definitions\": ");
  EXPECT_FALSE(m.load.success);
  EXPECT_NE(m.load.error.find("failed to parse JSON"), std::string::npos);
}

TEST(ModelLoader, MissingAndUnknownKinds)
{
  auto m = load(R"({ "definitions": {
    "A": { "elements": {} },
    "B": { "kind": "table" },
    "C": { "kind": "entity" }
  } })");
  ASSERT_TRUE(m.load.success);
  EXPECT_EQ(m.count("syntax-csn-required-subproperty"), 1U);
  EXPECT_EQ(m.count("syntax-csn-unknown-kind"), 1U);
  EXPECT_FALSE(m.def("A"));
  EXPECT_TRUE(m.def("C"));
}

TEST(ModelLoader, DuplicateDefinitionAcrossSources)
{
  auto m = load(R"({ "sources": [
    { "file": "a.cds", "definitions": { "E": { "kind": "entity" } } },
    { "file": "b.cds", "definitions": { "E": { "kind": "type" } } }
  ] })");
  ASSERT_TRUE(m.load.success);
  EXPECT_EQ(m.count("duplicate-definition"), 1U);
  EXPECT_TRUE(m.model->definitions().find("E")->is_ambiguous());
}
