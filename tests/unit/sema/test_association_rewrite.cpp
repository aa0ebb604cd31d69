// tests/sema/test_association_rewrite.cpp - Foreign keys and ON conditions of query associations
//
#include <gtest/gtest.h>

#include "dml/basic/casting.hpp"
#include "dml/model/model_dumper.hpp"
#include "dml/test_support/model_helpers.hpp"

using namespace dml;
using dml::test_support::resolve;

// ============================================================================
// Managed associations
// ============================================================================

TEST(AssociationRewrite, ForeignKeyNotCoveredByTheNewTarget)
{
  auto m = resolve(R"({ "definitions": {
    "B": { "kind": "entity", "elements": {
      "id": { "key": true, "type": "cds.Integer" },
      "name": { "type": "cds.String" }
    } },
    "A": { "kind": "entity", "elements": {
      "id": { "key": true, "type": "cds.Integer" },
      "toB": { "type": "cds.Association", "target": "B", "keys": [ { "ref": ["id"], "as": "bId" } ] }
    } },
    "B_proj": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["B"] }, "columns": [ { "ref": ["name"] } ]
    } } },
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["A"] },
      "columns": [ { "ref": ["id"] }, { "ref": ["toB"], "cast": { "target": "B_proj" } } ]
    } } }
  } })");
  EXPECT_FALSE(m.success);
  EXPECT_EQ(m.count("rewrite-key-not-covered-explicit"), 1U);

  // The foreign key is kept, unbound.
  const NodeId key = m.node("V:toB").foreign_keys.get("bId");
  ASSERT_TRUE(key);
  const auto * ref = dyn_cast<RefExpr>(m.model->node(key).value);
  ASSERT_NE(ref, nullptr);
  EXPECT_EQ(ref->resolution().state, ResolutionState::NotFound);
}

TEST(AssociationRewrite, ImplicitKeysFollowTheRedirection)
{
  auto m = resolve(R"({ "definitions": {
    "B": { "kind": "entity", "elements": {
      "id": { "key": true, "type": "cds.Integer" },
      "name": { "type": "cds.String" }
    } },
    "A": { "kind": "entity", "elements": {
      "id": { "key": true, "type": "cds.Integer" },
      "toB": { "type": "cds.Association", "target": "B" }
    } },
    "BV": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["B"] }, "columns": [ { "ref": ["id"], "as": "bid" }, { "ref": ["name"] } ]
    } } },
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["A"] },
      "columns": [ { "ref": ["id"] }, { "ref": ["toB"], "cast": { "target": "BV" } } ]
    } } }
  } })");
  EXPECT_TRUE(m.success);
  EXPECT_TRUE(m.node("A:toB").implicit_keys);

  const auto json = to_json(*m.model, m.element("V:toB"));
  ASSERT_EQ(json["keys"].size(), 1U);
  EXPECT_EQ(json["keys"][0]["ref"][0], "bid");
  EXPECT_EQ(json["keys"][0]["as"], "id");
  EXPECT_EQ(json["target"], "BV");
}

TEST(AssociationRewrite, ImplicitRedirectionMissingKey)
{
  auto m = resolve(R"({ "definitions": {
    "B": { "kind": "entity", "elements": {
      "id": { "key": true, "type": "cds.Integer" },
      "name": { "type": "cds.String" }
    } },
    "A": { "kind": "entity", "elements": {
      "id": { "key": true, "type": "cds.Integer" },
      "toB": { "type": "cds.Association", "target": "B" }
    } },
    "S": { "kind": "service" },
    "S.A": { "kind": "entity", "projection": { "from": { "ref": ["A"] } } },
    "S.B": { "kind": "entity", "projection": { "from": { "ref": ["B"] }, "columns": [ { "ref": ["name"] } ] } }
  } })");
  EXPECT_FALSE(m.success);
  EXPECT_EQ(m.count("rewrite-key-not-covered-implicit"), 1U);
  EXPECT_EQ(m.count("rewrite-key-not-covered-explicit"), 0U);
}

TEST(AssociationRewrite, ExplicitKeysMustMatch)
{
  auto m = resolve(R"({ "definitions": {
    "B": { "kind": "entity", "elements": { "id": { "key": true, "type": "cds.Integer" } } },
    "A": { "kind": "entity", "elements": {
      "id": { "key": true, "type": "cds.Integer" },
      "toB": { "type": "cds.Association", "target": "B", "keys": [ { "ref": ["id"] } ] }
    } },
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["A"] },
      "columns": [ { "ref": ["id"] },
                   { "ref": ["toB"], "cast": { "target": "B", "keys": [ { "ref": ["id"], "as": "other" } ] } } ]
    } } }
  } })");
  EXPECT_EQ(m.count("rewrite-key-not-matched-explicit"), 1U);
  EXPECT_EQ(m.count("rewrite-key-not-covered-explicit"), 1U);
}

TEST(AssociationRewrite, ExplicitKeysForImplicitForeignKeys)
{
  auto m = resolve(R"({ "definitions": {
    "B": { "kind": "entity", "elements": { "id": { "key": true, "type": "cds.Integer" } } },
    "A": { "kind": "entity", "elements": {
      "id": { "key": true, "type": "cds.Integer" },
      "toB": { "type": "cds.Association", "target": "B" }
    } },
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["A"] },
      "columns": [ { "ref": ["id"] },
                   { "ref": ["toB"], "cast": { "target": "B", "keys": [ { "ref": ["id"], "as": "other" } ] } } ]
    } } }
  } })");
  EXPECT_EQ(m.count("rewrite-key-not-matched-implicit"), 1U);
  EXPECT_EQ(m.count("rewrite-key-not-covered-implicit"), 1U);
  EXPECT_EQ(m.count("rewrite-key-not-matched-explicit"), 0U);
}

TEST(AssociationRewrite, OnConditionForManagedAssociation)
{
  auto m = resolve(R"({ "definitions": {
    "B": { "kind": "entity", "elements": { "id": { "key": true, "type": "cds.Integer" } } },
    "A": { "kind": "entity", "elements": {
      "id": { "key": true, "type": "cds.Integer" },
      "toB": { "type": "cds.Association", "target": "B" }
    } },
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["A"] },
      "columns": [ { "ref": ["id"] },
                   { "ref": ["toB"], "cast": { "target": "B",
                     "on": [ { "ref": ["toB", "id"] }, "=", { "ref": ["id"] } ] } } ]
    } } }
  } })");
  EXPECT_EQ(m.count("rewrite-on-for-managed"), 1U);
}

// ============================================================================
// Unmanaged associations
// ============================================================================

TEST(AssociationRewrite, OnConditionUsesTheProjectedElements)
{
  auto m = resolve(R"({ "definitions": {
    "Items": { "kind": "entity", "elements": {
      "pos": { "key": true, "type": "cds.Integer" },
      "orderId": { "type": "cds.Integer" }
    } },
    "Orders": { "kind": "entity", "elements": {
      "id": { "key": true, "type": "cds.Integer" },
      "items": { "type": "cds.Association", "target": "Items", "cardinality": { "max": "*" },
                 "on": [ { "ref": ["items", "orderId"] }, "=", { "ref": ["id"] } ] }
    } },
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["Orders"] },
      "columns": [ { "ref": ["id"], "as": "orderKey" }, { "ref": ["items"], "as": "lines" } ]
    } } }
  } })");
  EXPECT_TRUE(m.success);

  const auto on = to_json(*m.model, m.node("V:lines").on);
  ASSERT_TRUE(on.contains("xpr"));
  EXPECT_EQ(on["xpr"][0]["ref"], (nlohmann::ordered_json{"lines", "orderId"}));
  EXPECT_EQ(on["xpr"][1], "=");
  EXPECT_EQ(on["xpr"][2]["ref"], (nlohmann::ordered_json{"orderKey"}));
}

TEST(AssociationRewrite, OnConditionElementNotProjected)
{
  auto m = resolve(R"({ "definitions": {
    "Items": { "kind": "entity", "elements": {
      "pos": { "key": true, "type": "cds.Integer" },
      "orderId": { "type": "cds.Integer" }
    } },
    "Orders": { "kind": "entity", "elements": {
      "id": { "key": true, "type": "cds.Integer" },
      "items": { "type": "cds.Association", "target": "Items", "cardinality": { "max": "*" },
                 "on": [ { "ref": ["items", "orderId"] }, "=", { "ref": ["id"] } ] }
    } },
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["Orders"] },
      "columns": [ { "ref": ["items"] } ]
    } } }
  } })");
  EXPECT_FALSE(m.success);
  EXPECT_EQ(m.count("rewrite-not-projected"), 1U);
}

TEST(AssociationRewrite, DeepSelfPathIsNotRewritten)
{
  auto m = resolve(R"({ "definitions": {
    "Items": { "kind": "entity", "elements": {
      "pos": { "key": true, "type": "cds.Integer" },
      "orderId": { "type": "cds.Integer" }
    } },
    "Orders": { "kind": "entity", "elements": {
      "id": { "key": true, "type": "cds.Integer" },
      "s": { "elements": { "t": { "type": "cds.Integer" } } },
      "items": { "type": "cds.Association", "target": "Items", "cardinality": { "max": "*" },
                 "on": [ { "ref": ["items", "orderId"] }, "=", { "ref": ["$self", "s", "t"] } ] }
    } },
    "V": { "kind": "entity", "projection": { "from": { "ref": ["Orders"] } } },
    "W": { "kind": "entity", "projection": { "from": { "ref": ["V"] } } }
  } })");
  EXPECT_FALSE(m.success);
  // Once for V:items and once for W:items.
  EXPECT_EQ(m.count("rewrite-not-supported"), 2U);
  EXPECT_EQ(m.count("rewrite-not-projected"), 0U);
}

TEST(AssociationRewrite, KeysForUnmanagedAssociation)
{
  auto m = resolve(R"({ "definitions": {
    "Items": { "kind": "entity", "elements": {
      "pos": { "key": true, "type": "cds.Integer" },
      "orderId": { "type": "cds.Integer" }
    } },
    "Orders": { "kind": "entity", "elements": {
      "id": { "key": true, "type": "cds.Integer" },
      "items": { "type": "cds.Association", "target": "Items", "cardinality": { "max": "*" },
                 "on": [ { "ref": ["items", "orderId"] }, "=", { "ref": ["id"] } ] }
    } },
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["Orders"] },
      "columns": [ { "ref": ["id"] },
                   { "ref": ["items"], "cast": { "target": "Items", "keys": [ { "ref": ["pos"] } ] } } ]
    } } }
  } })");
  EXPECT_EQ(m.count("rewrite-key-for-unmanaged"), 1U);
}

TEST(AssociationRewrite, BacklinkFollowsTheRedirectedForwardAssociation)
{
  auto m = resolve(R"({ "definitions": {
    "Books": { "kind": "entity", "elements": {
      "ID": { "key": true, "type": "cds.Integer" },
      "author": { "type": "cds.Association", "target": "Authors" }
    } },
    "Authors": { "kind": "entity", "elements": {
      "ID": { "key": true, "type": "cds.Integer" },
      "books": { "type": "cds.Association", "target": "Books", "cardinality": { "max": "*" },
                 "on": [ { "ref": ["books", "author"] }, "=", { "ref": ["$self"] } ] }
    } },
    "Cat": { "kind": "service" },
    "Cat.Books": { "kind": "entity", "projection": { "from": { "ref": ["Books"] } } },
    "Cat.Authors": { "kind": "entity", "projection": { "from": { "ref": ["Authors"] } } }
  } })");
  EXPECT_TRUE(m.success);

  const Node & books = m.node("Cat.Authors:books");
  EXPECT_EQ(books.target->target(), m.def("Cat.Books"));
  const auto on = to_json(*m.model, books.on);
  ASSERT_TRUE(on.contains("xpr"));
  EXPECT_EQ(on["xpr"][0]["ref"], (nlohmann::ordered_json{"books", "author"}));
  EXPECT_EQ(on["xpr"][2]["ref"], (nlohmann::ordered_json{"$self"}));

  // The forward association was rewritten on the way.
  const Node & author = m.node("Cat.Books:author");
  EXPECT_EQ(author.target->target(), m.def("Cat.Authors"));
  ASSERT_TRUE(author.foreign_keys.contains("ID"));
}
