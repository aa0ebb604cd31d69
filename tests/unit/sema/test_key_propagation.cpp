// tests/sema/test_key_propagation.cpp - Primary keys of views
//
#include <gtest/gtest.h>

#include "dml/test_support/model_helpers.hpp"

using namespace dml;
using dml::test_support::resolve;

namespace
{

constexpr const char * k_orders = R"(
    "Orders": { "kind": "entity", "elements": {
      "id": { "key": true, "type": "cds.Integer" },
      "note": { "type": "cds.String" },
      "items": { "type": "cds.Composition", "target": "Items", "cardinality": { "max": "*" },
                 "on": [ { "ref": ["items", "order"] }, "=", { "ref": ["$self"] } ] },
      "customer": { "type": "cds.Association", "target": "Customers" }
    } },
    "Items": { "kind": "entity", "elements": {
      "pos": { "key": true, "type": "cds.Integer" },
      "order": { "type": "cds.Association", "target": "Orders" },
      "qty": { "type": "cds.Integer" }
    } },
    "Customers": { "kind": "entity", "elements": {
      "cid": { "key": true, "type": "cds.Integer" },
      "name": { "type": "cds.String" }
    } })";

std::string model_with(const std::string & views)
{
  return std::string(R"({ "definitions": {)") + k_orders + "," + views + "} }";
}

}  // namespace

TEST(KeyPropagation, ProjectedKeyStaysKey)
{
  auto m = resolve(model_with(R"(
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["Orders"] },
      "columns": [ { "ref": ["id"] }, { "ref": ["note"] } ]
    } } })"));
  EXPECT_TRUE(m.success);
  EXPECT_TRUE(m.node("V:id").key);
  EXPECT_FALSE(m.node("V:note").key);
}

TEST(KeyPropagation, RenamedKeyStaysKey)
{
  auto m = resolve(model_with(R"(
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["Orders"], "as": "o" },
      "columns": [ { "ref": ["o", "id"], "as": "orderId" } ]
    } } })"));
  EXPECT_TRUE(m.node("V:orderId").key);
}

TEST(KeyPropagation, ToManyStepInFrom)
{
  auto m = resolve(model_with(R"(
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["Orders", "items"] },
      "columns": [ { "ref": ["pos"] }, { "ref": ["qty"] } ]
    } } })"));
  EXPECT_FALSE(m.node("V:pos").key);
  EXPECT_EQ(m.count("query-from-many"), 1U);
}

TEST(KeyPropagation, NavigatingToManyInAColumn)
{
  auto m = resolve(model_with(R"(
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["Orders"] },
      "columns": [ { "ref": ["id"] }, { "ref": ["items", "qty"] } ]
    } } })"));
  EXPECT_FALSE(m.node("V:id").key);
  EXPECT_EQ(m.count("query-navigate-many"), 1U);
}

TEST(KeyPropagation, NavigatingToManyInsideAnExpression)
{
  auto m = resolve(model_with(R"(
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["Orders"] },
      "columns": [ { "ref": ["id"] },
                   { "xpr": [ { "ref": ["items", "qty"] }, "+", { "val": 1 } ], "as": "q" } ]
    } } })"));
  EXPECT_FALSE(m.node("V:id").key);
  EXPECT_EQ(m.count("query-navigate-many"), 1U);
}

TEST(KeyPropagation, ToOneInsideAFunctionKeepsKeys)
{
  auto m = resolve(model_with(R"(
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["Orders"] },
      "columns": [ { "ref": ["id"] },
                   { "func": "upper", "args": [ { "ref": ["customer", "name"] } ], "as": "who" } ]
    } } })"));
  EXPECT_TRUE(m.success);
  EXPECT_TRUE(m.node("V:id").key);
  EXPECT_EQ(m.count("query-navigate-many"), 0U);
}

TEST(KeyPropagation, NavigatingToOneKeepsKeys)
{
  auto m = resolve(model_with(R"(
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["Orders"] },
      "columns": [ { "ref": ["id"] }, { "ref": ["customer", "name"] } ]
    } } })"));
  EXPECT_TRUE(m.node("V:id").key);
  EXPECT_EQ(m.count("query-navigate-many"), 0U);
}

TEST(KeyPropagation, MissingKey)
{
  auto m = resolve(model_with(R"(
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["Orders"] },
      "columns": [ { "ref": ["note"] } ]
    } } })"));
  EXPECT_TRUE(m.success);
  EXPECT_EQ(m.count("query-missing-keys"), 1U);
}

TEST(KeyPropagation, ExplicitKeyColumnsAreKept)
{
  auto m = resolve(model_with(R"(
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["Orders"] },
      "columns": [ { "ref": ["id"] }, { "ref": ["note"], "key": true } ]
    } } })"));
  EXPECT_FALSE(m.node("V:id").key);
  EXPECT_TRUE(m.node("V:note").key);
}

TEST(KeyPropagation, ViewsOfViews)
{
  auto m = resolve(model_with(R"(
    "P": { "kind": "entity", "projection": { "from": { "ref": ["Orders"] } } },
    "PP": { "kind": "entity", "projection": { "from": { "ref": ["P"] },
            "columns": [ { "ref": ["id"] }, { "ref": ["note"] } ] } })"));
  EXPECT_TRUE(m.success);
  EXPECT_TRUE(m.node("P:id").key);
  EXPECT_TRUE(m.node("PP:id").key);
}
