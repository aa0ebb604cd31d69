// tests/model/test_model_dumper.cpp - JSON output of resolved models
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "dml/model/model_dumper.hpp"
#include "dml/test_support/model_helpers.hpp"

using namespace dml;
using dml::test_support::resolve;

namespace
{

std::vector<std::string> keys_of(const nlohmann::ordered_json & obj)
{
  std::vector<std::string> out;
  for (auto it = obj.begin(); it != obj.end(); ++it) out.push_back(it.key());
  return out;
}

}  // namespace

TEST(ModelDumper, InferredElementsKeepColumnOrder)
{
  auto m = resolve(R"({ "definitions": {
    "E": { "kind": "entity", "elements": {
      "a": { "key": true, "type": "cds.Integer" },
      "b": { "type": "cds.String" },
      "c": { "type": "cds.String" }
    } },
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["E"] },
      "columns": [ { "ref": ["c"], "as": "z" }, "*" ]
    } } }
  } })");
  ASSERT_TRUE(m.success);

  const auto out = to_json(*m.model);
  const auto & v = out["definitions"]["V"];
  EXPECT_EQ(v["kind"], "entity");
  EXPECT_EQ(keys_of(v["elements"]), (std::vector<std::string>{"z", "a", "b", "c"}));
  EXPECT_EQ(v["elements"]["a"]["key"], true);
  EXPECT_EQ(v["elements"]["b"]["type"], "cds.String");
  EXPECT_EQ(v["elements"]["z"]["type"], "cds.String");
  EXPECT_EQ(v["query"]["SELECT"]["from"]["ref"][0], "E");
  ASSERT_EQ(v["query"]["SELECT"]["columns"].size(), 2U);
  EXPECT_EQ(v["query"]["SELECT"]["columns"][0]["as"], "z");
  EXPECT_EQ(v["query"]["SELECT"]["columns"][1], "*");
}

TEST(ModelDumper, AllSelectClauses)
{
  auto m = resolve(R"({ "definitions": {
    "E": { "kind": "entity", "elements": {
      "a": { "key": true, "type": "cds.Integer" },
      "b": { "type": "cds.String" },
      "c": { "type": "cds.Integer" }
    } },
    "V": { "kind": "entity", "query": { "SELECT": {
      "from": { "ref": ["E"] },
      "columns": [ "*", { "func": "count", "args": [ { "ref": ["a"] } ], "as": "n" } ],
      "excluding": [ "c" ],
      "where": [ { "ref": ["a"] }, ">", { "val": 0 } ],
      "groupBy": [ { "ref": ["a"] }, { "ref": ["b"] } ],
      "having": [ { "ref": ["b"] }, "<>", { "val": "x" } ],
      "orderBy": [ { "ref": ["b"] } ]
    } } }
  } })");
  ASSERT_TRUE(m.success);

  const auto select = to_json(*m.model)["definitions"]["V"]["query"]["SELECT"];
  EXPECT_EQ(select["columns"].size(), 2U);
  EXPECT_EQ(select["columns"][1]["func"], "count");
  EXPECT_EQ(select["columns"][1]["as"], "n");
  ASSERT_EQ(select["excluding"].size(), 1U);
  EXPECT_EQ(select["excluding"][0], "c");
  EXPECT_TRUE(select.contains("where"));
  EXPECT_EQ(select["groupBy"].size(), 2U);
  EXPECT_TRUE(select.contains("having"));
  ASSERT_EQ(select["orderBy"].size(), 1U);
  EXPECT_EQ(select["orderBy"][0]["ref"][0], "b");
}

TEST(ModelDumper, GeneratedForeignKeysAndAutoexposedEntities)
{
  auto m = resolve(R"({ "definitions": {
    "Books": { "kind": "entity", "elements": {
      "ID": { "key": true, "type": "cds.Integer" },
      "genre": { "type": "cds.Association", "target": "Genres" }
    } },
    "Genres": { "kind": "entity", "@cds.autoexpose": true, "elements": {
      "code": { "key": true, "type": "cds.String" }
    } },
    "Cat": { "kind": "service" },
    "Cat.Books": { "kind": "entity", "projection": { "from": { "ref": ["Books"] } } }
  } })");
  ASSERT_TRUE(m.success);

  const auto out = to_json(*m.model);
  const auto & genre = out["definitions"]["Books"]["elements"]["genre"];
  ASSERT_TRUE(genre.contains("keys"));
  EXPECT_EQ(genre["keys"][0]["ref"][0], "code");
  EXPECT_EQ(genre["keys"][0]["as"], "code");

  const auto & exposed = out["definitions"]["Cat.Books"]["elements"]["genre"];
  EXPECT_EQ(exposed["target"], "Cat.Genres");
  ASSERT_TRUE(out.contains("$autoexposed"));
  EXPECT_EQ(out["$autoexposed"][0], "Cat.Genres");
  EXPECT_EQ(out["definitions"]["Cat.Genres"]["@cds.autoexposed"], true);
}

TEST(ModelDumper, Expressions)
{
  auto m = resolve(R"({ "definitions": {
    "E": { "kind": "entity", "elements": {
      "a": { "type": "cds.Integer", "default": { "val": 1 } }
    } }
  } })");
  ASSERT_TRUE(m.success);

  const Node & a = m.node("E:a");
  EXPECT_EQ(to_json(*m.model, a.default_value), (nlohmann::ordered_json{{"val", 1}}));
  EXPECT_EQ(to_json(*m.model, a.type), (nlohmann::ordered_json{{"ref", {"cds.Integer"}}}));
  EXPECT_TRUE(to_json(*m.model, static_cast<const Expr *>(nullptr)).is_null());
}
