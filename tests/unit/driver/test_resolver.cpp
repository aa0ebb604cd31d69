// tests/driver/test_resolver.cpp - Resolver pipeline end to end
//
#include <gtest/gtest.h>

#include "dml/driver/resolver.hpp"
#include "dml/model/model_loader.hpp"
#include "dml/test_support/model_helpers.hpp"

using namespace dml;
using dml::test_support::resolve;

namespace
{

constexpr const char * k_bookshop = R"({ "sources": [
  { "file": "db/schema.cds", "namespace": "shop",
    "definitions": {
      "Books": { "kind": "entity", "elements": {
        "ID": { "key": true, "type": "cds.Integer" },
        "title": { "type": "cds.String", "@title": "Title" },
        "author": { "type": "cds.Association", "target": "Authors" },
        "chapters": { "type": "cds.Composition", "target": "Chapters", "cardinality": { "max": "*" },
                      "on": [ { "ref": ["chapters", "book"] }, "=", { "ref": ["$self"] } ] }
      } },
      "Authors": { "kind": "entity", "elements": {
        "ID": { "key": true, "type": "cds.Integer" },
        "name": { "type": "cds.String" },
        "books": { "type": "cds.Association", "target": "Books", "cardinality": { "max": "*" },
                   "on": [ { "ref": ["books", "author"] }, "=", { "ref": ["$self"] } ] }
      } },
      "Chapters": { "kind": "entity", "elements": {
        "book": { "key": true, "type": "cds.Association", "target": "Books" },
        "number": { "key": true, "type": "cds.Integer" }
      } }
    } },
  { "file": "srv/cat-service.cds", "dependencies": ["db/schema.cds"],
    "definitions": {
      "CatalogService": { "kind": "service" },
      "CatalogService.Books": { "kind": "entity", "projection": { "from": { "ref": ["shop.Books"] } } },
      "CatalogService.Authors": { "kind": "entity", "projection": { "from": { "ref": ["shop.Authors"] } } }
    },
    "extensions": [ { "annotate": "CatalogService.Books", "@readonly": true } ] }
] })";

}  // namespace

TEST(Resolver, BookshopResolvesCleanly)
{
  auto m = resolve(k_bookshop);
  ASSERT_TRUE(m.load.success);
  EXPECT_TRUE(m.success);
  EXPECT_FALSE(m.diags.has_errors());

  // Chapters are exposed through the composition.
  EXPECT_TRUE(m.def("CatalogService.Chapters"));
  EXPECT_EQ(m.stats.autoexposed, 1U);
  EXPECT_EQ(m.stats.definitions, m.model->definitions().size());

  EXPECT_EQ(
    m.node("CatalogService.Books:author").target->target(), m.def("CatalogService.Authors"));
  EXPECT_EQ(
    m.node("CatalogService.Authors:books").target->target(), m.def("CatalogService.Books"));
  EXPECT_TRUE(m.node("CatalogService.Books:ID").key);
  EXPECT_TRUE(m.model->node(m.def("CatalogService.Books")).annotation_flag("readonly").value_or(false));
  EXPECT_NE(m.node("shop.Books:title").annotation("title"), nullptr);
}

TEST(Resolver, StaticResolveUsesAFreshBag)
{
  Model model;
  DiagnosticBag load_diags;
  ModelLoader loader(model, load_diags);
  ASSERT_TRUE(loader.add_text(k_bookshop, "bookshop.json").success);
  loader.finish();

  const ResolveResult result = Resolver::resolve(model, dml::test_support::test_options());
  EXPECT_TRUE(result.success);
  EXPECT_FALSE(result.diagnostics.has_errors());
  EXPECT_GT(result.stats.definitions, 0U);
  for (double ms : result.stats.phase_ms) {
    EXPECT_GE(ms, 0.0);
  }
}

TEST(Resolver, ErrorsDoNotStopLaterPhases)
{
  auto m = resolve(R"({ "definitions": {
    "E": { "kind": "entity", "elements": {
      "id": { "key": true, "type": "cds.Integer" },
      "bad": { "type": "Missing" }
    } },
    "T1": { "kind": "type", "type": "T2" },
    "T2": { "kind": "type", "type": "T1" },
    "V": { "kind": "entity", "projection": { "from": { "ref": ["E"] } } }
  } })");
  EXPECT_FALSE(m.success);
  EXPECT_EQ(m.count("ref-undefined-art"), 1U);
  EXPECT_EQ(m.count("ref-cyclic"), 2U);
  EXPECT_TRUE(m.node("V:id").key);
}
