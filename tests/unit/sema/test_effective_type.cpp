// tests/sema/test_effective_type.cpp - Type chains, structure expansion, type cycles
//
#include <gtest/gtest.h>

#include "dml/sema/types/effective_type.hpp"
#include "dml/test_support/model_helpers.hpp"

using namespace dml;
using dml::test_support::load;
using dml::test_support::resolve;
using dml::test_support::SemaHarness;

TEST(EffectiveType, FollowsTypeChainsToTheBuiltin)
{
  auto m = load(R"({ "definitions": {
    "Name": { "kind": "type", "type": "cds.String" },
    "ShortName": { "kind": "type", "type": "Name" },
    "E": { "kind": "entity", "elements": { "n": { "type": "ShortName" } } }
  } })");
  ASSERT_TRUE(m.load.success);
  SemaHarness h(m);

  const TypeResult r = h.sema.types().effective(m.element("E:n"));
  ASSERT_TRUE(r.is_node());
  EXPECT_EQ(r.node, m.model->builtin("cds.String"));
  // The chain members share the result.
  EXPECT_EQ(h.sema.types().effective(m.def("Name")).node, r.node);
  EXPECT_TRUE(m.diags.empty());
}

TEST(EffectiveType, StructuredTypesAreExpanded)
{
  auto m = load(R"({ "definitions": {
    "Address": { "kind": "type", "elements": {
      "street": { "type": "cds.String" },
      "city": { "type": "cds.String" }
    } },
    "E": { "kind": "entity", "elements": { "addr": { "type": "Address" } } }
  } })");
  ASSERT_TRUE(m.load.success);
  SemaHarness h(m);

  const Dict * elements = h.sema.types().elements_of(m.element("E:addr"));
  ASSERT_NE(elements, nullptr);
  EXPECT_EQ(elements->names(), (std::vector<std::string>{"street", "city"}));
  EXPECT_EQ(m.model->links().origin(m.element("E:addr.city")), m.element("Address:city"));
}

TEST(EffectiveType, AssociationTypes)
{
  auto m = load(R"({ "definitions": {
    "B": { "kind": "entity", "elements": { "id": { "key": true, "type": "cds.Integer" } } },
    "ToB": { "kind": "type", "type": "cds.Association", "target": "B", "cardinality": { "max": "*" } },
    "A": { "kind": "entity", "elements": { "bs": { "type": "ToB" } } }
  } })");
  ASSERT_TRUE(m.load.success);
  SemaHarness h(m);

  EffectiveTypeEngine & types = h.sema.types();
  const NodeId bs = m.element("A:bs");
  EXPECT_EQ(types.association_of(bs), m.def("ToB"));
  EXPECT_EQ(types.target_of(bs), m.def("B"));
  EXPECT_TRUE(types.is_to_many(bs));
}

TEST(EffectiveType, TypeCycleIsReportedPerMember)
{
  auto m = resolve(R"({ "definitions": {
    "T1": { "kind": "type", "type": "T2" },
    "T2": { "kind": "type", "type": "T1" },
    "T3": { "kind": "type", "type": "T1" }
  } })");
  EXPECT_FALSE(m.success);
  EXPECT_EQ(m.count("ref-cyclic"), 2U);
  EXPECT_EQ(m.stats.cyclic_references, 2U);
  EXPECT_EQ(m.model->links().type_status(m.def("T3")).result.kind, TypeResultKind::Cyclic);
}

TEST(EffectiveType, SelfReferencingType)
{
  auto m = resolve(R"({ "definitions": {
    "T": { "kind": "type", "type": "T" }
  } })");
  EXPECT_EQ(m.count("ref-cyclic"), 1U);
}
