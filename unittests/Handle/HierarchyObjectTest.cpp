//===- HierarchyObjectTest.cpp - Tests for scope navigation ---------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "simproxy/Handle/HandleFactory.h"
#include "simproxy/Native/MemorySimulator.h"
#include "gtest/gtest.h"

using namespace simproxy;

namespace {

class HierarchyObjectTest : public ::testing::Test {
protected:
  HierarchyObjectTest() : factory(sim) {
    top = sim.addModule("top");
    core = sim.addModule("u_core", top, "core", "rtl/core.sv");
    clk = sim.addSignal("clk", top, 1);
  }

  HierarchyObject *getTop() {
    auto topOrErr = factory.resolveRoot("top");
    if (!topOrErr) {
      ADD_FAILURE() << llvm::toString(topOrErr.takeError());
      return nullptr;
    }
    return llvm::dyn_cast<HierarchyObject>(*topOrErr);
  }

  MemorySimulator sim;
  HandleFactory factory;
  NativeHandle top = 0;
  NativeHandle core = 0;
  NativeHandle clk = 0;
};

//===----------------------------------------------------------------------===//
// Lookup Tests
//===----------------------------------------------------------------------===//

TEST_F(HierarchyObjectTest, GetChild) {
  HierarchyObject *scope = getTop();
  ASSERT_NE(scope, nullptr);

  auto coreOrErr = scope->getChild("u_core");
  ASSERT_TRUE(static_cast<bool>(coreOrErr));
  EXPECT_TRUE(llvm::isa<HierarchyObject>(*coreOrErr));
  EXPECT_EQ((*coreOrErr)->getPath(), "top.u_core");
  EXPECT_EQ((*coreOrErr)->getHandle(), core);
}

TEST_F(HierarchyObjectTest, PositiveLookupsAreCached) {
  HierarchyObject *scope = getTop();
  ASSERT_NE(scope, nullptr);
  sim.resetStatistics();

  auto first = scope->getChild("clk");
  auto second = scope->getChild("clk");
  ASSERT_TRUE(first && second);
  EXPECT_EQ(*first, *second);
  EXPECT_EQ(sim.getStatistics().nameLookups, 1u);
}

TEST_F(HierarchyObjectTest, MissingChildIsCachedNegatively) {
  HierarchyObject *scope = getTop();
  ASSERT_NE(scope, nullptr);
  sim.resetStatistics();

  auto first = scope->getChild("nope");
  EXPECT_TRUE(isProxyError(first.takeError(), ProxyErrorCode::NoSuchChild));
  auto second = scope->getChild("nope");
  EXPECT_TRUE(isProxyError(second.takeError(), ProxyErrorCode::NoSuchChild));
  EXPECT_EQ(sim.getStatistics().nameLookups, 1u);
}

TEST_F(HierarchyObjectTest, HasChild) {
  HierarchyObject *scope = getTop();
  ASSERT_NE(scope, nullptr);

  auto present = scope->hasChild("clk");
  ASSERT_TRUE(static_cast<bool>(present));
  EXPECT_NE(*present, nullptr);

  sim.resetStatistics();
  auto absent = scope->hasChild("nope");
  ASSERT_TRUE(static_cast<bool>(absent));
  EXPECT_EQ(*absent, nullptr);

  // The peek recorded the miss.
  auto again = scope->getChild("nope");
  EXPECT_TRUE(isProxyError(again.takeError(), ProxyErrorCode::NoSuchChild));
  EXPECT_EQ(sim.getStatistics().nameLookups, 1u);
}

TEST_F(HierarchyObjectTest, HasChildPropagatesOtherErrors) {
  sim.addObject("ram", top, ObjectType::Memory);
  HierarchyObject *scope = getTop();
  ASSERT_NE(scope, nullptr);

  auto ram = scope->hasChild("ram");
  EXPECT_TRUE(
      isProxyError(ram.takeError(), ProxyErrorCode::UnknownHandleType));
}

TEST_F(HierarchyObjectTest, ExtendedIdentifier) {
  NativeHandle escaped = sim.addSignal("\\bus[0].valid\\", top, 1);
  HierarchyObject *scope = getTop();
  ASSERT_NE(scope, nullptr);

  auto childOrErr = scope->getExtendedChild("bus[0].valid");
  ASSERT_TRUE(static_cast<bool>(childOrErr));
  EXPECT_EQ((*childOrErr)->getHandle(), escaped);
}

//===----------------------------------------------------------------------===//
// Assignment Tests
//===----------------------------------------------------------------------===//

TEST_F(HierarchyObjectTest, SetChildDefersWrite) {
  HierarchyObject *scope = getTop();
  ASSERT_NE(scope, nullptr);

  EXPECT_FALSE(static_cast<bool>(scope->setChild("clk", 1)));
  EXPECT_EQ(sim.getValueBinStr(clk), "x");
  EXPECT_EQ(factory.getWriteBuffer().size(), 1u);

  EXPECT_FALSE(static_cast<bool>(factory.getWriteBuffer().flush()));
  EXPECT_EQ(sim.getValueBinStr(clk), "1");
}

TEST_F(HierarchyObjectTest, SetChildCannotCreate) {
  HierarchyObject *scope = getTop();
  ASSERT_NE(scope, nullptr);
  EXPECT_TRUE(isProxyError(scope->setChild("new_sig", 1),
                           ProxyErrorCode::NoSuchChild));
  EXPECT_TRUE(factory.getWriteBuffer().empty());
}

TEST_F(HierarchyObjectTest, ScopesHaveNoValue) {
  HierarchyObject *scope = getTop();
  ASSERT_NE(scope, nullptr);
  EXPECT_TRUE(isProxyError(scope->getValue().takeError(),
                           ProxyErrorCode::NotReadable));
  EXPECT_TRUE(isProxyError(scope->setValue(1),
                           ProxyErrorCode::UnsupportedAssignment));
  EXPECT_TRUE(isProxyError(scope->setImmediateValue(1),
                           ProxyErrorCode::UnsupportedAssignment));
}

//===----------------------------------------------------------------------===//
// Discovery Tests
//===----------------------------------------------------------------------===//

TEST_F(HierarchyObjectTest, DiscoveryRunsOnce) {
  HierarchyObject *scope = getTop();
  ASSERT_NE(scope, nullptr);
  sim.resetStatistics();

  EXPECT_FALSE(scope->isDiscovered());
  scope->discoverAll();
  scope->discoverAll();
  EXPECT_TRUE(scope->isDiscovered());
  EXPECT_EQ(sim.getStatistics().iterations, 1u);

  std::vector<std::string> names = scope->getChildNames();
  EXPECT_EQ(names, (std::vector<std::string>{"u_core", "clk"}));
  EXPECT_EQ(sim.getStatistics().iterations, 1u);
}

TEST_F(HierarchyObjectTest, ChildNamesKeepDiscoveryOrder) {
  sim.addSignal("zeta", top, 1);
  sim.addSignal("alpha", top, 1);
  sim.addModule("mid", top);
  HierarchyObject *scope = getTop();
  ASSERT_NE(scope, nullptr);

  EXPECT_EQ(scope->getChildNames(),
            (std::vector<std::string>{"u_core", "clk", "zeta", "alpha",
                                      "mid"}));
  auto alphaOrErr = scope->getChild("alpha");
  ASSERT_TRUE(static_cast<bool>(alphaOrErr));
  EXPECT_EQ((*alphaOrErr)->getPath(), "top.alpha");
}

TEST_F(HierarchyObjectTest, DiscoverySkipsUnknownTypes) {
  sim.addObject("ram", top, ObjectType::Memory);
  sim.addSignal("rst", top, 1);
  HierarchyObject *scope = getTop();
  ASSERT_NE(scope, nullptr);

  std::vector<SimHandleBase *> children = scope->children();
  ASSERT_EQ(children.size(), 3u);
  EXPECT_EQ(children[0]->getName(), "u_core");
  EXPECT_EQ(children[1]->getName(), "clk");
  EXPECT_EQ(children[2]->getName(), "rst");
  EXPECT_EQ(children[2]->getPath(), "top.rst");
}

TEST_F(HierarchyObjectTest, DiscoveredChildrenNeedNoLookup) {
  HierarchyObject *scope = getTop();
  ASSERT_NE(scope, nullptr);
  scope->discoverAll();
  sim.resetStatistics();

  auto clkOrErr = scope->getChild("clk");
  ASSERT_TRUE(static_cast<bool>(clkOrErr));
  EXPECT_EQ(sim.getStatistics().nameLookups, 0u);
}

TEST_F(HierarchyObjectTest, StructuresAreScopes) {
  NativeHandle bus = sim.addStructure("bus", top);
  sim.addSignal("valid", bus, 1);
  HierarchyObject *scope = getTop();
  ASSERT_NE(scope, nullptr);

  auto busOrErr = scope->getChild("bus");
  ASSERT_TRUE(static_cast<bool>(busOrErr));
  auto *busScope = llvm::dyn_cast<HierarchyObject>(*busOrErr);
  ASSERT_NE(busScope, nullptr);
  auto validOrErr = busScope->getChild("valid");
  ASSERT_TRUE(static_cast<bool>(validOrErr));
  EXPECT_EQ((*validOrErr)->getPath(), "top.bus.valid");
  EXPECT_EQ(busScope->getLength(), 1u);
}

//===----------------------------------------------------------------------===//
// Generate Array Tests
//===----------------------------------------------------------------------===//

TEST_F(HierarchyObjectTest, GenerateArrayIndexing) {
  NativeHandle gen = sim.addGenerateArray("gen_blk", top, IndexRange{0, 2});
  sim.addSignal("q", sim.getChildByIndex(gen, 1), 4);
  HierarchyObject *scope = getTop();
  ASSERT_NE(scope, nullptr);

  auto genOrErr = scope->getChild("gen_blk");
  ASSERT_TRUE(static_cast<bool>(genOrErr));
  auto *array = llvm::dyn_cast<HierarchyArrayObject>(*genOrErr);
  ASSERT_NE(array, nullptr);
  EXPECT_EQ(array->getLength(), 3u);

  auto blockOrErr = array->getIndex(1);
  ASSERT_TRUE(static_cast<bool>(blockOrErr));
  EXPECT_EQ((*blockOrErr)->getPath(), "top.gen_blk[1]");
  auto *block = llvm::dyn_cast<HierarchyObject>(*blockOrErr);
  ASSERT_NE(block, nullptr);
  auto qOrErr = block->getChild("q");
  ASSERT_TRUE(static_cast<bool>(qOrErr));
  EXPECT_EQ((*qOrErr)->getPath(), "top.gen_blk[1].q");

  auto missing = array->getIndex(5);
  EXPECT_TRUE(
      isProxyError(missing.takeError(), ProxyErrorCode::IndexOutOfRange));
}

TEST_F(HierarchyObjectTest, GenerateArrayIsReadOnly) {
  NativeHandle gen = sim.addGenerateArray("gen_blk", top, IndexRange{0, 1});
  auto genOrErr = factory.resolve(gen);
  ASSERT_TRUE(static_cast<bool>(genOrErr));
  auto *array = llvm::cast<HierarchyArrayObject>(*genOrErr);

  EXPECT_TRUE(isProxyError(array->getSlice(0, 1).takeError(),
                           ProxyErrorCode::UnsupportedIndex));
  EXPECT_TRUE(isProxyError(array->setIndex(0, 1),
                           ProxyErrorCode::ReadOnlyIndex));
  EXPECT_TRUE(isProxyError(array->getValue().takeError(),
                           ProxyErrorCode::NotReadable));
}

TEST_F(HierarchyObjectTest, GenerateArrayNamingSchemes) {
  NativeHandle paren = sim.addGenerateArray("g", top, IndexRange{3, 2},
                                            GenerateNaming::Paren);
  NativeHandle under = sim.addGenerateArray("h", top, IndexRange{0, 1},
                                            GenerateNaming::Underscore);

  auto parenOrErr = factory.resolve(paren);
  auto underOrErr = factory.resolve(under);
  ASSERT_TRUE(parenOrErr && underOrErr);
  auto *parenArray = llvm::cast<RegionObject>(*parenOrErr);
  auto *underArray = llvm::cast<RegionObject>(*underOrErr);

  EXPECT_EQ(parenArray->getChildNames(),
            (std::vector<std::string>{"2", "3"}));
  EXPECT_EQ(underArray->getChildNames(),
            (std::vector<std::string>{"0", "1"}));
}

TEST_F(HierarchyObjectTest, UnmatchedGenerateChildIsDropped) {
  NativeHandle gen = sim.addGenerateArray("gen_blk", top, IndexRange{0, 1});
  sim.addModule("stray", gen);

  auto genOrErr = factory.resolve(gen);
  ASSERT_TRUE(static_cast<bool>(genOrErr));
  auto *array = llvm::cast<HierarchyArrayObject>(*genOrErr);
  EXPECT_EQ(array->getLength(), 2u);
  EXPECT_EQ(array->children().size(), 2u);
}

TEST_F(HierarchyObjectTest, CustomIndexPatterns) {
  auto config = std::make_unique<ProxyConfig>();
  auto patternsOrErr = IndexNamePatterns::create({"{name}_g([0-9]+)$"});
  ASSERT_TRUE(static_cast<bool>(patternsOrErr));
  config->getIndexPatterns() = std::move(*patternsOrErr);
  HandleFactory configured(sim, std::move(config));

  NativeHandle gen = sim.addObject("blk", top, ObjectType::GenArray);
  sim.addModule("blk_g4", gen);
  sim.addModule("blk[5]", gen);

  auto genOrErr = configured.resolve(gen);
  ASSERT_TRUE(static_cast<bool>(genOrErr));
  auto *array = llvm::cast<HierarchyArrayObject>(*genOrErr);
  EXPECT_EQ(array->getChildNames(), (std::vector<std::string>{"4"}));
}

TEST_F(HierarchyObjectTest, IterationFlattensGenerateArrays) {
  NativeHandle gen = sim.addGenerateArray("gen_blk", top, IndexRange{0, 2});
  sim.removeArrayElement(gen, 1);
  HierarchyObject *scope = getTop();
  ASSERT_NE(scope, nullptr);

  std::vector<std::string> paths;
  for (SimHandleBase *child : scope->children())
    paths.push_back(child->getPath().str());
  EXPECT_EQ(paths, (std::vector<std::string>{"top.u_core", "top.clk",
                                             "top.gen_blk[0]",
                                             "top.gen_blk[2]"}));
}

} // namespace
