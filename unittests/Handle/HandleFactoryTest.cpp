//===- HandleFactoryTest.cpp - Tests for proxy creation and identity ------===//
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

class HandleFactoryTest : public ::testing::Test {
protected:
  HandleFactoryTest() : factory(sim) {
    top = sim.addModule("top", 0, "top_mod", "rtl/top.sv");
  }

  /// Resolve \p handle and expect success.
  SimHandleBase *resolve(NativeHandle handle) {
    auto proxyOrErr = factory.resolve(handle);
    if (!proxyOrErr) {
      ADD_FAILURE() << llvm::toString(proxyOrErr.takeError());
      return nullptr;
    }
    return *proxyOrErr;
  }

  MemorySimulator sim;
  HandleFactory factory;
  NativeHandle top = 0;
};

//===----------------------------------------------------------------------===//
// Identity Tests
//===----------------------------------------------------------------------===//

TEST_F(HandleFactoryTest, SameHandleSameProxy) {
  NativeHandle clk = sim.addSignal("clk", top, 1);
  SimHandleBase *first = resolve(clk);
  SimHandleBase *second = resolve(clk);
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first, second);
  EXPECT_EQ(factory.size(), 1u);
}

TEST_F(HandleFactoryTest, LookupAndDiscoveryShareProxies) {
  sim.addSignal("clk", top, 1);
  sim.addSignal("rst", top, 1);

  auto *scope = llvm::dyn_cast_or_null<HierarchyObject>(resolve(top));
  ASSERT_NE(scope, nullptr);
  auto clkOrErr = scope->getChild("clk");
  ASSERT_TRUE(static_cast<bool>(clkOrErr));

  std::vector<SimHandleBase *> children = scope->children();
  ASSERT_EQ(children.size(), 2u);
  EXPECT_EQ(children[0], *clkOrErr);
  EXPECT_TRUE(*children[0] == **clkOrErr);
  EXPECT_TRUE(*children[0] != *children[1]);
}

TEST_F(HandleFactoryTest, LookupDoesNotCreate) {
  NativeHandle clk = sim.addSignal("clk", top, 1);
  EXPECT_EQ(factory.lookup(clk), nullptr);
  SimHandleBase *proxy = resolve(clk);
  EXPECT_EQ(factory.lookup(clk), proxy);
}

//===----------------------------------------------------------------------===//
// Type Mapping Tests
//===----------------------------------------------------------------------===//

TEST_F(HandleFactoryTest, MapsNativeTypes) {
  EXPECT_TRUE(llvm::isa<HierarchyObject>(resolve(top)));
  EXPECT_TRUE(
      llvm::isa<HierarchyObject>(resolve(sim.addStructure("bus", top))));
  EXPECT_TRUE(llvm::isa<ModifiableObject>(resolve(sim.addSignal("r", top, 4))));
  EXPECT_TRUE(llvm::isa<ModifiableObject>(
      resolve(sim.addSignal("n", top, 4, ObjectType::Net))));
  EXPECT_TRUE(llvm::isa<ArrayObject>(
      resolve(sim.addArray("mem", top, IndexRange{3, 0}, 8))));
  EXPECT_TRUE(llvm::isa<RealObject>(resolve(sim.addReal("x", top))));
  EXPECT_TRUE(llvm::isa<IntegerObject>(resolve(sim.addInteger("i", top))));
  EXPECT_TRUE(llvm::isa<EnumObject>(resolve(sim.addEnum("state", top))));
  EXPECT_TRUE(llvm::isa<StringObject>(resolve(sim.addString("s", top))));
  EXPECT_TRUE(llvm::isa<HierarchyArrayObject>(
      resolve(sim.addGenerateArray("gen", top, IndexRange{0, 1}))));
}

TEST_F(HandleFactoryTest, ArrayKindsFormAHierarchy) {
  SimHandleBase *reg = resolve(sim.addSignal("r", top, 4));
  SimHandleBase *mem = resolve(sim.addArray("mem", top, IndexRange{1, 0}, 8));
  SimHandleBase *real = resolve(sim.addReal("x", top));

  EXPECT_TRUE(llvm::isa<ArrayObject>(reg));
  EXPECT_TRUE(llvm::isa<NonConstantObject>(reg));
  EXPECT_FALSE(llvm::isa<NonConstantObject>(mem));
  EXPECT_TRUE(llvm::isa<ModifiableObject>(real));
  EXPECT_FALSE(llvm::isa<RegionObject>(real));
  EXPECT_TRUE(llvm::isa<RegionObject>(resolve(top)));
}

TEST_F(HandleFactoryTest, ConstantsOverrideTypeMapping) {
  NativeHandle width =
      sim.addParameter("WIDTH", top, ObjectType::Integer, "", 8);
  NativeHandle mask =
      sim.addParameter("MASK", top, ObjectType::Parameter, "1010");
  EXPECT_TRUE(llvm::isa<ConstantObject>(resolve(width)));
  EXPECT_TRUE(llvm::isa<ConstantObject>(resolve(mask)));
}

TEST_F(HandleFactoryTest, UnknownTypeIsAnError) {
  NativeHandle memory = sim.addObject("ram", top, ObjectType::Memory);
  auto proxyOrErr = factory.resolve(memory, llvm::StringRef("top.ram"));
  ASSERT_FALSE(static_cast<bool>(proxyOrErr));

  std::string message;
  llvm::handleAllErrors(proxyOrErr.takeError(), [&](const ProxyError &err) {
    EXPECT_EQ(err.getCode(), ProxyErrorCode::UnknownHandleType);
    message = err.getMessage().str();
  });
  EXPECT_NE(message.find("GPI_MEMORY"), std::string::npos);
  EXPECT_NE(message.find("top.ram"), std::string::npos);
  EXPECT_EQ(factory.lookup(memory), nullptr);
}

//===----------------------------------------------------------------------===//
// Metadata Tests
//===----------------------------------------------------------------------===//

TEST_F(HandleFactoryTest, RootByName) {
  auto rootOrErr = factory.resolveRoot("top");
  ASSERT_TRUE(static_cast<bool>(rootOrErr));
  EXPECT_EQ((*rootOrErr)->getPath(), "top");
  EXPECT_EQ((*rootOrErr)->getHandle(), top);

  auto missing = factory.resolveRoot("tb");
  EXPECT_TRUE(isProxyError(missing.takeError(), ProxyErrorCode::NoSuchChild));
}

TEST_F(HandleFactoryTest, PathDefaultsToName) {
  NativeHandle clk = sim.addSignal("clk", top, 1);
  auto proxyOrErr = factory.resolveRoot(clk);
  ASSERT_TRUE(static_cast<bool>(proxyOrErr));
  EXPECT_EQ((*proxyOrErr)->getPath(), "clk");
  EXPECT_EQ((*proxyOrErr)->getFullName(), "clk(GPI_REGISTER)");
}

TEST_F(HandleFactoryTest, Description) {
  SimHandleBase *scope = resolve(top);
  EXPECT_EQ(scope->getDescription(),
            "HierarchyObject(top with definition top_mod (at rtl/top.sv))");
  EXPECT_EQ(scope->getDefinitionName(), std::optional<std::string>("top_mod"));

  SimHandleBase *clk = resolve(sim.addSignal("clk", top, 1));
  EXPECT_EQ(clk->getDescription(), "ModifiableObject(clk)");
  EXPECT_EQ(clk->getClassName(), "ModifiableObject");
}

//===----------------------------------------------------------------------===//
// Scheduler Tests
//===----------------------------------------------------------------------===//

class RecordingScheduler : public WriteScheduler {
public:
  void saveWrite(ModifiableObject &target, const WriteValue &value) override {
    writes.emplace_back(&target, value);
  }

  std::vector<std::pair<ModifiableObject *, WriteValue>> writes;
};

TEST_F(HandleFactoryTest, AttachedSchedulerReceivesWrites) {
  RecordingScheduler recorder;
  factory.setScheduler(&recorder);

  SimHandleBase *clk = resolve(sim.addSignal("clk", top, 1));
  EXPECT_FALSE(static_cast<bool>(clk->setValue(1)));
  ASSERT_EQ(recorder.writes.size(), 1u);
  EXPECT_EQ(recorder.writes[0].first, clk);
  EXPECT_EQ(recorder.writes[0].second, WriteValue(1));
  EXPECT_TRUE(factory.getWriteBuffer().empty());

  factory.setScheduler(nullptr);
  EXPECT_FALSE(static_cast<bool>(clk->setValue(0)));
  EXPECT_EQ(factory.getWriteBuffer().size(), 1u);
  EXPECT_EQ(recorder.writes.size(), 1u);
}

TEST_F(HandleFactoryTest, ConfigIsShared) {
  auto config = std::make_unique<ProxyConfig>();
  config->setIntegerFastPathWidth(8);
  HandleFactory configured(sim, std::move(config));
  EXPECT_EQ(configured.getConfig().getIntegerFastPathWidth(), 8u);
  EXPECT_EQ(factory.getConfig().getIntegerFastPathWidth(), 32u);
}

} // namespace
