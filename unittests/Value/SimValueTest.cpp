//===- SimValueTest.cpp - Unit tests for SimValue -------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "simproxy/Value/SimValue.h"
#include "gtest/gtest.h"

using namespace simproxy;

namespace {

TEST(SimValueTest, Kinds) {
  EXPECT_TRUE(SimValue(5).isInteger());
  EXPECT_TRUE(SimValue(2.5).isReal());
  EXPECT_TRUE(SimValue(std::string("abc")).isText());
  EXPECT_TRUE(SimValue(BitVector(4, 3)).isBits());
}

TEST(SimValueTest, IntegerConversion) {
  EXPECT_EQ(SimValue(-3).toInteger(), -3);
  EXPECT_EQ(SimValue(BitVector(8, 200)).toInteger(), 200);
  EXPECT_FALSE(SimValue(*BitVector::fromBinaryString("1x")).toInteger());
  EXPECT_FALSE(SimValue(1.5).toInteger());
  EXPECT_FALSE(SimValue(std::string("7")).toInteger());
}

TEST(SimValueTest, DoubleConversion) {
  EXPECT_EQ(SimValue(1.5).toDouble(), 1.5);
  EXPECT_EQ(SimValue(4).toDouble(), 4.0);
  EXPECT_FALSE(SimValue(std::string("x")).toDouble());
}

TEST(SimValueTest, ToString) {
  EXPECT_EQ(SimValue(42).toString(), "42");
  EXPECT_EQ(SimValue(0.25).toString(), "0.25");
  EXPECT_EQ(SimValue(std::string("hello")).toString(), "hello");
  EXPECT_EQ(SimValue(*BitVector::fromBinaryString("01z")).toString(), "01z");
}

TEST(SimValueTest, Equality) {
  EXPECT_EQ(SimValue(1), SimValue(1));
  EXPECT_NE(SimValue(1), SimValue(1.0));
  EXPECT_NE(SimValue(BitVector(4, 1)), SimValue(BitVector(8, 1)));
}

} // namespace
