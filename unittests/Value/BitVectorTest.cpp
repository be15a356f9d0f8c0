//===- BitVectorTest.cpp - Unit tests for the four-state BitVector --------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "simproxy/Value/BitVector.h"
#include "gtest/gtest.h"

using namespace simproxy;

namespace {

TEST(BitVectorTest, DefaultIsOneZeroBit) {
  BitVector bits;
  EXPECT_EQ(bits.getWidth(), 1u);
  EXPECT_EQ(bits.toBinaryString(), "0");
  EXPECT_TRUE(bits.isFullyDefined());
}

TEST(BitVectorTest, ParseBinaryString) {
  auto bits = BitVector::fromBinaryString("1100_1000");
  EXPECT_FALSE(bits.has_value());

  bits = BitVector::fromBinaryString("11001000");
  ASSERT_TRUE(bits.has_value());
  EXPECT_EQ(bits->getWidth(), 8u);
  EXPECT_EQ(bits->toUnsigned(), 200u);
  EXPECT_EQ(bits->toSigned(), -56);
  EXPECT_EQ(bits->toBinaryString(), "11001000");
}

TEST(BitVectorTest, FourStateBits) {
  auto bits = BitVector::fromBinaryString("1xZ0");
  ASSERT_TRUE(bits.has_value());
  EXPECT_FALSE(bits->isFullyDefined());
  EXPECT_TRUE(bits->isUnknownBit(2));
  EXPECT_TRUE(bits->isHighZBit(1));
  EXPECT_FALSE(bits->isUnknownBit(0));
  EXPECT_EQ(bits->toBinaryString(), "1xz0");
  EXPECT_FALSE(bits->toUnsigned().has_value());
  EXPECT_FALSE(bits->toSigned().has_value());
}

TEST(BitVectorTest, RejectsEmptyAndInvalid) {
  EXPECT_FALSE(BitVector::fromBinaryString("").has_value());
  EXPECT_FALSE(BitVector::fromBinaryString("102").has_value());
  EXPECT_FALSE(BitVector::fromBinaryString("0b1").has_value());
}

TEST(BitVectorTest, FromInteger) {
  auto bits = BitVector::fromInteger(200, 8);
  ASSERT_TRUE(bits.has_value());
  EXPECT_EQ(bits->toBinaryString(), "11001000");

  auto negative = BitVector::fromInteger(-1, 4);
  ASSERT_TRUE(negative.has_value());
  EXPECT_EQ(negative->toBinaryString(), "1111");

  auto wide = BitVector::fromInteger(-2, 70);
  ASSERT_TRUE(wide.has_value());
  EXPECT_EQ(wide->getWidth(), 70u);
  EXPECT_EQ(wide->toBinaryString(), std::string(69, '1') + "0");
}

TEST(BitVectorTest, FromIntegerOverflow) {
  EXPECT_FALSE(BitVector::fromInteger(256, 8).has_value());
  EXPECT_FALSE(BitVector::fromInteger(-9, 4).has_value());
  EXPECT_FALSE(BitVector::fromInteger(1, 0).has_value());
}

TEST(BitVectorTest, WideValuesHaveNoIntegerView) {
  auto bits = BitVector::fromBinaryString(std::string(65, '1'));
  ASSERT_TRUE(bits.has_value());
  EXPECT_TRUE(bits->isFullyDefined());
  EXPECT_FALSE(bits->toUnsigned().has_value());
}

TEST(BitVectorTest, Equality) {
  EXPECT_EQ(*BitVector::fromBinaryString("10x"),
            *BitVector::fromBinaryString("10X"));
  EXPECT_NE(*BitVector::fromBinaryString("10x"),
            *BitVector::fromBinaryString("10z"));
  EXPECT_NE(*BitVector::fromBinaryString("010"),
            *BitVector::fromBinaryString("10"));
}

} // namespace
