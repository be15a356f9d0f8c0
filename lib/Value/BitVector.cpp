//===- BitVector.cpp - Fixed-width four-state bit vector ------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "simproxy/Value/BitVector.h"
#include "llvm/Support/MathExtras.h"

using namespace simproxy;

BitVector::BitVector(unsigned width, uint64_t val)
    : value(width ? width : 1, val), xMask(width ? width : 1, 0),
      zMask(width ? width : 1, 0) {}

BitVector::BitVector(llvm::APInt val)
    : value(std::move(val)), xMask(value.getBitWidth(), 0),
      zMask(value.getBitWidth(), 0) {}

std::optional<BitVector> BitVector::fromBinaryString(llvm::StringRef binstr) {
  if (binstr.empty())
    return std::nullopt;

  unsigned width = binstr.size();
  BitVector result(width);
  for (unsigned i = 0; i < width; ++i) {
    // Bit 0 is the last character.
    unsigned bit = width - 1 - i;
    switch (binstr[i]) {
    case '0':
      break;
    case '1':
      result.value.setBit(bit);
      break;
    case 'x':
    case 'X':
      result.xMask.setBit(bit);
      break;
    case 'z':
    case 'Z':
      result.zMask.setBit(bit);
      break;
    default:
      return std::nullopt;
    }
  }
  return result;
}

std::optional<BitVector> BitVector::fromInteger(int64_t val, unsigned width) {
  if (width == 0)
    return std::nullopt;
  if (width < 64) {
    bool fits = val < 0 ? llvm::isIntN(width, val)
                        : llvm::isUIntN(width, static_cast<uint64_t>(val));
    if (!fits)
      return std::nullopt;
  }
  llvm::APInt bits(64, static_cast<uint64_t>(val), /*isSigned=*/true);
  return BitVector(bits.sextOrTrunc(width));
}

std::optional<uint64_t> BitVector::toUnsigned() const {
  if (!isFullyDefined() || getWidth() > 64)
    return std::nullopt;
  return value.getZExtValue();
}

std::optional<int64_t> BitVector::toSigned() const {
  if (!isFullyDefined() || getWidth() > 64)
    return std::nullopt;
  return value.getSExtValue();
}

std::string BitVector::toBinaryString() const {
  unsigned width = getWidth();
  std::string result;
  result.reserve(width);
  for (unsigned i = width; i > 0; --i) {
    unsigned bit = i - 1;
    if (xMask[bit])
      result.push_back('x');
    else if (zMask[bit])
      result.push_back('z');
    else
      result.push_back(value[bit] ? '1' : '0');
  }
  return result;
}
