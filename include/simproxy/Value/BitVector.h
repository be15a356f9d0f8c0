//===- BitVector.h - Fixed-width four-state bit vector ----------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A fixed-width logic vector holding 0, 1, X and Z bits. It is the value
// snapshot returned for register and net reads and one of the payloads a
// caller may write. The width is chosen at construction and never changes.
//
//===----------------------------------------------------------------------===//

#ifndef SIMPROXY_VALUE_BITVECTOR_H
#define SIMPROXY_VALUE_BITVECTOR_H

#include "llvm/ADT/APInt.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"
#include <cstdint>
#include <optional>
#include <string>

namespace simproxy {

class BitVector {
public:
  /// Construct an all-zero vector of \p width bits (at least one).
  explicit BitVector(unsigned width = 1, uint64_t value = 0);

  /// Construct a fully defined vector from an APInt.
  explicit BitVector(llvm::APInt value);

  /// Parse a binary string, most significant bit first. Accepts 0, 1, x/X
  /// and z/Z; anything else (or an empty string) fails.
  static std::optional<BitVector> fromBinaryString(llvm::StringRef binstr);

  /// Encode \p value in \p width bits. Negative values use two's complement.
  /// Fails when the value does not fit.
  static std::optional<BitVector> fromInteger(int64_t value, unsigned width);

  unsigned getWidth() const { return value.getBitWidth(); }

  /// The 0/1 plane. X and Z bits read as 0 here.
  const llvm::APInt &getAPInt() const { return value; }

  /// True if no bit is X or Z.
  bool isFullyDefined() const { return xMask.isZero() && zMask.isZero(); }

  bool isUnknownBit(unsigned bit) const { return xMask[bit]; }
  bool isHighZBit(unsigned bit) const { return zMask[bit]; }

  /// Unsigned interpretation; only for fully defined vectors of <= 64 bits.
  std::optional<uint64_t> toUnsigned() const;

  /// Signed interpretation; only for fully defined vectors of <= 64 bits.
  std::optional<int64_t> toSigned() const;

  /// Render most significant bit first using 0, 1, x and z.
  std::string toBinaryString() const;

  bool operator==(const BitVector &other) const {
    return getWidth() == other.getWidth() && value == other.value &&
           xMask == other.xMask && zMask == other.zMask;
  }
  bool operator!=(const BitVector &other) const { return !(*this == other); }

private:
  llvm::APInt value;
  llvm::APInt xMask;
  llvm::APInt zMask;
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os,
                                     const BitVector &bits) {
  return os << bits.toBinaryString();
}

} // namespace simproxy

#endif // SIMPROXY_VALUE_BITVECTOR_H
