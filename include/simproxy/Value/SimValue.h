//===- SimValue.h - Snapshot of a simulator object's value ------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// SimValue is what a read returns: an integer, a real, a string or a bit
// vector, chosen by the native type of the object that was read.
//
//===----------------------------------------------------------------------===//

#ifndef SIMPROXY_VALUE_SIMVALUE_H
#define SIMPROXY_VALUE_SIMVALUE_H

#include "simproxy/Value/BitVector.h"
#include "llvm/Support/raw_ostream.h"
#include <cassert>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace simproxy {

class SimValue {
public:
  enum class Kind : uint8_t { Integer = 0, Real = 1, Text = 2, Bits = 3 };

  explicit SimValue(int64_t value) : storage(value) {}
  explicit SimValue(int value) : storage(static_cast<int64_t>(value)) {}
  explicit SimValue(double value) : storage(value) {}
  explicit SimValue(std::string value) : storage(std::move(value)) {}
  explicit SimValue(BitVector value) : storage(std::move(value)) {}

  Kind getKind() const { return static_cast<Kind>(storage.index()); }

  bool isInteger() const { return getKind() == Kind::Integer; }
  bool isReal() const { return getKind() == Kind::Real; }
  bool isText() const { return getKind() == Kind::Text; }
  bool isBits() const { return getKind() == Kind::Bits; }

  int64_t getInteger() const {
    assert(isInteger() && "not an integer value");
    return std::get<int64_t>(storage);
  }
  double getReal() const {
    assert(isReal() && "not a real value");
    return std::get<double>(storage);
  }
  const std::string &getText() const {
    assert(isText() && "not a text value");
    return std::get<std::string>(storage);
  }
  const BitVector &getBits() const {
    assert(isBits() && "not a bit vector value");
    return std::get<BitVector>(storage);
  }

  /// Integer view of the value: integers as-is, bit vectors when fully
  /// defined and at most 64 bits wide. Reals and text have none.
  std::optional<int64_t> toInteger() const;

  /// Real view of the value: reals as-is, integers and defined bit vectors
  /// converted.
  std::optional<double> toDouble() const;

  /// Human-readable rendering; bit vectors print as binary strings.
  std::string toString() const;

  bool operator==(const SimValue &other) const {
    return storage == other.storage;
  }
  bool operator!=(const SimValue &other) const { return !(*this == other); }

private:
  std::variant<int64_t, double, std::string, BitVector> storage;
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os,
                                     const SimValue &value) {
  return os << value.toString();
}

} // namespace simproxy

#endif // SIMPROXY_VALUE_SIMVALUE_H
