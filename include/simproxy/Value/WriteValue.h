//===- WriteValue.h - Values and override actions for writes ----*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A WriteValue is everything a caller may hand to a write: a payload (integer,
// real, string, bit vector or packed list of integers) together with the
// override action to apply it with. Plain payloads are deposits.
//
//   obj.setImmediateValue(200);                     // deposit
//   obj.setImmediateValue(WriteValue::force(5));    // hold at 5
//   obj.setImmediateValue(WriteValue::freeze());    // hold at current value
//   obj.setImmediateValue(WriteValue::release());   // drop force/freeze
//
//===----------------------------------------------------------------------===//

#ifndef SIMPROXY_VALUE_WRITEVALUE_H
#define SIMPROXY_VALUE_WRITEVALUE_H

#include "simproxy/Value/BitVector.h"
#include "simproxy/Value/SimValue.h"
#include "llvm/ADT/StringRef.h"
#include <cassert>
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace simproxy {

/// A list of equally sized integers packed into one vector. Element 0 lands
/// in the least significant bits.
struct PackedArray {
  std::vector<int64_t> values;
  unsigned bits = 0;

  bool operator==(const PackedArray &other) const {
    return values == other.values && bits == other.bits;
  }
};

/// How a write is applied to the native object.
enum class SetAction : uint8_t {
  /// Ordinary assignment.
  Deposit,
  /// Hold the object at the given value until released.
  Force,
  /// Hold the object at its current value until released.
  Freeze,
  /// Cancel an active force or freeze.
  Release,
};

llvm::StringRef stringifySetAction(SetAction action);

class WriteValue {
public:
  enum class Kind : uint8_t {
    Empty = 0,
    Integer = 1,
    Real = 2,
    Text = 3,
    Bits = 4,
    Packed = 5,
  };

  WriteValue() = default;
  /// Any integer type is stored as an int64_t.
  template <typename IntT,
            typename = std::enable_if_t<std::is_integral_v<IntT>>>
  WriteValue(IntT value) : payload(static_cast<int64_t>(value)) {}
  WriteValue(double value) : payload(value) {}
  WriteValue(const char *value) : payload(std::string(value)) {}
  WriteValue(std::string value) : payload(std::move(value)) {}
  WriteValue(BitVector value) : payload(std::move(value)) {}
  WriteValue(PackedArray value) : payload(std::move(value)) {}

  /// Convert a read snapshot back into a payload.
  static WriteValue fromSimValue(const SimValue &value);

  static WriteValue deposit(WriteValue value) {
    value.action = SetAction::Deposit;
    return value;
  }
  static WriteValue force(WriteValue value) {
    value.action = SetAction::Force;
    return value;
  }
  static WriteValue freeze() {
    WriteValue value;
    value.action = SetAction::Freeze;
    return value;
  }
  static WriteValue release() {
    WriteValue value;
    value.action = SetAction::Release;
    return value;
  }

  SetAction getAction() const { return action; }
  Kind getKind() const { return static_cast<Kind>(payload.index()); }

  /// Returns the payload with the action reset to a deposit.
  WriteValue withoutAction() const {
    WriteValue copy = *this;
    copy.action = SetAction::Deposit;
    return copy;
  }

  bool isEmpty() const { return getKind() == Kind::Empty; }
  bool isInteger() const { return getKind() == Kind::Integer; }
  bool isReal() const { return getKind() == Kind::Real; }
  bool isText() const { return getKind() == Kind::Text; }
  bool isBits() const { return getKind() == Kind::Bits; }
  bool isPacked() const { return getKind() == Kind::Packed; }

  int64_t getInteger() const {
    assert(isInteger() && "not an integer payload");
    return std::get<int64_t>(payload);
  }
  double getReal() const {
    assert(isReal() && "not a real payload");
    return std::get<double>(payload);
  }
  const std::string &getText() const {
    assert(isText() && "not a text payload");
    return std::get<std::string>(payload);
  }
  const BitVector &getBits() const {
    assert(isBits() && "not a bit vector payload");
    return std::get<BitVector>(payload);
  }
  const PackedArray &getPacked() const {
    assert(isPacked() && "not a packed payload");
    return std::get<PackedArray>(payload);
  }

  /// Name of the payload kind, used in error messages.
  llvm::StringRef getKindName() const;

  bool operator==(const WriteValue &other) const {
    return action == other.action && payload == other.payload;
  }
  bool operator!=(const WriteValue &other) const { return !(*this == other); }

private:
  std::variant<std::monostate, int64_t, double, std::string, BitVector,
               PackedArray>
      payload;
  SetAction action = SetAction::Deposit;
};

} // namespace simproxy

#endif // SIMPROXY_VALUE_WRITEVALUE_H
