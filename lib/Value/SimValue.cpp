//===- SimValue.cpp - Snapshot of a simulator object's value --------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "simproxy/Value/SimValue.h"
#include "llvm/Support/Format.h"

using namespace simproxy;

std::optional<int64_t> SimValue::toInteger() const {
  switch (getKind()) {
  case Kind::Integer:
    return getInteger();
  case Kind::Bits:
    if (auto value = getBits().toUnsigned())
      return static_cast<int64_t>(*value);
    return std::nullopt;
  case Kind::Real:
  case Kind::Text:
    return std::nullopt;
  }
  return std::nullopt;
}

std::optional<double> SimValue::toDouble() const {
  if (isReal())
    return getReal();
  if (auto value = toInteger())
    return static_cast<double>(*value);
  return std::nullopt;
}

std::string SimValue::toString() const {
  switch (getKind()) {
  case Kind::Integer:
    return std::to_string(getInteger());
  case Kind::Real: {
    std::string result;
    llvm::raw_string_ostream os(result);
    os << llvm::format("%g", getReal());
    return os.str();
  }
  case Kind::Text:
    return getText();
  case Kind::Bits:
    return getBits().toBinaryString();
  }
  return "";
}
