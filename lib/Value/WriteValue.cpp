//===- WriteValue.cpp - Values and override actions for writes ------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "simproxy/Value/WriteValue.h"

using namespace simproxy;

llvm::StringRef simproxy::stringifySetAction(SetAction action) {
  switch (action) {
  case SetAction::Deposit:
    return "deposit";
  case SetAction::Force:
    return "force";
  case SetAction::Freeze:
    return "freeze";
  case SetAction::Release:
    return "release";
  }
  return "unknown";
}

WriteValue WriteValue::fromSimValue(const SimValue &value) {
  switch (value.getKind()) {
  case SimValue::Kind::Integer:
    return WriteValue(value.getInteger());
  case SimValue::Kind::Real:
    return WriteValue(value.getReal());
  case SimValue::Kind::Text:
    return WriteValue(value.getText());
  case SimValue::Kind::Bits:
    return WriteValue(value.getBits());
  }
  return WriteValue();
}

llvm::StringRef WriteValue::getKindName() const {
  switch (getKind()) {
  case Kind::Empty:
    return "empty";
  case Kind::Integer:
    return "integer";
  case Kind::Real:
    return "real";
  case Kind::Text:
    return "string";
  case Kind::Bits:
    return "bit vector";
  case Kind::Packed:
    return "packed array";
  }
  return "unknown";
}
