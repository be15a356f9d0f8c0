//===- NativeInterface.cpp - Simulator access consumed by proxies ---------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "simproxy/Native/NativeInterface.h"

using namespace simproxy;

NativeSimInterface::~NativeSimInterface() = default;

llvm::StringRef simproxy::stringifyObjectType(ObjectType type) {
  switch (type) {
  case ObjectType::Unknown:
    return "GPI_UNKNOWN";
  case ObjectType::Memory:
    return "GPI_MEMORY";
  case ObjectType::Module:
    return "GPI_MODULE";
  case ObjectType::Net:
    return "GPI_NET";
  case ObjectType::Parameter:
    return "GPI_PARAMETER";
  case ObjectType::Register:
    return "GPI_REGISTER";
  case ObjectType::NetArray:
    return "GPI_ARRAY";
  case ObjectType::Enum:
    return "GPI_ENUM";
  case ObjectType::Structure:
    return "GPI_STRUCTURE";
  case ObjectType::Real:
    return "GPI_REAL";
  case ObjectType::Integer:
    return "GPI_INTEGER";
  case ObjectType::String:
    return "GPI_STRING";
  case ObjectType::GenArray:
    return "GPI_GENARRAY";
  }
  return "GPI_UNKNOWN";
}
