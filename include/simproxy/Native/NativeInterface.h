//===- NativeInterface.h - Simulator access consumed by proxies -*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file declares the interface through which the proxy layer talks to a
// simulator: opaque handles, metadata queries, child lookup and iteration,
// and value access in several encodings. A simulator adapter (VPI, VHPI, FLI)
// or the in-memory MemorySimulator implements it.
//
//===----------------------------------------------------------------------===//

#ifndef SIMPROXY_NATIVE_NATIVEINTERFACE_H
#define SIMPROXY_NATIVE_NATIVEINTERFACE_H

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace simproxy {

/// Opaque native object identifier. Zero means "no object".
using NativeHandle = uintptr_t;

//===----------------------------------------------------------------------===//
// ObjectType - Native type tags
//===----------------------------------------------------------------------===//

/// Type tags reported by the simulator for each object.
enum class ObjectType : int32_t {
  Unknown = 0,
  Memory = 1,
  Module = 2,
  Net = 3,
  Parameter = 4,
  Register = 5,
  NetArray = 6,
  Enum = 7,
  Structure = 8,
  Real = 9,
  Integer = 10,
  String = 11,
  GenArray = 12,
};

/// Returns the tag name, e.g. "GPI_MODULE".
llvm::StringRef stringifyObjectType(ObjectType type);

/// Objects that are navigated rather than read.
inline bool isHierarchyOrArrayType(ObjectType type) {
  return type == ObjectType::Module || type == ObjectType::Structure ||
         type == ObjectType::NetArray || type == ObjectType::GenArray;
}

/// What to enumerate with NativeSimInterface::iterate.
enum class IterationMode : uint8_t { Objects = 0, Drivers = 1, Loads = 2 };

/// Action codes understood by the native write accessors.
enum class NativeAction : int32_t { Deposit = 0, Force = 1, Release = 2 };

//===----------------------------------------------------------------------===//
// IndexRange - Declared array bounds
//===----------------------------------------------------------------------===//

/// Declared (left, right) bounds of an array. `[7:0]` is descending, `[0:7]`
/// ascending.
struct IndexRange {
  int32_t left = 0;
  int32_t right = 0;

  bool isDescending() const { return left > right; }

  /// Number of indices covered.
  size_t size() const {
    return static_cast<size_t>(std::abs(static_cast<int64_t>(left) - right)) +
           1;
  }

  /// Indices from left to right in declared direction.
  llvm::SmallVector<int32_t, 16> getIndices() const {
    llvm::SmallVector<int32_t, 16> indices;
    indices.reserve(size());
    int32_t step = isDescending() ? -1 : 1;
    for (int64_t i = left;; i += step) {
      indices.push_back(static_cast<int32_t>(i));
      if (i == right)
        break;
    }
    return indices;
  }

  bool contains(int32_t index) const {
    return isDescending() ? (index <= left && index >= right)
                          : (index >= left && index <= right);
  }

  bool operator==(const IndexRange &other) const {
    return left == other.left && right == other.right;
  }
};

//===----------------------------------------------------------------------===//
// NativeSimInterface
//===----------------------------------------------------------------------===//

/// The primitive operations the proxy layer needs from a simulator. All
/// methods run synchronously in the simulator's callback context.
class NativeSimInterface {
public:
  virtual ~NativeSimInterface();

  //===--------------------------------------------------------------------===//
  // Metadata
  //===--------------------------------------------------------------------===//

  virtual std::string getName(NativeHandle handle) = 0;
  virtual ObjectType getType(NativeHandle handle) = 0;
  virtual bool isConstant(NativeHandle handle) = 0;

  /// Name of the defining module/entity, absent for non-instantiated types.
  virtual std::optional<std::string> getDefinitionName(NativeHandle handle) = 0;

  /// File the definition came from, if known.
  virtual std::optional<std::string> getDefinitionFile(NativeHandle handle) = 0;

  /// Human-readable type name; defaults to the tag name.
  virtual std::string getTypeString(NativeHandle handle) {
    return stringifyObjectType(getType(handle)).str();
  }

  //===--------------------------------------------------------------------===//
  // Navigation
  //===--------------------------------------------------------------------===//

  /// Child of \p parent called \p name, or 0.
  virtual NativeHandle getChildByName(NativeHandle parent,
                                      llvm::StringRef name) = 0;

  /// Child of \p parent at declared index \p index, or 0.
  virtual NativeHandle getChildByIndex(NativeHandle parent, int32_t index) = 0;

  /// Declared bounds, absent if the object is not indexable.
  virtual std::optional<IndexRange> getRange(NativeHandle handle) = 0;

  /// Bit width for vectors, element count for arrays.
  virtual int32_t getNumElements(NativeHandle handle) = 0;

  virtual std::vector<NativeHandle> iterate(NativeHandle handle,
                                            IterationMode mode) = 0;

  //===--------------------------------------------------------------------===//
  // Values
  //===--------------------------------------------------------------------===//

  virtual int64_t getValueLong(NativeHandle handle) = 0;
  virtual double getValueReal(NativeHandle handle) = 0;
  virtual std::string getValueString(NativeHandle handle) = 0;

  /// Value as a binary string, most significant bit first.
  virtual std::string getValueBinStr(NativeHandle handle) = 0;

  virtual void setValueLong(NativeHandle handle, NativeAction action,
                            int64_t value) = 0;
  virtual void setValueReal(NativeHandle handle, NativeAction action,
                            double value) = 0;
  virtual void setValueString(NativeHandle handle, NativeAction action,
                              llvm::StringRef value) = 0;
  virtual void setValueBinStr(NativeHandle handle, NativeAction action,
                              llvm::StringRef value) = 0;
};

} // namespace simproxy

#endif // SIMPROXY_NATIVE_NATIVEINTERFACE_H
