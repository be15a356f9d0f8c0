//===- SimHandle.h - Proxy objects for simulator handles --------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the proxy objects that mirror an elaborated design. Each
// native handle is represented by exactly one proxy, created and owned by the
// HandleFactory. The classes form this tree:
//
//   SimHandleBase
//   +- RegionObject              named or indexed children, no value
//   |  +- HierarchyObject        modules, structures
//   |  +- HierarchyArrayObject   generate arrays
//   +- NonHierarchyObject        value-bearing objects
//      +- ConstantObject         parameters, value captured once
//      +- ArrayObject            value arrays with a declared range
//         +- NonConstantObject   drivers/loads
//            +- ModifiableObject registers and nets (bit vectors)
//               +- RealObject
//               +- EnumObject
//               +- IntegerObject
//               +- StringObject
//
// Use llvm::isa / llvm::dyn_cast to select the variant.
//
//===----------------------------------------------------------------------===//

#ifndef SIMPROXY_HANDLE_SIMHANDLE_H
#define SIMPROXY_HANDLE_SIMHANDLE_H

#include "simproxy/Native/NativeInterface.h"
#include "simproxy/Support/ProxyError.h"
#include "simproxy/Value/SimValue.h"
#include "simproxy/Value/WriteValue.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/MapVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Casting.h"
#include "llvm/Support/Error.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace simproxy {

class HandleFactory;
class ProxyConfig;

//===----------------------------------------------------------------------===//
// SimHandleBase
//===----------------------------------------------------------------------===//

/// Base class for all simulation objects.
class SimHandleBase {
public:
  /// Discriminator for LLVM-style RTTI. Ranges of kinds correspond to the
  /// abstract classes above.
  enum class HandleKind : uint8_t {
    Hierarchy,
    HierarchyArray,
    Constant,
    Array,
    Modifiable,
    Real,
    Enum,
    Integer,
    String,
  };

  /// Key under which a container caches a child: a local name or an index.
  using SubHandleKey = std::variant<std::string, int32_t>;

  SimHandleBase(const SimHandleBase &) = delete;
  SimHandleBase &operator=(const SimHandleBase &) = delete;
  virtual ~SimHandleBase();

  HandleKind getKind() const { return kind; }
  NativeHandle getHandle() const { return handle; }

  /// Local name as reported by the simulator.
  llvm::StringRef getName() const { return name; }

  /// Simulator type name.
  llvm::StringRef getTypeString() const { return typeString; }

  /// `name(type)`, used in diagnostics.
  llvm::StringRef getFullName() const { return fullName; }

  /// Hierarchical path used to reach this object, e.g. `top.u_core.regs[3]`.
  /// Diagnostic only; identity is the handle.
  llvm::StringRef getPath() const { return path; }

  const std::optional<std::string> &getDefinitionName() const {
    return defName;
  }
  const std::optional<std::string> &getDefinitionFile() const {
    return defFile;
  }

  /// For vectors the number of bits, for containers the number of elements.
  virtual size_t getLength();

  /// `ClassName(path with definition D (at F))`.
  std::string getDescription() const;

  /// Name of the proxy class, e.g. "HierarchyObject".
  llvm::StringRef getClassName() const;

  /// Read the current value. Fails with NotReadable on objects that carry
  /// no scalar value.
  virtual llvm::Expected<SimValue> getValue();

  /// Deferred write: hand the value to the write scheduler, to be applied at
  /// the end of the current time step.
  virtual llvm::Error setValue(const WriteValue &value);

  /// Write the value to the simulator now.
  virtual llvm::Error setImmediateValue(const WriteValue &value);

  bool operator==(const SimHandleBase &other) const {
    return handle == other.handle;
  }
  bool operator!=(const SimHandleBase &other) const {
    return handle != other.handle;
  }

protected:
  SimHandleBase(HandleKind kind, HandleFactory &factory, NativeHandle handle,
                std::optional<llvm::StringRef> path);

  NativeSimInterface &getNative() const;
  const ProxyConfig &getConfig() const;

  /// Resolve the child at \p index through the native layer, caching it.
  /// Shared by every indexable proxy.
  llvm::Expected<SimHandleBase *> getIndexedChild(int32_t index);

  /// Print a warning unless warnings are disabled in the configuration.
  void warn(const llvm::Twine &message) const;

  /// Consume \p err, tracing it as the reason \p what was skipped.
  static void logSkipped(const llvm::Twine &what, llvm::Error err);

  HandleFactory &factory;
  const HandleKind kind;
  const NativeHandle handle;
  std::string name;
  std::string typeString;
  std::string fullName;
  std::string path;
  std::optional<std::string> defName;
  std::optional<std::string> defFile;
  std::optional<size_t> length;

  /// Child resolution cache. Entries are never evicted.
  llvm::MapVector<std::string, SimHandleBase *, llvm::StringMap<unsigned>>
      subHandles;
  std::map<int32_t, SimHandleBase *> indexedSubHandles;

  /// Names known not to exist.
  llvm::StringSet<> invalidSubHandles;
};

//===----------------------------------------------------------------------===//
// RegionObject
//===----------------------------------------------------------------------===//

/// A region object, such as a scope or namespace. Regions have no value.
class RegionObject : public SimHandleBase {
public:
  /// Discover every child through the native iterator. Runs once; the
  /// hierarchy is static after elaboration. Children whose native type has
  /// no proxy mapping are skipped.
  void discoverAll();

  bool isDiscovered() const { return discovered; }

  /// All children, after discovery. Generate-array children are flattened
  /// into their elements.
  std::vector<SimHandleBase *> children();

  /// The keys of all discovered children.
  std::vector<std::string> getChildNames();

  static bool classof(const SimHandleBase *obj) {
    return obj->getKind() == HandleKind::Hierarchy ||
           obj->getKind() == HandleKind::HierarchyArray;
  }

protected:
  using SimHandleBase::SimHandleBase;

  /// Path of the child whose native name is \p childName.
  virtual std::string getChildPath(llvm::StringRef childName);

  /// Translate a native child name into the key used in the child cache.
  /// Returns std::nullopt if the name cannot be translated.
  virtual std::optional<SubHandleKey>
  getSubHandleKey(llvm::StringRef childName);

  bool discovered = false;
};

//===----------------------------------------------------------------------===//
// HierarchyObject
//===----------------------------------------------------------------------===//

/// Modules, instances and structures.
class HierarchyObject : public RegionObject {
public:
  HierarchyObject(HandleFactory &factory, NativeHandle handle,
                  std::optional<llvm::StringRef> path);

  /// Child called \p name. Fails with NoSuchChild if the design has no such
  /// object; the miss is remembered and not queried again.
  llvm::Expected<SimHandleBase *> getChild(llvm::StringRef name);

  /// Like getChild, but returns nullptr for a missing child instead of
  /// failing. Other errors still propagate.
  llvm::Expected<SimHandleBase *> hasChild(llvm::StringRef name);

  /// Child with an extended (escaped) identifier, looked up as `\name\`.
  llvm::Expected<SimHandleBase *> getExtendedChild(llvm::StringRef name);

  /// Deferred write to the existing child \p name. New names cannot be
  /// created.
  llvm::Error setChild(llvm::StringRef name, const WriteValue &value);

  static bool classof(const SimHandleBase *obj) {
    return obj->getKind() == HandleKind::Hierarchy;
  }
};

//===----------------------------------------------------------------------===//
// HierarchyArrayObject
//===----------------------------------------------------------------------===//

/// Generate arrays: containers of HierarchyObjects addressed by index.
class HierarchyArrayObject : public RegionObject {
public:
  HierarchyArrayObject(HandleFactory &factory, NativeHandle handle,
                       std::optional<llvm::StringRef> path);

  /// Number of generate blocks; triggers discovery.
  size_t getLength() override;

  /// Block at declared index \p index.
  llvm::Expected<SimHandleBase *> getIndex(int32_t index);

  /// Slices are not supported; always fails with UnsupportedIndex.
  llvm::Expected<SimHandleBase *> getSlice(int32_t left, int32_t right);

  /// Generate blocks are not assignable; always fails with ReadOnlyIndex.
  llvm::Error setIndex(int32_t index, const WriteValue &value);

  /// Blocks from the lowest to the highest discovered index (or across the
  /// declared range when the simulator reports one). Missing indices are
  /// reported as warnings and skipped.
  std::vector<SimHandleBase *> getElementsInRange();

  static bool classof(const SimHandleBase *obj) {
    return obj->getKind() == HandleKind::HierarchyArray;
  }

protected:
  std::string getChildPath(llvm::StringRef childName) override;
  std::optional<SubHandleKey>
  getSubHandleKey(llvm::StringRef childName) override;

private:
  std::optional<int32_t> matchIndex(llvm::StringRef childName) const;
};

//===----------------------------------------------------------------------===//
// NonHierarchyObject
//===----------------------------------------------------------------------===//

/// Common base class for all non-hierarchy objects.
class NonHierarchyObject : public SimHandleBase {
public:
  static bool classof(const SimHandleBase *obj) {
    return obj->getKind() >= HandleKind::Constant &&
           obj->getKind() <= HandleKind::String;
  }

protected:
  using SimHandleBase::SimHandleBase;
};

//===----------------------------------------------------------------------===//
// ConstantObject
//===----------------------------------------------------------------------===//

/// An object whose value can be read but not set. The value is fixed at
/// elaboration, so it is read once on construction.
class ConstantObject : public NonHierarchyObject {
public:
  ConstantObject(HandleFactory &factory, NativeHandle handle,
                 std::optional<llvm::StringRef> path, ObjectType type);

  llvm::Expected<SimValue> getValue() override;

  /// Always fails with ReadOnlyValue.
  llvm::Error setValue(const WriteValue &value) override;
  llvm::Error setImmediateValue(const WriteValue &value) override;

  const SimValue &getSnapshot() const { return snapshot; }

  std::optional<int64_t> toInteger() const { return snapshot.toInteger(); }
  std::optional<double> toDouble() const { return snapshot.toDouble(); }

  static bool classof(const SimHandleBase *obj) {
    return obj->getKind() == HandleKind::Constant;
  }

private:
  static SimValue readSnapshot(NativeSimInterface &native, NativeHandle handle,
                               ObjectType type);

  const SimValue snapshot;
};

//===----------------------------------------------------------------------===//
// ArrayObject
//===----------------------------------------------------------------------===//

/// A non-hierarchy indexable object. Element order follows the declared
/// range: for `arr[7:4]` the first element is `arr[7]`, for `arr[4:7]` it is
/// `arr[4]`.
class ArrayObject : public NonHierarchyObject {
public:
  ArrayObject(HandleFactory &factory, NativeHandle handle,
              std::optional<llvm::StringRef> path);

  const std::optional<IndexRange> &getRange() const { return range; }

  /// Element count of the declared range; the native element count if the
  /// object has no range.
  size_t getLength() override;

  llvm::Expected<SimHandleBase *> getIndex(int32_t index);

  /// Slices are not supported; always fails with UnsupportedIndex.
  llvm::Expected<SimHandleBase *> getSlice(int32_t left, int32_t right);

  /// Deferred write of \p value to the element at \p index.
  llvm::Error setIndex(int32_t index, const WriteValue &value);

  /// Elements in declared order. Indices the simulator cannot resolve are
  /// skipped.
  std::vector<SimHandleBase *> elements();

  /// Values of all elements in declared order.
  llvm::Expected<std::vector<SimValue>> getAll();

  /// Deferred write of \p values; position 0 goes to the left index. The
  /// length must match the range; nothing is written on failure.
  llvm::Error setAll(llvm::ArrayRef<WriteValue> values);

  /// Like setAll, but writes immediately.
  llvm::Error setAllImmediate(llvm::ArrayRef<WriteValue> values);

  static bool classof(const SimHandleBase *obj) {
    return obj->getKind() >= HandleKind::Array &&
           obj->getKind() <= HandleKind::String;
  }

protected:
  ArrayObject(HandleKind kind, HandleFactory &factory, NativeHandle handle,
              std::optional<llvm::StringRef> path);

private:
  /// Resolve every element of the range up front for a bulk write.
  llvm::Expected<std::vector<SimHandleBase *>>
  resolveForBulkWrite(size_t count);

  std::optional<IndexRange> range;
};

//===----------------------------------------------------------------------===//
// NonConstantObject
//===----------------------------------------------------------------------===//

/// A value object that is driven by the design and may have drivers and
/// loads.
class NonConstantObject : public ArrayObject {
public:
  /// Objects driving this one. Drivers of an unmapped native type are
  /// skipped.
  std::vector<SimHandleBase *> getDrivers();

  /// Objects reading this one.
  std::vector<SimHandleBase *> getLoads();

  static bool classof(const SimHandleBase *obj) {
    return obj->getKind() >= HandleKind::Modifiable &&
           obj->getKind() <= HandleKind::String;
  }

protected:
  using ArrayObject::ArrayObject;

private:
  std::vector<SimHandleBase *> resolveAll(IterationMode mode);
};

//===----------------------------------------------------------------------===//
// ModifiableObject
//===----------------------------------------------------------------------===//

/// Base class for simulator objects whose values can be modified. Registers
/// and nets read as bit vectors.
class ModifiableObject : public NonConstantObject {
public:
  ModifiableObject(HandleFactory &factory, NativeHandle handle,
                   std::optional<llvm::StringRef> path);

  llvm::Expected<SimValue> getValue() override;

  /// Hand the raw value to the write scheduler. It is encoded when the
  /// scheduler applies it.
  llvm::Error setValue(const WriteValue &value) override;

  /// Unwrap the override action, then encode and write the value now.
  llvm::Error setImmediateValue(const WriteValue &value) override;

  /// Integer view of the current value.
  llvm::Expected<int64_t> toInteger();

  static bool classof(const SimHandleBase *obj) {
    return NonConstantObject::classof(obj);
  }

protected:
  ModifiableObject(HandleKind kind, HandleFactory &factory,
                   NativeHandle handle, std::optional<llvm::StringRef> path);

  /// Turn \p value into the payload and native action to write. Freeze reads
  /// the current value; release writes a neutral zero.
  llvm::Expected<std::pair<WriteValue, NativeAction>>
  resolveSetAction(const WriteValue &value);

  /// Encode \p payload for this object's native kind and write it.
  virtual llvm::Error writeEncoded(const WriteValue &payload,
                                   NativeAction action);

  /// The UnsupportedAssignment error for \p payload, also logged.
  llvm::Error unsupportedAssignment(const WriteValue &payload,
                                    llvm::StringRef expected) const;
};

//===----------------------------------------------------------------------===//
// RealObject
//===----------------------------------------------------------------------===//

/// Real-valued signals and variables.
class RealObject : public ModifiableObject {
public:
  RealObject(HandleFactory &factory, NativeHandle handle,
             std::optional<llvm::StringRef> path);

  llvm::Expected<SimValue> getValue() override;

  llvm::Expected<double> toDouble();

  static bool classof(const SimHandleBase *obj) {
    return obj->getKind() == HandleKind::Real;
  }

protected:
  llvm::Error writeEncoded(const WriteValue &payload,
                           NativeAction action) override;
};

//===----------------------------------------------------------------------===//
// EnumObject / IntegerObject
//===----------------------------------------------------------------------===//

/// Enumeration signals and variables, read and written as integers.
class EnumObject : public ModifiableObject {
public:
  EnumObject(HandleFactory &factory, NativeHandle handle,
             std::optional<llvm::StringRef> path);

  llvm::Expected<SimValue> getValue() override;

  static bool classof(const SimHandleBase *obj) {
    return obj->getKind() == HandleKind::Enum;
  }

protected:
  llvm::Error writeEncoded(const WriteValue &payload,
                           NativeAction action) override;
};

/// Integer signals and variables.
class IntegerObject : public ModifiableObject {
public:
  IntegerObject(HandleFactory &factory, NativeHandle handle,
                std::optional<llvm::StringRef> path);

  llvm::Expected<SimValue> getValue() override;

  static bool classof(const SimHandleBase *obj) {
    return obj->getKind() == HandleKind::Integer;
  }

protected:
  llvm::Error writeEncoded(const WriteValue &payload,
                           NativeAction action) override;
};

//===----------------------------------------------------------------------===//
// StringObject
//===----------------------------------------------------------------------===//

/// String variables.
class StringObject : public ModifiableObject {
public:
  StringObject(HandleFactory &factory, NativeHandle handle,
               std::optional<llvm::StringRef> path);

  llvm::Expected<SimValue> getValue() override;

  static bool classof(const SimHandleBase *obj) {
    return obj->getKind() == HandleKind::String;
  }

protected:
  llvm::Error writeEncoded(const WriteValue &payload,
                           NativeAction action) override;
};

} // namespace simproxy

#endif // SIMPROXY_HANDLE_SIMHANDLE_H
