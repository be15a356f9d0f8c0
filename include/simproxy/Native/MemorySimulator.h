//===- MemorySimulator.h - In-memory elaborated design ----------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// MemorySimulator implements NativeSimInterface over an object database that
// is built programmatically: modules, signals, variables, parameters, value
// arrays and generate arrays. It keeps a driven value and an optional forced
// value per object so deposit/force/release behave as on a real simulator.
// It does not evaluate logic or advance time.
//
// Generate-array children are named the way the configured backend reports
// them:
//
//   GenerateNaming::Bracket      gen_blk[3]      (VPI)
//   GenerateNaming::Paren        gen_blk(3)      (FLI, VHPI on some tools)
//   GenerateNaming::Underscore   gen_blk__3      (VHPI on other tools)
//
//===----------------------------------------------------------------------===//

#ifndef SIMPROXY_NATIVE_MEMORYSIMULATOR_H
#define SIMPROXY_NATIVE_MEMORYSIMULATOR_H

#include "simproxy/Native/NativeInterface.h"
#include "llvm/ADT/DenseMap.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace simproxy {

/// How generate-array children are named.
enum class GenerateNaming : uint8_t { Bracket, Paren, Underscore };

/// The value state of one object. Only the field matching the object's type
/// is meaningful.
struct MemoryValue {
  std::string bits;
  int64_t integer = 0;
  double real = 0.0;
  std::string text;
};

/// One object in the database.
struct MemoryObject {
  uint32_t id = 0;
  ObjectType type = ObjectType::Unknown;
  std::string name;
  std::string fullName;
  bool isConst = false;
  std::optional<std::string> defName;
  std::optional<std::string> defFile;

  /// Bit width for registers and nets.
  uint32_t width = 0;

  /// Declared bounds for arrays.
  std::optional<IndexRange> range;

  /// Index within the parent array, for array elements.
  std::optional<int32_t> index;

  uint32_t parentId = 0;
  llvm::SmallVector<uint32_t, 8> children;
  llvm::SmallVector<uint32_t, 2> drivers;
  llvm::SmallVector<uint32_t, 2> loads;

  MemoryValue driven;
  std::optional<MemoryValue> forced;
};

class MemorySimulator : public NativeSimInterface {
public:
  MemorySimulator();
  ~MemorySimulator() override;

  //===--------------------------------------------------------------------===//
  // Design construction
  //===--------------------------------------------------------------------===//

  /// Add a module instance. A zero \p parent makes it a root.
  NativeHandle addModule(llvm::StringRef name, NativeHandle parent = 0,
                         llvm::StringRef defName = "",
                         llvm::StringRef defFile = "");

  /// Add a packed/unpacked structure, navigated like a scope.
  NativeHandle addStructure(llvm::StringRef name, NativeHandle parent);

  /// Add a register or net of \p width bits, initially all X.
  NativeHandle addSignal(llvm::StringRef name, NativeHandle parent,
                         uint32_t width,
                         ObjectType type = ObjectType::Register);

  NativeHandle addInteger(llvm::StringRef name, NativeHandle parent,
                          int64_t value = 0);
  NativeHandle addEnum(llvm::StringRef name, NativeHandle parent,
                       int64_t value = 0);
  NativeHandle addReal(llvm::StringRef name, NativeHandle parent,
                       double value = 0.0);
  NativeHandle addString(llvm::StringRef name, NativeHandle parent,
                         llvm::StringRef value = "");

  /// Add a constant of the given type. \p bits seeds vector-typed constants;
  /// \p integer, \p real and \p text seed the scalar kinds.
  NativeHandle addParameter(llvm::StringRef name, NativeHandle parent,
                            ObjectType type, llvm::StringRef bits = "",
                            int64_t integer = 0, double real = 0.0,
                            llvm::StringRef text = "");

  /// Add an object with an arbitrary type tag and no value.
  NativeHandle addObject(llvm::StringRef name, NativeHandle parent,
                         ObjectType type);

  /// Add a value array with declared bounds; each element is a signal of
  /// \p elementWidth bits named `name[i]`.
  NativeHandle addArray(llvm::StringRef name, NativeHandle parent,
                        IndexRange range, uint32_t elementWidth,
                        ObjectType elementType = ObjectType::Register);

  /// Add a generate array whose children are scopes named per \p naming.
  NativeHandle
  addGenerateArray(llvm::StringRef name, NativeHandle parent, IndexRange range,
                   GenerateNaming naming = GenerateNaming::Bracket);

  /// Remove the element at \p index from an array, leaving a hole.
  void removeArrayElement(NativeHandle array, int32_t index);

  void addDriver(NativeHandle signal, NativeHandle driver);
  void addLoad(NativeHandle signal, NativeHandle load);

  //===--------------------------------------------------------------------===//
  // Design-side value changes (bypass the override state)
  //===--------------------------------------------------------------------===//

  void driveBits(NativeHandle handle, llvm::StringRef bits);
  void driveInteger(NativeHandle handle, int64_t value);

  /// Whether a force or freeze is active on the object.
  bool isForced(NativeHandle handle) const;

  MemoryObject *findById(uint32_t id);
  const MemoryObject *findById(uint32_t id) const;

  //===--------------------------------------------------------------------===//
  // NativeSimInterface
  //===--------------------------------------------------------------------===//

  std::string getName(NativeHandle handle) override;
  ObjectType getType(NativeHandle handle) override;
  bool isConstant(NativeHandle handle) override;
  std::optional<std::string> getDefinitionName(NativeHandle handle) override;
  std::optional<std::string> getDefinitionFile(NativeHandle handle) override;

  NativeHandle getChildByName(NativeHandle parent,
                              llvm::StringRef name) override;
  NativeHandle getChildByIndex(NativeHandle parent, int32_t index) override;
  std::optional<IndexRange> getRange(NativeHandle handle) override;
  int32_t getNumElements(NativeHandle handle) override;
  std::vector<NativeHandle> iterate(NativeHandle handle,
                                    IterationMode mode) override;

  int64_t getValueLong(NativeHandle handle) override;
  double getValueReal(NativeHandle handle) override;
  std::string getValueString(NativeHandle handle) override;
  std::string getValueBinStr(NativeHandle handle) override;

  void setValueLong(NativeHandle handle, NativeAction action,
                    int64_t value) override;
  void setValueReal(NativeHandle handle, NativeAction action,
                    double value) override;
  void setValueString(NativeHandle handle, NativeAction action,
                      llvm::StringRef value) override;
  void setValueBinStr(NativeHandle handle, NativeAction action,
                      llvm::StringRef value) override;

  //===--------------------------------------------------------------------===//
  // Statistics
  //===--------------------------------------------------------------------===//

  struct Statistics {
    size_t objectsCreated = 0;
    size_t nameLookups = 0;
    size_t indexLookups = 0;
    size_t iterations = 0;
    size_t valueReads = 0;
    size_t valueWrites = 0;
  };

  const Statistics &getStatistics() const { return stats; }
  void resetStatistics() { stats = Statistics(); }

private:
  uint32_t nextObjectId() { return nextObjId++; }

  /// Create an object and link it under \p parentId.
  MemoryObject &createObject(llvm::StringRef name, uint32_t parentId,
                             ObjectType type);

  /// The value a read observes: forced if a force is active, else driven.
  const MemoryValue &effectiveValue(const MemoryObject &obj) const;

  /// Apply \p update to the driven or forced value according to \p action.
  template <typename UpdateFn>
  void applyWrite(NativeHandle handle, NativeAction action, UpdateFn update);

  /// Fit a binary string to \p width bits: pad with zeros on the left or drop
  /// the excess most significant bits.
  static std::string resizeBits(llvm::StringRef bits, uint32_t width);

  static std::string integerToBits(int64_t value, uint32_t width);

  llvm::DenseMap<uint32_t, std::unique_ptr<MemoryObject>> objects;

  /// Root module IDs.
  llvm::SmallVector<uint32_t, 4> rootModules;

  uint32_t nextObjId = 1;

  Statistics stats;
};

} // namespace simproxy

#endif // SIMPROXY_NATIVE_MEMORYSIMULATOR_H
