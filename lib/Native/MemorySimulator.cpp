//===- MemorySimulator.cpp - In-memory elaborated design ------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Object bookkeeping follows the VPI runtime: every object gets a numeric ID
// that doubles as its handle, children are kept as ID lists, and lookups walk
// those lists.
//
//===----------------------------------------------------------------------===//

#include "simproxy/Native/MemorySimulator.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "simproxy-memsim"

using namespace simproxy;

static bool isVectorType(ObjectType type) {
  return type == ObjectType::Register || type == ObjectType::Net ||
         type == ObjectType::Parameter || type == ObjectType::Memory;
}

static bool isIntegerType(ObjectType type) {
  return type == ObjectType::Integer || type == ObjectType::Enum;
}

MemorySimulator::MemorySimulator() = default;
MemorySimulator::~MemorySimulator() = default;

//===----------------------------------------------------------------------===//
// Object Management
//===----------------------------------------------------------------------===//

MemoryObject *MemorySimulator::findById(uint32_t id) {
  auto it = objects.find(id);
  if (it == objects.end())
    return nullptr;
  return it->second.get();
}

const MemoryObject *MemorySimulator::findById(uint32_t id) const {
  auto it = objects.find(id);
  if (it == objects.end())
    return nullptr;
  return it->second.get();
}

MemoryObject &MemorySimulator::createObject(llvm::StringRef name,
                                            uint32_t parentId,
                                            ObjectType type) {
  uint32_t id = nextObjectId();
  auto obj = std::make_unique<MemoryObject>();
  obj->id = id;
  obj->type = type;
  obj->name = name.str();
  obj->parentId = parentId;
  if (auto *parent = findById(parentId)) {
    obj->fullName = parent->fullName + "." + name.str();
    parent->children.push_back(id);
  } else {
    obj->fullName = name.str();
    rootModules.push_back(id);
  }
  stats.objectsCreated++;
  LLVM_DEBUG(llvm::dbgs() << "MemorySimulator: Created " << obj->fullName
                          << " (" << stringifyObjectType(type) << ", id "
                          << id << ")\n");
  auto &ref = *obj;
  objects[id] = std::move(obj);
  return ref;
}

NativeHandle MemorySimulator::addModule(llvm::StringRef name,
                                        NativeHandle parent,
                                        llvm::StringRef defName,
                                        llvm::StringRef defFile) {
  auto &obj = createObject(name, parent, ObjectType::Module);
  if (!defName.empty())
    obj.defName = defName.str();
  if (!defFile.empty())
    obj.defFile = defFile.str();
  return obj.id;
}

NativeHandle MemorySimulator::addStructure(llvm::StringRef name,
                                           NativeHandle parent) {
  return createObject(name, parent, ObjectType::Structure).id;
}

NativeHandle MemorySimulator::addSignal(llvm::StringRef name,
                                        NativeHandle parent, uint32_t width,
                                        ObjectType type) {
  auto &obj = createObject(name, parent, type);
  obj.width = width ? width : 1;
  obj.driven.bits.assign(obj.width, 'x');
  return obj.id;
}

NativeHandle MemorySimulator::addInteger(llvm::StringRef name,
                                         NativeHandle parent, int64_t value) {
  auto &obj = createObject(name, parent, ObjectType::Integer);
  obj.width = 32;
  obj.driven.integer = value;
  return obj.id;
}

NativeHandle MemorySimulator::addEnum(llvm::StringRef name,
                                      NativeHandle parent, int64_t value) {
  auto &obj = createObject(name, parent, ObjectType::Enum);
  obj.width = 32;
  obj.driven.integer = value;
  return obj.id;
}

NativeHandle MemorySimulator::addReal(llvm::StringRef name,
                                      NativeHandle parent, double value) {
  auto &obj = createObject(name, parent, ObjectType::Real);
  obj.width = 64;
  obj.driven.real = value;
  return obj.id;
}

NativeHandle MemorySimulator::addString(llvm::StringRef name,
                                        NativeHandle parent,
                                        llvm::StringRef value) {
  auto &obj = createObject(name, parent, ObjectType::String);
  obj.driven.text = value.str();
  obj.width = value.size();
  return obj.id;
}

NativeHandle MemorySimulator::addParameter(llvm::StringRef name,
                                           NativeHandle parent,
                                           ObjectType type,
                                           llvm::StringRef bits,
                                           int64_t integer, double real,
                                           llvm::StringRef text) {
  auto &obj = createObject(name, parent, type);
  obj.isConst = true;
  obj.driven.bits = bits.str();
  obj.driven.integer = integer;
  obj.driven.real = real;
  obj.driven.text = text.str();
  obj.width = isVectorType(type) ? bits.size() : 32;
  return obj.id;
}

NativeHandle MemorySimulator::addObject(llvm::StringRef name,
                                        NativeHandle parent,
                                        ObjectType type) {
  return createObject(name, parent, type).id;
}

NativeHandle MemorySimulator::addArray(llvm::StringRef name,
                                       NativeHandle parent, IndexRange range,
                                       uint32_t elementWidth,
                                       ObjectType elementType) {
  auto &array = createObject(name, parent, ObjectType::NetArray);
  array.range = range;
  uint32_t arrayId = array.id;
  for (int32_t index : range.getIndices()) {
    std::string elementName = name.str() + "[" + std::to_string(index) + "]";
    NativeHandle element =
        addSignal(elementName, arrayId, elementWidth, elementType);
    findById(element)->index = index;
  }
  return arrayId;
}

NativeHandle MemorySimulator::addGenerateArray(llvm::StringRef name,
                                               NativeHandle parent,
                                               IndexRange range,
                                               GenerateNaming naming) {
  auto &array = createObject(name, parent, ObjectType::GenArray);
  array.range = range;
  uint32_t arrayId = array.id;
  for (int32_t index : range.getIndices()) {
    std::string indexStr = std::to_string(index);
    std::string childName;
    switch (naming) {
    case GenerateNaming::Bracket:
      childName = name.str() + "[" + indexStr + "]";
      break;
    case GenerateNaming::Paren:
      childName = name.str() + "(" + indexStr + ")";
      break;
    case GenerateNaming::Underscore:
      childName = name.str() + "__" + indexStr;
      break;
    }
    auto &child = createObject(childName, arrayId, ObjectType::Module);
    child.index = index;
  }
  return arrayId;
}

void MemorySimulator::removeArrayElement(NativeHandle arrayHandle,
                                         int32_t index) {
  auto *array = findById(arrayHandle);
  if (!array)
    return;
  llvm::erase_if(array->children, [&](uint32_t childId) {
    auto *child = findById(childId);
    return child && child->index && *child->index == index;
  });
}

void MemorySimulator::addDriver(NativeHandle signal, NativeHandle driver) {
  if (auto *obj = findById(signal))
    obj->drivers.push_back(driver);
}

void MemorySimulator::addLoad(NativeHandle signal, NativeHandle load) {
  if (auto *obj = findById(signal))
    obj->loads.push_back(load);
}

void MemorySimulator::driveBits(NativeHandle handle, llvm::StringRef bits) {
  if (auto *obj = findById(handle))
    obj->driven.bits = resizeBits(bits, obj->width);
}

void MemorySimulator::driveInteger(NativeHandle handle, int64_t value) {
  auto *obj = findById(handle);
  if (!obj)
    return;
  if (isVectorType(obj->type))
    obj->driven.bits = integerToBits(value, obj->width);
  else
    obj->driven.integer = value;
}

bool MemorySimulator::isForced(NativeHandle handle) const {
  auto *obj = findById(handle);
  return obj && obj->forced.has_value();
}

const MemoryValue &
MemorySimulator::effectiveValue(const MemoryObject &obj) const {
  return obj.forced ? *obj.forced : obj.driven;
}

std::string MemorySimulator::resizeBits(llvm::StringRef bits, uint32_t width) {
  if (bits.size() >= width)
    return bits.take_back(width).str();
  return std::string(width - bits.size(), '0') + bits.str();
}

std::string MemorySimulator::integerToBits(int64_t value, uint32_t width) {
  std::string bits;
  bits.reserve(width);
  for (uint32_t i = width; i > 0; --i) {
    uint32_t bit = i - 1;
    bool set = bit < 64 ? (static_cast<uint64_t>(value) >> bit) & 1
                        : value < 0;
    bits.push_back(set ? '1' : '0');
  }
  return bits;
}

//===----------------------------------------------------------------------===//
// Metadata
//===----------------------------------------------------------------------===//

std::string MemorySimulator::getName(NativeHandle handle) {
  auto *obj = findById(handle);
  return obj ? obj->name : "";
}

ObjectType MemorySimulator::getType(NativeHandle handle) {
  auto *obj = findById(handle);
  return obj ? obj->type : ObjectType::Unknown;
}

bool MemorySimulator::isConstant(NativeHandle handle) {
  auto *obj = findById(handle);
  return obj && obj->isConst;
}

std::optional<std::string>
MemorySimulator::getDefinitionName(NativeHandle handle) {
  auto *obj = findById(handle);
  return obj ? obj->defName : std::nullopt;
}

std::optional<std::string>
MemorySimulator::getDefinitionFile(NativeHandle handle) {
  auto *obj = findById(handle);
  return obj ? obj->defFile : std::nullopt;
}

//===----------------------------------------------------------------------===//
// Navigation
//===----------------------------------------------------------------------===//

NativeHandle MemorySimulator::getChildByName(NativeHandle parent,
                                             llvm::StringRef name) {
  stats.nameLookups++;
  if (name.empty())
    return 0;

  if (parent == 0) {
    for (uint32_t rootId : rootModules)
      if (findById(rootId)->name == name)
        return rootId;
    return 0;
  }

  auto *obj = findById(parent);
  if (!obj)
    return 0;
  for (uint32_t childId : obj->children) {
    auto *child = findById(childId);
    if (child && child->name == name)
      return childId;
  }
  return 0;
}

NativeHandle MemorySimulator::getChildByIndex(NativeHandle parent,
                                              int32_t index) {
  stats.indexLookups++;
  auto *obj = findById(parent);
  if (!obj || !obj->range)
    return 0;

  // Arrays are addressed by declared index, not by position.
  for (uint32_t childId : obj->children) {
    auto *child = findById(childId);
    if (child && child->index && *child->index == index)
      return childId;
  }
  return 0;
}

std::optional<IndexRange> MemorySimulator::getRange(NativeHandle handle) {
  auto *obj = findById(handle);
  if (!obj)
    return std::nullopt;
  return obj->range;
}

int32_t MemorySimulator::getNumElements(NativeHandle handle) {
  auto *obj = findById(handle);
  if (!obj)
    return 0;
  if (obj->range)
    return static_cast<int32_t>(obj->range->size());
  if (obj->type == ObjectType::Module || obj->type == ObjectType::Structure)
    return static_cast<int32_t>(obj->children.size());
  if (obj->type == ObjectType::String)
    return static_cast<int32_t>(effectiveValue(*obj).text.size());
  return static_cast<int32_t>(obj->width);
}

std::vector<NativeHandle> MemorySimulator::iterate(NativeHandle handle,
                                                   IterationMode mode) {
  stats.iterations++;
  std::vector<NativeHandle> result;
  auto *obj = findById(handle);
  if (!obj)
    return result;

  switch (mode) {
  case IterationMode::Objects:
    result.assign(obj->children.begin(), obj->children.end());
    break;
  case IterationMode::Drivers:
    result.assign(obj->drivers.begin(), obj->drivers.end());
    break;
  case IterationMode::Loads:
    result.assign(obj->loads.begin(), obj->loads.end());
    break;
  }
  return result;
}

//===----------------------------------------------------------------------===//
// Values
//===----------------------------------------------------------------------===//

int64_t MemorySimulator::getValueLong(NativeHandle handle) {
  stats.valueReads++;
  auto *obj = findById(handle);
  if (!obj)
    return 0;
  const MemoryValue &value = effectiveValue(*obj);
  if (!isVectorType(obj->type))
    return value.integer;

  // Undefined bits read as zero, like vpiIntVal on most simulators.
  uint64_t result = 0;
  for (char c : value.bits)
    result = (result << 1) | (c == '1' ? 1 : 0);
  return static_cast<int64_t>(result);
}

double MemorySimulator::getValueReal(NativeHandle handle) {
  stats.valueReads++;
  auto *obj = findById(handle);
  return obj ? effectiveValue(*obj).real : 0.0;
}

std::string MemorySimulator::getValueString(NativeHandle handle) {
  stats.valueReads++;
  auto *obj = findById(handle);
  return obj ? effectiveValue(*obj).text : "";
}

std::string MemorySimulator::getValueBinStr(NativeHandle handle) {
  stats.valueReads++;
  auto *obj = findById(handle);
  if (!obj)
    return "";
  const MemoryValue &value = effectiveValue(*obj);
  if (isIntegerType(obj->type))
    return integerToBits(value.integer, 32);
  if (isVectorType(obj->type))
    return value.bits;
  return "";
}

template <typename UpdateFn>
void MemorySimulator::applyWrite(NativeHandle handle, NativeAction action,
                                 UpdateFn update) {
  stats.valueWrites++;
  auto *obj = findById(handle);
  if (!obj)
    return;
  if (obj->isConst) {
    LLVM_DEBUG(llvm::dbgs() << "MemorySimulator: Ignoring write to constant "
                            << obj->fullName << "\n");
    return;
  }

  switch (action) {
  case NativeAction::Deposit:
    // A deposit lands in the driven value; an active force still wins.
    update(*obj, obj->driven);
    break;
  case NativeAction::Force:
    if (!obj->forced)
      obj->forced = obj->driven;
    update(*obj, *obj->forced);
    break;
  case NativeAction::Release:
    obj->forced.reset();
    break;
  }
}

void MemorySimulator::setValueLong(NativeHandle handle, NativeAction action,
                                   int64_t value) {
  applyWrite(handle, action, [&](MemoryObject &obj, MemoryValue &target) {
    if (isVectorType(obj.type))
      target.bits = integerToBits(value, obj.width);
    else if (obj.type == ObjectType::Real)
      target.real = static_cast<double>(value);
    else
      target.integer = value;
  });
}

void MemorySimulator::setValueReal(NativeHandle handle, NativeAction action,
                                   double value) {
  applyWrite(handle, action,
             [&](MemoryObject &, MemoryValue &target) { target.real = value; });
}

void MemorySimulator::setValueString(NativeHandle handle, NativeAction action,
                                     llvm::StringRef value) {
  applyWrite(handle, action, [&](MemoryObject &, MemoryValue &target) {
    target.text = value.str();
  });
}

void MemorySimulator::setValueBinStr(NativeHandle handle, NativeAction action,
                                     llvm::StringRef value) {
  applyWrite(handle, action, [&](MemoryObject &obj, MemoryValue &target) {
    if (isIntegerType(obj.type)) {
      uint64_t result = 0;
      for (char c : value)
        result = (result << 1) | (c == '1' ? 1 : 0);
      target.integer = static_cast<int64_t>(result);
      return;
    }
    target.bits = resizeBits(value, obj.width);
  });
}
