//===- ValueObject.cpp - Value-bearing proxy objects ----------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Constants, value arrays and the modifiable objects. Reads always go to the
// native layer; only constants keep a snapshot.
//
//===----------------------------------------------------------------------===//

#include "simproxy/Handle/HandleFactory.h"
#include "simproxy/Handle/SimHandle.h"
#include "simproxy/Support/ProxyConfig.h"
#include "llvm/ADT/APInt.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/MathExtras.h"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "simproxy-handle"

using namespace simproxy;

//===----------------------------------------------------------------------===//
// ConstantObject
//===----------------------------------------------------------------------===//

ConstantObject::ConstantObject(HandleFactory &factory, NativeHandle handle,
                               std::optional<llvm::StringRef> path,
                               ObjectType type)
    : NonHierarchyObject(HandleKind::Constant, factory, handle, path),
      snapshot(readSnapshot(factory.getNative(), handle, type)) {
  LLVM_DEBUG(llvm::dbgs() << "Captured constant " << this->path << " = "
                          << snapshot << "\n");
}

SimValue ConstantObject::readSnapshot(NativeSimInterface &native,
                                      NativeHandle handle, ObjectType type) {
  switch (type) {
  case ObjectType::Integer:
  case ObjectType::Enum:
    return SimValue(native.getValueLong(handle));
  case ObjectType::Real:
    return SimValue(native.getValueReal(handle));
  case ObjectType::String:
    return SimValue(native.getValueString(handle));
  default:
    break;
  }

  std::string binstr = native.getValueBinStr(handle);
  if (std::optional<BitVector> bits = BitVector::fromBinaryString(binstr))
    return SimValue(std::move(*bits));
  return SimValue(std::move(binstr));
}

llvm::Expected<SimValue> ConstantObject::getValue() { return snapshot; }

llvm::Error ConstantObject::setValue(const WriteValue &value) {
  return makeProxyError(ProxyErrorCode::ReadOnlyValue,
                        "Cannot assign " + value.getKindName() +
                            " to constant " + path);
}

llvm::Error ConstantObject::setImmediateValue(const WriteValue &value) {
  return setValue(value);
}

//===----------------------------------------------------------------------===//
// ArrayObject
//===----------------------------------------------------------------------===//

ArrayObject::ArrayObject(HandleFactory &factory, NativeHandle handle,
                         std::optional<llvm::StringRef> path)
    : ArrayObject(HandleKind::Array, factory, handle, path) {}

ArrayObject::ArrayObject(HandleKind kind, HandleFactory &factory,
                         NativeHandle handle,
                         std::optional<llvm::StringRef> path)
    : NonHierarchyObject(kind, factory, handle, path),
      range(factory.getNative().getRange(handle)) {}

size_t ArrayObject::getLength() {
  if (range)
    return range->size();
  return SimHandleBase::getLength();
}

llvm::Expected<SimHandleBase *> ArrayObject::getIndex(int32_t index) {
  if (!range)
    return makeProxyError(ProxyErrorCode::IndexOutOfRange,
                          path + " is not indexable");
  if (!range->contains(index))
    return makeProxyError(ProxyErrorCode::IndexOutOfRange,
                          "Index " + llvm::Twine(index) + " is outside [" +
                              llvm::Twine(range->left) + ":" +
                              llvm::Twine(range->right) + "] of " + path);
  return getIndexedChild(index);
}

llvm::Expected<SimHandleBase *> ArrayObject::getSlice(int32_t left,
                                                      int32_t right) {
  return makeProxyError(ProxyErrorCode::UnsupportedIndex,
                        "Slice [" + llvm::Twine(left) + ":" +
                            llvm::Twine(right) + "] of " + path +
                            " is not supported");
}

llvm::Error ArrayObject::setIndex(int32_t index, const WriteValue &value) {
  auto elementOrErr = getIndex(index);
  if (!elementOrErr)
    return elementOrErr.takeError();
  return (*elementOrErr)->setValue(value);
}

std::vector<SimHandleBase *> ArrayObject::elements() {
  std::vector<SimHandleBase *> result;
  if (!range)
    return result;
  for (int32_t index : range->getIndices()) {
    auto elementOrErr = getIndex(index);
    if (!elementOrErr) {
      logSkipped(path + "[" + llvm::Twine(index) + "]",
                 elementOrErr.takeError());
      continue;
    }
    result.push_back(*elementOrErr);
  }
  return result;
}

llvm::Expected<std::vector<SimValue>> ArrayObject::getAll() {
  if (!range)
    return makeProxyError(ProxyErrorCode::IndexOutOfRange,
                          path + " has no declared range");

  std::vector<SimValue> values;
  values.reserve(range->size());
  for (int32_t index : range->getIndices()) {
    auto elementOrErr = getIndex(index);
    if (!elementOrErr)
      return elementOrErr.takeError();
    auto valueOrErr = (*elementOrErr)->getValue();
    if (!valueOrErr)
      return valueOrErr.takeError();
    values.push_back(std::move(*valueOrErr));
  }
  return std::move(values);
}

llvm::Expected<std::vector<SimHandleBase *>>
ArrayObject::resolveForBulkWrite(size_t count) {
  if (!range)
    return makeProxyError(ProxyErrorCode::UnsupportedAssignment,
                          "Cannot assign a list to " + path +
                              ", it has no declared range");
  if (count != range->size())
    return makeProxyError(ProxyErrorCode::LengthMismatch,
                          "Assigning list of length " + llvm::Twine(count) +
                              " to object " + path + " of length " +
                              llvm::Twine(range->size()));

  std::vector<SimHandleBase *> targets;
  targets.reserve(count);
  for (int32_t index : range->getIndices()) {
    auto elementOrErr = getIndex(index);
    if (!elementOrErr)
      return elementOrErr.takeError();
    SimHandleBase *element = *elementOrErr;
    if (llvm::isa<ConstantObject>(element))
      return makeProxyError(ProxyErrorCode::ReadOnlyValue,
                            "Element " + element->getPath() +
                                " is a constant");
    if (!llvm::isa<ModifiableObject>(element))
      return makeProxyError(ProxyErrorCode::UnsupportedAssignment,
                            "Element " + element->getPath() +
                                " cannot hold a value");
    targets.push_back(element);
  }
  return std::move(targets);
}

llvm::Error ArrayObject::setAll(llvm::ArrayRef<WriteValue> values) {
  auto targetsOrErr = resolveForBulkWrite(values.size());
  if (!targetsOrErr)
    return targetsOrErr.takeError();
  for (auto it : llvm::zip(*targetsOrErr, values))
    if (llvm::Error err = std::get<0>(it)->setValue(std::get<1>(it)))
      return err;
  return llvm::Error::success();
}

llvm::Error ArrayObject::setAllImmediate(llvm::ArrayRef<WriteValue> values) {
  auto targetsOrErr = resolveForBulkWrite(values.size());
  if (!targetsOrErr)
    return targetsOrErr.takeError();
  for (auto it : llvm::zip(*targetsOrErr, values))
    if (llvm::Error err = std::get<0>(it)->setImmediateValue(std::get<1>(it)))
      return err;
  return llvm::Error::success();
}

//===----------------------------------------------------------------------===//
// NonConstantObject
//===----------------------------------------------------------------------===//

std::vector<SimHandleBase *>
NonConstantObject::resolveAll(IterationMode mode) {
  std::vector<SimHandleBase *> result;
  for (NativeHandle other : getNative().iterate(handle, mode)) {
    auto otherOrErr = factory.resolve(other);
    if (!otherOrErr) {
      logSkipped(getNative().getName(other), otherOrErr.takeError());
      continue;
    }
    result.push_back(*otherOrErr);
  }
  return result;
}

std::vector<SimHandleBase *> NonConstantObject::getDrivers() {
  return resolveAll(IterationMode::Drivers);
}

std::vector<SimHandleBase *> NonConstantObject::getLoads() {
  return resolveAll(IterationMode::Loads);
}

//===----------------------------------------------------------------------===//
// ModifiableObject
//===----------------------------------------------------------------------===//

ModifiableObject::ModifiableObject(HandleFactory &factory, NativeHandle handle,
                                   std::optional<llvm::StringRef> path)
    : ModifiableObject(HandleKind::Modifiable, factory, handle, path) {}

ModifiableObject::ModifiableObject(HandleKind kind, HandleFactory &factory,
                                   NativeHandle handle,
                                   std::optional<llvm::StringRef> path)
    : NonConstantObject(kind, factory, handle, path) {}

llvm::Expected<SimValue> ModifiableObject::getValue() {
  std::string binstr = getNative().getValueBinStr(handle);
  if (std::optional<BitVector> bits = BitVector::fromBinaryString(binstr))
    return SimValue(std::move(*bits));
  return SimValue(std::move(binstr));
}

llvm::Expected<int64_t> ModifiableObject::toInteger() {
  auto valueOrErr = getValue();
  if (!valueOrErr)
    return valueOrErr.takeError();
  if (std::optional<int64_t> result = valueOrErr->toInteger())
    return *result;
  return makeProxyError(ProxyErrorCode::NotReadable,
                        "Value " + valueOrErr->toString() + " of " + path +
                            " is not an integer");
}

llvm::Error ModifiableObject::setValue(const WriteValue &value) {
  LLVM_DEBUG(llvm::dbgs() << "Scheduling " << stringifySetAction(
                                                  value.getAction())
                          << " of " << value.getKindName() << " to " << path
                          << "\n");
  factory.getScheduler().saveWrite(*this, value);
  return llvm::Error::success();
}

llvm::Error ModifiableObject::setImmediateValue(const WriteValue &value) {
  auto resolved = resolveSetAction(value);
  if (!resolved)
    return resolved.takeError();
  return writeEncoded(resolved->first, resolved->second);
}

llvm::Expected<std::pair<WriteValue, NativeAction>>
ModifiableObject::resolveSetAction(const WriteValue &value) {
  switch (value.getAction()) {
  case SetAction::Deposit:
    return std::make_pair(value.withoutAction(), NativeAction::Deposit);
  case SetAction::Force:
    return std::make_pair(value.withoutAction(), NativeAction::Force);
  case SetAction::Freeze: {
    auto currentOrErr = getValue();
    if (!currentOrErr)
      return currentOrErr.takeError();
    return std::make_pair(WriteValue::fromSimValue(*currentOrErr),
                          NativeAction::Force);
  }
  case SetAction::Release:
    return std::make_pair(WriteValue(0), NativeAction::Release);
  }
  llvm_unreachable("unknown set action");
}

llvm::Error
ModifiableObject::unsupportedAssignment(const WriteValue &payload,
                                        llvm::StringRef expected) const {
  std::string message = ("Unsupported type for value assignment: " +
                         payload.getKindName() + " (expected " + expected +
                         ") on " + path)
                            .str();
  llvm::WithColor::error(llvm::errs(), "simproxy") << message << "\n";
  return makeProxyError(ProxyErrorCode::UnsupportedAssignment, message);
}

/// Pack \p packed into one vector of \p width bits. Element 0 lands in the
/// least significant bits.
static std::optional<BitVector> packArray(const PackedArray &packed,
                                          unsigned width) {
  if (packed.bits == 0 || packed.values.size() * packed.bits != width)
    return std::nullopt;
  llvm::APInt result(width, 0);
  for (int64_t element : llvm::reverse(packed.values)) {
    result <<= packed.bits;
    llvm::APInt bits = llvm::APInt(64, static_cast<uint64_t>(element))
                           .zextOrTrunc(packed.bits)
                           .zextOrTrunc(width);
    result |= bits;
  }
  return BitVector(result);
}

llvm::Error ModifiableObject::writeEncoded(const WriteValue &payload,
                                           NativeAction action) {
  NativeSimInterface &native = getNative();
  unsigned width = static_cast<unsigned>(getLength());

  switch (payload.getKind()) {
  case WriteValue::Kind::Integer: {
    int64_t value = payload.getInteger();
    bool fits =
        width != 0 && (value < 0 ? llvm::isIntN(width, value)
                                 : llvm::isUIntN(width,
                                                 static_cast<uint64_t>(value)));
    if (fits && value < 0x7fffffff &&
        width <= getConfig().getIntegerFastPathWidth()) {
      native.setValueLong(handle, action, value);
      return llvm::Error::success();
    }
    std::optional<BitVector> bits = BitVector::fromInteger(value, width);
    if (!bits)
      return makeProxyError(ProxyErrorCode::UnsupportedAssignment,
                            "Value " + llvm::Twine(value) +
                                " does not fit in " + llvm::Twine(width) +
                                " bits of " + path);
    native.setValueBinStr(handle, action, bits->toBinaryString());
    return llvm::Error::success();
  }
  case WriteValue::Kind::Bits:
    native.setValueBinStr(handle, action, payload.getBits().toBinaryString());
    return llvm::Error::success();
  case WriteValue::Kind::Packed: {
    const PackedArray &packed = payload.getPacked();
    std::optional<BitVector> bits = packArray(packed, width);
    if (!bits) {
      std::string message =
          ("Number of bits in packed value (" +
           llvm::Twine(packed.values.size()) + " x " +
           llvm::Twine(packed.bits) + ") does not match the width " +
           llvm::Twine(width) + " of " + path)
              .str();
      llvm::WithColor::error(llvm::errs(), "simproxy") << message << "\n";
      return makeProxyError(ProxyErrorCode::UnsupportedAssignment, message);
    }
    native.setValueBinStr(handle, action, bits->toBinaryString());
    return llvm::Error::success();
  }
  default:
    return unsupportedAssignment(payload, "integer, bit vector or packed");
  }
}

//===----------------------------------------------------------------------===//
// RealObject
//===----------------------------------------------------------------------===//

RealObject::RealObject(HandleFactory &factory, NativeHandle handle,
                       std::optional<llvm::StringRef> path)
    : ModifiableObject(HandleKind::Real, factory, handle, path) {}

llvm::Expected<SimValue> RealObject::getValue() {
  return SimValue(getNative().getValueReal(handle));
}

llvm::Expected<double> RealObject::toDouble() {
  return getNative().getValueReal(handle);
}

llvm::Error RealObject::writeEncoded(const WriteValue &payload,
                                     NativeAction action) {
  double value;
  if (payload.isReal())
    value = payload.getReal();
  else if (payload.isInteger())
    value = static_cast<double>(payload.getInteger());
  else
    return unsupportedAssignment(payload, "real or integer");
  getNative().setValueReal(handle, action, value);
  return llvm::Error::success();
}

//===----------------------------------------------------------------------===//
// EnumObject / IntegerObject
//===----------------------------------------------------------------------===//

/// Integer-valued payloads accepted by enums and integers: plain integers
/// and fully defined bit vectors. Bit vectors read as unsigned and must fit
/// in an int64_t.
static std::optional<int64_t> getIntegerPayload(const WriteValue &payload) {
  if (payload.isInteger())
    return payload.getInteger();
  if (!payload.isBits())
    return std::nullopt;
  std::optional<uint64_t> bits = payload.getBits().toUnsigned();
  if (!bits || *bits > static_cast<uint64_t>(INT64_MAX))
    return std::nullopt;
  return static_cast<int64_t>(*bits);
}

EnumObject::EnumObject(HandleFactory &factory, NativeHandle handle,
                       std::optional<llvm::StringRef> path)
    : ModifiableObject(HandleKind::Enum, factory, handle, path) {}

llvm::Expected<SimValue> EnumObject::getValue() {
  return SimValue(getNative().getValueLong(handle));
}

llvm::Error EnumObject::writeEncoded(const WriteValue &payload,
                                     NativeAction action) {
  std::optional<int64_t> value = getIntegerPayload(payload);
  if (!value)
    return unsupportedAssignment(payload, "integer");
  getNative().setValueLong(handle, action, *value);
  return llvm::Error::success();
}

IntegerObject::IntegerObject(HandleFactory &factory, NativeHandle handle,
                             std::optional<llvm::StringRef> path)
    : ModifiableObject(HandleKind::Integer, factory, handle, path) {}

llvm::Expected<SimValue> IntegerObject::getValue() {
  return SimValue(getNative().getValueLong(handle));
}

llvm::Error IntegerObject::writeEncoded(const WriteValue &payload,
                                        NativeAction action) {
  std::optional<int64_t> value = getIntegerPayload(payload);
  if (!value)
    return unsupportedAssignment(payload, "integer");
  getNative().setValueLong(handle, action, *value);
  return llvm::Error::success();
}

//===----------------------------------------------------------------------===//
// StringObject
//===----------------------------------------------------------------------===//

StringObject::StringObject(HandleFactory &factory, NativeHandle handle,
                           std::optional<llvm::StringRef> path)
    : ModifiableObject(HandleKind::String, factory, handle, path) {}

llvm::Expected<SimValue> StringObject::getValue() {
  return SimValue(getNative().getValueString(handle));
}

llvm::Error StringObject::writeEncoded(const WriteValue &payload,
                                       NativeAction action) {
  // Release carries no text.
  if (action == NativeAction::Release) {
    getNative().setValueString(handle, action, "");
    return llvm::Error::success();
  }
  if (!payload.isText())
    return unsupportedAssignment(payload, "text");
  getNative().setValueString(handle, action, payload.getText());
  return llvm::Error::success();
}
