//===- SimHandle.cpp - Proxy object base and regions ----------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "simproxy/Handle/SimHandle.h"
#include "simproxy/Handle/HandleFactory.h"
#include "simproxy/Support/ProxyConfig.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "simproxy-handle"

using namespace simproxy;

//===----------------------------------------------------------------------===//
// SimHandleBase
//===----------------------------------------------------------------------===//

SimHandleBase::SimHandleBase(HandleKind kind, HandleFactory &factory,
                             NativeHandle handle,
                             std::optional<llvm::StringRef> path)
    : factory(factory), kind(kind), handle(handle) {
  NativeSimInterface &native = factory.getNative();
  name = native.getName(handle);
  typeString = native.getTypeString(handle);
  fullName = name + "(" + typeString + ")";
  this->path = path ? path->str() : name;
  defName = native.getDefinitionName(handle);
  defFile = native.getDefinitionFile(handle);
}

SimHandleBase::~SimHandleBase() = default;

NativeSimInterface &SimHandleBase::getNative() const {
  return factory.getNative();
}

const ProxyConfig &SimHandleBase::getConfig() const {
  return factory.getConfig();
}

size_t SimHandleBase::getLength() {
  if (!length) {
    int32_t count = getNative().getNumElements(handle);
    length = count > 0 ? static_cast<size_t>(count) : 0;
  }
  return *length;
}

llvm::StringRef SimHandleBase::getClassName() const {
  switch (kind) {
  case HandleKind::Hierarchy:
    return "HierarchyObject";
  case HandleKind::HierarchyArray:
    return "HierarchyArrayObject";
  case HandleKind::Constant:
    return "ConstantObject";
  case HandleKind::Array:
    return "ArrayObject";
  case HandleKind::Modifiable:
    return "ModifiableObject";
  case HandleKind::Real:
    return "RealObject";
  case HandleKind::Enum:
    return "EnumObject";
  case HandleKind::Integer:
    return "IntegerObject";
  case HandleKind::String:
    return "StringObject";
  }
  llvm_unreachable("unknown handle kind");
}

std::string SimHandleBase::getDescription() const {
  std::string result;
  llvm::raw_string_ostream os(result);
  os << getClassName() << "(" << path;
  if (defName) {
    os << " with definition " << *defName;
    if (defFile)
      os << " (at " << *defFile << ")";
  }
  os << ")";
  return os.str();
}

llvm::Expected<SimValue> SimHandleBase::getValue() {
  return makeProxyError(ProxyErrorCode::NotReadable,
                        getDescription() + " has no value");
}

llvm::Error SimHandleBase::setValue(const WriteValue &value) {
  return makeProxyError(ProxyErrorCode::UnsupportedAssignment,
                        "Cannot assign " + value.getKindName() + " to " +
                            getDescription());
}

llvm::Error SimHandleBase::setImmediateValue(const WriteValue &value) {
  return setValue(value);
}

llvm::Expected<SimHandleBase *> SimHandleBase::getIndexedChild(int32_t index) {
  auto it = indexedSubHandles.find(index);
  if (it != indexedSubHandles.end())
    return it->second;

  NativeHandle child = getNative().getChildByIndex(handle, index);
  if (!child)
    return makeProxyError(ProxyErrorCode::IndexOutOfRange,
                          path + " contains no object at index " +
                              llvm::Twine(index));

  std::string childPath = path + "[" + std::to_string(index) + "]";
  auto childOrErr = factory.resolve(child, llvm::StringRef(childPath));
  if (!childOrErr)
    return childOrErr.takeError();
  indexedSubHandles[index] = *childOrErr;
  return *childOrErr;
}

void SimHandleBase::warn(const llvm::Twine &message) const {
  if (getConfig().getWarningsEnabled())
    llvm::WithColor::warning(llvm::errs(), "simproxy") << message << "\n";
}

void SimHandleBase::logSkipped(const llvm::Twine &what, llvm::Error err) {
  std::string reason = llvm::toString(std::move(err));
  LLVM_DEBUG(llvm::dbgs() << "Skipping " << what << ": " << reason << "\n");
  (void)reason;
}

//===----------------------------------------------------------------------===//
// RegionObject
//===----------------------------------------------------------------------===//

/// Strip a fully qualified name down to its last segment.
static llvm::StringRef getLocalName(llvm::StringRef childName) {
  // Extended identifiers `\a.b\` may contain dots.
  if (!childName.empty() && childName.back() == '\\') {
    size_t start = childName.drop_back().rfind('\\');
    if (start != llvm::StringRef::npos)
      return childName.drop_front(start);
  }
  llvm::StringRef local = childName.rsplit('.').second;
  return local.empty() ? childName : local;
}

std::string RegionObject::getChildPath(llvm::StringRef childName) {
  return path + "." + getLocalName(childName).str();
}

std::optional<SimHandleBase::SubHandleKey>
RegionObject::getSubHandleKey(llvm::StringRef childName) {
  return SubHandleKey(getLocalName(childName).str());
}

void RegionObject::discoverAll() {
  if (discovered)
    return;
  LLVM_DEBUG(llvm::dbgs() << "Discovering all on " << name << "\n");

  NativeSimInterface &native = getNative();
  for (NativeHandle child : native.iterate(handle, IterationMode::Objects)) {
    std::string childName = native.getName(child);
    auto childOrErr = factory.resolve(child, getChildPath(childName));
    if (!childOrErr) {
      logSkipped(childName, childOrErr.takeError());
      continue;
    }

    std::optional<SubHandleKey> key = getSubHandleKey(childName);
    if (!key)
      continue;
    if (auto *index = std::get_if<int32_t>(&*key))
      indexedSubHandles[*index] = *childOrErr;
    else
      subHandles[std::get<std::string>(*key)] = *childOrErr;
  }

  LLVM_DEBUG(llvm::dbgs() << "Discovered " << subHandles.size() << " named and "
                          << indexedSubHandles.size()
                          << " indexed children of " << name << "\n");
  discovered = true;
}

std::vector<SimHandleBase *> RegionObject::children() {
  discoverAll();
  std::vector<SimHandleBase *> result;
  for (auto &entry : subHandles) {
    if (auto *array = llvm::dyn_cast<HierarchyArrayObject>(entry.second)) {
      std::vector<SimHandleBase *> blocks = array->getElementsInRange();
      result.insert(result.end(), blocks.begin(), blocks.end());
      continue;
    }
    result.push_back(entry.second);
  }
  for (auto &entry : indexedSubHandles)
    result.push_back(entry.second);
  return result;
}

std::vector<std::string> RegionObject::getChildNames() {
  discoverAll();
  std::vector<std::string> names;
  names.reserve(subHandles.size() + indexedSubHandles.size());
  for (auto &entry : subHandles)
    names.push_back(entry.first);
  for (auto &entry : indexedSubHandles)
    names.push_back(std::to_string(entry.first));
  return names;
}

//===----------------------------------------------------------------------===//
// HierarchyObject
//===----------------------------------------------------------------------===//

HierarchyObject::HierarchyObject(HandleFactory &factory, NativeHandle handle,
                                 std::optional<llvm::StringRef> path)
    : RegionObject(HandleKind::Hierarchy, factory, handle, path) {}

llvm::Expected<SimHandleBase *>
HierarchyObject::getChild(llvm::StringRef childName) {
  auto it = subHandles.find(childName.str());
  if (it != subHandles.end())
    return it->second;

  if (invalidSubHandles.count(childName))
    return makeProxyError(ProxyErrorCode::NoSuchChild,
                          path + " contains no object named " + childName);

  NativeHandle child = getNative().getChildByName(handle, childName);
  if (!child) {
    LLVM_DEBUG(llvm::dbgs() << "Recording " << childName
                            << " as absent from " << path << "\n");
    invalidSubHandles.insert(childName);
    return makeProxyError(ProxyErrorCode::NoSuchChild,
                          path + " contains no object named " + childName);
  }

  auto childOrErr = factory.resolve(child, getChildPath(childName));
  if (!childOrErr)
    return childOrErr.takeError();
  subHandles[childName.str()] = *childOrErr;
  return *childOrErr;
}

llvm::Expected<SimHandleBase *>
HierarchyObject::hasChild(llvm::StringRef childName) {
  auto childOrErr = getChild(childName);
  if (childOrErr)
    return *childOrErr;

  llvm::Error err = llvm::handleErrors(
      childOrErr.takeError(),
      [](std::unique_ptr<ProxyError> proxyErr) -> llvm::Error {
        if (proxyErr->getCode() == ProxyErrorCode::NoSuchChild)
          return llvm::Error::success();
        return llvm::Error(std::move(proxyErr));
      });
  if (err)
    return std::move(err);
  return nullptr;
}

llvm::Expected<SimHandleBase *>
HierarchyObject::getExtendedChild(llvm::StringRef childName) {
  return getChild(("\\" + childName + "\\").str());
}

llvm::Error HierarchyObject::setChild(llvm::StringRef childName,
                                      const WriteValue &value) {
  auto childOrErr = getChild(childName);
  if (!childOrErr)
    return childOrErr.takeError();
  return (*childOrErr)->setValue(value);
}

//===----------------------------------------------------------------------===//
// HierarchyArrayObject
//===----------------------------------------------------------------------===//

HierarchyArrayObject::HierarchyArrayObject(HandleFactory &factory,
                                           NativeHandle handle,
                                           std::optional<llvm::StringRef> path)
    : RegionObject(HandleKind::HierarchyArray, factory, handle, path) {}

std::optional<int32_t>
HierarchyArrayObject::matchIndex(llvm::StringRef childName) const {
  return getConfig().getIndexPatterns().match(name, childName);
}

std::optional<SimHandleBase::SubHandleKey>
HierarchyArrayObject::getSubHandleKey(llvm::StringRef childName) {
  std::optional<int32_t> index = matchIndex(childName);
  if (!index) {
    llvm::WithColor::error(llvm::errs(), "simproxy")
        << "Unable to match an index pattern: " << childName << "\n";
    return std::nullopt;
  }
  return SubHandleKey(*index);
}

std::string HierarchyArrayObject::getChildPath(llvm::StringRef childName) {
  if (std::optional<int32_t> index = matchIndex(childName))
    return path + "[" + std::to_string(*index) + "]";
  return RegionObject::getChildPath(childName);
}

size_t HierarchyArrayObject::getLength() {
  discoverAll();
  return indexedSubHandles.size();
}

llvm::Expected<SimHandleBase *> HierarchyArrayObject::getIndex(int32_t index) {
  return getIndexedChild(index);
}

llvm::Expected<SimHandleBase *> HierarchyArrayObject::getSlice(int32_t left,
                                                               int32_t right) {
  return makeProxyError(ProxyErrorCode::UnsupportedIndex,
                        "Slice [" + llvm::Twine(left) + ":" +
                            llvm::Twine(right) + "] of " + path +
                            " is not supported");
}

llvm::Error HierarchyArrayObject::setIndex(int32_t index,
                                           const WriteValue &value) {
  return makeProxyError(ProxyErrorCode::ReadOnlyIndex,
                        "Cannot assign " + value.getKindName() + " to " +
                            path + "[" + llvm::Twine(index) +
                            "]: generate blocks are read-only");
}

std::vector<SimHandleBase *> HierarchyArrayObject::getElementsInRange() {
  discoverAll();
  std::vector<SimHandleBase *> result;
  if (indexedSubHandles.empty())
    return result;

  llvm::SmallVector<int32_t, 16> indices;
  if (std::optional<IndexRange> range = getNative().getRange(handle)) {
    indices = range->getIndices();
  } else {
    int32_t first = indexedSubHandles.begin()->first;
    int32_t last = indexedSubHandles.rbegin()->first;
    for (int32_t index = first; index <= last; ++index)
      indices.push_back(index);
  }

  for (int32_t index : indices) {
    auto it = indexedSubHandles.find(index);
    if (it == indexedSubHandles.end()) {
      warn("Index " + llvm::Twine(index) + " doesn't exist in " + path);
      continue;
    }
    result.push_back(it->second);
  }
  return result;
}
