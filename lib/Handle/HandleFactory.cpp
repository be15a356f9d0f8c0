//===- HandleFactory.cpp - Identity-preserving proxy factory --------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "simproxy/Handle/HandleFactory.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "simproxy-factory"

using namespace simproxy;

HandleFactory::HandleFactory(NativeSimInterface &native)
    : HandleFactory(native, std::make_unique<ProxyConfig>()) {}

HandleFactory::HandleFactory(NativeSimInterface &native,
                             std::unique_ptr<ProxyConfig> config)
    : native(native), config(std::move(config)), scheduler(&writeBuffer) {}

HandleFactory::~HandleFactory() = default;

void HandleFactory::setScheduler(WriteScheduler *newScheduler) {
  scheduler = newScheduler ? newScheduler : &writeBuffer;
}

SimHandleBase *HandleFactory::lookup(NativeHandle handle) const {
  auto it = handles.find(handle);
  return it == handles.end() ? nullptr : it->second.get();
}

template <typename ProxyT, typename... Args>
SimHandleBase *HandleFactory::create(NativeHandle handle, Args &&...args) {
  auto proxy = std::make_unique<ProxyT>(*this, handle,
                                        std::forward<Args>(args)...);
  SimHandleBase *result = proxy.get();
  handles[handle] = std::move(proxy);
  LLVM_DEBUG(llvm::dbgs() << "Created " << result->getDescription() << "\n");
  return result;
}

llvm::Expected<SimHandleBase *>
HandleFactory::resolve(NativeHandle handle,
                       std::optional<llvm::StringRef> path) {
  if (SimHandleBase *existing = lookup(handle))
    return existing;

  ObjectType type = native.getType(handle);

  // Constant-ness overrides the type mapping for everything that can hold a
  // value.
  if (native.isConstant(handle) && !isHierarchyOrArrayType(type))
    return create<ConstantObject>(handle, path, type);

  switch (type) {
  case ObjectType::Module:
  case ObjectType::Structure:
    return create<HierarchyObject>(handle, path);
  case ObjectType::Register:
  case ObjectType::Net:
    return create<ModifiableObject>(handle, path);
  case ObjectType::NetArray:
    return create<ArrayObject>(handle, path);
  case ObjectType::Real:
    return create<RealObject>(handle, path);
  case ObjectType::Integer:
    return create<IntegerObject>(handle, path);
  case ObjectType::Enum:
    return create<EnumObject>(handle, path);
  case ObjectType::String:
    return create<StringObject>(handle, path);
  case ObjectType::GenArray:
    return create<HierarchyArrayObject>(handle, path);
  default:
    break;
  }

  std::string where = path ? path->str() : native.getName(handle);
  return makeProxyError(ProxyErrorCode::UnknownHandleType,
                        "Unable to map native type " +
                            stringifyObjectType(type) + " (" +
                            llvm::Twine(static_cast<int>(type)) +
                            ") of object " + where);
}

llvm::Expected<SimHandleBase *>
HandleFactory::resolveRoot(llvm::StringRef name) {
  NativeHandle handle = native.getChildByName(0, name);
  if (!handle)
    return makeProxyError(ProxyErrorCode::NoSuchChild,
                          "No top-level object named " + name);
  return resolve(handle);
}
