//===- HandleFactory.h - Identity-preserving proxy factory ------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The HandleFactory turns native handles into proxy objects. It owns every
// proxy it creates and guarantees that a native handle maps to the same proxy
// for the lifetime of the factory.
//
//===----------------------------------------------------------------------===//

#ifndef SIMPROXY_HANDLE_HANDLEFACTORY_H
#define SIMPROXY_HANDLE_HANDLEFACTORY_H

#include "simproxy/Handle/SimHandle.h"
#include "simproxy/Handle/WriteScheduler.h"
#include "simproxy/Native/NativeInterface.h"
#include "simproxy/Support/ProxyConfig.h"
#include "llvm/ADT/DenseMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <memory>
#include <optional>

namespace simproxy {

class HandleFactory {
public:
  /// Create a factory with the default configuration.
  explicit HandleFactory(NativeSimInterface &native);
  HandleFactory(NativeSimInterface &native,
                std::unique_ptr<ProxyConfig> config);
  ~HandleFactory();

  HandleFactory(const HandleFactory &) = delete;
  HandleFactory &operator=(const HandleFactory &) = delete;

  /// Return the proxy for \p handle, creating it on first use. \p path is
  /// recorded for diagnostics; the native name is used if it is absent.
  /// Fails with UnknownHandleType if the native type has no proxy class.
  llvm::Expected<SimHandleBase *>
  resolve(NativeHandle handle, std::optional<llvm::StringRef> path = {});

  /// Resolve a top-level handle; its path is its own name.
  llvm::Expected<SimHandleBase *> resolveRoot(NativeHandle handle) {
    return resolve(handle);
  }

  /// Look up the top-level object called \p name.
  llvm::Expected<SimHandleBase *> resolveRoot(llvm::StringRef name);

  /// The proxy for \p handle if one was created, otherwise nullptr.
  SimHandleBase *lookup(NativeHandle handle) const;

  /// Number of proxies created so far.
  size_t size() const { return handles.size(); }

  NativeSimInterface &getNative() const { return native; }
  const ProxyConfig &getConfig() const { return *config; }

  /// The scheduler that receives deferred writes. This is the built-in
  /// WriteBuffer unless another scheduler was attached.
  WriteScheduler &getScheduler() const { return *scheduler; }

  /// Route deferred writes to \p newScheduler, which must outlive the
  /// factory. nullptr restores the built-in buffer.
  void setScheduler(WriteScheduler *newScheduler);

  /// The built-in write buffer.
  WriteBuffer &getWriteBuffer() { return writeBuffer; }

private:
  template <typename ProxyT, typename... Args>
  SimHandleBase *create(NativeHandle handle, Args &&...args);

  NativeSimInterface &native;
  std::unique_ptr<ProxyConfig> config;
  WriteBuffer writeBuffer;
  WriteScheduler *scheduler;
  llvm::DenseMap<NativeHandle, std::unique_ptr<SimHandleBase>> handles;
};

} // namespace simproxy

#endif // SIMPROXY_HANDLE_HANDLEFACTORY_H
