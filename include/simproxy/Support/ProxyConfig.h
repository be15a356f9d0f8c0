//===- ProxyConfig.h - Proxy layer configuration ----------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file declares the ProxyConfig class for loading the proxy layer's
// settings from YAML (simproxy.yaml). Every key is optional.
//
// Example configuration:
//
// ```yaml
// handles:
//   integer_fast_path_width: 32
//   warnings: true
//
// generate_arrays:
//   index_patterns:
//     - '{name}__([0-9]+)$'
//     - '{name}\(([0-9]+)\)$'
//     - '{name}\[([0-9]+)\]$'
//     - '{name}_gen([0-9]+)$'
// ```
//
//===----------------------------------------------------------------------===//

#ifndef SIMPROXY_SUPPORT_PROXYCONFIG_H
#define SIMPROXY_SUPPORT_PROXYCONFIG_H

#include "simproxy/Support/IndexNamePatterns.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <memory>
#include <string>

namespace simproxy {

/// Returns the file names searched by ProxyConfig::findAndLoad.
llvm::ArrayRef<llvm::StringRef> getProxyConfigFileNames();

class ProxyConfig {
public:
  ProxyConfig();
  ~ProxyConfig();

  //===--------------------------------------------------------------------===//
  // Loading Methods
  //===--------------------------------------------------------------------===//

  /// Load configuration from a YAML file.
  static llvm::Expected<std::unique_ptr<ProxyConfig>>
  loadFromFile(llvm::StringRef filePath);

  /// Load configuration from a YAML string.
  static llvm::Expected<std::unique_ptr<ProxyConfig>>
  loadFromYAML(llvm::StringRef yamlContent);

  /// Find and load configuration from a directory.
  static llvm::Expected<std::unique_ptr<ProxyConfig>>
  findAndLoad(llvm::StringRef directory);

  //===--------------------------------------------------------------------===//
  // Settings
  //===--------------------------------------------------------------------===//

  /// Widest target (in bits) that integer writes send through the native
  /// integer accessor. Wider targets get a bit string.
  unsigned getIntegerFastPathWidth() const { return integerFastPathWidth; }
  void setIntegerFastPathWidth(unsigned width) { integerFastPathWidth = width; }

  /// Whether warnings are printed.
  bool getWarningsEnabled() const { return warningsEnabled; }
  void setWarningsEnabled(bool enabled) { warningsEnabled = enabled; }

  const IndexNamePatterns &getIndexPatterns() const { return indexPatterns; }
  IndexNamePatterns &getIndexPatterns() { return indexPatterns; }

private:
  unsigned integerFastPathWidth = 32;
  bool warningsEnabled = true;
  IndexNamePatterns indexPatterns;
};

} // namespace simproxy

#endif // SIMPROXY_SUPPORT_PROXYCONFIG_H
