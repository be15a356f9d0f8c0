//===- IndexNamePatterns.h - Generate-array child name parsing --*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Simulators disagree on how they name the children of a generate array.
// IndexNamePatterns holds an ordered list of regular expressions, each with a
// `{name}` placeholder for the array name and one capture group for the
// index, and returns the index from the first one that matches.
//
//===----------------------------------------------------------------------===//

#ifndef SIMPROXY_SUPPORT_INDEXNAMEPATTERNS_H
#define SIMPROXY_SUPPORT_INDEXNAMEPATTERNS_H

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace simproxy {

class IndexNamePatterns {
public:
  /// The built-in patterns, in the order they are tried:
  /// `name__3`, `name(3)`, `name[3]`.
  static llvm::ArrayRef<llvm::StringRef> getDefaultPatterns();

  /// A pattern set with the built-in patterns.
  IndexNamePatterns();

  /// Build a pattern set; fails if a pattern lacks `{name}` or does not
  /// compile.
  static llvm::Expected<IndexNamePatterns>
  create(llvm::ArrayRef<std::string> patterns);

  /// Add a pattern to the end of the list.
  llvm::Error addPattern(llvm::StringRef pattern);

  /// Extract the index from \p childName, a child of the array \p arrayName.
  std::optional<int32_t> match(llvm::StringRef arrayName,
                               llvm::StringRef childName) const;

  llvm::ArrayRef<std::string> getPatterns() const { return patterns; }

private:
  /// Substitute the escaped array name and anchor the expression.
  static std::string instantiate(llvm::StringRef pattern,
                                 llvm::StringRef arrayName);

  std::vector<std::string> patterns;
};

} // namespace simproxy

#endif // SIMPROXY_SUPPORT_INDEXNAMEPATTERNS_H
