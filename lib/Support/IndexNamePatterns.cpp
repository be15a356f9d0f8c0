//===- IndexNamePatterns.cpp - Generate-array child name parsing ----------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "simproxy/Support/IndexNamePatterns.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Regex.h"

using namespace simproxy;

static constexpr llvm::StringLiteral namePlaceholder = "{name}";

// VHPI (Aldec), FLI and VHPI (IUS), VPI.
static const llvm::StringRef defaultPatterns[] = {
    "{name}__([0-9]+)$",
    "{name}\\(([0-9]+)\\)$",
    "{name}\\[([0-9]+)\\]$",
};

llvm::ArrayRef<llvm::StringRef> IndexNamePatterns::getDefaultPatterns() {
  return defaultPatterns;
}

IndexNamePatterns::IndexNamePatterns() {
  for (auto pattern : defaultPatterns)
    patterns.push_back(pattern.str());
}

llvm::Expected<IndexNamePatterns>
IndexNamePatterns::create(llvm::ArrayRef<std::string> patterns) {
  IndexNamePatterns result;
  result.patterns.clear();
  for (const auto &pattern : patterns)
    if (auto err = result.addPattern(pattern))
      return std::move(err);
  return result;
}

llvm::Error IndexNamePatterns::addPattern(llvm::StringRef pattern) {
  if (pattern.find(namePlaceholder) == llvm::StringRef::npos)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "index pattern '%s' has no {name}",
                                   pattern.str().c_str());

  llvm::Regex regex(instantiate(pattern, "probe"));
  std::string error;
  if (!regex.isValid(error))
    return llvm::createStringError(std::errc::invalid_argument,
                                   "invalid index pattern '%s': %s",
                                   pattern.str().c_str(), error.c_str());
  if (regex.getNumMatches() < 1)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "index pattern '%s' has no capture group",
                                   pattern.str().c_str());

  patterns.push_back(pattern.str());
  return llvm::Error::success();
}

std::string IndexNamePatterns::instantiate(llvm::StringRef pattern,
                                           llvm::StringRef arrayName) {
  std::string result = "^";
  std::string escaped = llvm::Regex::escape(arrayName);
  while (!pattern.empty()) {
    size_t pos = pattern.find(namePlaceholder);
    if (pos == llvm::StringRef::npos) {
      result += pattern.str();
      break;
    }
    result += pattern.take_front(pos).str();
    result += escaped;
    pattern = pattern.drop_front(pos + namePlaceholder.size());
  }
  return result;
}

std::optional<int32_t>
IndexNamePatterns::match(llvm::StringRef arrayName,
                         llvm::StringRef childName) const {
  for (const auto &pattern : patterns) {
    llvm::Regex regex(instantiate(pattern, arrayName));
    llvm::SmallVector<llvm::StringRef, 2> matches;
    if (!regex.match(childName, &matches) || matches.size() < 2)
      continue;
    int32_t index;
    if (matches[1].getAsInteger(10, index))
      continue;
    return index;
  }
  return std::nullopt;
}
