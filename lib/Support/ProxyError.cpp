//===- ProxyError.cpp - Error taxonomy for simulator proxies --------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "simproxy/Support/ProxyError.h"

using namespace simproxy;

char ProxyError::ID = 0;

llvm::StringRef simproxy::stringifyProxyErrorCode(ProxyErrorCode code) {
  switch (code) {
  case ProxyErrorCode::NoSuchChild:
    return "NoSuchChild";
  case ProxyErrorCode::IndexOutOfRange:
    return "IndexOutOfRange";
  case ProxyErrorCode::UnsupportedIndex:
    return "UnsupportedIndex";
  case ProxyErrorCode::UnsupportedAssignment:
    return "UnsupportedAssignment";
  case ProxyErrorCode::LengthMismatch:
    return "LengthMismatch";
  case ProxyErrorCode::UnknownHandleType:
    return "UnknownHandleType";
  case ProxyErrorCode::ReadOnlyValue:
    return "ReadOnlyValue";
  case ProxyErrorCode::ReadOnlyIndex:
    return "ReadOnlyIndex";
  case ProxyErrorCode::NotReadable:
    return "NotReadable";
  }
  return "Unknown";
}

namespace {
class ProxyErrorCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "simproxy"; }

  std::string message(int condition) const override {
    return stringifyProxyErrorCode(static_cast<ProxyErrorCode>(condition))
        .str();
  }
};
} // namespace

const std::error_category &simproxy::proxyErrorCategory() {
  static ProxyErrorCategory category;
  return category;
}

void ProxyError::log(llvm::raw_ostream &os) const {
  os << stringifyProxyErrorCode(code) << ": " << message;
}

bool simproxy::isProxyError(llvm::Error err, ProxyErrorCode code) {
  if (!err)
    return false;
  unsigned count = 0;
  bool matched = false;
  llvm::handleAllErrors(
      std::move(err),
      [&](const ProxyError &proxyErr) {
        ++count;
        matched = proxyErr.getCode() == code;
      },
      [&](const llvm::ErrorInfoBase &) { ++count; });
  return count == 1 && matched;
}
