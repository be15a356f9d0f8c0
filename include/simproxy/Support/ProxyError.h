//===- ProxyError.h - Error taxonomy for simulator proxies ------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file declares the errors reported while resolving, reading and writing
// simulator proxy objects. All of them are local failures carried through
// llvm::Error; none of them terminate the process.
//
//===----------------------------------------------------------------------===//

#ifndef SIMPROXY_SUPPORT_PROXYERROR_H
#define SIMPROXY_SUPPORT_PROXYERROR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"
#include <string>
#include <system_error>

namespace simproxy {

/// The kinds of failure a proxy operation can report.
enum class ProxyErrorCode {
  /// A name has no corresponding native object.
  NoSuchChild = 1,
  /// An index is outside the declared bounds or the object is not indexable.
  IndexOutOfRange,
  /// Multi-element (slice) indexing was requested.
  UnsupportedIndex,
  /// A value cannot be encoded for the target, or the target holds no value.
  UnsupportedAssignment,
  /// A bulk array write had the wrong number of elements.
  LengthMismatch,
  /// The native type tag has no proxy mapping.
  UnknownHandleType,
  /// Write attempted on a constant.
  ReadOnlyValue,
  /// Indexed write attempted on a hierarchy array.
  ReadOnlyIndex,
  /// Value requested from an object that has no scalar value.
  NotReadable,
};

/// Returns a short stable name for \p code, e.g. "NoSuchChild".
llvm::StringRef stringifyProxyErrorCode(ProxyErrorCode code);

/// The std::error_category shared by all ProxyErrorCode values.
const std::error_category &proxyErrorCategory();

inline std::error_code make_error_code(ProxyErrorCode code) {
  return std::error_code(static_cast<int>(code), proxyErrorCategory());
}

/// Error payload for proxy failures.
class ProxyError : public llvm::ErrorInfo<ProxyError> {
public:
  static char ID;

  ProxyError(ProxyErrorCode code, std::string message)
      : code(code), message(std::move(message)) {}

  ProxyErrorCode getCode() const { return code; }
  llvm::StringRef getMessage() const { return message; }

  void log(llvm::raw_ostream &os) const override;
  std::error_code convertToErrorCode() const override {
    return make_error_code(code);
  }

private:
  ProxyErrorCode code;
  std::string message;
};

/// Create an llvm::Error holding a ProxyError.
inline llvm::Error makeProxyError(ProxyErrorCode code,
                                  const llvm::Twine &message) {
  return llvm::make_error<ProxyError>(code, message.str());
}

/// Consume \p err and report whether it was a single ProxyError with \p code.
/// A success value returns false.
bool isProxyError(llvm::Error err, ProxyErrorCode code);

} // namespace simproxy

namespace std {
template <>
struct is_error_code_enum<simproxy::ProxyErrorCode> : std::true_type {};
} // namespace std

#endif // SIMPROXY_SUPPORT_PROXYERROR_H
