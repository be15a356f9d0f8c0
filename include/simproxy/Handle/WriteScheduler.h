//===- WriteScheduler.h - Deferred write scheduling -------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Deferred writes are handed to a WriteScheduler, which applies them at the
// end of the current simulation time step. WriteBuffer is the in-process
// implementation: it keeps the last write per target and applies them on
// flush().
//
//===----------------------------------------------------------------------===//

#ifndef SIMPROXY_HANDLE_WRITESCHEDULER_H
#define SIMPROXY_HANDLE_WRITESCHEDULER_H

#include "simproxy/Value/WriteValue.h"
#include "llvm/ADT/MapVector.h"
#include "llvm/Support/Error.h"

namespace simproxy {

class ModifiableObject;

/// Receives deferred writes.
class WriteScheduler {
public:
  virtual ~WriteScheduler();

  /// Record that \p value should be written to \p target. The value still
  /// carries its override action and is not encoded yet.
  virtual void saveWrite(ModifiableObject &target, const WriteValue &value) = 0;
};

/// Buffers deferred writes until flush(). A second write to the same target
/// replaces the first.
class WriteBuffer : public WriteScheduler {
public:
  void saveWrite(ModifiableObject &target, const WriteValue &value) override;

  /// Apply all pending writes in the order their targets were first written.
  /// Every write is attempted; the errors of failing writes are joined.
  llvm::Error flush();

  /// Drop all pending writes.
  void clear() { pending.clear(); }

  size_t size() const { return pending.size(); }
  bool empty() const { return pending.empty(); }

  /// The pending write for \p target, or nullptr.
  const WriteValue *getPending(const ModifiableObject &target) const;

private:
  llvm::MapVector<ModifiableObject *, WriteValue> pending;
};

} // namespace simproxy

#endif // SIMPROXY_HANDLE_WRITESCHEDULER_H
