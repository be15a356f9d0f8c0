//===- WriteBuffer.cpp - Deferred write buffer ----------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "simproxy/Handle/WriteScheduler.h"
#include "simproxy/Handle/SimHandle.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "simproxy-handle"

using namespace simproxy;

WriteScheduler::~WriteScheduler() = default;

void WriteBuffer::saveWrite(ModifiableObject &target, const WriteValue &value) {
  auto inserted = pending.insert({&target, value});
  if (!inserted.second) {
    LLVM_DEBUG(llvm::dbgs() << "Replacing pending write to "
                            << target.getPath() << "\n");
    inserted.first->second = value;
  }
}

const WriteValue *
WriteBuffer::getPending(const ModifiableObject &target) const {
  auto it = pending.find(const_cast<ModifiableObject *>(&target));
  return it == pending.end() ? nullptr : &it->second;
}

llvm::Error WriteBuffer::flush() {
  // Writes scheduled while flushing belong to the next step.
  llvm::MapVector<ModifiableObject *, WriteValue> writes;
  std::swap(writes, pending);

  LLVM_DEBUG(llvm::dbgs() << "Flushing " << writes.size()
                          << " pending writes\n");
  llvm::Error result = llvm::Error::success();
  for (auto &entry : writes)
    if (llvm::Error err = entry.first->setImmediateValue(entry.second))
      result = llvm::joinErrors(std::move(result), std::move(err));
  return result;
}
