/* vmcore -- A single address space virtual memory manager
 *
 *    syscalls.h - mmap/munmap system call entry points
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __VMCORE_SYSCALLS_H__
#define __VMCORE_SYSCALLS_H__

#include "os/memorymanager.h"

#include <ostream>
#include <vector>

namespace VMCore {

enum class SyscallStatus
{
  Success,
  InvalidArgument,
  OutOfMemory
};

std::ostream &operator<<(std::ostream &os, const SyscallStatus status);

struct SyscallResult
{
  SyscallStatus status;
  uint64_t value;

  SyscallResult(SyscallStatus s, uint64_t v = 0) : status(s), value(v) {}
};

using SyscallArguments = std::vector<int64_t>;

/* mmap(size, protection = 0, flags = 0), returns the mapped address. */
SyscallResult sysMmap(MemoryManager &memory, const SyscallArguments &args);

/* munmap(address, size) */
SyscallResult sysMunmap(MemoryManager &memory, const SyscallArguments &args);

} /* namespace VMCore */

#endif /* __VMCORE_SYSCALLS_H__ */
