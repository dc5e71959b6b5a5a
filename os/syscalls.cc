/* vmcore -- A single address space virtual memory manager
 *
 *    syscalls.cc - mmap/munmap system call entry points
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "syscalls.h"

namespace VMCore {

static bool
getArgument(const SyscallArguments &args, size_t index, int64_t &value)
{
  if (index >= args.size())
    return false;

  value = args[index];
  return true;
}

static int64_t
getOptionalArgument(const SyscallArguments &args, size_t index, int64_t defaultValue)
{
  return index < args.size() ? args[index] : defaultValue;
}

std::ostream &
operator<<(std::ostream &os, const SyscallStatus status)
{
  switch (status)
    {
      case SyscallStatus::Success:
        return os << "Success";
      case SyscallStatus::InvalidArgument:
        return os << "InvalidArgument";
      case SyscallStatus::OutOfMemory:
        return os << "OutOfMemory";
    }
  return os << "SyscallStatus(" << static_cast<int>(status) << ")";
}

SyscallResult
sysMmap(MemoryManager &memory, const SyscallArguments &args)
{
  int64_t size = 0;
  if (not getArgument(args, 0, size) or size <= 0)
    return SyscallResult(SyscallStatus::InvalidArgument);

  const int64_t protection = getOptionalArgument(args, 1, 0);
  const int64_t flags = getOptionalArgument(args, 2, 0);
  if (protection < 0 or flags < 0)
    return SyscallResult(SyscallStatus::InvalidArgument);

  uint64_t vAddr = 0;
  if (not memory.mmap(size, protection, flags, vAddr))
    return SyscallResult(SyscallStatus::OutOfMemory);

  return SyscallResult(SyscallStatus::Success, vAddr);
}

SyscallResult
sysMunmap(MemoryManager &memory, const SyscallArguments &args)
{
  int64_t address = 0, size = 0;
  if (not getArgument(args, 0, address) or not getArgument(args, 1, size))
    return SyscallResult(SyscallStatus::InvalidArgument);
  if (address < 0 or size < 0)
    return SyscallResult(SyscallStatus::InvalidArgument);

  memory.munmap(address, size);
  return SyscallResult(SyscallStatus::Success);
}

} /* namespace VMCore */
