/* vmcore -- A single address space virtual memory manager
 *
 *    types.h - Addresses, page table entries and statistics
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __VMCORE_TYPES_H__
#define __VMCORE_TYPES_H__

#include <cstdint>
#include <cstddef>
#include <ostream>

namespace VMCore {

/* Addressing: 48-bit virtual addresses, 4 KiB pages.
 */
const static uint64_t addressSpaceBits = 48;
const static uint64_t pageBits = 12; /* 4 KiB / page */
const static uint64_t pageSize = 1UL << pageBits;

static inline uint64_t
pageNumber(const uint64_t vAddr)
{
  return vAddr >> pageBits;
}

static inline uint64_t
pageOffset(const uint64_t vAddr)
{
  return vAddr & (pageSize - 1);
}

static inline uint64_t
pagesForSize(const uint64_t size)
{
  return (size + pageSize - 1) / pageSize;
}

/* Protection bits of a page table entry. */
enum PageFlag : uint32_t
{
  PagePresent    = 1U << 0,
  PageWritable   = 1U << 1,
  PageExecutable = 1U << 2,
  PageUser       = 1U << 3
};

/* Flags accepted by MemoryManager::allocate(). */
enum AllocFlag : uint32_t
{
  AllocReadable   = 1U << 0,
  AllocWritable   = 1U << 1,
  AllocExecutable = 1U << 2,
  AllocUser       = 1U << 3,
  AllocKernel     = 1U << 4
};

/* mmap() protection and mapping flags. */
enum MapProtection : uint32_t
{
  ProtRead    = 1U << 0,
  ProtWrite   = 1U << 1,
  ProtExecute = 1U << 2
};

enum MapFlag : uint32_t
{
  MapShared    = 1U << 0,
  MapPrivate   = 1U << 1,
  MapAnonymous = 1U << 2,
  MapFixed     = 1U << 3
};

/* Every mapping is present; readability is implied by presence. */
static inline uint32_t
toPageFlags(const uint32_t allocFlags)
{
  uint32_t flags = PagePresent;
  if (allocFlags & AllocWritable)
    flags |= PageWritable;
  if (allocFlags & AllocExecutable)
    flags |= PageExecutable;
  if (allocFlags & AllocUser)
    flags |= PageUser;
  return flags;
}

static inline uint32_t
toAllocFlags(const uint32_t protection)
{
  uint32_t flags = 0;
  if (protection & ProtRead)
    flags |= AllocReadable;
  if (protection & ProtWrite)
    flags |= AllocWritable;
  if (protection & ProtExecute)
    flags |= AllocExecutable;
  return flags;
}

struct PageTableEntry
{
  uint64_t virtualPage;
  uint64_t physicalFrame;
  uint32_t flags;
  bool accessed;
  bool dirty;

  PageTableEntry()
    : virtualPage(0), physicalFrame(0), flags(0), accessed(false), dirty(false)
  {}
  PageTableEntry(uint64_t vp, uint64_t frame, uint32_t fl)
    : virtualPage(vp), physicalFrame(frame), flags(fl), accessed(false), dirty(false)
  {}

  bool isPresent(void) const    { return flags & PagePresent; }
  bool isWritable(void) const   { return flags & PageWritable; }
  bool isExecutable(void) const { return flags & PageExecutable; }
  bool isUser(void) const       { return flags & PageUser; }
};

enum class AccessResult
{
  Success,
  PermissionDenied,
  Fault
};

std::ostream &operator<<(std::ostream &os, const AccessResult result);

enum class ReplacementKind
{
  LRU,    /* accessed-bit approximation */
  Clock   /* second chance */
};

std::ostream &operator<<(std::ostream &os, const ReplacementKind kind);

struct MemoryStatistics
{
  uint64_t allocations = 0;
  uint64_t deallocations = 0;
  uint64_t bytesAllocated = 0;
  uint64_t bytesDeallocated = 0;
  uint64_t pagesAllocated = 0;
  uint64_t pagesDeallocated = 0;
  uint64_t pageFaults = 0;
  uint64_t majorPageFaults = 0;
  uint64_t tlbHits = 0;
  uint64_t tlbMisses = 0;
  uint64_t swapIns = 0;
  uint64_t swapOuts = 0;
  uint64_t allocationFailures = 0;
  uint64_t evictions = 0;
  uint64_t swapDiscards = 0;
};

struct MemoryInfo
{
  uint64_t totalPhysical;
  uint64_t freePhysical;
  uint64_t usedPhysical;
  uint64_t totalVirtual;
  uint64_t freeVirtual;
  uint64_t swapTotal;
  uint64_t swapUsed;
  uint64_t pageSizeBytes;
  MemoryStatistics statistics;
};

std::ostream &operator<<(std::ostream &os, const MemoryInfo &info);

} /* namespace VMCore */

#endif /* __VMCORE_TYPES_H__ */
