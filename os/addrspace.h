/* vmcore -- A single address space virtual memory manager
 *
 *    addrspace.h - Virtual address space allocator
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __VMCORE_ADDRSPACE_H__
#define __VMCORE_ADDRSPACE_H__

#include "vmcore/types.h"

#include <list>

namespace VMCore {

struct VirtualRegion
{
  uint64_t startAddress;
  uint64_t pageCount;

  VirtualRegion(uint64_t start, uint64_t count) : startAddress(start), pageCount(count) {}

  uint64_t endAddress(void) const
  {
    return startAddress + pageCount * pageSize;
  }
};

/* Keeps track of the allocated regions of the single global address
 * space. The first page is never handed out, so that address 0 always
 * faults.
 */
class AddressSpaceAllocator
{
  protected:
    const uint64_t totalSize;

    /* Allocated regions, sorted by start address on demand. */
    std::list<VirtualRegion> regions;
    bool sorted;
    uint64_t allocatedPages;

    void sortRegions(void);

  public:
    explicit AddressSpaceAllocator(const uint8_t addressBits = addressSpaceBits);

    /* Reserves the first gap of pageCount pages; returns its address. */
    bool      findFreeRegion(const uint64_t pageCount, uint64_t &addr);
    bool      freeRegion(const uint64_t addr);
    /* As above, also reports the size of the released region. */
    bool      freeRegion(const uint64_t addr, uint64_t &pageCount);

    bool      contains(const uint64_t vAddr) const;

    uint64_t  getTotalSize(void) const;
    uint64_t  getFreeSize(void) const;
    size_t    getRegionCount(void) const;
};

} /* namespace VMCore */

#endif /* __VMCORE_ADDRSPACE_H__ */
