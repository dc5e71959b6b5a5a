/* vmcore -- A single address space virtual memory manager
 *
 *    addrspace.cc - Virtual address space allocator
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "addrspace.h"

#include <stdexcept>
#include <algorithm>

namespace VMCore {

AddressSpaceAllocator::AddressSpaceAllocator(const uint8_t addressBits)
  : totalSize(addressBits < 64 ? 1UL << addressBits : 0), regions(), sorted(true), allocatedPages(0)
{
  if (addressBits <= pageBits or addressBits > 63)
    throw std::invalid_argument("AddressSpaceAllocator: unsupported address width.");
}

void
AddressSpaceAllocator::sortRegions(void)
{
  if (sorted)
    return;

  regions.sort([](const VirtualRegion &a, const VirtualRegion &b) {
    return a.startAddress < b.startAddress;
  });
  sorted = true;
}

bool
AddressSpaceAllocator::findFreeRegion(const uint64_t pageCount, uint64_t &addr)
{
  if (pageCount == 0)
    throw std::invalid_argument("AddressSpaceAllocator: cannot reserve an empty region.");

  /* Guard against overflow of the byte length below. */
  if (pageCount > totalSize / pageSize)
    return false;

  const uint64_t length = pageCount * pageSize;

  sortRegions();

  /* First-fit: scan the gaps between consecutive regions, starting after
   * the guard page.
   */
  uint64_t current = pageSize;
  auto it = regions.begin();
  for ( ; it != regions.end(); ++it)
    {
      if (current + length <= it->startAddress)
        break;
      current = std::max(current, it->endAddress());
    }

  if (it == regions.end() and (current > totalSize or length > totalSize - current))
    return false;

  if (it != regions.end())
    sorted = false;
  regions.emplace_back(current, pageCount);
  allocatedPages += pageCount;

  addr = current;
  return true;
}

bool
AddressSpaceAllocator::freeRegion(const uint64_t addr)
{
  uint64_t pageCount = 0;
  return freeRegion(addr, pageCount);
}

bool
AddressSpaceAllocator::freeRegion(const uint64_t addr, uint64_t &pageCount)
{
  for (auto it = regions.begin(); it != regions.end(); ++it)
    {
      if (it->startAddress == addr)
        {
          pageCount = it->pageCount;
          allocatedPages -= it->pageCount;
          regions.erase(it);
          return true;
        }
    }

  return false;
}

bool
AddressSpaceAllocator::contains(const uint64_t vAddr) const
{
  return std::any_of(regions.begin(), regions.end(),
                     [vAddr](const VirtualRegion &region) {
                       return vAddr >= region.startAddress and vAddr < region.endAddress();
                     });
}

uint64_t
AddressSpaceAllocator::getTotalSize(void) const
{
  return totalSize;
}

uint64_t
AddressSpaceAllocator::getFreeSize(void) const
{
  /* The guard page is never handed out. */
  return totalSize - pageSize - allocatedPages * pageSize;
}

size_t
AddressSpaceAllocator::getRegionCount(void) const
{
  return regions.size();
}

} /* namespace VMCore */
