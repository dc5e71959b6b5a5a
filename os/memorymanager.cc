/* vmcore -- A single address space virtual memory manager
 *
 *    memorymanager.cc - Virtual memory manager
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "memorymanager.h"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace VMCore {

/* Strips the sign-extension bits, as the MMU does. */
static inline uint64_t
canonicalAddress(const uint64_t vAddr)
{
  return vAddr & ((1UL << addressSpaceBits) - 1);
}

static inline uint64_t
canonicalPage(const uint64_t vAddr)
{
  return pageNumber(canonicalAddress(vAddr));
}

MemoryManager::MemoryManager(std::unique_ptr<FrameAllocator> _frames,
                             std::unique_ptr<ReplacementPolicy> _policy,
                             const MemoryConfig &config)
  : frames(std::move(_frames)), policy(std::move(_policy)),
    addressSpace(config.addressSpaceBits),
    swap(config.swapSize, config.enforceSwapLimit),
    pageTable(), mmu(pageTable, config.tlbEntries), stats(), lock()
{
  if (not frames)
    throw std::invalid_argument("MemoryManager: no frame allocator given.");
  if (not policy)
    throw std::invalid_argument("MemoryManager: no replacement policy given.");

  mmu.initialize([this](uint64_t vAddr) { return servicePageFault(vAddr); });
}

MemoryManager::MemoryManager(const MemoryConfig &config)
  : MemoryManager(std::make_unique<FrameAllocator>(config.memorySize),
                  makeReplacementPolicy(config.policy), config)
{
}

MemoryManager::~MemoryManager()
{
}

bool
MemoryManager::allocatePhysicalPage(uint64_t &frame)
{
  if (frames->allocate(frame))
    return true;

  /* Memory pressure: reclaim the frame of a resident page. */
  PageTableEntry victim;
  if (not policy->selectVictim(pageTable, victim))
    return false;

  if (victim.dirty)
    {
      if (not swap.writeOut(victim, frames->getFrameData(victim.physicalFrame)))
        return false;
      stats.swapOuts++;
    }

  if (LogEvictions)
    std::cerr << "VMM: evicted page "
              << std::hex << std::showbase << victim.virtualPage
              << std::dec << " from frame " << victim.physicalFrame
              << (victim.dirty ? " (dirty)" : " (clean)") << std::endl;

  mmu.invalidate(victim.virtualPage);
  pageTable.removeEntry(victim.virtualPage);
  stats.evictions++;

  frame = victim.physicalFrame;
  return true;
}

bool
MemoryManager::servicePageFault(const uint64_t vAddr)
{
  stats.pageFaults++;

  const uint64_t vPage = canonicalPage(vAddr);

  if (LogPageFaults)
    std::cerr << "VMM: page fault @ " << std::hex << std::showbase << vAddr
              << std::dec << std::endl;

  PageTableEntry resident;
  if (pageTable.lookup(vPage, resident))
    return true;

  SwappedPage page;
  if (not swap.readIn(vPage, page))
    {
      stats.majorPageFaults++;
      if (LogPageFaults)
        std::cerr << "VMM: major fault, page "
                  << std::hex << std::showbase << vPage << std::dec
                  << " is not backed" << std::endl;
      return false;
    }

  uint64_t frame = 0;
  if (not allocatePhysicalPage(frame))
    {
      swap.restore(std::move(page));
      if (LogPageFaults)
        std::cerr << "VMM: no frame available to swap in page "
                  << std::hex << std::showbase << vPage << std::dec << std::endl;
      return false;
    }

  std::memcpy(frames->getFrameData(frame), page.data.data(), pageSize);

  /* The swap copy was consumed, the frame now holds the only copy. */
  PageTableEntry entry(vPage, frame, page.flags);
  entry.dirty = true;
  pageTable.addEntry(entry);
  mmu.cacheTranslation(vPage, frame);

  stats.swapIns++;
  return true;
}

bool
MemoryManager::allocate(const uint64_t size, const uint32_t flags, uint64_t &vAddr)
{
  std::lock_guard<std::mutex> guard(lock);

  if (size == 0)
    {
      stats.allocationFailures++;
      return false;
    }

  const uint64_t nPages = pagesForSize(size);

  uint64_t start = 0;
  if (not addressSpace.findFreeRegion(nPages, start))
    {
      stats.allocationFailures++;
      return false;
    }

  /* Collect all frames before mapping anything, so that eviction can
   * never pick a page of this allocation.
   */
  std::vector<uint64_t> allocatedFrames;
  allocatedFrames.reserve(std::min<uint64_t>(nPages, frames->getFrameCount()));
  for (uint64_t i = 0; i < nPages; ++i)
    {
      uint64_t frame = 0;
      if (not allocatePhysicalPage(frame))
        {
          for (uint64_t f : allocatedFrames)
            frames->free(f);
          addressSpace.freeRegion(start);
          stats.allocationFailures++;

          if (LogEvictions)
            std::cerr << "VMM: out of memory allocating " << size
                      << " bytes" << std::endl;
          return false;
        }
      allocatedFrames.push_back(frame);
    }

  const uint32_t pageFlags = toPageFlags(flags);
  for (uint64_t i = 0; i < nPages; ++i)
    {
      std::memset(frames->getFrameData(allocatedFrames[i]), 0, pageSize);
      pageTable.addEntry(PageTableEntry(pageNumber(start) + i,
                                        allocatedFrames[i], pageFlags));
    }

  stats.allocations++;
  stats.bytesAllocated += size;
  stats.pagesAllocated += nPages;

  vAddr = start;
  return true;
}

void
MemoryManager::deallocate(const uint64_t vAddr, const uint64_t size)
{
  std::lock_guard<std::mutex> guard(lock);

  const uint64_t firstPage = canonicalPage(vAddr);

  /* A region is always released as a whole, so every page of it is
   * unmapped, also those beyond a shorter size.
   */
  uint64_t nPages = pagesForSize(size);
  uint64_t regionPages = 0;
  if (addressSpace.freeRegion(firstPage << pageBits, regionPages))
    nPages = std::max(nPages, regionPages);

  for (uint64_t i = 0; i < nPages; ++i)
    {
      const uint64_t vPage = firstPage + i;

      PageTableEntry entry;
      if (pageTable.lookup(vPage, entry))
        {
          frames->free(entry.physicalFrame);
          pageTable.removeEntry(vPage);
          mmu.invalidate(vPage);
        }
      else if (swap.discard(vPage))
        {
          stats.swapDiscards++;
        }
    }

  stats.deallocations++;
  stats.bytesDeallocated += size;
  stats.pagesDeallocated += nPages;
}

AccessResult
MemoryManager::read(const uint64_t vAddr, const size_t size, std::vector<uint8_t> &data)
{
  std::lock_guard<std::mutex> guard(lock);

  std::vector<uint8_t> buffer(size);
  size_t done = 0;
  while (done < size)
    {
      const uint64_t addr = vAddr + done;
      const size_t chunk = std::min<uint64_t>(size - done, pageSize - pageOffset(addr));

      uint64_t pAddr = 0;
      AccessResult result = mmu.translate(addr, false, pAddr);
      if (result != AccessResult::Success)
        return result;

      std::memcpy(buffer.data() + done, frames->getPhysicalData(pAddr), chunk);
      done += chunk;
    }

  data = std::move(buffer);
  return AccessResult::Success;
}

AccessResult
MemoryManager::checkWritable(const uint64_t vAddr, const size_t size)
{
  const uint64_t first = canonicalPage(vAddr);
  const uint64_t last = canonicalPage(vAddr + size - 1);

  for (uint64_t vPage = first; vPage <= last; ++vPage)
    {
      PageTableEntry entry;
      uint32_t flags = 0;

      if (pageTable.lookup(vPage, entry))
        flags = entry.flags;
      else if (not swap.peekFlags(vPage, flags))
        {
          /* Unbacked, let the regular fault path report it. */
          uint64_t pAddr = 0;
          return mmu.translate(std::max(canonicalAddress(vAddr), vPage << pageBits),
                               true, pAddr);
        }

      if (not (flags & PageWritable))
        return AccessResult::PermissionDenied;
    }

  return AccessResult::Success;
}

AccessResult
MemoryManager::write(const uint64_t vAddr, const std::vector<uint8_t> &data)
{
  std::lock_guard<std::mutex> guard(lock);

  if (data.empty())
    return AccessResult::Success;

  /* Nothing is written unless every page in the range is writable. A
   * page that cannot be swapped back in still fails the write part way.
   */
  AccessResult result = checkWritable(vAddr, data.size());
  if (result != AccessResult::Success)
    return result;

  size_t done = 0;
  while (done < data.size())
    {
      const uint64_t addr = vAddr + done;
      const size_t chunk = std::min<uint64_t>(data.size() - done, pageSize - pageOffset(addr));

      uint64_t pAddr = 0;
      result = mmu.translate(addr, true, pAddr);
      if (result != AccessResult::Success)
        return result;

      std::memcpy(frames->getPhysicalData(pAddr), data.data() + done, chunk);
      done += chunk;
    }

  return AccessResult::Success;
}

bool
MemoryManager::handlePageFault(const uint64_t vAddr)
{
  std::lock_guard<std::mutex> guard(lock);
  return servicePageFault(vAddr);
}

bool
MemoryManager::mmap(const uint64_t size, const uint32_t protection,
                    const uint32_t flags, uint64_t &vAddr)
{
  /* Shared, private, anonymous and fixed mappings are all treated as
   * private anonymous memory.
   */
  if (LogMemoryAccesses)
    std::cerr << "VMM: mmap " << size << " bytes, protection "
              << std::hex << std::showbase << protection
              << " flags " << flags << std::dec << std::endl;

  return allocate(size, toAllocFlags(protection), vAddr);
}

void
MemoryManager::munmap(const uint64_t vAddr, const uint64_t size)
{
  deallocate(vAddr, size);
}

MemoryInfo
MemoryManager::getMemoryInfo(void) const
{
  std::lock_guard<std::mutex> guard(lock);

  MemoryInfo info;
  info.totalPhysical = frames->getMemorySize();
  info.freePhysical = frames->getFreeFrameCount() * pageSize;
  info.usedPhysical = info.totalPhysical - info.freePhysical;
  info.totalVirtual = addressSpace.getTotalSize();
  info.freeVirtual = addressSpace.getFreeSize();
  info.swapTotal = swap.getTotalSize();
  info.swapUsed = swap.getUsedSize();
  info.pageSizeBytes = pageSize;
  info.statistics = stats;

  int nLookups{}, nHits{}, nEvictions{}, nFlush{}, nFlushEvictions{};
  mmu.getTLBStatistics(nLookups, nHits, nEvictions, nFlush, nFlushEvictions);
  info.statistics.tlbHits = nHits;
  info.statistics.tlbMisses = nLookups - nHits;

  return info;
}

void
MemoryManager::flush(void)
{
  std::lock_guard<std::mutex> guard(lock);
  mmu.flushTLB();
}

std::vector<PageTableEntry>
MemoryManager::getPageTableSnapshot(void) const
{
  return pageTable.allEntries();
}

uint64_t
MemoryManager::getFreeFrameCount(void) const
{
  std::lock_guard<std::mutex> guard(lock);
  return frames->getFreeFrameCount();
}

const PageTable &
MemoryManager::getPageTable(void) const
{
  return pageTable;
}

const SwapStore &
MemoryManager::getSwapStore(void) const
{
  return swap;
}

const FrameAllocator &
MemoryManager::getFrameAllocator(void) const
{
  return *frames;
}

const AddressSpaceAllocator &
MemoryManager::getAddressSpace(void) const
{
  return addressSpace;
}

const ReplacementPolicy &
MemoryManager::getPolicy(void) const
{
  return *policy;
}

TLB *
MemoryManager::getTLB(void)
{
  return mmu.getTLB();
}

} /* namespace VMCore */
