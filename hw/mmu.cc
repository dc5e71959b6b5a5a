/* vmcore -- A single address space virtual memory manager
 *
 *    mmu.cc - Memory Management Unit component
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "vmcore/mmu.h"
#include "vmcore/settings.h"

#include <iostream>

namespace VMCore {

TLB::TLB(const size_t nEntries)
  : nEntries(nEntries), entries(), index(),
    nLookups(0), nHits(0), nEvictions(0), nFlush(0), nFlushEvictions(0),
    nInvalidations(0)
{
}

TLB::~TLB()
{
}

bool
TLB::lookup(const uint64_t vPage, uint64_t &pFrame)
{
  nLookups++;

  auto it = index.find(vPage);
  if (it == index.end())
    return false;

  nHits++;
  pFrame = it->second->pFrame;
  entries.splice(entries.begin(), entries, it->second);
  return true;
}

bool
TLB::translate(const uint64_t vAddr, uint64_t &pAddr)
{
  uint64_t pFrame = 0;
  if (not lookup(pageNumber(vAddr), pFrame))
    return false;

  pAddr = (pFrame << pageBits) | pageOffset(vAddr);
  return true;
}

void
TLB::add(const uint64_t vPage, const uint64_t pFrame)
{
  if (nEntries == 0)
    return;

  auto it = index.find(vPage);
  if (it != index.end())
    {
      entries.erase(it->second);
      index.erase(it);
    }

  entries.emplace_front(vPage, pFrame);
  index[vPage] = entries.begin();

  if (entries.size() > nEntries)
    {
      index.erase(entries.back().vPage);
      entries.pop_back();
      nEvictions++;
    }
}

bool
TLB::invalidate(const uint64_t vPage)
{
  auto it = index.find(vPage);
  if (it == index.end())
    return false;

  entries.erase(it->second);
  index.erase(it);
  nInvalidations++;
  return true;
}

void
TLB::flush(void)
{
  nFlush++;
  nFlushEvictions += entries.size();

  entries.clear();
  index.clear();
}

void
TLB::clear(void)
{
  flush();
  nLookups = 0;
  nHits = 0;
  nEvictions = 0;
  nFlush = 0;
  nFlushEvictions = 0;
  nInvalidations = 0;
}

bool
TLB::contains(const uint64_t vPage) const
{
  return index.count(vPage) != 0;
}

size_t
TLB::size(void) const
{
  return entries.size();
}

size_t
TLB::capacity(void) const
{
  return nEntries;
}

void
TLB::getStatistics(int &nLookups, int &nHits, int &nEvictions,
                   int &nFlush, int &nFlushEvictions) const
{
  nLookups = this->nLookups;
  nHits = this->nHits;
  nEvictions = this->nEvictions;
  nFlush = this->nFlush;
  nFlushEvictions = this->nFlushEvictions;
}

int
TLB::getInvalidations(void) const
{
  return nInvalidations;
}

MMU::MMU(PageTable &pageTable, const size_t tlbEntries)
  : pageTable(pageTable), tlb(std::make_unique<TLB>(tlbEntries)),
    pageFaultHandler()
{
}

MMU::~MMU()
{
  if (not LogTLBStatistics)
    return;

  int nLookups{}, nHits{}, nEvictions{}, nFlush{}, nFlushEvictions{};
  getTLBStatistics(nLookups, nHits, nEvictions, nFlush, nFlushEvictions);

  std::cerr << std::dec << std::endl
            << "TLB Statistics (since last reset):" << std::endl
            << "# lookups: " << nLookups << std::endl
            << "# hits: " << nHits
            << " (" << (nLookups ? ((float)nHits/nLookups)*100. : 0.) << "%)" << std::endl
            << "# line evictions: " << nEvictions << std::endl
            << "# flushes: " << nFlush << std::endl
            << "# line evictions due to flush: " << nFlushEvictions << std::endl;
}

void
MMU::initialize(PageFaultFunction _pageFaultHandler)
{
  pageFaultHandler = _pageFaultHandler;
}

AccessResult
MMU::translate(const uint64_t vAddr, bool isWrite, uint64_t &pAddr)
{
  if (LogMemoryAccesses)
    std::cerr << "MMU: memory access: " << (isWrite ? "store" : "load")
              << " @ " << std::hex << std::showbase << vAddr
              << std::dec << std::endl;

  /* A fault is serviced at most once, then the translation is retried. */
  AccessResult result = AccessResult::Fault;
  for (int attempt = 0; attempt < 2; ++attempt)
    {
      result = getTranslation(vAddr, isWrite, pAddr);
      if (result != AccessResult::Fault)
        break;

      if (attempt > 0 or not pageFaultHandler or not pageFaultHandler(vAddr))
        break;
    }

  if (LogMemoryAccesses and result == AccessResult::Success)
    std::cerr << "MMU: translated virtual "
              << std::hex << std::showbase << vAddr
              << " to physical " << pAddr << std::dec << std::endl;

  return result;
}

uint64_t
MMU::makePhysicalAddr(const uint64_t vAddr, const uint64_t pFrame) const
{
  uint64_t pAddr = pFrame << getPageBits();
  pAddr |= vAddr & (getPageSize() - 1);

  return pAddr;
}

AccessResult
MMU::getTranslation(const uint64_t addr, bool isWrite, uint64_t &pAddr)
{
  /* Strip off (zero out) unused sign-extension bits in virtual address */
  const uint64_t vAddr = addr & ((1UL << getAddressSpaceBits()) - 1);

  const uint64_t vPage = vAddr >> getPageBits();
  uint64_t pFrame = 0;

  if (tlb and tlb->lookup(vPage, pFrame))
    {
      /* Reads are served from the TLB alone. Writes still consult the
       * page table for the protection and to set the dirty bit.
       */
      if (not isWrite)
        {
          pAddr = makePhysicalAddr(vAddr, pFrame);
          return AccessResult::Success;
        }

      PageTableEntry entry;
      if (pageTable.lookup(vPage, entry))
        {
          if (not entry.isWritable())
            return AccessResult::PermissionDenied;

          pageTable.markAccessed(vPage, true);
          pAddr = makePhysicalAddr(vAddr, pFrame);
          return AccessResult::Success;
        }

      /* Stale entry, mapping removed without invalidation. */
      tlb->invalidate(vPage);
    }

  /* TLB miss - perform page table walk */
  PageTableEntry entry;
  if (not pageTable.lookup(vPage, entry) or not entry.isPresent())
    return AccessResult::Fault;

  if (isWrite and not entry.isWritable())
    return AccessResult::PermissionDenied;

  if (tlb)
    tlb->add(vPage, entry.physicalFrame);
  pageTable.markAccessed(vPage, isWrite);

  pAddr = makePhysicalAddr(vAddr, entry.physicalFrame);
  return AccessResult::Success;
}

void
MMU::invalidate(const uint64_t vPage)
{
  if (tlb)
    tlb->invalidate(vPage);
}

void
MMU::cacheTranslation(const uint64_t vPage, const uint64_t pFrame)
{
  if (tlb)
    tlb->add(vPage, pFrame);
}

void
MMU::setTLB(std::unique_ptr<TLB> tlb_ptr)
{
  tlb = std::move(tlb_ptr);
}

TLB *
MMU::getTLB(void)
{
  return tlb.get();
}

void
MMU::flushTLB(void)
{
  if (tlb)
    tlb->flush();
}

void
MMU::getTLBStatistics(int &nLookups, int &nHits, int &nEvictions,
                      int &nFlush, int &nFlushEvictions) const
{
  if (tlb)
    {
      tlb->getStatistics(nLookups, nHits, nEvictions, nFlush, nFlushEvictions);
    }
  else
    {
      nLookups = 0;
      nHits = 0;
      nEvictions = 0;
      nFlush = 0;
      nFlushEvictions = 0;
    }
}

} /* namespace VMCore */
