/* vmcore -- A single address space virtual memory manager
 *
 *    mmu.h - Memory Management Unit component
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __VMCORE_MMU_H__
#define __VMCORE_MMU_H__

#include "vmcore/pagetable.h"

#include <functional>
#include <list>
#include <memory>
#include <unordered_map>

namespace VMCore {

/* Called by the MMU on a translation miss without a mapping. Returns true
 * if a mapping was installed.
 */
using PageFaultFunction = std::function<bool(uint64_t)>;

/* Fully associative translation cache with strict LRU replacement. The
 * most recently used entry is kept at the front of the list.
 */
class TLB
{
  protected:
    struct TLBEntry
    {
      uint64_t vPage;
      uint64_t pFrame;

      TLBEntry(uint64_t vp, uint64_t pf) : vPage(vp), pFrame(pf) {}
    };

    /* Number of entries in TLB */
    const size_t nEntries;

    std::list<TLBEntry> entries;
    std::unordered_map<uint64_t, std::list<TLBEntry>::iterator> index;

    /* TLB statistics */
    int nLookups;
    int nHits;
    int nEvictions;
    int nFlush;
    int nFlushEvictions;
    int nInvalidations;

  public:
    explicit TLB(const size_t nEntries);
    ~TLB();

    /* Looks up the frame for a virtual page number, a hit makes the entry
     * the most recently used one.
     */
    bool lookup(const uint64_t vPage, uint64_t &pFrame);

    /* As lookup, but for a full virtual address; the page offset is
     * carried over into the physical address.
     */
    bool translate(const uint64_t vAddr, uint64_t &pAddr);

    void add(const uint64_t vPage, const uint64_t pFrame);
    bool invalidate(const uint64_t vPage);

    /* Drops all entries */
    void flush(void);

    /* Drops all entries and resets the statistics */
    void clear(void);

    /* Does not change the recency order. */
    bool contains(const uint64_t vPage) const;
    size_t size(void) const;
    size_t capacity(void) const;

    void getStatistics(int &nLookups, int &nHits, int &nEvictions,
                       int &nFlush, int &nFlushEvictions) const;
    int getInvalidations(void) const;
};

class MMU
{
  protected:
    PageTable &pageTable;
    std::unique_ptr<TLB> tlb;
    PageFaultFunction pageFaultHandler;

    AccessResult getTranslation(const uint64_t vAddr, bool isWrite, uint64_t &pAddr);

  public:
    MMU(PageTable &pageTable, const size_t tlbEntries);
    ~MMU();

    void initialize(PageFaultFunction pageFaultHandler);

    /* Translates a virtual address for a read or a write. A missing
     * mapping invokes the page fault handler once, after which the
     * translation is retried once.
     */
    AccessResult translate(const uint64_t vAddr, bool isWrite, uint64_t &pAddr);

    uint64_t makePhysicalAddr(const uint64_t vAddr, const uint64_t pFrame) const;

    /* Must be called whenever a mapping is removed. */
    void invalidate(const uint64_t vPage);
    void cacheTranslation(const uint64_t vPage, const uint64_t pFrame);

    void setTLB(std::unique_ptr<TLB> tlb);
    TLB *getTLB(void);
    void flushTLB(void);

    void getTLBStatistics(int &nLookups, int &nHits,
                          int &nEvictions,
                          int &nFlush, int &nFlushEvictions) const;

    uint8_t getPageBits(void) const       { return pageBits; }
    uint64_t getPageSize(void) const      { return pageSize; }
    uint8_t getAddressSpaceBits(void) const { return addressSpaceBits; }

    MMU(const MMU &) = delete;
    MMU &operator=(const MMU &) = delete;
};

} /* namespace VMCore */

#endif /* __VMCORE_MMU_H__ */
