/* vmcore -- A single address space virtual memory manager
 *
 *    swapstore.h - In-memory backing store for evicted pages
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __VMCORE_SWAPSTORE_H__
#define __VMCORE_SWAPSTORE_H__

#include "vmcore/types.h"

#include <unordered_map>
#include <vector>

namespace VMCore {

struct SwappedPage
{
  uint64_t virtualPage;
  std::vector<uint8_t> data;
  uint32_t flags;

  SwappedPage() : virtualPage(0), data(), flags(0) {}
};

/* Holds at most one copy per virtual page; a copy is consumed when it is
 * read back in.
 */
class SwapStore
{
  protected:
    const uint64_t totalSize;
    const bool enforceLimit;
    uint64_t usedSize;

    std::unordered_map<uint64_t, SwappedPage> pages;

  public:
    explicit SwapStore(const uint64_t totalSize, bool enforceLimit = true);

    /* Copies one page of frameData. Fails if the store is full and no
     * older copy of the page is present to be overwritten.
     */
    bool      writeOut(const PageTableEntry &entry, const uint8_t *frameData);
    bool      readIn(const uint64_t vPage, SwappedPage &page);

    /* Puts back a page taken by readIn(), bypassing the limit. */
    void      restore(SwappedPage &&page);
    bool      discard(const uint64_t vPage);

    bool      contains(const uint64_t vPage) const;
    bool      peekFlags(const uint64_t vPage, uint32_t &flags) const;

    uint64_t  getTotalSize(void) const;
    uint64_t  getUsedSize(void) const;
    size_t    getPageCount(void) const;
    bool      isLimitEnforced(void) const;
};

} /* namespace VMCore */

#endif /* __VMCORE_SWAPSTORE_H__ */
