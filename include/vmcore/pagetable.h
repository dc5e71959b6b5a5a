/* vmcore -- A single address space virtual memory manager
 *
 *    pagetable.h - Page table of the global address space
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __VMCORE_PAGETABLE_H__
#define __VMCORE_PAGETABLE_H__

#include "vmcore/types.h"

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace VMCore {

/* Maps virtual page numbers to resident frames. Entries are stored by
 * value; the accessed and dirty bits are only changed through the update
 * methods below.
 *
 * The table carries its own lock so that snapshots can be taken while the
 * memory manager's lock is held by another thread. The memory manager may
 * call into the table with its own lock held, never the reverse.
 */
class PageTable
{
  protected:
    std::map<uint64_t, PageTableEntry> entries;

    /* Reverse map frame -> virtual page, a frame backs one page at most. */
    std::unordered_map<uint64_t, uint64_t> frameOwners;

    mutable std::mutex lock;

  public:
    PageTable();

    void      addEntry(const PageTableEntry &entry);
    bool      removeEntry(const uint64_t vPage);
    bool      lookup(const uint64_t vPage, PageTableEntry &entry) const;

    /* Sets the accessed bit, and the dirty bit for writes. */
    bool      markAccessed(const uint64_t vPage, bool isWrite);
    bool      setAccessed(const uint64_t vPage, bool setting);

    /* Snapshot in ascending virtual page order. */
    std::vector<PageTableEntry> allEntries(void) const;

    size_t    size(void) const;
    bool      empty(void) const;

    PageTable(const PageTable &) = delete;
    PageTable &operator=(const PageTable &) = delete;
};

} /* namespace VMCore */

#endif /* __VMCORE_PAGETABLE_H__ */
