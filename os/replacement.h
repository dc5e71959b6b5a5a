/* vmcore -- A single address space virtual memory manager
 *
 *    replacement.h - Page replacement policies
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __VMCORE_REPLACEMENT_H__
#define __VMCORE_REPLACEMENT_H__

#include "vmcore/pagetable.h"

#include <memory>

namespace VMCore {

/* Selects the resident page to evict when the frame pool is exhausted.
 * Fails only if the page table is empty.
 */
class ReplacementPolicy
{
  public:
    virtual ~ReplacementPolicy() {}

    virtual bool selectVictim(PageTable &pageTable, PageTableEntry &victim) = 0;
    virtual ReplacementKind getKind(void) const = 0;
};

/* Approximate LRU on the accessed bit alone: the first page that was not
 * accessed wins, otherwise the first page. Accessed bits are left intact.
 */
class LRUPolicy : public ReplacementPolicy
{
  public:
    bool selectVictim(PageTable &pageTable, PageTableEntry &victim) override;
    ReplacementKind getKind(void) const override;
};

/* Second chance. The hand persists across calls; accessed pages passed by
 * the hand get their bit cleared.
 */
class ClockPolicy : public ReplacementPolicy
{
  protected:
    size_t hand;

  public:
    ClockPolicy();

    bool selectVictim(PageTable &pageTable, PageTableEntry &victim) override;
    ReplacementKind getKind(void) const override;

    size_t getHand(void) const;
};

std::unique_ptr<ReplacementPolicy> makeReplacementPolicy(ReplacementKind kind);

} /* namespace VMCore */

#endif /* __VMCORE_REPLACEMENT_H__ */
