/* vmcore -- A single address space virtual memory manager
 *
 *    replacement.cc - Page replacement policies
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "replacement.h"

#include <stdexcept>

namespace VMCore {

bool
LRUPolicy::selectVictim(PageTable &pageTable, PageTableEntry &victim)
{
  const std::vector<PageTableEntry> entries = pageTable.allEntries();
  if (entries.empty())
    return false;

  for (const auto &entry : entries)
    {
      if (not entry.accessed)
        {
          victim = entry;
          return true;
        }
    }

  victim = entries.front();
  return true;
}

ReplacementKind
LRUPolicy::getKind(void) const
{
  return ReplacementKind::LRU;
}

ClockPolicy::ClockPolicy()
  : hand(0)
{
}

bool
ClockPolicy::selectVictim(PageTable &pageTable, PageTableEntry &victim)
{
  std::vector<PageTableEntry> entries = pageTable.allEntries();
  if (entries.empty())
    return false;

  const size_t count = entries.size();
  for (size_t step = 0; step < 2 * count; ++step)
    {
      const size_t slot = hand % count;
      hand = slot + 1;

      PageTableEntry &entry = entries[slot];
      if (not entry.accessed)
        {
          victim = entry;
          return true;
        }

      /* Second chance. The snapshot is updated as well so that the
       * second round sees the cleared bit.
       */
      entry.accessed = false;
      pageTable.setAccessed(entry.virtualPage, false);
    }

  victim = entries.front();
  return true;
}

ReplacementKind
ClockPolicy::getKind(void) const
{
  return ReplacementKind::Clock;
}

size_t
ClockPolicy::getHand(void) const
{
  return hand;
}

std::unique_ptr<ReplacementPolicy>
makeReplacementPolicy(ReplacementKind kind)
{
  switch (kind)
    {
      case ReplacementKind::LRU:
        return std::make_unique<LRUPolicy>();
      case ReplacementKind::Clock:
        return std::make_unique<ClockPolicy>();
    }

  throw std::invalid_argument("unknown replacement policy");
}

} /* namespace VMCore */
