/* vmcore -- A single address space virtual memory manager
 *
 *    swapstore.cc - In-memory backing store for evicted pages
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "swapstore.h"
#include "vmcore/settings.h"

#include <iostream>
#include <utility>

namespace VMCore {

SwapStore::SwapStore(const uint64_t totalSize, bool enforceLimit)
  : totalSize(totalSize), enforceLimit(enforceLimit), usedSize(0), pages()
{
}

bool
SwapStore::writeOut(const PageTableEntry &entry, const uint8_t *frameData)
{
  auto it = pages.find(entry.virtualPage);
  if (it == pages.end())
    {
      if (enforceLimit and usedSize + pageSize > totalSize)
        {
          if (LogEvictions)
            std::cerr << "SWAP: store full (" << usedSize << " of "
                      << totalSize << " bytes), cannot write out page "
                      << std::hex << std::showbase << entry.virtualPage
                      << std::dec << std::endl;
          return false;
        }

      it = pages.emplace(entry.virtualPage, SwappedPage()).first;
      usedSize += pageSize;
    }

  SwappedPage &page = it->second;
  page.virtualPage = entry.virtualPage;
  page.data.assign(frameData, frameData + pageSize);
  page.flags = entry.flags;

  if (LogEvictions)
    std::cerr << "SWAP: wrote out page "
              << std::hex << std::showbase << entry.virtualPage
              << std::dec << std::endl;

  return true;
}

bool
SwapStore::readIn(const uint64_t vPage, SwappedPage &page)
{
  auto it = pages.find(vPage);
  if (it == pages.end())
    return false;

  page = std::move(it->second);
  pages.erase(it);
  usedSize -= pageSize;
  return true;
}

void
SwapStore::restore(SwappedPage &&page)
{
  const uint64_t vPage = page.virtualPage;
  if (pages.count(vPage) == 0)
    usedSize += pageSize;

  pages[vPage] = std::move(page);
}

bool
SwapStore::discard(const uint64_t vPage)
{
  if (pages.erase(vPage) == 0)
    return false;

  usedSize -= pageSize;
  return true;
}

bool
SwapStore::contains(const uint64_t vPage) const
{
  return pages.count(vPage) != 0;
}

bool
SwapStore::peekFlags(const uint64_t vPage, uint32_t &flags) const
{
  auto it = pages.find(vPage);
  if (it == pages.end())
    return false;

  flags = it->second.flags;
  return true;
}

uint64_t
SwapStore::getTotalSize(void) const
{
  return totalSize;
}

uint64_t
SwapStore::getUsedSize(void) const
{
  return usedSize;
}

size_t
SwapStore::getPageCount(void) const
{
  return pages.size();
}

bool
SwapStore::isLimitEnforced(void) const
{
  return enforceLimit;
}

} /* namespace VMCore */
