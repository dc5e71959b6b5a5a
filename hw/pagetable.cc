/* vmcore -- A single address space virtual memory manager
 *
 *    pagetable.cc - Page table of the global address space
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "vmcore/pagetable.h"

#include <stdexcept>
#include <string>

namespace VMCore {

PageTable::PageTable()
  : entries(), frameOwners(), lock()
{
}

void
PageTable::addEntry(const PageTableEntry &entry)
{
  std::lock_guard<std::mutex> guard(lock);

  if (entries.count(entry.virtualPage))
    throw std::runtime_error("PageTable: virtual page "
                             + std::to_string(entry.virtualPage)
                             + " is already mapped.");
  if (frameOwners.count(entry.physicalFrame))
    throw std::runtime_error("PageTable: frame "
                             + std::to_string(entry.physicalFrame)
                             + " already backs another page.");

  entries.emplace(entry.virtualPage, entry);
  frameOwners.emplace(entry.physicalFrame, entry.virtualPage);
}

bool
PageTable::removeEntry(const uint64_t vPage)
{
  std::lock_guard<std::mutex> guard(lock);

  auto it = entries.find(vPage);
  if (it == entries.end())
    return false;

  frameOwners.erase(it->second.physicalFrame);
  entries.erase(it);
  return true;
}

bool
PageTable::lookup(const uint64_t vPage, PageTableEntry &entry) const
{
  std::lock_guard<std::mutex> guard(lock);

  auto it = entries.find(vPage);
  if (it == entries.end())
    return false;

  entry = it->second;
  return true;
}

bool
PageTable::markAccessed(const uint64_t vPage, bool isWrite)
{
  std::lock_guard<std::mutex> guard(lock);

  auto it = entries.find(vPage);
  if (it == entries.end())
    return false;

  it->second.accessed = true;
  if (isWrite)
    it->second.dirty = true;
  return true;
}

bool
PageTable::setAccessed(const uint64_t vPage, bool setting)
{
  std::lock_guard<std::mutex> guard(lock);

  auto it = entries.find(vPage);
  if (it == entries.end())
    return false;

  it->second.accessed = setting;
  return true;
}

std::vector<PageTableEntry>
PageTable::allEntries(void) const
{
  std::lock_guard<std::mutex> guard(lock);

  std::vector<PageTableEntry> snapshot;
  snapshot.reserve(entries.size());
  for (const auto &kv : entries)
    snapshot.push_back(kv.second);

  return snapshot;
}

size_t
PageTable::size(void) const
{
  std::lock_guard<std::mutex> guard(lock);
  return entries.size();
}

bool
PageTable::empty(void) const
{
  std::lock_guard<std::mutex> guard(lock);
  return entries.empty();
}

} /* namespace VMCore */
